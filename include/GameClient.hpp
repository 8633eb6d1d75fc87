#pragma once

#include "Config.hpp"
#include "Connection.hpp"
#include <asio.hpp>
#include <atomic>
#include <string>
#include <thread>

namespace lansync {

/**
 * @brief Client side of the game link: one TCP socket to the host.
 *
 * A background thread runs the io_context with an async read chain and
 * queues every parsed message (sender HOST_SLOT). send() hands the write to
 * that thread, so only it touches the socket. Losing the link, for whatever
 * reason, queues exactly one ConnectionLost. There is no automatic reconnect.
 */
class GameClient {
public:
    GameClient(EventQueue& events, SyncConfig config);
    ~GameClient();

    GameClient(const GameClient&) = delete;
    GameClient& operator=(const GameClient&) = delete;

    // Blocking connect bounded by config.connectTimeout; detail holds the error on failure
    NetResult connect(const std::string& host, uint16_t port);

    // Send a message to the host
    bool send(const Message& message);

    // Planned goodbye; safe to call more than once
    void disconnect();

    bool isConnected() const { return _connected; }
    const std::string& getHostAddress() const { return _hostAddress; }

private:
    enum { read_chunk = 4096 };

    void doRead();
    void onRead(const std::error_code& ec, std::size_t length);
    bool writeRecord(const std::string& record);
    void markLost(const std::string& reason);
    void stopReceiveThread();

    EventQueue& _events;
    SyncConfig _config;

    asio::io_context _ioContext;
    asio::ip::tcp::socket _tcpSocket;
    LineBuffer _buffer;
    char _chunk[read_chunk];
    std::string _hostAddress;

    std::atomic<bool> _connected;
    std::thread _receiveThread;
};

} // namespace lansync
