#pragma once

#include "Config.hpp"
#include "Connection.hpp"
#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lansync {

/**
 * @brief Host side of the game link.
 *
 * A single pump thread runs the io_context: async accept of new peers and
 * async reads on every live connection. Parsed messages and join/leave
 * events go to the shared EventQueue. send() and broadcast() hand the write
 * to the pump thread and wait for it, so only that thread touches sockets.
 *
 * A connection is removed in exactly one place (removeConnection), so each
 * peer produces exactly one PlayerLeft, whatever the cause.
 */
class Server {
public:
    Server(EventQueue& events, SyncConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Bind + listen on config.gamePort; detail holds the bound port or the error
    NetResult start(int maxPlayers);
    void stop();

    // Game thread only. False when the slot is unknown or the write failed.
    bool send(int slot, const Message& message);
    // Game thread only. False when encoding failed or the pump did not answer.
    bool broadcast(const Message& message);

    bool isRunning() const { return _running; }
    size_t getClientCount() const;
    std::vector<int> getSlots() const;
    uint16_t getPort() const { return _port; }

private:
    using ConnectionPtr = std::shared_ptr<Connection>;

    void doAccept();
    void doRead(ConnectionPtr connection);
    void onRead(const ConnectionPtr& connection, const std::error_code& ec, std::size_t length);
    void handleMessage(Connection& connection, Message message);
    bool writeTo(Connection& connection, const std::string& record);
    bool writeToSlot(int slot, const std::string& record);
    void writeToAll(const std::string& record);
    void removeConnection(int slot, const std::string& reason);
    bool isLive(const ConnectionPtr& connection) const;
    int allocateSlot() const;

    EventQueue& _events;
    SyncConfig _config;
    int _maxPlayers;
    uint16_t _port;

    asio::io_context _ioContext;
    asio::ip::tcp::acceptor _acceptor;

    // Written by the pump thread only; the mutex lets other threads read it
    mutable std::mutex _connectionsMutex;
    std::map<int, ConnectionPtr> _connections;

    std::atomic<bool> _running;
    std::thread _pumpThread;
};

} // namespace lansync
