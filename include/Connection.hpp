#pragma once

#include "Protocol.hpp"
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace lansync {

// Outcome of a setup call: bound/peer address on success, error text otherwise
struct NetResult {
    bool ok;
    std::string detail;
};

// Slot of the host itself; clients get 1..maxPlayers-1
constexpr int HOST_SLOT = 0;

// Events surfaced to the session logic through getMessages()
struct MessageReceived {
    int slot;               // Sender (HOST_SLOT on the client side)
    Message message;
};

struct PlayerJoined {
    int slot;
    std::string address;
};

struct PlayerLeft {
    int slot;
};

struct ConnectionLost {
    std::string reason;
};

using NetworkEvent = std::variant<MessageReceived, PlayerJoined, PlayerLeft, ConnectionLost>;

/**
 * @brief Mutex guarded hand-off between the network thread and the game loop.
 */
class EventQueue {
public:
    void push(NetworkEvent event);

    // Everything pushed since the last drain, in arrival order. Never blocks on I/O.
    std::vector<NetworkEvent> drain();

    std::size_t size() const;
    void clear();

private:
    mutable std::mutex _mutex;
    std::deque<NetworkEvent> _events;
};

/**
 * @brief Accumulates raw TCP bytes and cuts them into newline terminated records.
 */
class LineBuffer {
public:
    void append(const char* data, std::size_t length);

    // Complete lines, without the terminator; the incomplete tail is kept
    std::vector<std::string> extractLines();

    std::size_t pending() const { return _buffer.size(); }
    void clear() { _buffer.clear(); }

private:
    std::string _buffer;
};

// One TCP peer: socket plus its partial read buffer
struct Connection {
    asio::ip::tcp::socket socket;
    std::string address;
    int slot;
    LineBuffer buffer;

    enum { read_chunk = 4096 };
    char chunk[read_chunk];

    Connection(asio::ip::tcp::socket s, std::string addr, int id)
        : socket(std::move(s)), address(std::move(addr)), slot(id) {}
};

// Write one record followed by '\n'. Works on non-blocking sockets, giving up after timeout.
bool writeLine(asio::ip::tcp::socket& socket, const std::string& record,
               std::chrono::milliseconds timeout, std::error_code& ec);

// Decode every line; malformed ones are logged under tag and dropped
std::vector<Message> decodeLines(const std::vector<std::string>& lines, const char* tag);

/**
 * @brief Run task on the thread driving ioContext and wait for its result.
 *
 * Sockets are only touched from that thread. Returns false when the task
 * did not finish within timeout or the context was stopped before running it.
 * Must not be called from the io thread itself.
 */
template <typename Task>
bool runOnIoThread(asio::io_context& ioContext, Task task, std::chrono::milliseconds timeout) {
    auto done = std::make_shared<std::promise<bool>>();
    std::future<bool> result = done->get_future();

    asio::post(ioContext, [done, task = std::move(task)]() mutable {
        done->set_value(task());
    });

    if (result.wait_for(timeout) != std::future_status::ready) {
        return false;
    }
    try {
        return result.get();
    } catch (const std::future_error&) {
        // Handler dropped with the context, never ran
        return false;
    }
}

} // namespace lansync
