#include "../include/Server.hpp"
#include <iostream>

namespace lansync {

Server::Server(EventQueue& events, SyncConfig config)
    : _events(events),
      _config(std::move(config)),
      _maxPlayers(_config.maxPlayers),
      _port(0),
      _acceptor(_ioContext),
      _running(false) {
}

Server::~Server() {
    stop();
}

NetResult Server::start(int maxPlayers) {
    if (_running) {
        return {false, "host already running"};
    }
    if (maxPlayers < 2) {
        return {false, "max players must be at least 2"};
    }
    _maxPlayers = maxPlayers;

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), _config.gamePort);
        _acceptor.open(endpoint.protocol());
        _acceptor.set_option(asio::socket_base::reuse_address(true));
        _acceptor.bind(endpoint);
        _acceptor.listen();
        _port = _acceptor.local_endpoint().port();
    } catch (const std::exception& e) {
        std::cerr << "[Host] Failed to start host: " << e.what() << std::endl;
        std::error_code ignored;
        _acceptor.close(ignored);
        return {false, e.what()};
    }

    _ioContext.restart();
    _running = true;
    doAccept();

    _pumpThread = std::thread([this] {
        try {
            _ioContext.run();
        } catch (const std::exception& e) {
            std::cerr << "[Host] Pump stopped: " << e.what() << std::endl;
        }
    });

    std::cout << "[Host] Listening on TCP port " << _port
              << " (up to " << (_maxPlayers - 1) << " clients)" << std::endl;
    return {true, std::to_string(_port)};
}

void Server::stop() {
    bool wasRunning = _running.exchange(false);

    if (wasRunning) {
        // Say goodbye from the pump thread while it still runs
        const std::string goodbye = encodeMessage(DisconnectMessage{"host shutting down"});
        runOnIoThread(_ioContext, [this, goodbye] {
            std::error_code ec;
            _acceptor.close(ec);
            for (int slot : getSlots()) {
                auto it = _connections.find(slot);
                if (it != _connections.end()) {
                    writeTo(*it->second, goodbye);
                }
                removeConnection(slot, "host shutting down");
            }
            return true;
        }, _config.writeTimeout * (_maxPlayers + 1));
        _ioContext.stop();
    }

    if (_pumpThread.joinable()) {
        _pumpThread.join();
    }

    // The pump is gone: whatever it did not get to is closed here
    for (int slot : getSlots()) {
        removeConnection(slot, "host shutting down");
    }
    std::error_code ec;
    _acceptor.close(ec);

    if (wasRunning) {
        std::cout << "[Host] Stopped" << std::endl;
    }
}

void Server::doAccept() {
    _acceptor.async_accept(
        [this](std::error_code ec, asio::ip::tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !_running || !_acceptor.is_open()) {
                return;
            }
            if (ec) {
                std::cerr << "[Host] Accept error: " << ec.message() << std::endl;
                doAccept();
                return;
            }

            auto remote = socket.remote_endpoint(ec);
            std::string address = ec ? "unknown"
                                     : remote.address().to_string() + ":" + std::to_string(remote.port());

            int slot = allocateSlot();
            if (slot < 0) {
                std::cout << "[Host] Rejected " << address << ": session is full" << std::endl;
                socket.close(ec);
                doAccept();
                return;
            }

            // Writes are synchronous; non-blocking lets writeLine bound them by writeTimeout
            socket.non_blocking(true, ec);
            if (!ec) {
                socket.set_option(asio::ip::tcp::no_delay(true), ec);
            }
            if (ec) {
                std::cerr << "[Host] Could not configure socket for " << address
                          << ": " << ec.message() << std::endl;
                socket.close(ec);
                doAccept();
                return;
            }

            auto connection = std::make_shared<Connection>(std::move(socket), address, slot);
            size_t clients = 0;
            {
                std::lock_guard<std::mutex> lock(_connectionsMutex);
                _connections.emplace(slot, connection);
                clients = _connections.size();
            }
            std::cout << "[Host] Client #" << slot << " connected from " << address
                      << " (clients: " << clients << ")" << std::endl;
            _events.push(PlayerJoined{slot, address});

            doRead(connection);
            doAccept();
        });
}

void Server::doRead(ConnectionPtr connection) {
    connection->socket.async_read_some(
        asio::buffer(connection->chunk),
        [this, connection](std::error_code ec, std::size_t length) {
            onRead(connection, ec, length);
        });
}

void Server::onRead(const ConnectionPtr& connection, const std::error_code& ec, std::size_t length) {
    static const bool VERBOSE_LOGGING = false;

    // Removed while the read was pending (send failure, shutdown)
    if (!isLive(connection)) {
        return;
    }

    if (!ec) {
        connection->buffer.append(connection->chunk, length);
    }

    // Records that arrived before a close are still delivered
    for (auto& message : decodeLines(connection->buffer.extractLines(), "Host")) {
        if (VERBOSE_LOGGING) {
            std::cout << "[Host] Client #" << connection->slot << " -> "
                      << messageTypeName(message) << std::endl;
        }
        handleMessage(*connection, std::move(message));
        if (!isLive(connection)) {
            return;
        }
    }

    if (ec == asio::error::eof) {
        removeConnection(connection->slot, "connection closed by peer");
        return;
    }
    if (ec) {
        removeConnection(connection->slot, ec.message());
        return;
    }
    doRead(connection);
}

void Server::handleMessage(Connection& connection, Message message) {
    if (auto* ping = std::get_if<PingMessage>(&message)) {
        if (!writeTo(connection, encodeMessage(PongMessage{ping->timestamp}))) {
            removeConnection(connection.slot, "send failed");
        }
        return;
    }
    if (std::holds_alternative<DisconnectMessage>(message)) {
        removeConnection(connection.slot, "client disconnected");
        return;
    }
    _events.push(MessageReceived{connection.slot, std::move(message)});
}

bool Server::writeTo(Connection& connection, const std::string& record) {
    std::error_code ec;
    if (!writeLine(connection.socket, record, _config.writeTimeout, ec)) {
        std::cerr << "[Host] Error writing to client #" << connection.slot
                  << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

// Pump thread
bool Server::writeToSlot(int slot, const std::string& record) {
    auto it = _connections.find(slot);
    if (it == _connections.end()) {
        return false;
    }
    if (!writeTo(*it->second, record)) {
        removeConnection(slot, "send failed");
        return false;
    }
    return true;
}

// Pump thread. A failing client is pruned, the others still get the record.
void Server::writeToAll(const std::string& record) {
    std::vector<int> failed;
    for (auto& [slot, connection] : _connections) {
        if (!writeTo(*connection, record)) {
            failed.push_back(slot);
        }
    }
    for (int slot : failed) {
        removeConnection(slot, "send failed");
    }
}

bool Server::send(int slot, const Message& message) {
    if (!_running) {
        return false;
    }

    std::string record;
    try {
        record = encodeMessage(message);
    } catch (const MalformedMessage& e) {
        std::cerr << "[Host] Cannot encode " << messageTypeName(message) << ": " << e.what() << std::endl;
        return false;
    }

    return runOnIoThread(_ioContext, [this, slot, record] {
        return writeToSlot(slot, record);
    }, _config.writeTimeout * (_maxPlayers + 1));
}

bool Server::broadcast(const Message& message) {
    if (!_running) {
        return false;
    }

    std::string record;
    try {
        record = encodeMessage(message);
    } catch (const MalformedMessage& e) {
        std::cerr << "[Host] Cannot encode " << messageTypeName(message) << ": " << e.what() << std::endl;
        return false;
    }

    return runOnIoThread(_ioContext, [this, record] {
        writeToAll(record);
        return true;
    }, _config.writeTimeout * (_maxPlayers + 1));
}

void Server::removeConnection(int slot, const std::string& reason) {
    ConnectionPtr connection;
    size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(_connectionsMutex);
        auto it = _connections.find(slot);
        if (it == _connections.end()) {
            return;
        }
        connection = it->second;
        _connections.erase(it);
        remaining = _connections.size();
    }

    std::error_code ec;
    connection->socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    connection->socket.close(ec);

    std::cout << "[Host] Client #" << slot << " left (" << reason << ", clients: "
              << remaining << ")" << std::endl;
    _events.push(PlayerLeft{slot});
}

bool Server::isLive(const ConnectionPtr& connection) const {
    auto it = _connections.find(connection->slot);
    return it != _connections.end() && it->second == connection;
}

// Lowest free slot, or -1 when every client slot is taken
int Server::allocateSlot() const {
    for (int slot = 1; slot < _maxPlayers; ++slot) {
        if (_connections.find(slot) == _connections.end()) {
            return slot;
        }
    }
    return -1;
}

size_t Server::getClientCount() const {
    std::lock_guard<std::mutex> lock(_connectionsMutex);
    return _connections.size();
}

std::vector<int> Server::getSlots() const {
    std::lock_guard<std::mutex> lock(_connectionsMutex);
    std::vector<int> slots;
    for (const auto& [slot, connection] : _connections) {
        slots.push_back(slot);
    }
    return slots;
}

} // namespace lansync
