#include "../include/GameClient.hpp"
#include <iostream>

namespace lansync {

GameClient::GameClient(EventQueue& events, SyncConfig config)
    : _events(events),
      _config(std::move(config)),
      _tcpSocket(_ioContext),
      _connected(false) {
}

GameClient::~GameClient() {
    disconnect();
}

NetResult GameClient::connect(const std::string& host, uint16_t port) {
    if (_connected) {
        return {false, "already connected to " + _hostAddress};
    }

    // A previous session may have been lost without disconnect()
    stopReceiveThread();

    try {
        std::cout << "[Client] Connecting to " << host << ":" << port << "..." << std::endl;
        asio::ip::tcp::resolver resolver(_ioContext);
        auto endpoints = resolver.resolve(host, std::to_string(port));

        std::error_code result = asio::error::would_block;
        asio::async_connect(_tcpSocket, endpoints,
            [&result](const std::error_code& ec, const asio::ip::tcp::endpoint& /*endpoint*/) {
                result = ec;
            });

        _ioContext.restart();
        _ioContext.run_for(_config.connectTimeout);

        if (result == asio::error::would_block) {
            // Cancel the pending connect and let its handler run before result goes away
            std::error_code ignored;
            _tcpSocket.close(ignored);
            _ioContext.restart();
            _ioContext.run();
            std::cerr << "[Client] Connection to " << host << ":" << port << " timed out" << std::endl;
            return {false, "connection timed out"};
        }
        if (result) {
            std::error_code ignored;
            _tcpSocket.close(ignored);
            std::cerr << "[Client] Connection failed: " << result.message() << std::endl;
            return {false, result.message()};
        }

        _tcpSocket.set_option(asio::ip::tcp::no_delay(true));
        // Writes are synchronous; non-blocking lets writeLine bound them by writeTimeout
        _tcpSocket.non_blocking(true);
    } catch (const std::exception& e) {
        std::error_code ignored;
        _tcpSocket.close(ignored);
        std::cerr << "[Client] Connection error: " << e.what() << std::endl;
        return {false, e.what()};
    }

    _hostAddress = host + ":" + std::to_string(port);
    _buffer.clear();
    _connected = true;

    _ioContext.restart();
    doRead();
    _receiveThread = std::thread([this] {
        try {
            _ioContext.run();
        } catch (const std::exception& e) {
            std::cerr << "[Client] Receive thread stopped: " << e.what() << std::endl;
        }
    });

    std::cout << "[Client] Connected to host at " << _hostAddress << std::endl;
    return {true, _hostAddress};
}

bool GameClient::send(const Message& message) {
    if (!_connected) {
        return false;
    }

    std::string record;
    try {
        record = encodeMessage(message);
    } catch (const MalformedMessage& e) {
        std::cerr << "[Client] Cannot encode " << messageTypeName(message) << ": " << e.what() << std::endl;
        return false;
    }

    return runOnIoThread(_ioContext, [this, record] {
        if (!_connected) {
            return false;
        }
        if (!writeRecord(record)) {
            markLost("send failed");
            return false;
        }
        return true;
    }, _config.writeTimeout * 2);
}

// Receive thread, or after it has been joined
bool GameClient::writeRecord(const std::string& record) {
    if (!_tcpSocket.is_open()) {
        return false;
    }
    std::error_code ec;
    if (!writeLine(_tcpSocket, record, _config.writeTimeout, ec)) {
        std::cerr << "[Client] Error sending to host: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

void GameClient::disconnect() {
    if (_connected) {
        const std::string goodbye = encodeMessage(DisconnectMessage{"client leaving"});
        runOnIoThread(_ioContext, [this, goodbye] {
            if (_connected) {
                writeRecord(goodbye);
                markLost("disconnected");
            }
            return true;
        }, _config.writeTimeout * 2);
    }

    stopReceiveThread();
    // The receive thread was gone before it could say goodbye
    markLost("disconnected");
}

void GameClient::stopReceiveThread() {
    _ioContext.stop();
    if (_receiveThread.joinable()) {
        _receiveThread.join();
    }
}

void GameClient::markLost(const std::string& reason) {
    // Only the first caller reports the loss
    if (!_connected.exchange(false)) {
        return;
    }

    std::error_code ec;
    _tcpSocket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    _tcpSocket.close(ec);

    std::cout << "[Client] Connection to " << _hostAddress << " lost: " << reason << std::endl;
    _events.push(ConnectionLost{reason});
}

void GameClient::doRead() {
    _tcpSocket.async_read_some(asio::buffer(_chunk),
        [this](std::error_code ec, std::size_t length) {
            onRead(ec, length);
        });
}

void GameClient::onRead(const std::error_code& ec, std::size_t length) {
    static const bool VERBOSE_LOGGING = false;

    // The socket was closed under a pending read
    if (!_connected) {
        return;
    }

    if (!ec) {
        _buffer.append(_chunk, length);
    }

    // Deliver whatever was complete before a close
    for (auto& message : decodeLines(_buffer.extractLines(), "Client")) {
        if (VERBOSE_LOGGING) {
            std::cout << "[Client] Host -> " << messageTypeName(message) << std::endl;
        }

        if (auto* ping = std::get_if<PingMessage>(&message)) {
            if (!writeRecord(encodeMessage(PongMessage{ping->timestamp}))) {
                markLost("send failed");
                return;
            }
        } else if (std::holds_alternative<DisconnectMessage>(message)) {
            markLost("host closed the session");
            return;
        } else {
            _events.push(MessageReceived{HOST_SLOT, std::move(message)});
        }
    }

    if (ec == asio::error::eof) {
        markLost("connection closed by host");
        return;
    }
    if (ec) {
        markLost(ec.message());
        return;
    }
    doRead();
}

} // namespace lansync
