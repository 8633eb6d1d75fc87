#include "../include/NetworkManager.hpp"
#include <iostream>

namespace lansync {

std::string detectLocalAddress() {
    // Connecting a UDP socket sends nothing but picks the outgoing interface
    try {
        asio::io_context ioContext;
        asio::ip::udp::socket route(ioContext);
        route.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        return route.local_endpoint().address().to_string();
    } catch (const std::exception& e) {
        std::cerr << "[Host] Could not detect LAN address (" << e.what()
                  << "), using loopback" << std::endl;
        return "127.0.0.1";
    }
}

NetworkManager::NetworkManager(SyncConfig config)
    : _config(std::move(config)),
      _role(NetworkRole::None) {
}

NetworkManager::~NetworkManager() {
    shutdown();
}

NetResult NetworkManager::startHost(int maxPlayers) {
    if (_role != NetworkRole::None) {
        return {false, "network already active"};
    }

    _events.clear();
    _server = std::make_unique<Server>(_events, _config);
    NetResult result = _server->start(maxPlayers);
    if (!result.ok) {
        _server.reset();
        return result;
    }

    _role = NetworkRole::Host;
    _localAddress = detectLocalAddress() + ":" + std::to_string(_server->getPort());
    std::cout << "[Host] Host started on " << _localAddress << std::endl;
    return {true, _localAddress};
}

NetResult NetworkManager::connect(const std::string& hostIp) {
    return connect(hostIp, _config.gamePort);
}

NetResult NetworkManager::connect(const std::string& hostIp, uint16_t port) {
    if (_role != NetworkRole::None) {
        return {false, "network already active"};
    }

    _events.clear();
    _client = std::make_unique<GameClient>(_events, _config);
    NetResult result = _client->connect(hostIp, port);
    if (!result.ok) {
        _client.reset();
        return result;
    }

    _role = NetworkRole::Client;
    _localAddress = detectLocalAddress();
    return result;
}

bool NetworkManager::send(int slot, const Message& message) {
    switch (_role) {
        case NetworkRole::Host:
            return _server->send(slot, message);
        case NetworkRole::Client:
            return _client->send(message);
        case NetworkRole::None:
            break;
    }
    return false;
}

bool NetworkManager::send(const Message& message) {
    if (_role != NetworkRole::Client) {
        return false;
    }
    return _client->send(message);
}

bool NetworkManager::broadcast(const Message& message) {
    if (_role != NetworkRole::Host) {
        return false;
    }
    return _server->broadcast(message);
}

std::vector<NetworkEvent> NetworkManager::getMessages() {
    return _events.drain();
}

void NetworkManager::shutdown() {
    if (_server) {
        _server->stop();
        _server.reset();
    }
    if (_client) {
        _client->disconnect();
        _client.reset();
    }
    if (_role != NetworkRole::None) {
        std::cout << "[Network] Cleaned up" << std::endl;
    }
    _role = NetworkRole::None;
}

bool NetworkManager::isConnected() const {
    switch (_role) {
        case NetworkRole::Host:
            return _server->isRunning();
        case NetworkRole::Client:
            return _client->isConnected();
        case NetworkRole::None:
            break;
    }
    return false;
}

int NetworkManager::connectedPlayers() const {
    switch (_role) {
        case NetworkRole::Host:
            return static_cast<int>(_server->getClientCount()) + 1;
        case NetworkRole::Client:
            return -1;
        case NetworkRole::None:
            break;
    }
    return 0;
}

} // namespace lansync
