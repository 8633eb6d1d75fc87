#include "../include/Discovery.hpp"
#include <algorithm>
#include <iostream>

namespace lansync {

std::string buildAnnouncement(const std::string& serverName, uint16_t gamePort) {
    // The separator cannot appear inside the name
    std::string name = serverName;
    std::replace(name.begin(), name.end(), DISCOVERY_SEPARATOR, '_');
    return std::string(RESPONSE_MAGIC) + DISCOVERY_SEPARATOR + name +
           DISCOVERY_SEPARATOR + std::to_string(gamePort);
}

std::optional<ServerAnnouncement> parseAnnouncement(const std::string& datagram) {
    const std::string prefix = std::string(RESPONSE_MAGIC) + DISCOVERY_SEPARATOR;
    if (datagram.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }

    std::string payload = datagram.substr(prefix.size());
    size_t sepPos = payload.find(DISCOVERY_SEPARATOR);
    if (sepPos == std::string::npos) {
        return std::nullopt;
    }

    std::string name = payload.substr(0, sepPos);
    std::string portStr = payload.substr(sepPos + 1);
    if (portStr.empty() || portStr.size() > 5 ||
        !std::all_of(portStr.begin(), portStr.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }

    int port = std::stoi(portStr);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }

    return ServerAnnouncement{name, static_cast<uint16_t>(port)};
}

// DiscoveryBroadcaster implementation
DiscoveryBroadcaster::DiscoveryBroadcaster(std::string serverName, uint16_t gamePort, SyncConfig config)
    : _serverName(std::move(serverName)),
      _gamePort(gamePort),
      _config(std::move(config)),
      _socket(_ioContext),
      _running(false),
      _heartbeatsSent(0) {
}

DiscoveryBroadcaster::~DiscoveryBroadcaster() {
    stop();
}

bool DiscoveryBroadcaster::start() {
    if (_running) {
        return true;
    }

    try {
        _target = asio::ip::udp::endpoint(
            asio::ip::make_address_v4(_config.broadcastAddress), _config.discoveryPort);

        _socket.open(asio::ip::udp::v4());
        _socket.set_option(asio::socket_base::broadcast(true));
        _socket.set_option(asio::socket_base::reuse_address(true));
    } catch (const std::exception& e) {
        std::cerr << "[Discovery] Failed to start broadcaster: " << e.what() << std::endl;
        std::error_code ignored;
        _socket.close(ignored);
        return false;
    }

    _running = true;
    _thread = std::thread(&DiscoveryBroadcaster::broadcastLoop, this);

    std::cout << "[Discovery] Broadcasting server '" << _serverName << "' (game port "
              << _gamePort << ") on " << _target.address().to_string() << ":"
              << _config.discoveryPort << std::endl;
    return true;
}

void DiscoveryBroadcaster::stop() {
    {
        std::lock_guard<std::mutex> lock(_wakeMutex);
        if (!_running && !_thread.joinable()) {
            return;
        }
        _running = false;
    }
    _wake.notify_all();

    if (_thread.joinable()) {
        _thread.join();
    }

    std::error_code ec;
    _socket.close(ec);
    std::cout << "[Discovery] Stopped broadcasting" << std::endl;
}

void DiscoveryBroadcaster::broadcastLoop() {
    const std::string datagram = buildAnnouncement(_serverName, _gamePort);

    while (_running) {
        std::error_code ec;
        _socket.send_to(asio::buffer(datagram), _target, 0, ec);
        if (ec) {
            std::cerr << "[Discovery] Broadcast error: " << ec.message() << std::endl;
        } else {
            _heartbeatsSent++;
        }

        std::unique_lock<std::mutex> lock(_wakeMutex);
        _wake.wait_for(lock, _config.heartbeatInterval, [this] { return !_running; });
    }
}

// DiscoveryListener implementation
DiscoveryListener::DiscoveryListener(SyncConfig config)
    : _config(std::move(config)),
      _socket(_ioContext),
      _running(false) {
}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

bool DiscoveryListener::start() {
    if (_running) {
        return true;
    }

    try {
        _socket.open(asio::ip::udp::v4());
        _socket.set_option(asio::socket_base::reuse_address(true));
        _socket.set_option(asio::socket_base::broadcast(true));
        _socket.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), _config.discoveryPort));
        _socket.non_blocking(true);
    } catch (const std::exception& e) {
        std::cerr << "[Discovery] Failed to start listener: " << e.what() << std::endl;
        std::error_code ignored;
        _socket.close(ignored);
        return false;
    }

    _running = true;
    _thread = std::thread(&DiscoveryListener::listenLoop, this);

    std::cout << "[Discovery] Listening for servers on port " << _config.discoveryPort << std::endl;
    return true;
}

void DiscoveryListener::stop() {
    {
        std::lock_guard<std::mutex> lock(_wakeMutex);
        if (!_running && !_thread.joinable()) {
            return;
        }
        _running = false;
    }
    _wake.notify_all();

    if (_thread.joinable()) {
        _thread.join();
    }

    std::error_code ec;
    _socket.close(ec);

    {
        std::lock_guard<std::mutex> lock(_serversMutex);
        _servers.clear();
    }
    std::cout << "[Discovery] Stopped listening" << std::endl;
}

void DiscoveryListener::listenLoop() {
    char buffer[1024];

    while (_running) {
        asio::ip::udp::endpoint sender;
        std::error_code ec;
        size_t length = _socket.receive_from(asio::buffer(buffer), sender, 0, ec);

        if (!ec) {
            handleDatagram(std::string(buffer, length), sender.address().to_string());
        } else if (ec == asio::error::would_block || ec == asio::error::try_again) {
            // Nothing pending: wait one receive timeout, or until stop()
            purgeStale();
            std::unique_lock<std::mutex> lock(_wakeMutex);
            _wake.wait_for(lock, _config.listenerTimeout, [this] { return !_running; });
            continue;
        } else if (_running) {
            std::cerr << "[Discovery] Listen error: " << ec.message() << std::endl;
        }

        purgeStale();
    }
}

void DiscoveryListener::handleDatagram(const std::string& datagram, const std::string& senderIp,
                                       Clock::time_point now) {
    auto announcement = parseAnnouncement(datagram);
    if (!announcement) {
        return;
    }

    std::lock_guard<std::mutex> lock(_serversMutex);
    auto it = _servers.find(senderIp);
    if (it == _servers.end()) {
        std::cout << "[Discovery] Found server '" << announcement->name << "' at "
                  << senderIp << ":" << announcement->port << std::endl;
    }
    _servers[senderIp] = DiscoveredServer{announcement->name, senderIp, announcement->port, now};
}

void DiscoveryListener::purgeStale(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(_serversMutex);
    for (auto it = _servers.begin(); it != _servers.end();) {
        if (now - it->second.lastSeen > _config.serverTtl) {
            std::cout << "[Discovery] Server '" << it->second.name << "' at "
                      << it->first << " timed out" << std::endl;
            it = _servers.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<DiscoveredServer> DiscoveryListener::getServers() const {
    std::lock_guard<std::mutex> lock(_serversMutex);
    std::vector<DiscoveredServer> servers;
    servers.reserve(_servers.size());
    for (const auto& [ip, server] : _servers) {
        servers.push_back(server);
    }
    return servers;
}

} // namespace lansync
