#pragma once

#include "Config.hpp"
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lansync {

using Clock = std::chrono::steady_clock;

// Datagram prefixes, so unrelated broadcast traffic on the same port is ignored
constexpr const char* DISCOVERY_MAGIC = "LANSYNC_DISCOVER_V1";
constexpr const char* RESPONSE_MAGIC = "LANSYNC_RESPONSE_V1";
constexpr char DISCOVERY_SEPARATOR = '|';

struct ServerAnnouncement {
    std::string name;
    uint16_t port;
};

// "<RESPONSE_MAGIC>|<name>|<port>"
std::string buildAnnouncement(const std::string& serverName, uint16_t gamePort);

// nullopt for anything that is not a well formed announcement
std::optional<ServerAnnouncement> parseAnnouncement(const std::string& datagram);

struct DiscoveredServer {
    std::string name;
    std::string ip;
    uint16_t port;
    Clock::time_point lastSeen;
};

/**
 * @brief Host side: announces the game on the LAN every heartbeat interval.
 *
 * The heartbeat runs on its own thread; start() and stop() never block
 * longer than one thread join.
 */
class DiscoveryBroadcaster {
public:
    DiscoveryBroadcaster(std::string serverName, uint16_t gamePort, SyncConfig config = {});
    ~DiscoveryBroadcaster();

    DiscoveryBroadcaster(const DiscoveryBroadcaster&) = delete;
    DiscoveryBroadcaster& operator=(const DiscoveryBroadcaster&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return _running; }
    std::size_t heartbeatsSent() const { return _heartbeatsSent; }

private:
    void broadcastLoop();

    std::string _serverName;
    uint16_t _gamePort;
    SyncConfig _config;

    asio::io_context _ioContext;
    asio::ip::udp::socket _socket;
    asio::ip::udp::endpoint _target;

    std::atomic<bool> _running;
    std::atomic<std::size_t> _heartbeatsSent;
    std::thread _thread;
    std::mutex _wakeMutex;
    std::condition_variable _wake;
};

/**
 * @brief Client side: collects announcements into a TTL cache keyed by IP.
 */
class DiscoveryListener {
public:
    explicit DiscoveryListener(SyncConfig config = {});
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return _running; }

    // Copy of the live servers, safe to call from any thread
    std::vector<DiscoveredServer> getServers() const;

    // One received datagram; malformed payloads are skipped
    void handleDatagram(const std::string& datagram, const std::string& senderIp,
                        Clock::time_point now = Clock::now());

    // Drop servers not seen for longer than the TTL
    void purgeStale(Clock::time_point now = Clock::now());

private:
    void listenLoop();

    SyncConfig _config;

    asio::io_context _ioContext;
    asio::ip::udp::socket _socket;

    std::atomic<bool> _running;
    std::thread _thread;
    std::mutex _wakeMutex;
    std::condition_variable _wake;

    mutable std::mutex _serversMutex;
    std::unordered_map<std::string, DiscoveredServer> _servers;
};

} // namespace lansync
