#pragma once

#include "Config.hpp"
#include "Connection.hpp"
#include "GameClient.hpp"
#include "Server.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lansync {

enum class NetworkRole {
    None,
    Host,
    Client
};

/**
 * @brief Entry point for the lobby/session logic.
 *
 * Owns either a Server (host role) or a GameClient (client role) and the
 * event queue both of them feed. Nothing here is fatal: setup failures come
 * back as NetResult, disconnects come back as events.
 */
class NetworkManager {
public:
    explicit NetworkManager(SyncConfig config = {});
    ~NetworkManager();

    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    // Host role. detail is "lan-ip:port" on success
    NetResult startHost(int maxPlayers);
    NetResult startHost() { return startHost(_config.maxPlayers); }

    // Client role, on config.gamePort unless a port is given
    NetResult connect(const std::string& hostIp);
    NetResult connect(const std::string& hostIp, uint16_t port);

    // Host: to one client slot. Client: slot is ignored, goes to the host.
    bool send(int slot, const Message& message);
    // Client: to the host
    bool send(const Message& message);
    // Host: to every client. A client whose write fails is dropped, the rest still get it.
    bool broadcast(const Message& message);

    // Drain everything received since the last call; never blocks
    std::vector<NetworkEvent> getMessages();

    // Close everything; safe to call twice
    void shutdown();

    NetworkRole role() const { return _role; }
    bool isHost() const { return _role == NetworkRole::Host; }
    bool isClient() const { return _role == NetworkRole::Client; }
    bool isConnected() const;
    // Host: clients + 1, client: -1 (unknown), none: 0
    int connectedPlayers() const;
    const std::string& localAddress() const { return _localAddress; }
    const SyncConfig& config() const { return _config; }

private:
    SyncConfig _config;
    NetworkRole _role;
    EventQueue _events;
    std::unique_ptr<Server> _server;
    std::unique_ptr<GameClient> _client;
    std::string _localAddress;
};

// LAN address of this machine as seen by peers, "127.0.0.1" when offline
std::string detectLocalAddress();

} // namespace lansync
