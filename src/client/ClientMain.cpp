#include "../../include/Discovery.hpp"
#include "../../include/NetworkManager.hpp"
#include "../../include/Synchronizer.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <thread>

using namespace lansync;

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

// Wait for the first announced server, up to timeout
std::optional<DiscoveredServer> discoverServer(const SyncConfig& config, std::chrono::seconds timeout) {
    DiscoveryListener listener(config);
    if (!listener.start()) {
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        auto servers = listener.getServers();
        if (!servers.empty()) {
            for (const auto& server : servers) {
                std::cout << "[Client] Found '" << server.name << "' at "
                          << server.ip << ":" << server.port << std::endl;
            }
            return servers.front();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return std::nullopt;
}

void printPositions(int entityId, const std::vector<RenderPos>& positions) {
    std::cout << "[Client] Entity " << entityId << ":";
    std::cout << std::fixed << std::setprecision(2);
    for (const auto& pos : positions) {
        std::cout << " (" << pos.x << ", " << pos.y << ")";
    }
    std::cout << std::defaultfloat << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    SyncConfig config;
    std::string hostIp;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find('=') == std::string::npos && hostIp.empty()) {
            hostIp = arg;
        } else if (!applyOption(config, arg)) {
            std::cerr << "Usage: " << argv[0] << " [host_ip] [key=value ...]" << std::endl;
            return 1;
        }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    uint16_t port = config.gamePort;
    if (hostIp.empty()) {
        std::cout << "[Client] Searching for servers on the LAN..." << std::endl;
        auto server = discoverServer(config, std::chrono::seconds(10));
        if (!server) {
            std::cerr << "Error: no server found" << std::endl;
            return 1;
        }
        hostIp = server->ip;
        port = server->port;
    }

    NetworkManager network(config);
    NetResult connected = network.connect(hostIp, port);
    if (!connected.ok) {
        std::cerr << "Error: " << connected.detail << std::endl;
        return 1;
    }
    network.send(ReadyMessage{});

    Synchronizer sync(config);
    std::optional<int> myEntity;
    auto lastReport = std::chrono::steady_clock::now();
    bool wasStale = false;

    while (g_running) {
        for (auto& event : network.getMessages()) {
            if (auto* lost = std::get_if<ConnectionLost>(&event)) {
                std::cerr << "[Client] Disconnected: " << lost->reason << std::endl;
                g_running = false;
                continue;
            }

            auto* received = std::get_if<MessageReceived>(&event);
            if (!received) {
                continue;
            }

            if (auto* update = std::get_if<WorldSnapshotMessage>(&received->message)) {
                sync.ingest(update->snapshot, update->snapshot.tick);
            } else if (auto* assigned = std::get_if<PlayerAssignedMessage>(&received->message)) {
                myEntity = assigned->entityId;
                std::cout << "[Client] Controlling entity " << assigned->entityId << std::endl;
            } else if (auto* lobby = std::get_if<LobbyStateMessage>(&received->message)) {
                std::cout << "[Client] Players in session: " << lobby->connectedCount << std::endl;
            } else if (auto* pong = std::get_if<PongMessage>(&received->message)) {
                std::cout << "[Client] Round trip: " << (currentTimestampMs() - pong->timestamp)
                          << " ms" << std::endl;
            } else if (std::holds_alternative<GameStartMessage>(received->message) ||
                       std::holds_alternative<ReturnToLobbyMessage>(received->message)) {
                sync.reset();
            }
        }

        bool stale = sync.isStale();
        if (stale != wasStale) {
            std::cout << (stale ? "[Client] Waiting for host..." : "[Client] Receiving updates") << std::endl;
            wasStale = stale;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastReport >= std::chrono::seconds(1)) {
            lastReport = now;
            if (myEntity) {
                if (auto positions = sync.positionsFor(*myEntity)) {
                    printPositions(*myEntity, *positions);
                }
            }
            network.send(PingMessage{currentTimestampMs()});
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    network.shutdown();
    return 0;
}
