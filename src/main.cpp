#include "../include/Discovery.hpp"
#include "../include/NetworkManager.hpp"
#include "../include/Prediction.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <thread>

using namespace lansync;

namespace {

std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running = false;
}

// One head driven chain per participant, moved on a fixed cadence
struct DemoEntity {
    EntitySnapshot state;
    int moveTimer = 0;
};

constexpr int MOVE_INTERVAL_TICKS = 16;

DemoEntity makeEntity(int id, const GridSize& grid) {
    DemoEntity entity;
    entity.state.entityId = id;
    entity.state.facing = Direction::Right;
    entity.state.meta = 3;
    int row = (2 + id * 3) % grid.height;
    for (int i = 0; i < 3; ++i) {
        entity.state.positions.push_back(GridPos{(grid.width / 2 - i + grid.width) % grid.width, row});
    }
    return entity;
}

void stepWorld(std::map<int, DemoEntity>& entities, const GridSize& grid) {
    for (auto& [id, entity] : entities) {
        if (++entity.moveTimer < MOVE_INTERVAL_TICKS) {
            continue;
        }
        entity.moveTimer = 0;
        auto& chain = entity.state.positions;
        chain.insert(chain.begin(), stepCell(chain.front(), entity.state.facing, grid));
        chain.pop_back();
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <server_name> [key=value ...]" << std::endl;
        std::cerr << "Example: " << argv[0] << " MyGame game_port=5555 max_players=4" << std::endl;
        return 1;
    }

    const std::string serverName = argv[1];
    SyncConfig config;
    for (int i = 2; i < argc; ++i) {
        if (!applyOption(config, argv[i])) {
            return 1;
        }
    }
    std::cout << "[Host] " << describeConfig(config) << std::endl;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    NetworkManager network(config);
    NetResult started = network.startHost(config.maxPlayers);
    if (!started.ok) {
        std::cerr << "Error: could not start host: " << started.detail << std::endl;
        return 1;
    }

    DiscoveryBroadcaster broadcaster(serverName, config.gamePort, config);
    if (!broadcaster.start()) {
        std::cerr << "[Host] Discovery disabled, clients must connect to " << started.detail << std::endl;
    }

    std::map<int, DemoEntity> entities;
    entities.emplace(HOST_SLOT, makeEntity(HOST_SLOT, config.grid));

    const auto tickInterval = std::chrono::microseconds(1000000 / config.tickRate);
    auto nextTick = std::chrono::steady_clock::now();
    int64_t tick = 0;

    std::cout << "[Host] '" << serverName << "' is running, waiting for clients..." << std::endl;

    while (g_running) {
        for (auto& event : network.getMessages()) {
            if (auto* joined = std::get_if<PlayerJoined>(&event)) {
                entities.emplace(joined->slot, makeEntity(joined->slot, config.grid));
                network.send(joined->slot, PlayerAssignedMessage{joined->slot});
                network.broadcast(LobbyStateMessage{nlohmann::json::object(), network.connectedPlayers()});
            } else if (auto* left = std::get_if<PlayerLeft>(&event)) {
                entities.erase(left->slot);
                network.broadcast(LobbyStateMessage{nlohmann::json::object(), network.connectedPlayers()});
            } else if (auto* received = std::get_if<MessageReceived>(&event)) {
                if (auto* input = std::get_if<InputMessage>(&received->message)) {
                    // A client only steers its own entity
                    auto it = entities.find(received->slot);
                    if (it != entities.end() && input->entityId == received->slot) {
                        it->second.state.facing = input->direction;
                    }
                }
            }
        }

        stepWorld(entities, config.grid);

        WorldSnapshot snapshot;
        snapshot.tick = ++tick;
        for (const auto& [id, entity] : entities) {
            snapshot.entities.push_back(entity.state);
        }
        network.broadcast(WorldSnapshotMessage{snapshot});

        nextTick += tickInterval;
        std::this_thread::sleep_until(nextTick);
    }

    std::cout << "[Host] Shutting down..." << std::endl;
    broadcaster.stop();
    network.shutdown();
    return 0;
}
