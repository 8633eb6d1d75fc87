#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <thread>
#include <vector>

#include "Discovery.hpp"
#include "NetworkManager.hpp"
#include "Synchronizer.hpp"

namespace {

using namespace lansync;
using namespace std::chrono_literals;

SyncConfig configOnPort(uint16_t port) {
    SyncConfig config;
    config.gamePort = port;
    config.connectTimeout = std::chrono::milliseconds(1000);
    return config;
}

// Drain into collected until predicate holds or the deadline passes
bool waitFor(const std::function<std::vector<NetworkEvent>()>& drain,
             std::vector<NetworkEvent>& collected,
             const std::function<bool(const std::vector<NetworkEvent>&)>& predicate,
             std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        for (auto& event : drain()) {
            collected.push_back(std::move(event));
        }
        if (predicate(collected)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
}

template <typename T>
std::size_t countOf(const std::vector<NetworkEvent>& events) {
    std::size_t count = 0;
    for (const auto& event : events) {
        if (std::holds_alternative<T>(event)) {
            count++;
        }
    }
    return count;
}

template <typename M>
const M* findMessage(const std::vector<NetworkEvent>& events, int* slot = nullptr) {
    for (const auto& event : events) {
        if (auto* received = std::get_if<MessageReceived>(&event)) {
            if (auto* message = std::get_if<M>(&received->message)) {
                if (slot) {
                    *slot = received->slot;
                }
                return message;
            }
        }
    }
    return nullptr;
}

WorldSnapshot singleEntitySnapshot(int64_t tick, GridPos head) {
    WorldSnapshot snapshot;
    snapshot.tick = tick;
    EntitySnapshot entity;
    entity.entityId = 0;
    entity.positions = {head};
    entity.facing = Direction::Right;
    entity.active = true;
    snapshot.entities.push_back(entity);
    return snapshot;
}

TEST(EventQueue, DrainReturnsEventsInOrderAndEmpties) {
    EventQueue queue;
    queue.push(PlayerJoined{1, "10.0.0.2:4000"});
    queue.push(MessageReceived{1, ReadyMessage{}});
    queue.push(PlayerLeft{1});

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_TRUE(std::holds_alternative<PlayerJoined>(events[0]));
    EXPECT_TRUE(std::holds_alternative<MessageReceived>(events[1]));
    EXPECT_TRUE(std::holds_alternative<PlayerLeft>(events[2]));
    EXPECT_TRUE(queue.drain().empty());
}

TEST(LineBuffer, SplitsRecordsAcrossChunks) {
    LineBuffer buffer;
    const std::string first = "{\"type\":\"ready\"}\n{\"type\":";
    buffer.append(first.data(), first.size());

    auto lines = buffer.extractLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"type\":\"ready\"}");
    EXPECT_GT(buffer.pending(), 0u);

    const std::string second = "\"ping\",\"timestamp\":5}\r\n\n";
    buffer.append(second.data(), second.size());
    lines = buffer.extractLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"type\":\"ping\",\"timestamp\":5}");
    EXPECT_EQ(buffer.pending(), 0u);
}

TEST(DecodeLines, DropsMalformedRecords) {
    auto messages = decodeLines({"{\"type\":\"ready\"}", "not json", "{\"type\":\"warp\"}",
                                 "{\"type\":\"ping\",\"timestamp\":1}"}, "Test");
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<ReadyMessage>(messages[0]));
    EXPECT_TRUE(std::holds_alternative<PingMessage>(messages[1]));
}

TEST(RunOnIoThread, ReturnsTaskResultFromTheIoThread) {
    asio::io_context ioContext;
    auto guard = asio::make_work_guard(ioContext);
    std::thread runner([&] { ioContext.run(); });

    std::thread::id ranOn;
    EXPECT_TRUE(runOnIoThread(ioContext, [&] { ranOn = std::this_thread::get_id(); return true; }, 1000ms));
    EXPECT_EQ(ranOn, runner.get_id());
    EXPECT_FALSE(runOnIoThread(ioContext, [] { return false; }, 1000ms));

    guard.reset();
    ioContext.stop();
    runner.join();
}

TEST(RunOnIoThread, TimesOutWhenNothingRunsTheContext) {
    asio::io_context ioContext;
    bool ran = false;
    EXPECT_FALSE(runOnIoThread(ioContext, [&] { ran = true; return true; }, 50ms));
    EXPECT_FALSE(ran);
}

TEST(Network, ConnectToMissingHostFails) {
    NetworkManager client(configOnPort(47611));
    NetResult result = client.connect("127.0.0.1");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.detail.empty());
    EXPECT_EQ(client.role(), NetworkRole::None);
    EXPECT_EQ(client.connectedPlayers(), 0);
}

TEST(Network, ClientJoinsAndReceivesBroadcast) {
    NetworkManager host(configOnPort(47612));
    NetResult started = host.startHost(4);
    ASSERT_TRUE(started.ok) << started.detail;
    EXPECT_TRUE(host.isHost());

    NetworkManager client(configOnPort(47612));
    ASSERT_TRUE(client.connect("127.0.0.1").ok);
    EXPECT_TRUE(client.isClient());
    EXPECT_TRUE(client.isConnected());

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));
    EXPECT_EQ(std::get<PlayerJoined>(hostEvents.front()).slot, 1);
    EXPECT_EQ(host.connectedPlayers(), 2);

    host.broadcast(WorldSnapshotMessage{singleEntitySnapshot(7, {2, 2})});

    std::vector<NetworkEvent> clientEvents;
    ASSERT_TRUE(waitFor([&] { return client.getMessages(); }, clientEvents,
                        [](const auto& events) { return findMessage<WorldSnapshotMessage>(events) != nullptr; }));
    int slot = -1;
    const auto* update = findMessage<WorldSnapshotMessage>(clientEvents, &slot);
    EXPECT_EQ(slot, HOST_SLOT);
    EXPECT_EQ(update->snapshot.tick, 7);

    client.send(InputMessage{0, Direction::Up});
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return findMessage<InputMessage>(events) != nullptr; }));
    const auto* input = findMessage<InputMessage>(hostEvents, &slot);
    EXPECT_EQ(slot, 1);
    EXPECT_EQ(input->direction, Direction::Up);
}

TEST(Network, SlotsAreReusedAfterLeaving) {
    NetworkManager host(configOnPort(47613));
    ASSERT_TRUE(host.startHost(4).ok);

    auto first = std::make_unique<NetworkManager>(configOnPort(47613));
    NetworkManager second(configOnPort(47613));
    ASSERT_TRUE(first->connect("127.0.0.1").ok);

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));

    ASSERT_TRUE(second.connect("127.0.0.1").ok);
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 2; }));
    EXPECT_EQ(std::get<PlayerJoined>(hostEvents[1]).slot, 2);

    first.reset();
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerLeft>(events) == 1; }));

    NetworkManager third(configOnPort(47613));
    ASSERT_TRUE(third.connect("127.0.0.1").ok);
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 3; }));

    int lastJoined = -1;
    for (const auto& event : hostEvents) {
        if (auto* joined = std::get_if<PlayerJoined>(&event)) {
            lastJoined = joined->slot;
        }
    }
    EXPECT_EQ(lastJoined, 1);
}

TEST(Network, FullSessionRefusesExtraClient) {
    NetworkManager host(configOnPort(47614));
    ASSERT_TRUE(host.startHost(2).ok);

    NetworkManager first(configOnPort(47614));
    ASSERT_TRUE(first.connect("127.0.0.1").ok);
    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));

    NetworkManager extra(configOnPort(47614));
    extra.connect("127.0.0.1");

    std::vector<NetworkEvent> extraEvents;
    EXPECT_TRUE(waitFor([&] { return extra.getMessages(); }, extraEvents,
                        [](const auto& events) { return countOf<ConnectionLost>(events) == 1; }));

    waitFor([&] { return host.getMessages(); }, hostEvents,
            [](const auto&) { return false; }, 200ms);
    EXPECT_EQ(countOf<PlayerJoined>(hostEvents), 1u);
    EXPECT_EQ(host.connectedPlayers(), 2);
}

TEST(Network, PlannedDisconnectGivesOnePlayerLeft) {
    NetworkManager host(configOnPort(47615));
    ASSERT_TRUE(host.startHost(4).ok);

    NetworkManager client(configOnPort(47615));
    ASSERT_TRUE(client.connect("127.0.0.1").ok);

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));

    client.shutdown();
    client.shutdown();

    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerLeft>(events) >= 1; }));
    waitFor([&] { return host.getMessages(); }, hostEvents, [](const auto&) { return false; }, 200ms);

    EXPECT_EQ(countOf<PlayerLeft>(hostEvents), 1u);
    EXPECT_EQ(host.connectedPlayers(), 1);
}

TEST(Network, AbruptCloseGivesOnePlayerLeft) {
    EventQueue hostQueue;
    Server server(hostQueue, configOnPort(47616));
    ASSERT_TRUE(server.start(4).ok);

    {
        asio::io_context ioContext;
        asio::ip::tcp::socket raw(ioContext);
        raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 47616));

        std::vector<NetworkEvent> events;
        ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                            [](const auto& collected) { return countOf<PlayerJoined>(collected) == 1; }));

        // Half a record then a hard close
        const std::string partial = "{\"type\":\"rea";
        asio::write(raw, asio::buffer(partial));
    }

    std::vector<NetworkEvent> events;
    ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                        [](const auto& collected) { return countOf<PlayerLeft>(collected) >= 1; }));
    waitFor([&] { return hostQueue.drain(); }, events, [](const auto&) { return false; }, 200ms);

    EXPECT_EQ(countOf<PlayerLeft>(events), 1u);
    EXPECT_EQ(countOf<MessageReceived>(events), 0u);
    EXPECT_EQ(server.getClientCount(), 0u);
    server.stop();
}

TEST(Network, ResetPeerIsDroppedOnceWhileBroadcasting) {
    EventQueue hostQueue;
    Server server(hostQueue, configOnPort(47622));
    ASSERT_TRUE(server.start(4).ok);

    asio::io_context ioContext;
    asio::ip::tcp::socket raw(ioContext);
    raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 47622));

    std::vector<NetworkEvent> events;
    ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                        [](const auto& collected) { return countOf<PlayerJoined>(collected) == 1; }));

    NetworkManager survivor(configOnPort(47622));
    ASSERT_TRUE(survivor.connect("127.0.0.1").ok);
    ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                        [](const auto& collected) { return countOf<PlayerJoined>(collected) == 2; }));

    // Zero linger turns the close into a reset
    raw.set_option(asio::socket_base::linger(true, 0));
    std::error_code ec;
    raw.close(ec);

    for (int tick = 1; tick <= 50; ++tick) {
        EXPECT_TRUE(server.broadcast(WorldSnapshotMessage{singleEntitySnapshot(tick, {tick % 10, 0})}));
        for (auto& event : hostQueue.drain()) {
            events.push_back(std::move(event));
        }
        std::this_thread::sleep_for(5ms);
    }

    ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                        [](const auto& collected) { return countOf<PlayerLeft>(collected) >= 1; }));
    waitFor([&] { return hostQueue.drain(); }, events, [](const auto&) { return false; }, 200ms);

    ASSERT_EQ(countOf<PlayerLeft>(events), 1u);
    for (const auto& event : events) {
        if (auto* left = std::get_if<PlayerLeft>(&event)) {
            EXPECT_EQ(left->slot, 1);
        }
    }
    EXPECT_EQ(server.getClientCount(), 1u);
    EXPECT_EQ(server.getSlots(), std::vector<int>{2});

    std::vector<NetworkEvent> survivorEvents;
    ASSERT_TRUE(waitFor([&] { return survivor.getMessages(); }, survivorEvents,
                        [](const auto& collected) { return findMessage<WorldSnapshotMessage>(collected) != nullptr; }));
    EXPECT_TRUE(survivor.isConnected());
    EXPECT_EQ(countOf<ConnectionLost>(survivorEvents), 0u);

    survivor.shutdown();
    server.stop();
}

TEST(Network, MalformedLineDoesNotDropConnection) {
    EventQueue hostQueue;
    Server server(hostQueue, configOnPort(47617));
    ASSERT_TRUE(server.start(4).ok);

    asio::io_context ioContext;
    asio::ip::tcp::socket raw(ioContext);
    raw.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 47617));

    const std::string records = "garbage\n{\"type\":\"ready\"}\n";
    asio::write(raw, asio::buffer(records));

    std::vector<NetworkEvent> events;
    ASSERT_TRUE(waitFor([&] { return hostQueue.drain(); }, events,
                        [](const auto& collected) { return findMessage<ReadyMessage>(collected) != nullptr; }));
    EXPECT_EQ(countOf<PlayerLeft>(events), 0u);
    EXPECT_EQ(server.getClientCount(), 1u);

    std::error_code ec;
    raw.close(ec);
    server.stop();
}

TEST(Network, PingIsAnsweredAutomatically) {
    NetworkManager host(configOnPort(47618));
    ASSERT_TRUE(host.startHost(4).ok);
    NetworkManager client(configOnPort(47618));
    ASSERT_TRUE(client.connect("127.0.0.1").ok);

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));

    ASSERT_TRUE(client.send(PingMessage{1234}));
    std::vector<NetworkEvent> clientEvents;
    ASSERT_TRUE(waitFor([&] { return client.getMessages(); }, clientEvents,
                        [](const auto& events) { return findMessage<PongMessage>(events) != nullptr; }));
    EXPECT_EQ(findMessage<PongMessage>(clientEvents)->timestamp, 1234);

    ASSERT_TRUE(host.send(1, PingMessage{99}));
    int slot = -1;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return findMessage<PongMessage>(events) != nullptr; }));
    EXPECT_EQ(findMessage<PongMessage>(hostEvents, &slot)->timestamp, 99);
    EXPECT_EQ(slot, 1);
    EXPECT_EQ(findMessage<PingMessage>(hostEvents), nullptr);
}

TEST(Network, HostShutdownIsReportedOnceToClient) {
    NetworkManager host(configOnPort(47619));
    ASSERT_TRUE(host.startHost(4).ok);
    NetworkManager client(configOnPort(47619));
    ASSERT_TRUE(client.connect("127.0.0.1").ok);

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));

    host.shutdown();
    EXPECT_EQ(host.role(), NetworkRole::None);

    std::vector<NetworkEvent> clientEvents;
    ASSERT_TRUE(waitFor([&] { return client.getMessages(); }, clientEvents,
                        [](const auto& events) { return countOf<ConnectionLost>(events) >= 1; }));
    waitFor([&] { return client.getMessages(); }, clientEvents, [](const auto&) { return false; }, 200ms);

    EXPECT_EQ(countOf<ConnectionLost>(clientEvents), 1u);
    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(client.send(ReadyMessage{}));
}

TEST(Network, SecondRoleIsRejected) {
    NetworkManager host(configOnPort(47620));
    ASSERT_TRUE(host.startHost(4).ok);
    EXPECT_FALSE(host.startHost(4).ok);
    EXPECT_FALSE(host.connect("127.0.0.1").ok);
    EXPECT_FALSE(host.send(ReadyMessage{}));
}

TEST(Network, DiscoverConnectAndRenderFirstSnapshot) {
    SyncConfig config = configOnPort(47621);
    config.discoveryPort = 50733;
    config.broadcastAddress = "127.0.0.1";
    config.heartbeatInterval = std::chrono::milliseconds(100);
    config.listenerTimeout = std::chrono::milliseconds(50);

    NetworkManager host(config);
    ASSERT_TRUE(host.startHost(4).ok);
    DiscoveryBroadcaster broadcaster("TestServer", config.gamePort, config);
    ASSERT_TRUE(broadcaster.start());

    DiscoveryListener listener(config);
    ASSERT_TRUE(listener.start());
    std::vector<DiscoveredServer> servers;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (servers.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
        servers = listener.getServers();
    }
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers.front().name, "TestServer");
    EXPECT_EQ(servers.front().port, config.gamePort);

    NetworkManager client(config);
    ASSERT_TRUE(client.connect(servers.front().ip, servers.front().port).ok);

    std::vector<NetworkEvent> hostEvents;
    ASSERT_TRUE(waitFor([&] { return host.getMessages(); }, hostEvents,
                        [](const auto& events) { return countOf<PlayerJoined>(events) == 1; }));
    EXPECT_EQ(std::get<PlayerJoined>(hostEvents.front()).slot, 1);

    host.broadcast(WorldSnapshotMessage{singleEntitySnapshot(10, {3, 3})});

    std::vector<NetworkEvent> clientEvents;
    ASSERT_TRUE(waitFor([&] { return client.getMessages(); }, clientEvents,
                        [](const auto& events) { return findMessage<WorldSnapshotMessage>(events) != nullptr; }));

    Synchronizer sync(config);
    const auto& snapshot = findMessage<WorldSnapshotMessage>(clientEvents)->snapshot;
    ASSERT_TRUE(sync.ingest(snapshot, snapshot.tick));

    auto positions = sync.positionsFor(0, 16);
    ASSERT_TRUE(positions.has_value());
    ASSERT_EQ(positions->size(), 1u);
    EXPECT_DOUBLE_EQ((*positions)[0].x, 3.0);
    EXPECT_DOUBLE_EQ((*positions)[0].y, 3.0);

    broadcaster.stop();
    listener.stop();
}

} // namespace
