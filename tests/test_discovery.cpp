#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "Discovery.hpp"

namespace {

using namespace lansync;
using namespace std::chrono_literals;

SyncConfig loopbackConfig(uint16_t discoveryPort) {
    SyncConfig config;
    config.discoveryPort = discoveryPort;
    config.broadcastAddress = "127.0.0.1";
    config.heartbeatInterval = std::chrono::milliseconds(100);
    config.listenerTimeout = std::chrono::milliseconds(50);
    return config;
}

TEST(Announcement, BuildAndParse) {
    std::string datagram = buildAnnouncement("Game Room", 5555);
    EXPECT_EQ(datagram, "LANSYNC_RESPONSE_V1|Game Room|5555");

    auto parsed = parseAnnouncement(datagram);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "Game Room");
    EXPECT_EQ(parsed->port, 5555);
}

TEST(Announcement, SeparatorInNameIsReplaced) {
    auto parsed = parseAnnouncement(buildAnnouncement("a|b", 6000));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->name, "a_b");
    EXPECT_EQ(parsed->port, 6000);
}

TEST(Announcement, RejectsMalformedDatagrams) {
    EXPECT_FALSE(parseAnnouncement("").has_value());
    EXPECT_FALSE(parseAnnouncement("hello").has_value());
    EXPECT_FALSE(parseAnnouncement(DISCOVERY_MAGIC).has_value());
    EXPECT_FALSE(parseAnnouncement("OTHER_GAME|Room|5555").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room|").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room|port").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room|0").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room|70000").has_value());
    EXPECT_FALSE(parseAnnouncement("LANSYNC_RESPONSE_V1|Room|-1").has_value());
}

TEST(DiscoveryListener, CachesServersByAddress) {
    DiscoveryListener listener;
    const auto t0 = Clock::now();

    listener.handleDatagram(buildAnnouncement("Room", 5555), "192.168.1.20", t0);
    listener.handleDatagram(buildAnnouncement("Renamed", 5556), "192.168.1.20", t0 + 1s);
    listener.handleDatagram(buildAnnouncement("Other", 5555), "192.168.1.21", t0 + 1s);

    auto servers = listener.getServers();
    ASSERT_EQ(servers.size(), 2u);
    for (const auto& server : servers) {
        if (server.ip == "192.168.1.20") {
            EXPECT_EQ(server.name, "Renamed");
            EXPECT_EQ(server.port, 5556);
        } else {
            EXPECT_EQ(server.ip, "192.168.1.21");
            EXPECT_EQ(server.name, "Other");
        }
    }
}

TEST(DiscoveryListener, IgnoresForeignTraffic) {
    DiscoveryListener listener;
    listener.handleDatagram(DISCOVERY_MAGIC, "10.0.0.5");
    listener.handleDatagram("garbage", "10.0.0.6");
    listener.handleDatagram("LANSYNC_RESPONSE_V1|Room|abc", "10.0.0.7");
    EXPECT_TRUE(listener.getServers().empty());
}

TEST(DiscoveryListener, ServersExpireAfterTtl) {
    DiscoveryListener listener;
    const auto t0 = Clock::now();
    listener.handleDatagram(buildAnnouncement("Room", 5555), "10.0.0.2", t0);

    listener.purgeStale(t0 + 4s);
    EXPECT_EQ(listener.getServers().size(), 1u);

    listener.purgeStale(t0 + 5s + 1ms);
    EXPECT_TRUE(listener.getServers().empty());
}

TEST(DiscoveryListener, RegularHeartbeatsKeepServerListed) {
    DiscoveryListener listener;
    const auto t0 = Clock::now();

    for (int second = 0; second <= 20; ++second) {
        auto now = t0 + std::chrono::seconds(second);
        listener.handleDatagram(buildAnnouncement("Room", 5555), "10.0.0.2", now);
        listener.purgeStale(now);
        EXPECT_EQ(listener.getServers().size(), 1u);
    }
}

TEST(Discovery, ListenerFindsBroadcasterOnLoopback) {
    SyncConfig config = loopbackConfig(50731);

    DiscoveryListener listener(config);
    ASSERT_TRUE(listener.start());

    DiscoveryBroadcaster broadcaster("Loopback Room", 6123, config);
    ASSERT_TRUE(broadcaster.start());

    std::vector<DiscoveredServer> servers;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (servers.empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
        servers = listener.getServers();
    }

    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers.front().name, "Loopback Room");
    EXPECT_EQ(servers.front().ip, "127.0.0.1");
    EXPECT_EQ(servers.front().port, 6123);
    EXPECT_GE(broadcaster.heartbeatsSent(), 1u);

    broadcaster.stop();
    EXPECT_FALSE(broadcaster.isRunning());
    listener.stop();
    EXPECT_TRUE(listener.getServers().empty());
}

TEST(Discovery, StopIsPromptAndIdempotent) {
    SyncConfig config = loopbackConfig(50732);
    config.heartbeatInterval = std::chrono::milliseconds(5000);

    DiscoveryBroadcaster broadcaster("Room", 6124, config);
    ASSERT_TRUE(broadcaster.start());
    std::this_thread::sleep_for(20ms);

    auto before = std::chrono::steady_clock::now();
    broadcaster.stop();
    broadcaster.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 1s);
}

} // namespace
