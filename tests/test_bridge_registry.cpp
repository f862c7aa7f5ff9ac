// =============================================================================
// SimPilot - BridgeRegistry Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "bridge/bridge_registry.hpp"

#include <map>
#include <vector>

using namespace simpilot;
using namespace simpilot::bridge;
using simpilot::fakes::FakeTransport;
using simpilot::fakes::scriptSession;

namespace {

class BridgeRegistryTest : public ::testing::Test {
protected:
    BridgeRegistryTest() {
        config.agent.host = "agent-host";
        config.agent.port = 8100;
        config.agent.timeout_ms = 4000;
        config.device_ports["SIM-B"] = 8102;
    }

    // 生成された Transport を host:port ごとに記録
    BridgeRegistry::TransportFactory factory() {
        return [this](const std::string& host, int port) {
            auto t = std::make_shared<FakeTransport>();
            scriptSession(*t, "S-" + std::to_string(port));
            created.emplace_back(host, port);
            transports[port] = t;
            return t;
        };
    }

    config::AppConfig config;
    std::vector<std::pair<std::string, int>> created;
    std::map<int, std::shared_ptr<FakeTransport>> transports;
};

} // namespace

TEST_F(BridgeRegistryTest, GetOrCreateReusesBridge) {
    BridgeRegistry registry(config, factory());

    auto a1 = registry.getOrCreate("SIM-A");
    auto a2 = registry.getOrCreate("SIM-A");
    EXPECT_EQ(a1.get(), a2.get());
    EXPECT_EQ(registry.size(), 1u);
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0].first, "agent-host");
    EXPECT_EQ(created[0].second, 8100);
}

TEST_F(BridgeRegistryTest, PerDevicePort) {
    BridgeRegistry registry(config, factory());
    registry.getOrCreate("SIM-A");
    registry.getOrCreate("SIM-B");

    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[1].second, 8102);
}

TEST_F(BridgeRegistryTest, TimeoutFromConfig) {
    BridgeRegistry registry(config, factory());
    auto bridge = registry.getOrCreate("SIM-A");
    ASSERT_TRUE(bridge->start().is_ok());
    EXPECT_EQ(transports[8100]->calls()[0].timeout, std::chrono::milliseconds(4000));
}

TEST_F(BridgeRegistryTest, FindMissingReturnsNull) {
    BridgeRegistry registry(config, factory());
    EXPECT_EQ(registry.find("nope"), nullptr);
    registry.getOrCreate("SIM-A");
    EXPECT_NE(registry.find("SIM-A"), nullptr);
}

TEST_F(BridgeRegistryTest, RemoveStopsBridge) {
    BridgeRegistry registry(config, factory());
    auto bridge = registry.getOrCreate("SIM-A");
    ASSERT_TRUE(bridge->start().is_ok());

    EXPECT_TRUE(registry.remove("SIM-A"));
    EXPECT_EQ(bridge->state(), BridgeState::Disconnected);
    EXPECT_EQ(transports[8100]->countOf("DELETE", "/session/S-8100"), 1u);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.remove("SIM-A"));
}

TEST_F(BridgeRegistryTest, ListReportsAllBridges) {
    BridgeRegistry registry(config, factory());
    registry.getOrCreate("SIM-A");
    ASSERT_TRUE(registry.getOrCreate("SIM-B")->start().is_ok());

    auto statuses = registry.list();
    ASSERT_EQ(statuses.size(), 2u);
    EXPECT_EQ(statuses[0].device_id, "SIM-A");
    EXPECT_EQ(statuses[0].state, BridgeState::Disconnected);
    EXPECT_EQ(statuses[1].device_id, "SIM-B");
    EXPECT_EQ(statuses[1].state, BridgeState::Active);
    EXPECT_EQ(statuses[1].session_id, "S-8102");
}

TEST_F(BridgeRegistryTest, ChangeCallbackForwardsTransitions) {
    BridgeRegistry registry(config, factory());
    std::vector<std::string> events;
    registry.setChangeCallback([&events](const std::string& id, BridgeState, BridgeState to) {
        events.push_back(id + ":" + bridgeStateName(to));
    });

    ASSERT_TRUE(registry.getOrCreate("SIM-A")->start().is_ok());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "SIM-A:connecting");
    EXPECT_EQ(events[1], "SIM-A:active");

    registry.setChangeCallback(nullptr);
}

TEST_F(BridgeRegistryTest, DestructorStopsActiveBridges) {
    std::shared_ptr<Bridge> bridge;
    {
        BridgeRegistry registry(config, factory());
        bridge = registry.getOrCreate("SIM-A");
        ASSERT_TRUE(bridge->start().is_ok());
    }
    EXPECT_EQ(bridge->state(), BridgeState::Disconnected);
}
