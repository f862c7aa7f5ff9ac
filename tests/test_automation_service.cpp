// =============================================================================
// SimPilot - Automation Service Tests (fake agent + scripted simctl)
// =============================================================================

#include <gtest/gtest.h>
#include "service_harness.hpp"
#include "base64.hpp"

#include <filesystem>

using namespace simpilot;
using simpilot::fakes::ServiceHarness;
using simpilot::fakes::wdaValue;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

json sourceTree() {
    return wdaValue({
        {"type", "XCUIElementTypeApplication"},
        {"label", "Demo"},
        {"rect", {{"x", 0}, {"y", 0}, {"width", 390}, {"height", 844}}},
        {"children", json::array({
            {{"type", "XCUIElementTypeButton"}, {"label", "Login"},
             {"rect", {{"x", 20}, {"y", 100}, {"width", 100}, {"height", 40}}}},
            {{"type", "XCUIElementTypeStaticText"}, {"label", "Welcome"},
             {"rect", {{"x", 20}, {"y", 40}, {"width", 200}, {"height", 20}}}},
        })},
    });
}

class AutomationServiceTest : public ::testing::Test {
protected:
    ServiceHarness harness{"service"};
    AutomationService& service = harness.service();
};

} // namespace

// =============================================================================
// Bridge lifecycle
// =============================================================================

TEST_F(AutomationServiceTest, StartBridgeReportsStatus) {
    harness.prepare("SIM-1");
    auto r = service.startBridge("SIM-1");
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["state"], "active");
    EXPECT_EQ(r.value()["session_id"], "S-SIM-1");
    EXPECT_EQ(r.value()["device_id"], "SIM-1");
}

TEST_F(AutomationServiceTest, InvalidDeviceIdRejected) {
    auto r = service.startBridge("bad id;");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(harness.bridges().size(), 0u);
}

TEST_F(AutomationServiceTest, AgentOperationWithoutBridge) {
    auto r = service.tap("SIM-1", 10, 20);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);
    EXPECT_NE(r.error().message.find("start the bridge first"), std::string::npos);
}

TEST_F(AutomationServiceTest, TapGoesThroughBridge) {
    auto t = harness.prepare("SIM-1");
    t->reply("POST", "/session/S-SIM-1/actions", 200, wdaValue(nullptr));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.tap("SIM-1", 10, 20);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value(), okPayload());
    EXPECT_EQ(t->countOf("POST", "/session/S-SIM-1/actions"), 1u);
}

TEST_F(AutomationServiceTest, StopBridgeDeletesSession) {
    auto t = harness.prepare("SIM-1");
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.stopBridge("SIM-1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value()["stopped"], true);
    EXPECT_EQ(t->countOf("DELETE", "/session/S-SIM-1"), 1u);
    EXPECT_EQ(service.stopBridge("SIM-1").value()["stopped"], false);
}

TEST_F(AutomationServiceTest, BridgeStatusListsAll) {
    harness.prepare("SIM-1");
    harness.prepare("SIM-2");
    ASSERT_TRUE(service.startBridge("SIM-2").is_ok());

    auto all = service.bridgeStatus("");
    ASSERT_TRUE(all.is_ok());
    ASSERT_EQ(all.value()["bridges"].size(), 2u);
    EXPECT_EQ(all.value()["bridges"][0]["state"], "disconnected");
    EXPECT_EQ(all.value()["bridges"][1]["state"], "active");

    auto one = service.bridgeStatus("SIM-2");
    ASSERT_TRUE(one.is_ok());
    EXPECT_EQ(one.value()["session_id"], "S-SIM-2");
}

// =============================================================================
// UI tree
// =============================================================================

TEST_F(AutomationServiceTest, UiTreePayload) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/source?format=json", 200, sourceTree());
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.getUiTree("SIM-1", ui::TreeFormat::Json);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["count"], 3);
    EXPECT_EQ(r.value()["elements"].size(), 3u);
    EXPECT_EQ(r.value()["elements"][1]["type"], "Button");
    EXPECT_NE(r.value()["tree"].get<std::string>().find("Button \"Login\""), std::string::npos);
}

TEST_F(AutomationServiceTest, TapElementByPredicate) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/source?format=json", 200, sourceTree());
    t->reply("POST", "/session/S-SIM-1/actions", 200, wdaValue(nullptr));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.tapElement("SIM-1", ui::Predicate().where("label", "Login"));
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["status"], "ok");
    EXPECT_EQ(r.value()["element"]["index"], 1);
    EXPECT_EQ(r.value()["element"]["center"]["x"], 70);
    EXPECT_EQ(r.value()["element"]["center"]["y"], 120);
}

TEST_F(AutomationServiceTest, FindElementNoMatch) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/source?format=json", 200, sourceTree());
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.findElement("SIM-1", ui::Predicate().where("label", "Logout"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::NoSuchElement);
}

// =============================================================================
// Apps / system
// =============================================================================

TEST_F(AutomationServiceTest, TerminateAndAppState) {
    auto t = harness.prepare("SIM-1");
    t->reply("POST", "/session/S-SIM-1/wda/apps/terminate", 200, wdaValue(true));
    t->reply("POST", "/session/S-SIM-1/wda/apps/state", 200, wdaValue(4));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto terminated = service.terminateApp("SIM-1", "com.example.demo");
    ASSERT_TRUE(terminated.is_ok());
    EXPECT_EQ(terminated.value()["terminated"], true);

    auto state = service.appState("SIM-1", "com.example.demo");
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value()["state"], 4);
    EXPECT_EQ(state.value()["name"], "running_foreground");
    EXPECT_EQ(state.value()["bundle_id"], "com.example.demo");
}

TEST_F(AutomationServiceTest, WindowSizePayload) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/window/size", 200, wdaValue({{"width", 390}, {"height", 844}}));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.getWindowSize("SIM-1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), (json{{"width", 390}, {"height", 844}}));
}

// =============================================================================
// Recording
// =============================================================================

TEST_F(AutomationServiceTest, RecordingPayloadSavedAsArtifact) {
    auto t = harness.prepare("SIM-1");
    t->reply("POST", "/wda/video/start", 200, wdaValue({{"fps", 24}}));
    const std::string video = "fake-mp4-bytes";
    t->reply("POST", "/wda/video/stop", 200,
             wdaValue(base64Encode(reinterpret_cast<const uint8_t*>(video.data()), video.size())));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto started = service.startRecording("SIM-1", json::object());
    ASSERT_TRUE(started.is_ok()) << started.error().message;
    EXPECT_EQ(started.value()["status"], "recording");

    auto stopped = service.stopRecording("SIM-1");
    ASSERT_TRUE(stopped.is_ok()) << stopped.error().message;
    EXPECT_EQ(stopped.value()["status"], "stopped");
    EXPECT_EQ(stopped.value()["bytes"], video.size());

    fs::path path(stopped.value()["path"].get<std::string>());
    EXPECT_EQ(path.extension(), ".mp4");
    EXPECT_EQ(fs::file_size(path), video.size());
}

// =============================================================================
// Device lifecycle
// =============================================================================

TEST_F(AutomationServiceTest, ListDevicesThroughSimctl) {
    harness.simctl_outputs.push_back({0, R"({"devices": {
        "com.apple.CoreSimulator.SimRuntime.iOS-17-2": [
          {"udid": "AAAA-0001", "name": "iPhone 15", "state": "Booted", "isAvailable": true}
        ]}})", ""});

    auto r = service.listDevices();
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["count"], 1);
    EXPECT_EQ(r.value()["devices"][0]["udid"], "AAAA-0001");
}

TEST_F(AutomationServiceTest, SimctlFailureIsDeviceManagementError) {
    harness.simctl_outputs.push_back({148, "", "Invalid device: AAAA-9999"});

    auto r = service.bootDevice("AAAA-9999");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::DeviceManagementError);
    EXPECT_EQ(r.error().raw["exit_code"], 148);
}

TEST_F(AutomationServiceTest, ShutdownRemovesBridge) {
    auto t = harness.prepare("SIM-1");
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto r = service.shutdownDevice("SIM-1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value()["state"], "Shutdown");
    EXPECT_EQ(harness.bridges().find("SIM-1"), nullptr);
    EXPECT_EQ(t->countOf("DELETE", "/session/S-SIM-1"), 1u);
    ASSERT_EQ(harness.simctl_calls.size(), 1u);
    EXPECT_EQ(harness.simctl_calls[0][2], "shutdown");
}

// =============================================================================
// Screenshot
// =============================================================================

TEST_F(AutomationServiceTest, SimctlScreenshotWithDefaults) {
    auto png = ServiceHarness::pngOf(40, 80);
    harness.simctl_outputs.push_back({0, std::string(png.begin(), png.end()), ""});

    auto r = service.getScreenshot("SIM-1", ScreenshotRequest{});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["width"], 20);
    EXPECT_EQ(r.value()["height"], 40);
    EXPECT_EQ(r.value()["format"], "jpeg");
    EXPECT_EQ(r.value()["source"], "simctl");
    EXPECT_FALSE(r.value().contains("data"));

    fs::path path(r.value()["path"].get<std::string>());
    EXPECT_EQ(path.extension(), ".jpg");
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(path.parent_path(), harness.artifactDir());
}

TEST_F(AutomationServiceTest, ScreenshotUsesAgentOrientation) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/orientation", 200, wdaValue("LANDSCAPE"));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto png = ServiceHarness::pngOf(80, 40);
    harness.simctl_outputs.push_back({0, std::string(png.begin(), png.end()), ""});

    ScreenshotRequest request;
    request.scale = 1.0;
    request.format = "png";
    request.include_data = true;
    auto r = service.getScreenshot("SIM-1", request);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["width"], 40);
    EXPECT_EQ(r.value()["height"], 80);
    EXPECT_FALSE(r.value()["data"].get<std::string>().empty());
}

TEST_F(AutomationServiceTest, AgentScreenshot) {
    auto t = harness.prepare("SIM-1");
    auto png = ServiceHarness::pngOf(10, 20);
    t->reply("GET", "/session/S-SIM-1/orientation", 200, wdaValue("PORTRAIT"));
    t->reply("GET", "/screenshot", 200, wdaValue(base64Encode(png.data(), png.size())));
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    ScreenshotRequest request;
    request.source = "agent";
    request.scale = 1.0;
    auto r = service.getScreenshot("SIM-1", request);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["source"], "agent");
    EXPECT_EQ(r.value()["width"], 10);
    EXPECT_TRUE(harness.simctl_calls.empty());
}

TEST_F(AutomationServiceTest, ScreenshotArgumentErrors) {
    ScreenshotRequest bad_format;
    bad_format.format = "gif";
    EXPECT_EQ(service.getScreenshot("SIM-1", bad_format).error().kind, ErrorKind::InvalidArgument);

    ScreenshotRequest bad_source;
    bad_source.source = "camera";
    EXPECT_EQ(service.getScreenshot("SIM-1", bad_source).error().kind, ErrorKind::InvalidArgument);

    ScreenshotRequest agent;
    agent.source = "agent";
    auto r = service.getScreenshot("SIM-1", agent);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);

    EXPECT_TRUE(harness.simctl_calls.empty());
}

TEST_F(AutomationServiceTest, ScreenshotOnExpiredBridgeReportsSessionExpired) {
    auto t = harness.prepare("SIM-1");
    t->reply("POST", "/session/S-SIM-1/actions", 404,
             {{"value", {{"error", "invalid session id"}, {"message", "Session does not exist"}}}});
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());
    ASSERT_EQ(service.tap("SIM-1", 1, 1).error().kind, ErrorKind::SessionExpired);
    t->clearCalls();

    auto simctl_shot = service.getScreenshot("SIM-1", ScreenshotRequest{});
    ASSERT_TRUE(simctl_shot.is_err());
    EXPECT_EQ(simctl_shot.error().kind, ErrorKind::SessionExpired);
    EXPECT_NE(simctl_shot.error().message.find("reset_session"), std::string::npos);

    ScreenshotRequest agent;
    agent.source = "agent";
    auto agent_shot = service.getScreenshot("SIM-1", agent);
    ASSERT_TRUE(agent_shot.is_err());
    EXPECT_EQ(agent_shot.error().kind, ErrorKind::SessionExpired);

    EXPECT_EQ(t->callCount(), 0u);
    EXPECT_TRUE(harness.simctl_calls.empty());
}

TEST_F(AutomationServiceTest, ScreenshotFallsBackToPortraitWhenOrientationFails) {
    auto t = harness.prepare("SIM-1");
    t->reply("GET", "/session/S-SIM-1/orientation", 500,
             {{"value", {{"error", "unknown error"}, {"message", "orientation unavailable"}}}});
    ASSERT_TRUE(service.startBridge("SIM-1").is_ok());

    auto png = ServiceHarness::pngOf(40, 80);
    harness.simctl_outputs.push_back({0, std::string(png.begin(), png.end()), ""});

    auto r = service.getScreenshot("SIM-1", ScreenshotRequest{});
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_EQ(r.value()["width"], 20);
    EXPECT_EQ(r.value()["height"], 40);
    EXPECT_EQ(t->countOf("GET", "/session/S-SIM-1/orientation"), 1u);
}
