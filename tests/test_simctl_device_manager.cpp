// =============================================================================
// SimPilot - simctl Device Manager Tests (scripted command runner)
// =============================================================================

#include <gtest/gtest.h>
#include "simctl/simctl_device_manager.hpp"

#include <deque>
#include <vector>

using namespace simpilot;
using namespace simpilot::simctl;

namespace {

const char* kDeviceListJson = R"({
  "devices": {
    "com.apple.CoreSimulator.SimRuntime.iOS-17-2": [
      {"udid": "AAAA-0001", "name": "iPhone 15", "state": "Shutdown", "isAvailable": true},
      {"udid": "AAAA-0002", "name": "iPhone 15 Pro", "state": "Booted", "isAvailable": true},
      {"udid": "AAAA-0003", "name": "iPhone 12", "state": "Shutdown", "isAvailable": false}
    ],
    "com.apple.CoreSimulator.SimRuntime.iOS-16-4": [
      {"udid": "BBBB-0001", "name": "iPad Air", "state": "Shutdown", "isAvailable": true}
    ],
    "com.apple.CoreSimulator.SimRuntime.watchOS-10-2": [
      {"udid": "CCCC-0001", "name": "Apple Watch", "state": "Booted", "isAvailable": true}
    ]
  }
})";

// 呼び出しを記録し、登録順に出力を返す
struct ScriptedRunner {
    std::vector<std::vector<std::string>> calls;
    std::deque<CommandOutput> outputs;

    CommandRunner runner() {
        return [this](const std::vector<std::string>& argv) {
            calls.push_back(argv);
            if (outputs.empty()) return CommandOutput{0, "", ""};
            CommandOutput out = outputs.front();
            outputs.pop_front();
            return out;
        };
    }
};

} // namespace

// =============================================================================
// Device ids
// =============================================================================

TEST(SimctlDeviceManagerTest, DeviceIdValidation) {
    EXPECT_TRUE(isValidDeviceId("5A8E1A3C-1F7B-4C58-9E5E-1D2C3B4A5F60"));
    EXPECT_TRUE(isValidDeviceId("booted"));
    EXPECT_FALSE(isValidDeviceId(""));
    EXPECT_FALSE(isValidDeviceId("abc; rm -rf /"));
    EXPECT_FALSE(isValidDeviceId("$(whoami)"));
    EXPECT_FALSE(isValidDeviceId("a b"));
    EXPECT_FALSE(isValidDeviceId("--set"));
    EXPECT_FALSE(isValidDeviceId(std::string(129, 'a')));
}

TEST(SimctlDeviceManagerTest, ShellQuote) {
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
}

TEST(SimctlDeviceManagerTest, InvalidIdNeverReachesRunner) {
    ScriptedRunner script;
    SimctlDeviceManager mgr("xcrun", script.runner());

    auto r = mgr.boot("x;reboot");
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(script.calls.empty());
    EXPECT_EQ(r.error().toAutomationError().kind, ErrorKind::DeviceManagementError);
}

// =============================================================================
// Device list
// =============================================================================

TEST(SimctlDeviceManagerTest, ParseDeviceListFiltersAndSorts) {
    auto r = SimctlDeviceManager::parseDeviceList(kDeviceListJson);
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    const auto& devices = r.value();

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].udid, "AAAA-0002");   // booted first
    EXPECT_EQ(devices[0].state, DeviceState::Booted);
    EXPECT_EQ(devices[1].name, "iPad Air");
    EXPECT_EQ(devices[1].os_version, "16.4");
    EXPECT_EQ(devices[2].name, "iPhone 15");
    EXPECT_EQ(devices[2].os_version, "17.2");
    for (const auto& d : devices) EXPECT_TRUE(d.available);
}

TEST(SimctlDeviceManagerTest, ParseDeviceListRejectsGarbage) {
    EXPECT_TRUE(SimctlDeviceManager::parseDeviceList("not json").is_err());
    EXPECT_TRUE(SimctlDeviceManager::parseDeviceList(R"({"runtimes": []})").is_err());
}

TEST(SimctlDeviceManagerTest, OsVersionFromRuntime) {
    EXPECT_EQ(SimctlDeviceManager::osVersionFromRuntime("com.apple.CoreSimulator.SimRuntime.iOS-17-2"), "17.2");
    EXPECT_EQ(SimctlDeviceManager::osVersionFromRuntime("com.apple.CoreSimulator.SimRuntime.iOS-18-0-1"), "18.0.1");
    EXPECT_EQ(SimctlDeviceManager::osVersionFromRuntime("nodash"), "");
}

TEST(SimctlDeviceManagerTest, ListDevicesRunsSimctl) {
    ScriptedRunner script;
    script.outputs.push_back({0, kDeviceListJson, ""});
    SimctlDeviceManager mgr("/usr/bin/xcrun", script.runner());

    auto r = mgr.listDevices();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().size(), 3u);
    ASSERT_EQ(script.calls.size(), 1u);
    EXPECT_EQ(script.calls[0],
              (std::vector<std::string>{"/usr/bin/xcrun", "simctl", "list", "devices", "-j"}));

    auto j = r.value()[0].toJson();
    EXPECT_EQ(j["state"], "Booted");
    EXPECT_EQ(j["os_version"], "17.2");
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST(SimctlDeviceManagerTest, BootAlreadyBootedIsSuccess) {
    ScriptedRunner script;
    script.outputs.push_back({149, "",
        "An error was encountered processing the command (domain=com.apple.CoreSimulator.SimError, code=405):\n"
        "Unable to boot device in current state: Booted\n"});
    SimctlDeviceManager mgr("xcrun", script.runner());

    EXPECT_TRUE(mgr.boot("AAAA-0002").is_ok());
    EXPECT_EQ(script.calls[0], (std::vector<std::string>{"xcrun", "simctl", "boot", "AAAA-0002"}));
}

TEST(SimctlDeviceManagerTest, BootFailureCarriesExitCodeAndStderr) {
    ScriptedRunner script;
    script.outputs.push_back({148, "", "Invalid device: AAAA-9999\n"});
    SimctlDeviceManager mgr("xcrun", script.runner());

    auto r = mgr.boot("AAAA-9999");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().exit_code, 148);
    EXPECT_NE(r.error().message.find("Invalid device"), std::string::npos);

    auto ae = r.error().toAutomationError();
    EXPECT_EQ(ae.raw["exit_code"], 148);
}

TEST(SimctlDeviceManagerTest, ShutdownAlreadyShutdownIsSuccess) {
    ScriptedRunner script;
    script.outputs.push_back({149, "", "Unable to shutdown device in current state: Shutdown"});
    SimctlDeviceManager mgr("xcrun", script.runner());
    EXPECT_TRUE(mgr.shutdown("AAAA-0001").is_ok());
}

TEST(SimctlDeviceManagerTest, ScreenshotReturnsStdoutBytes) {
    ScriptedRunner script;
    script.outputs.push_back({0, std::string("\x89PNG\r\n\x1a\n", 8), ""});
    script.outputs.push_back({0, "", "Detected file type 'PNG' from extension"});
    SimctlDeviceManager mgr("xcrun", script.runner());

    auto r = mgr.screenshot("AAAA-0002");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().size(), 8u);
    EXPECT_EQ(r.value()[1], 'P');
    EXPECT_EQ(script.calls[0],
              (std::vector<std::string>{"xcrun", "simctl", "io", "AAAA-0002", "screenshot", "--type=png", "-"}));

    EXPECT_TRUE(mgr.screenshot("AAAA-0002").is_err());  // 出力なし
}

TEST(SimctlDeviceManagerTest, InstallAndUninstall) {
    ScriptedRunner script;
    SimctlDeviceManager mgr("xcrun", script.runner());

    ASSERT_TRUE(mgr.installApp("AAAA-0002", "/tmp/My App.app").is_ok());
    ASSERT_TRUE(mgr.uninstallApp("AAAA-0002", "com.example.app").is_ok());
    EXPECT_TRUE(mgr.installApp("AAAA-0002", "").is_err());

    ASSERT_EQ(script.calls.size(), 2u);
    EXPECT_EQ(script.calls[0].back(), "/tmp/My App.app");
    EXPECT_EQ(script.calls[1][2], "uninstall");
}

// =============================================================================
// Status bar
// =============================================================================

TEST(SimctlDeviceManagerTest, StatusBarOverrideArguments) {
    ScriptedRunner script;
    SimctlDeviceManager mgr("xcrun", script.runner());

    StatusBarOverride values;
    values.time = "9:41";
    values.battery_level = 100;
    values.battery_state = "charged";
    values.cellular_bars = 4;
    values.wifi_bars = 3;
    values.data_network = "wifi";
    ASSERT_TRUE(mgr.statusBarOverride("AAAA-0002", values).is_ok());

    EXPECT_EQ(script.calls[0], (std::vector<std::string>{
        "xcrun", "simctl", "status_bar", "AAAA-0002", "override",
        "--time", "9:41", "--batteryLevel", "100", "--batteryState", "charged",
        "--cellularBars", "4", "--wifiBars", "3", "--dataNetwork", "wifi"}));
}

TEST(SimctlDeviceManagerTest, StatusBarOverrideValidation) {
    ScriptedRunner script;
    SimctlDeviceManager mgr("xcrun", script.runner());

    EXPECT_TRUE(mgr.statusBarOverride("AAAA-0002", StatusBarOverride{}).is_err());

    StatusBarOverride bad;
    bad.battery_level = 101;
    EXPECT_TRUE(mgr.statusBarOverride("AAAA-0002", bad).is_err());

    StatusBarOverride bad_state;
    bad_state.battery_state = "exploding";
    EXPECT_TRUE(mgr.statusBarOverride("AAAA-0002", bad_state).is_err());

    EXPECT_TRUE(script.calls.empty());
}

TEST(SimctlDeviceManagerTest, StatusBarClear) {
    ScriptedRunner script;
    SimctlDeviceManager mgr("xcrun", script.runner());
    ASSERT_TRUE(mgr.statusBarClear("AAAA-0002").is_ok());
    EXPECT_EQ(script.calls[0],
              (std::vector<std::string>{"xcrun", "simctl", "status_bar", "AAAA-0002", "clear"}));
}

// =============================================================================
// runProcess
// =============================================================================

TEST(SimctlDeviceManagerTest, RunProcessCapturesOutputAndExitCode) {
    auto out = runProcess({"sh", "-c", "printf out; printf err >&2; exit 3"});
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.stdout_text, "out");
    EXPECT_EQ(out.stderr_text, "err");
}

TEST(SimctlDeviceManagerTest, RunProcessEmptyArgv) {
    auto out = runProcess({});
    EXPECT_NE(out.exit_code, 0);
}
