#pragma once
// =============================================================================
// SimPilot - Simulator Device Manager (xcrun simctl)
// =============================================================================
// Device lifecycle through the simctl CLI. The exit code plus stdout/stderr
// are the only failure signal; any non-zero exit becomes a DeviceError.
// Device ids are validated against shell metacharacters before they reach a
// command line.
// =============================================================================

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::simctl {

struct CommandOutput {
    int exit_code = -1;
    std::string stdout_text;  // may hold binary data (screenshots)
    std::string stderr_text;
};

// argv[0] is the program; arguments are passed without shell interpretation
using CommandRunner = std::function<CommandOutput(const std::vector<std::string>& argv)>;

// Default runner: popen with each argument single-quoted, stderr captured
// through a temporary file
CommandOutput runProcess(const std::vector<std::string>& argv);

std::string shellQuote(const std::string& arg);

// UDIDs and names: no shell metacharacters, at most 128 chars
bool isValidDeviceId(const std::string& id);

enum class DeviceState { Shutdown, Booted, Booting, Unknown };

const char* deviceStateName(DeviceState state);
DeviceState parseDeviceState(const std::string& name);

struct SimDevice {
    std::string udid;
    std::string name;
    std::string os_version;   // "17.2"
    std::string runtime;      // "com.apple.CoreSimulator.SimRuntime.iOS-17-2"
    bool available = false;
    DeviceState state = DeviceState::Unknown;

    nlohmann::json toJson() const;
};

struct StatusBarOverride {
    std::optional<std::string> time;           // "9:41"
    std::optional<int> battery_level;          // 0-100
    std::optional<std::string> battery_state;  // charging, charged, discharging
    std::optional<int> cellular_bars;          // 0-4
    std::optional<int> wifi_bars;              // 0-3
    std::optional<std::string> data_network;   // wifi, 3g, 4g, lte, 5g, ...

    bool empty() const {
        return !time && !battery_level && !battery_state && !cellular_bars &&
               !wifi_bars && !data_network;
    }
};

class SimctlDeviceManager {
public:
    explicit SimctlDeviceManager(std::string xcrun_path = "xcrun", CommandRunner runner = nullptr);

    // iOS runtimes only, available only; booted first, then by name
    Result<std::vector<SimDevice>, DeviceError> listDevices();

    // Already booted counts as success
    Result<void, DeviceError> boot(const std::string& udid);
    // Already shut down counts as success
    Result<void, DeviceError> shutdown(const std::string& udid);

    // PNG bytes from `simctl io <udid> screenshot --type=png -`
    Result<std::vector<uint8_t>, DeviceError> screenshot(const std::string& udid);

    Result<void, DeviceError> installApp(const std::string& udid, const std::string& app_path);
    Result<void, DeviceError> uninstallApp(const std::string& udid, const std::string& bundle_id);

    Result<void, DeviceError> statusBarOverride(const std::string& udid,
                                                const StatusBarOverride& values);
    Result<void, DeviceError> statusBarClear(const std::string& udid);

    // Parses `simctl list devices -j` output (exposed for tests)
    static Result<std::vector<SimDevice>, DeviceError> parseDeviceList(const std::string& json_text);

    // "com.apple.CoreSimulator.SimRuntime.iOS-17-2" -> "17.2"
    static std::string osVersionFromRuntime(const std::string& runtime);

private:
    Result<CommandOutput, DeviceError> simctl(const std::vector<std::string>& args);
    Result<void, DeviceError> checkId(const std::string& udid) const;

    std::string xcrun_path_;
    CommandRunner runner_;
};

} // namespace simpilot::simctl
