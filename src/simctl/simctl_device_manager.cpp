#include "simctl/simctl_device_manager.hpp"
#include "simpilot_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace simpilot::simctl {

namespace {

constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r ";
constexpr size_t MAX_OUTPUT_SIZE = 64 * 1024 * 1024;  // 64MB limit

// RAII wrapper for popen/pclose
struct PipeDeleter {
    void operator()(FILE* fp) const {
        if (fp) pclose(fp);
    }
};
using UniquePipe = std::unique_ptr<FILE, PipeDeleter>;

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// =============================================================================
// Process execution
// =============================================================================

std::string shellQuote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

CommandOutput runProcess(const std::vector<std::string>& argv) {
    CommandOutput out;
    if (argv.empty()) {
        out.stderr_text = "empty command";
        return out;
    }

    char err_path[] = "/tmp/simpilot_stderr_XXXXXX";
    int err_fd = mkstemp(err_path);
    if (err_fd < 0) {
        out.stderr_text = std::string("mkstemp failed: ") + std::strerror(errno);
        return out;
    }
    close(err_fd);

    std::string cmd;
    for (const auto& arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += shellQuote(arg);
    }
    cmd += " 2>" + shellQuote(err_path);

    SPLOG_DEBUG("simctl", "exec: %s", cmd.c_str());

    FILE* raw = popen(cmd.c_str(), "r");
    if (!raw) {
        out.stderr_text = std::string("popen failed: ") + std::strerror(errno);
        std::remove(err_path);
        return out;
    }
    UniquePipe pipe(raw);

    char buffer[4096];
    size_t bytes_read;
    while ((bytes_read = fread(buffer, 1, sizeof(buffer), pipe.get())) > 0) {
        if (out.stdout_text.size() + bytes_read > MAX_OUTPUT_SIZE) {
            SPLOG_WARN("simctl", "output exceeds %zu bytes, truncated", MAX_OUTPUT_SIZE);
            break;
        }
        out.stdout_text.append(buffer, bytes_read);
    }

    const int status = pclose(pipe.release());
    if (status != -1 && WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else {
        out.exit_code = -1;
    }

    out.stderr_text = readFile(err_path);
    std::remove(err_path);
    return out;
}

bool isValidDeviceId(const std::string& id) {
    if (id.empty() || id.length() > 128) {
        return false;
    }
    for (char c : id) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            SPLOG_ERROR("simctl", "Invalid character in device ID: '%c'", c);
            return false;
        }
    }
    if (id.front() == '-') return false;  // would read as an option
    return true;
}

// =============================================================================
// Device model
// =============================================================================

const char* deviceStateName(DeviceState state) {
    switch (state) {
        case DeviceState::Shutdown: return "Shutdown";
        case DeviceState::Booted:   return "Booted";
        case DeviceState::Booting:  return "Booting";
        case DeviceState::Unknown:  return "Unknown";
    }
    return "Unknown";
}

DeviceState parseDeviceState(const std::string& name) {
    if (name == "Booted") return DeviceState::Booted;
    if (name == "Shutdown") return DeviceState::Shutdown;
    if (name == "Booting") return DeviceState::Booting;
    return DeviceState::Unknown;
}

nlohmann::json SimDevice::toJson() const {
    return nlohmann::json{
        {"udid", udid},
        {"name", name},
        {"os_version", os_version},
        {"runtime", runtime},
        {"available", available},
        {"state", deviceStateName(state)},
    };
}

std::string SimctlDeviceManager::osVersionFromRuntime(const std::string& runtime) {
    // "...SimRuntime.iOS-17-2" -> "17-2" -> "17.2"
    const auto dot = runtime.rfind('.');
    std::string tail = dot == std::string::npos ? runtime : runtime.substr(dot + 1);
    const auto dash = tail.find('-');
    if (dash == std::string::npos) return "";
    std::string version = tail.substr(dash + 1);
    std::replace(version.begin(), version.end(), '-', '.');
    return version;
}

Result<std::vector<SimDevice>, DeviceError>
SimctlDeviceManager::parseDeviceList(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return DeviceError(std::string("unreadable simctl device list: ") + e.what());
    }
    if (!doc.is_object() || !doc.contains("devices") || !doc["devices"].is_object()) {
        return DeviceError("simctl device list has no 'devices' object");
    }

    std::vector<SimDevice> devices;
    for (auto it = doc["devices"].begin(); it != doc["devices"].end(); ++it) {
        const std::string& runtime = it.key();
        if (!contains(runtime, ".iOS-") || !it.value().is_array()) continue;

        const std::string os_version = osVersionFromRuntime(runtime);
        for (const auto& entry : it.value()) {
            if (!entry.is_object()) continue;
            if (!entry.value("isAvailable", false)) continue;

            SimDevice dev;
            dev.udid = entry.value("udid", "");
            dev.name = entry.value("name", "");
            dev.state = parseDeviceState(entry.value("state", ""));
            dev.runtime = runtime;
            dev.os_version = os_version;
            dev.available = true;
            if (!dev.udid.empty()) devices.push_back(std::move(dev));
        }
    }

    std::stable_sort(devices.begin(), devices.end(), [](const SimDevice& a, const SimDevice& b) {
        const bool a_booted = a.state == DeviceState::Booted;
        const bool b_booted = b.state == DeviceState::Booted;
        if (a_booted != b_booted) return a_booted;
        return a.name < b.name;
    });
    return devices;
}

// =============================================================================
// SimctlDeviceManager
// =============================================================================

SimctlDeviceManager::SimctlDeviceManager(std::string xcrun_path, CommandRunner runner)
    : xcrun_path_(std::move(xcrun_path)), runner_(std::move(runner)) {
    if (!runner_) runner_ = runProcess;
}

Result<void, DeviceError> SimctlDeviceManager::checkId(const std::string& udid) const {
    if (!isValidDeviceId(udid)) {
        SPLOG_ERROR("simctl", "Invalid device ID rejected: %s", udid.c_str());
        return DeviceError("invalid device id: '" + udid + "'");
    }
    return Ok();
}

Result<CommandOutput, DeviceError> SimctlDeviceManager::simctl(const std::vector<std::string>& args) {
    std::vector<std::string> argv = {xcrun_path_, "simctl"};
    argv.insert(argv.end(), args.begin(), args.end());

    CommandOutput out = runner_(argv);
    if (out.exit_code != 0) {
        std::string verb = args.empty() ? "" : args.front();
        std::string detail = trim(out.stderr_text);
        SPLOG_WARN("simctl", "simctl %s exited %d: %s", verb.c_str(), out.exit_code, detail.c_str());
        return DeviceError("simctl " + verb + " failed" + (detail.empty() ? "" : ": " + detail),
                           out.exit_code, out.stderr_text);
    }
    return out;
}

Result<std::vector<SimDevice>, DeviceError> SimctlDeviceManager::listDevices() {
    auto out = simctl({"list", "devices", "-j"});
    if (out.is_err()) return out.error();

    auto devices = parseDeviceList(out.value().stdout_text);
    if (devices.is_ok()) {
        SPLOG_DEBUG("simctl", "%zu available iOS devices", devices.value().size());
    }
    return devices;
}

Result<void, DeviceError> SimctlDeviceManager::boot(const std::string& udid) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;

    auto out = simctl({"boot", udid});
    if (out.is_err()) {
        // "Unable to boot device in current state: Booted"
        if (contains(out.error().stderr_text, "current state: Booted")) {
            SPLOG_INFO("simctl", "%s already booted", udid.c_str());
            return Ok();
        }
        return out.error();
    }
    SPLOG_INFO("simctl", "booted %s", udid.c_str());
    return Ok();
}

Result<void, DeviceError> SimctlDeviceManager::shutdown(const std::string& udid) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;

    auto out = simctl({"shutdown", udid});
    if (out.is_err()) {
        if (contains(out.error().stderr_text, "current state: Shutdown")) {
            SPLOG_INFO("simctl", "%s already shut down", udid.c_str());
            return Ok();
        }
        return out.error();
    }
    SPLOG_INFO("simctl", "shut down %s", udid.c_str());
    return Ok();
}

Result<std::vector<uint8_t>, DeviceError> SimctlDeviceManager::screenshot(const std::string& udid) {
    if (auto ok = checkId(udid); ok.is_err()) return ok.error();

    auto out = simctl({"io", udid, "screenshot", "--type=png", "-"});
    if (out.is_err()) return out.error();

    const std::string& data = out.value().stdout_text;
    if (data.empty()) {
        return DeviceError("simctl screenshot produced no data", 0, out.value().stderr_text);
    }
    return std::vector<uint8_t>(data.begin(), data.end());
}

Result<void, DeviceError> SimctlDeviceManager::installApp(const std::string& udid,
                                                          const std::string& app_path) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;
    if (app_path.empty()) return DeviceError("app path is empty");

    auto out = simctl({"install", udid, app_path});
    if (out.is_err()) return out.error();
    SPLOG_INFO("simctl", "installed %s on %s", app_path.c_str(), udid.c_str());
    return Ok();
}

Result<void, DeviceError> SimctlDeviceManager::uninstallApp(const std::string& udid,
                                                            const std::string& bundle_id) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;
    if (bundle_id.empty()) return DeviceError("bundle id is empty");

    auto out = simctl({"uninstall", udid, bundle_id});
    if (out.is_err()) return out.error();
    SPLOG_INFO("simctl", "uninstalled %s from %s", bundle_id.c_str(), udid.c_str());
    return Ok();
}

Result<void, DeviceError> SimctlDeviceManager::statusBarOverride(const std::string& udid,
                                                                 const StatusBarOverride& values) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;
    if (values.empty()) return DeviceError("status bar override has no values");

    std::vector<std::string> args = {"status_bar", udid, "override"};
    if (values.time) {
        args.insert(args.end(), {"--time", *values.time});
    }
    if (values.battery_level) {
        if (*values.battery_level < 0 || *values.battery_level > 100) {
            return DeviceError("battery level must be 0-100");
        }
        args.insert(args.end(), {"--batteryLevel", std::to_string(*values.battery_level)});
    }
    if (values.battery_state) {
        const std::string& s = *values.battery_state;
        if (s != "charging" && s != "charged" && s != "discharging") {
            return DeviceError("battery state must be charging, charged or discharging");
        }
        args.insert(args.end(), {"--batteryState", s});
    }
    if (values.cellular_bars) {
        if (*values.cellular_bars < 0 || *values.cellular_bars > 4) {
            return DeviceError("cellular bars must be 0-4");
        }
        args.insert(args.end(), {"--cellularBars", std::to_string(*values.cellular_bars)});
    }
    if (values.wifi_bars) {
        if (*values.wifi_bars < 0 || *values.wifi_bars > 3) {
            return DeviceError("wifi bars must be 0-3");
        }
        args.insert(args.end(), {"--wifiBars", std::to_string(*values.wifi_bars)});
    }
    if (values.data_network) {
        args.insert(args.end(), {"--dataNetwork", *values.data_network});
    }

    auto out = simctl(args);
    if (out.is_err()) return out.error();
    return Ok();
}

Result<void, DeviceError> SimctlDeviceManager::statusBarClear(const std::string& udid) {
    if (auto ok = checkId(udid); ok.is_err()) return ok;

    auto out = simctl({"status_bar", udid, "clear"});
    if (out.is_err()) return out.error();
    return Ok();
}

} // namespace simpilot::simctl
