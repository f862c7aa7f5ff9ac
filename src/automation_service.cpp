// =============================================================================
// SimPilot - Automation Service Implementation
// =============================================================================
#include "automation_service.hpp"
#include "base64.hpp"
#include "simpilot_log.hpp"

static constexpr const char* TAG = "service";

namespace simpilot {

using json = nlohmann::json;
using bridge::Bridge;
using bridge::BridgeState;
using wda::WdaClient;

namespace {

Reply fromDevice(const Result<void, DeviceError>& r, json payload) {
    if (r.is_err()) return r.error().toAutomationError();
    return payload;
}

Result<void> checkDeviceId(const std::string& device_id) {
    if (!simctl::isValidDeviceId(device_id)) {
        return AutomationError(ErrorKind::InvalidArgument, "invalid device id: '" + device_id + "'");
    }
    return Ok();
}

} // namespace

json okPayload() {
    return json{{"status", "ok"}};
}

AutomationService::AutomationService(bridge::BridgeRegistry& bridges,
                                     simctl::SimctlDeviceManager& devices,
                                     ArtifactStore& artifacts,
                                     config::ScreenshotConfig screenshot_defaults)
    : bridges_(bridges),
      devices_(devices),
      artifacts_(artifacts),
      screenshot_defaults_(std::move(screenshot_defaults)) {}

// =============================================================================
// Bridge plumbing
// =============================================================================

Result<std::shared_ptr<Bridge>> AutomationService::startedBridge(const std::string& device_id) const {
    if (auto ok = checkDeviceId(device_id); ok.is_err()) return ok.error();

    auto bridge = bridges_.find(device_id);
    if (!bridge) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "no bridge for " + device_id + "; start the bridge first");
    }
    return bridge;
}

template<typename T, typename ToJson>
Reply AutomationService::onBridge(const std::string& device_id, const char* op,
                                  const Bridge::Operation<T>& fn, ToJson to_json,
                                  Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    Result<T> r = bridge.value()->template run<T>(op, fn, timeout);
    if (r.is_err()) return r.error();
    return to_json(r.value());
}

Reply AutomationService::onBridge(const std::string& device_id, const char* op,
                                  const Bridge::Operation<void>& fn, Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto r = bridge.value()->run<void>(op, fn, timeout);
    if (r.is_err()) return r.error();
    return okPayload();
}

// =============================================================================
// Device lifecycle
// =============================================================================

Reply AutomationService::listDevices() {
    auto devices = devices_.listDevices();
    if (devices.is_err()) return devices.error().toAutomationError();

    json arr = json::array();
    for (const auto& dev : devices.value()) arr.push_back(dev.toJson());
    return json{{"devices", arr}, {"count", arr.size()}};
}

Reply AutomationService::bootDevice(const std::string& device_id) {
    return fromDevice(devices_.boot(device_id), json{{"device_id", device_id}, {"state", "Booted"}});
}

Reply AutomationService::shutdownDevice(const std::string& device_id) {
    // Agent sessions do not survive a shutdown
    bridges_.remove(device_id);
    return fromDevice(devices_.shutdown(device_id), json{{"device_id", device_id}, {"state", "Shutdown"}});
}

Reply AutomationService::installApp(const std::string& device_id, const std::string& app_path) {
    return fromDevice(devices_.installApp(device_id, app_path), okPayload());
}

Reply AutomationService::uninstallApp(const std::string& device_id, const std::string& bundle_id) {
    return fromDevice(devices_.uninstallApp(device_id, bundle_id), okPayload());
}

Reply AutomationService::statusBarOverride(const std::string& device_id,
                                           const simctl::StatusBarOverride& values) {
    return fromDevice(devices_.statusBarOverride(device_id, values), okPayload());
}

Reply AutomationService::statusBarClear(const std::string& device_id) {
    return fromDevice(devices_.statusBarClear(device_id), okPayload());
}

// =============================================================================
// Bridge lifecycle
// =============================================================================

Reply AutomationService::startBridge(const std::string& device_id) {
    if (auto ok = checkDeviceId(device_id); ok.is_err()) return ok.error();

    auto bridge = bridges_.getOrCreate(device_id);
    auto started = bridge->start();
    if (started.is_err()) return started.error();
    return bridge->status().toJson();
}

Reply AutomationService::stopBridge(const std::string& device_id) {
    if (auto ok = checkDeviceId(device_id); ok.is_err()) return ok.error();
    const bool removed = bridges_.remove(device_id);
    return json{{"device_id", device_id}, {"stopped", removed}};
}

Reply AutomationService::resetSession(const std::string& device_id) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto reset = bridge.value()->resetSession();
    if (reset.is_err()) return reset.error();
    return bridge.value()->status().toJson();
}

Reply AutomationService::bridgeStatus(const std::string& device_id) {
    if (device_id.empty()) {
        json arr = json::array();
        for (const auto& status : bridges_.list()) arr.push_back(status.toJson());
        return json{{"bridges", arr}};
    }
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();
    return bridge.value()->status().toJson();
}

Reply AutomationService::health(const std::string& device_id) {
    if (auto ok = checkDeviceId(device_id); ok.is_err()) return ok.error();

    // Health does not need a session; check through a (possibly new) bridge
    auto bridge = bridges_.getOrCreate(device_id);
    const bool healthy = bridge->health();
    json out = bridge->status().toJson();
    out["healthy"] = healthy;
    return out;
}

// =============================================================================
// UI tree
// =============================================================================

Reply AutomationService::getUiTree(const std::string& device_id, ui::TreeFormat format,
                                   Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto index = bridge.value()->uiTree(format, timeout);
    if (index.is_err()) return index.error();
    return json{
        {"count", index.value().size()},
        {"tree", index.value().render()},
        {"elements", index.value().toJson()},
    };
}

Reply AutomationService::findElement(const std::string& device_id, const ui::Predicate& predicate,
                                     Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto element = bridge.value()->findElement(predicate, timeout);
    if (element.is_err()) return element.error();
    return ui::elementToJson(element.value());
}

Reply AutomationService::tapElement(const std::string& device_id, int index, Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto element = bridge.value()->tapElement(index, timeout);
    if (element.is_err()) return element.error();
    return json{{"status", "ok"}, {"element", ui::elementToJson(element.value())}};
}

Reply AutomationService::tapElement(const std::string& device_id, const ui::Predicate& predicate,
                                    Timeout timeout) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto element = bridge.value()->tapElement(predicate, timeout);
    if (element.is_err()) return element.error();
    return json{{"status", "ok"}, {"element", ui::elementToJson(element.value())}};
}

// =============================================================================
// Gestures / input
// =============================================================================

Reply AutomationService::tap(const std::string& device_id, int x, int y, Timeout timeout) {
    return onBridge(device_id, "tap",
        [x, y](WdaClient& c, const std::string& sid) { return c.tap(sid, x, y); }, timeout);
}

Reply AutomationService::doubleTap(const std::string& device_id, int x, int y, Timeout timeout) {
    return onBridge(device_id, "double_tap",
        [x, y](WdaClient& c, const std::string& sid) { return c.doubleTap(sid, x, y); }, timeout);
}

Reply AutomationService::longPress(const std::string& device_id, int x, int y, int duration_ms,
                                   Timeout timeout) {
    return onBridge(device_id, "long_press",
        [=](WdaClient& c, const std::string& sid) { return c.longPress(sid, x, y, duration_ms); },
        timeout);
}

Reply AutomationService::swipe(const std::string& device_id, int from_x, int from_y,
                               int to_x, int to_y, int duration_ms, Timeout timeout) {
    return onBridge(device_id, "swipe",
        [=](WdaClient& c, const std::string& sid) {
            return c.swipe(sid, from_x, from_y, to_x, to_y, duration_ms);
        }, timeout);
}

Reply AutomationService::typeText(const std::string& device_id, const std::string& text,
                                  Timeout timeout) {
    return onBridge(device_id, "type_text",
        [&text](WdaClient& c, const std::string& sid) { return c.typeText(sid, text); }, timeout);
}

Reply AutomationService::pressButton(const std::string& device_id, const std::string& name,
                                     Timeout timeout) {
    return onBridge(device_id, "press_button",
        [&name](WdaClient& c, const std::string& sid) { return c.pressButton(sid, name); }, timeout);
}

// =============================================================================
// Apps
// =============================================================================

Reply AutomationService::launchApp(const std::string& device_id, const std::string& bundle_id,
                                   Timeout timeout) {
    return onBridge(device_id, "launch_app",
        [&bundle_id](WdaClient& c, const std::string& sid) { return c.launchApp(sid, bundle_id); },
        timeout);
}

Reply AutomationService::terminateApp(const std::string& device_id, const std::string& bundle_id,
                                      Timeout timeout) {
    return onBridge<bool>(device_id, "terminate_app",
        [&bundle_id](WdaClient& c, const std::string& sid) { return c.terminateApp(sid, bundle_id); },
        [](bool terminated) { return json{{"terminated", terminated}}; }, timeout);
}

Reply AutomationService::activateApp(const std::string& device_id, const std::string& bundle_id,
                                     Timeout timeout) {
    return onBridge(device_id, "activate_app",
        [&bundle_id](WdaClient& c, const std::string& sid) { return c.activateApp(sid, bundle_id); },
        timeout);
}

Reply AutomationService::appState(const std::string& device_id, const std::string& bundle_id,
                                  Timeout timeout) {
    return onBridge<wda::AppState>(device_id, "app_state",
        [&bundle_id](WdaClient& c, const std::string& sid) { return c.appState(sid, bundle_id); },
        [&bundle_id](wda::AppState state) {
            return json{{"bundle_id", bundle_id},
                        {"state", static_cast<int>(state)},
                        {"name", wda::appStateName(state)}};
        }, timeout);
}

Reply AutomationService::listApps(const std::string& device_id, Timeout timeout) {
    return onBridge<json>(device_id, "list_apps",
        [](WdaClient& c, const std::string& sid) { return c.listApps(sid); },
        [](const json& apps) { return json{{"apps", apps}}; }, timeout);
}

// =============================================================================
// System
// =============================================================================

Reply AutomationService::setLocation(const std::string& device_id, double latitude,
                                     double longitude, Timeout timeout) {
    return onBridge(device_id, "set_location",
        [=](WdaClient& c, const std::string& sid) {
            return c.setLocation(sid, wda::GeoLocation{latitude, longitude});
        }, timeout);
}

Reply AutomationService::getLocation(const std::string& device_id, Timeout timeout) {
    return onBridge<wda::GeoLocation>(device_id, "get_location",
        [](WdaClient& c, const std::string& sid) { return c.getLocation(sid); },
        [](const wda::GeoLocation& loc) {
            return json{{"latitude", loc.latitude}, {"longitude", loc.longitude}};
        }, timeout);
}

Reply AutomationService::clearLocation(const std::string& device_id, Timeout timeout) {
    return onBridge(device_id, "clear_location",
        [](WdaClient& c, const std::string& sid) { return c.clearLocation(sid); }, timeout);
}

Reply AutomationService::getClipboard(const std::string& device_id, Timeout timeout) {
    return onBridge<std::string>(device_id, "get_clipboard",
        [](WdaClient& c, const std::string& sid) { return c.getClipboard(sid); },
        [](const std::string& text) { return json{{"text", text}}; }, timeout);
}

Reply AutomationService::setClipboard(const std::string& device_id, const std::string& text,
                                      Timeout timeout) {
    return onBridge(device_id, "set_clipboard",
        [&text](WdaClient& c, const std::string& sid) { return c.setClipboard(sid, text); }, timeout);
}

Reply AutomationService::getWindowSize(const std::string& device_id, Timeout timeout) {
    return onBridge<wda::WindowSize>(device_id, "get_window_size",
        [](WdaClient& c, const std::string& sid) { return c.getWindowSize(sid); },
        [](const wda::WindowSize& size) {
            return json{{"width", size.width}, {"height", size.height}};
        }, timeout);
}

Reply AutomationService::getOrientation(const std::string& device_id, Timeout timeout) {
    return onBridge<std::string>(device_id, "get_orientation",
        [](WdaClient& c, const std::string& sid) { return c.getOrientation(sid); },
        [](const std::string& orientation) { return json{{"orientation", orientation}}; }, timeout);
}

Reply AutomationService::getAppearance(const std::string& device_id, Timeout timeout) {
    return onBridge<std::string>(device_id, "get_appearance",
        [](WdaClient& c, const std::string&) { return c.getAppearance(); },
        [](const std::string& style) { return json{{"appearance", style}}; }, timeout);
}

Reply AutomationService::setAppearance(const std::string& device_id, const std::string& style,
                                       Timeout timeout) {
    return onBridge(device_id, "set_appearance",
        [&style](WdaClient& c, const std::string& sid) { return c.setAppearance(sid, style); },
        timeout);
}

Reply AutomationService::biometricMatch(const std::string& device_id, bool match, Timeout timeout) {
    return onBridge(device_id, "biometric_match",
        [match](WdaClient& c, const std::string& sid) { return c.biometricMatch(sid, match); },
        timeout);
}

// =============================================================================
// Recording
// =============================================================================

Reply AutomationService::startRecording(const std::string& device_id, const json& options) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto started = bridge.value()->startRecording(options);
    if (started.is_err()) return started.error();
    return json{{"status", "recording"}, {"agent", started.value()}};
}

Reply AutomationService::stopRecording(const std::string& device_id) {
    auto bridge = startedBridge(device_id);
    if (bridge.is_err()) return bridge.error();

    auto stopped = bridge.value()->stopRecording();
    if (stopped.is_err()) return stopped.error();

    // A string payload is the base64 video itself
    const json& value = stopped.value();
    if (value.is_string() && !value.get<std::string>().empty()) {
        auto bytes = base64Decode(value.get<std::string>());
        if (!bytes) {
            return AutomationError(ErrorKind::UnknownAgentError, "recording payload is not base64");
        }
        auto path = artifacts_.save("recording", "mp4", *bytes);
        if (path.is_err()) return path.error();
        return json{{"status", "stopped"}, {"path", path.value()}, {"bytes", bytes->size()}};
    }
    return json{{"status", "stopped"}, {"agent", value}};
}

// =============================================================================
// Alerts
// =============================================================================

Reply AutomationService::getAlertText(const std::string& device_id, Timeout timeout) {
    return onBridge<std::string>(device_id, "get_alert_text",
        [](WdaClient& c, const std::string& sid) { return c.getAlertText(sid); },
        [](const std::string& text) { return json{{"text", text}}; }, timeout);
}

Reply AutomationService::acceptAlert(const std::string& device_id, Timeout timeout) {
    return onBridge(device_id, "accept_alert",
        [](WdaClient& c, const std::string& sid) { return c.acceptAlert(sid); }, timeout);
}

Reply AutomationService::dismissAlert(const std::string& device_id, Timeout timeout) {
    return onBridge(device_id, "dismiss_alert",
        [](WdaClient& c, const std::string& sid) { return c.dismissAlert(sid); }, timeout);
}

// =============================================================================
// Screenshot
// =============================================================================

Reply AutomationService::getScreenshot(const std::string& device_id, const ScreenshotRequest& request) {
    if (auto ok = checkDeviceId(device_id); ok.is_err()) return ok.error();

    image::ScreenshotOptions options;
    options.scale = request.scale.value_or(screenshot_defaults_.scale);
    options.quality = request.quality.value_or(screenshot_defaults_.quality);

    const std::string format_name = request.format.value_or(screenshot_defaults_.format);
    auto format = image::parseImageFormat(format_name);
    if (!format) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "unsupported image format '" + format_name + "' (jpeg, png)");
    }
    options.format = *format;

    const std::string source = request.source.value_or(screenshot_defaults_.source);
    if (source != "simctl" && source != "agent") {
        return AutomationError(ErrorKind::InvalidArgument,
                               "screenshot source must be 'simctl' or 'agent'");
    }

    // Orientation comes from the agent whenever the device has a started
    // bridge. An expired session is reported, never silently skipped.
    auto bridge = bridges_.find(device_id);
    const bool started = bridge && bridge->state() != BridgeState::Disconnected;
    if (started) {
        auto orientation = bridge->run<std::string>("get_orientation",
            [](WdaClient& c, const std::string& sid) { return c.getOrientation(sid); });
        if (orientation.is_ok()) {
            options.orientation = image::parseOrientation(orientation.value());
        } else if (orientation.error().is(ErrorKind::SessionExpired)) {
            return orientation.error();
        } else {
            SPLOG_WARN(TAG, "[%s] orientation unknown, assuming portrait: %s",
                       device_id.c_str(), orientation.error().message.c_str());
        }
    } else if (source == "agent") {
        return AutomationError(ErrorKind::InvalidArgument,
                               "agent screenshots need a started bridge for " + device_id +
                               "; start the bridge first");
    }

    std::vector<uint8_t> raw;
    if (source == "agent") {
        auto shot = bridge->run<std::vector<uint8_t>>("screenshot",
            [](WdaClient& c, const std::string&) { return c.screenshot(); });
        if (shot.is_err()) return shot.error();
        raw = std::move(shot.value());
    } else {
        auto shot = devices_.screenshot(device_id);
        if (shot.is_err()) return shot.error().toAutomationError();
        raw = std::move(shot.value());
    }

    auto processed = image::processScreenshot(raw, options);
    if (processed.is_err()) return processed.error();

    const auto& shot = processed.value();
    auto path = artifacts_.save("screenshot", image::imageFormatExtension(shot.format), shot.data);
    if (path.is_err()) return path.error();

    json out = shot.toJson();
    out["path"] = path.value();
    out["source"] = source;
    if (request.include_data) {
        out["data"] = base64Encode(shot.data.data(), shot.data.size());
    }
    return out;
}

} // namespace simpilot
