#pragma once
// =============================================================================
// SimPilot - Automation Service
// =============================================================================
// One call per operation: device id + typed parameters in, JSON payload or a
// tagged AutomationError out. Agent operations go through the device's
// Bridge (which must have been started); lifecycle operations go to simctl.
// =============================================================================

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "artifact_store.hpp"
#include "bridge/bridge_registry.hpp"
#include "config_loader.hpp"
#include "image/screenshot_processor.hpp"
#include "result.hpp"
#include "simctl/simctl_device_manager.hpp"
#include "ui/ui_tree.hpp"

namespace simpilot {

using Reply = Result<nlohmann::json>;
using Timeout = std::optional<std::chrono::milliseconds>;

struct ScreenshotRequest {
    std::optional<double> scale;
    std::optional<std::string> format;   // "jpeg" | "png"
    std::optional<int> quality;
    std::optional<std::string> source;   // "simctl" | "agent"
    bool include_data = false;           // base64 payload in the reply
};

class AutomationService {
public:
    AutomationService(bridge::BridgeRegistry& bridges,
                      simctl::SimctlDeviceManager& devices,
                      ArtifactStore& artifacts,
                      config::ScreenshotConfig screenshot_defaults);

    // --- Device lifecycle (simctl) ---
    Reply listDevices();
    Reply bootDevice(const std::string& device_id);
    Reply shutdownDevice(const std::string& device_id);
    Reply installApp(const std::string& device_id, const std::string& app_path);
    Reply uninstallApp(const std::string& device_id, const std::string& bundle_id);
    Reply statusBarOverride(const std::string& device_id, const simctl::StatusBarOverride& values);
    Reply statusBarClear(const std::string& device_id);

    // --- Bridge ---
    Reply startBridge(const std::string& device_id);
    Reply stopBridge(const std::string& device_id);
    Reply resetSession(const std::string& device_id);
    // Empty id: every bridge
    Reply bridgeStatus(const std::string& device_id);
    Reply health(const std::string& device_id);

    // --- UI tree ---
    Reply getUiTree(const std::string& device_id, ui::TreeFormat format, Timeout timeout = {});
    Reply findElement(const std::string& device_id, const ui::Predicate& predicate,
                      Timeout timeout = {});
    Reply tapElement(const std::string& device_id, int index, Timeout timeout = {});
    Reply tapElement(const std::string& device_id, const ui::Predicate& predicate,
                     Timeout timeout = {});

    // --- Gestures / input ---
    Reply tap(const std::string& device_id, int x, int y, Timeout timeout = {});
    Reply doubleTap(const std::string& device_id, int x, int y, Timeout timeout = {});
    Reply longPress(const std::string& device_id, int x, int y, int duration_ms,
                    Timeout timeout = {});
    Reply swipe(const std::string& device_id, int from_x, int from_y, int to_x, int to_y,
                int duration_ms, Timeout timeout = {});
    Reply typeText(const std::string& device_id, const std::string& text, Timeout timeout = {});
    Reply pressButton(const std::string& device_id, const std::string& name, Timeout timeout = {});

    // --- Apps ---
    Reply launchApp(const std::string& device_id, const std::string& bundle_id, Timeout timeout = {});
    Reply terminateApp(const std::string& device_id, const std::string& bundle_id, Timeout timeout = {});
    Reply activateApp(const std::string& device_id, const std::string& bundle_id, Timeout timeout = {});
    Reply appState(const std::string& device_id, const std::string& bundle_id, Timeout timeout = {});
    Reply listApps(const std::string& device_id, Timeout timeout = {});

    // --- System ---
    Reply setLocation(const std::string& device_id, double latitude, double longitude,
                      Timeout timeout = {});
    Reply getLocation(const std::string& device_id, Timeout timeout = {});
    Reply clearLocation(const std::string& device_id, Timeout timeout = {});
    Reply getClipboard(const std::string& device_id, Timeout timeout = {});
    Reply setClipboard(const std::string& device_id, const std::string& text, Timeout timeout = {});
    Reply getWindowSize(const std::string& device_id, Timeout timeout = {});
    Reply getOrientation(const std::string& device_id, Timeout timeout = {});
    Reply getAppearance(const std::string& device_id, Timeout timeout = {});
    Reply setAppearance(const std::string& device_id, const std::string& style, Timeout timeout = {});
    Reply biometricMatch(const std::string& device_id, bool match, Timeout timeout = {});

    // --- Recording ---
    Reply startRecording(const std::string& device_id, const nlohmann::json& options);
    Reply stopRecording(const std::string& device_id);

    // --- Alerts ---
    Reply getAlertText(const std::string& device_id, Timeout timeout = {});
    Reply acceptAlert(const std::string& device_id, Timeout timeout = {});
    Reply dismissAlert(const std::string& device_id, Timeout timeout = {});

    // --- Screenshot ---
    Reply getScreenshot(const std::string& device_id, const ScreenshotRequest& request);

private:
    Result<std::shared_ptr<bridge::Bridge>> startedBridge(const std::string& device_id) const;

    // Runs fn on the device's bridge, mapping the value to JSON
    template<typename T, typename ToJson>
    Reply onBridge(const std::string& device_id, const char* op,
                   const bridge::Bridge::Operation<T>& fn, ToJson to_json, Timeout timeout);
    Reply onBridge(const std::string& device_id, const char* op,
                   const bridge::Bridge::Operation<void>& fn, Timeout timeout);

    bridge::BridgeRegistry& bridges_;
    simctl::SimctlDeviceManager& devices_;
    ArtifactStore& artifacts_;
    config::ScreenshotConfig screenshot_defaults_;
};

// {"status":"ok"}
nlohmann::json okPayload();

} // namespace simpilot
