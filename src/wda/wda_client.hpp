#pragma once
// =============================================================================
// SimPilot - WebDriverAgent Protocol Client
// =============================================================================
// Session, gesture, app, system and alert operations against one agent.
// Every failure comes back normalized (error_normalizer); transport failures
// are reclassified as ConnectionRefused or Timeout.
//
// Gestures use W3C pointer actions first and fall back to the legacy /wda/
// gesture verbs only when the agent reports the actions endpoint as
// unsupported. Any other failure is returned unchanged.
// =============================================================================

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "ui/ui_tree.hpp"
#include "wda/http_transport.hpp"
#include "wda/touch_actions.hpp"

namespace simpilot::wda {

struct WindowSize {
    int width = 0;
    int height = 0;
};

struct GeoLocation {
    double latitude = 0.0;
    double longitude = 0.0;
};

// XCUIApplicationState
enum class AppState {
    Unknown = 0,
    NotRunning = 1,
    RunningBackgroundSuspended = 2,
    RunningBackground = 3,
    RunningForeground = 4,
};

const char* appStateName(AppState state);

class WdaClient {
public:
    explicit WdaClient(std::shared_ptr<Transport> transport,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    // Timeout applied to each subsequent request
    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    std::string baseUrl() const { return transport_->base_url(); }

    // --- Session ---
    Result<std::string> createSession(const nlohmann::json& capabilities = nlohmann::json::object());
    // Already-gone sessions count as deleted
    Result<void> deleteSession(const std::string& session_id);
    // GET /status; false on any failure
    bool getHealth();
    Result<nlohmann::json> getStatus();

    // --- Hierarchy ---
    Result<ui::ElementNode> getUiTree(const std::string& session_id,
                                      ui::TreeFormat format = ui::TreeFormat::Json);

    // --- Gestures ---
    Result<void> performActions(const std::string& session_id,
                                const std::vector<PointerSequence>& sequences);
    Result<void> tap(const std::string& session_id, int x, int y);
    Result<void> doubleTap(const std::string& session_id, int x, int y);
    Result<void> longPress(const std::string& session_id, int x, int y,
                           int duration_ms = kLongPressDefaultMs);
    Result<void> swipe(const std::string& session_id, int from_x, int from_y,
                       int to_x, int to_y, int duration_ms = kSwipeDefaultMs);

    // --- Keyboard / hardware buttons ---
    Result<void> typeText(const std::string& session_id, const std::string& text);
    // home, volumeUp, volumeDown
    Result<void> pressButton(const std::string& session_id, const std::string& name);

    // --- Apps ---
    Result<void> launchApp(const std::string& session_id, const std::string& bundle_id);
    Result<bool> terminateApp(const std::string& session_id, const std::string& bundle_id);
    Result<void> activateApp(const std::string& session_id, const std::string& bundle_id);
    Result<AppState> appState(const std::string& session_id, const std::string& bundle_id);
    Result<nlohmann::json> listApps(const std::string& session_id);

    // --- Simulated location ---
    Result<void> setLocation(const std::string& session_id, const GeoLocation& location);
    Result<GeoLocation> getLocation(const std::string& session_id);
    Result<void> clearLocation(const std::string& session_id);

    // --- Clipboard (plaintext) ---
    Result<std::string> getClipboard(const std::string& session_id);
    Result<void> setClipboard(const std::string& session_id, const std::string& text);

    // --- Device ---
    Result<WindowSize> getWindowSize(const std::string& session_id);
    Result<std::string> getOrientation(const std::string& session_id);
    // Device-wide (/wda/device/info), not session-scoped
    Result<std::string> getAppearance();
    // "light" | "dark"
    Result<void> setAppearance(const std::string& session_id, const std::string& style);
    Result<void> biometricMatch(const std::string& session_id, bool match);

    // --- Screen recording (agent-wide, /wda/video/*) ---
    Result<nlohmann::json> startRecording(const nlohmann::json& options = nlohmann::json::object());
    Result<nlohmann::json> stopRecording();

    // --- Screenshot (PNG bytes) ---
    Result<std::vector<uint8_t>> screenshot();

    // --- Alerts ---
    Result<std::string> getAlertText(const std::string& session_id);
    Result<void> acceptAlert(const std::string& session_id);
    Result<void> dismissAlert(const std::string& session_id);

private:
    // One request; the "value" member of a successful reply (or the whole body)
    Result<nlohmann::json> call(const std::string& method, const std::string& path,
                                const std::optional<nlohmann::json>& body = std::nullopt);
    Result<void> callVoid(const std::string& method, const std::string& path,
                          const std::optional<nlohmann::json>& body = std::nullopt);

    // Actions first, legacy verb only when actions are unsupported
    Result<void> gesture(const std::string& session_id,
                         const PointerSequence& sequence,
                         const std::string& legacy_path,
                         const nlohmann::json& legacy_body);

    static std::string sessionPath(const std::string& session_id, const std::string& suffix);

    std::shared_ptr<Transport> transport_;
    std::chrono::milliseconds timeout_;
};

} // namespace simpilot::wda
