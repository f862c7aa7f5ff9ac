// =============================================================================
// SimPilot - WebDriverAgent Protocol Client Implementation
// =============================================================================
#include "wda/wda_client.hpp"
#include "wda/error_normalizer.hpp"
#include "base64.hpp"
#include "simpilot_log.hpp"

static constexpr const char* TAG = "wda";

namespace simpilot::wda {

using json = nlohmann::json;

namespace {

// Seconds as the legacy /wda/ verbs expect them
double toSeconds(int ms) { return static_cast<double>(ms) / 1000.0; }

Result<void> checkPoint(int x, int y) {
    if (x < 0 || y < 0) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "coordinates must be non-negative: (" + std::to_string(x) + ", " +
                               std::to_string(y) + ")");
    }
    return Ok();
}

Result<void> checkBundleId(const std::string& bundle_id) {
    if (bundle_id.empty()) {
        return AutomationError(ErrorKind::InvalidArgument, "bundle id is empty");
    }
    return Ok();
}

std::string valueAsString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

} // namespace

const char* appStateName(AppState state) {
    switch (state) {
        case AppState::Unknown:                    return "unknown";
        case AppState::NotRunning:                 return "not_running";
        case AppState::RunningBackgroundSuspended: return "running_background_suspended";
        case AppState::RunningBackground:          return "running_background";
        case AppState::RunningForeground:          return "running_foreground";
    }
    return "unknown";
}

WdaClient::WdaClient(std::shared_ptr<Transport> transport, std::chrono::milliseconds timeout)
    : transport_(std::move(transport)), timeout_(timeout) {}

std::string WdaClient::sessionPath(const std::string& session_id, const std::string& suffix) {
    return "/session/" + session_id + suffix;
}

// =============================================================================
// Request plumbing
// =============================================================================

Result<json> WdaClient::call(const std::string& method, const std::string& path,
                             const std::optional<json>& body) {
    SPLOG_DEBUG(TAG, "%s %s", method.c_str(), path.c_str());

    auto sent = transport_->send(method, path, body, timeout_);
    if (sent.is_err()) {
        const auto& terr = sent.error();
        SPLOG_WARN(TAG, "%s %s: transport failure (%s)", method.c_str(), path.c_str(),
                   terr.message.c_str());
        return fromTransportError(terr);
    }

    HttpResponse& response = sent.value();
    if (isErrorResponse(response.status, response.body)) {
        AutomationError err = normalizeError(response.status, response.body);
        SPLOG_DEBUG(TAG, "%s %s -> HTTP %d %s: %s", method.c_str(), path.c_str(),
                    response.status, errorKindName(err.kind), err.message.c_str());
        return err;
    }

    if (response.body.is_object() && response.body.contains("value")) {
        return json(response.body["value"]);
    }
    return std::move(response.body);
}

Result<void> WdaClient::callVoid(const std::string& method, const std::string& path,
                                 const std::optional<json>& body) {
    auto r = call(method, path, body);
    if (r.is_err()) return r.error();
    return Ok();
}

// =============================================================================
// Session
// =============================================================================

Result<std::string> WdaClient::createSession(const json& capabilities) {
    json body = {{"capabilities", {{"alwaysMatch", capabilities.is_object() ? capabilities : json::object()}}}};

    auto sent = transport_->send("POST", "/session", body, timeout_);
    if (sent.is_err()) {
        SPLOG_WARN(TAG, "session create: agent at %s unreachable (%s)",
                   transport_->base_url().c_str(), sent.error().message.c_str());
        return fromTransportError(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (isErrorResponse(response.status, response.body)) {
        return normalizeError(response.status, response.body);
    }

    const json& b = response.body;
    if (b.is_object() && b.contains("sessionId") && b["sessionId"].is_string()) {
        return b["sessionId"].get<std::string>();
    }
    if (b.is_object() && b.contains("value") && b["value"].is_object() &&
        b["value"].contains("sessionId") && b["value"]["sessionId"].is_string()) {
        return b["value"]["sessionId"].get<std::string>();
    }

    return AutomationError(ErrorKind::UnknownAgentError,
                           "session response carries no sessionId", b, response.status);
}

Result<void> WdaClient::deleteSession(const std::string& session_id) {
    if (session_id.empty()) return Ok();

    auto r = call("DELETE", sessionPath(session_id, ""));
    if (r.is_ok()) return Ok();

    const AutomationError& err = r.error();
    if (err.is(ErrorKind::SessionExpired) || err.is(ErrorKind::NoSuchElement) ||
        err.http_status == 404) {
        SPLOG_DEBUG(TAG, "session %s already gone", session_id.c_str());
        return Ok();
    }
    return err;
}

Result<json> WdaClient::getStatus() {
    return call("GET", "/status");
}

bool WdaClient::getHealth() {
    auto r = getStatus();
    if (r.is_err()) return false;
    const json& status = r.value();
    if (status.is_object() && status.contains("ready") && status["ready"].is_boolean()) {
        return status["ready"].get<bool>();
    }
    return true;
}

// =============================================================================
// Hierarchy
// =============================================================================

Result<ui::ElementNode> WdaClient::getUiTree(const std::string& session_id, ui::TreeFormat format) {
    const bool as_json = format == ui::TreeFormat::Json;
    auto r = call("GET", sessionPath(session_id, as_json ? "/source?format=json" : "/source?format=xml"));
    if (r.is_err()) return r.error();

    json& value = r.value();
    if (as_json) {
        if (value.is_object()) return ui::parseJsonTree(value);
        // Some agent builds double-encode the JSON tree as a string
        if (value.is_string()) {
            try {
                return ui::parseJsonTree(json::parse(value.get<std::string>()));
            } catch (const json::parse_error& e) {
                return AutomationError(ErrorKind::UnknownAgentError,
                                       std::string("unparseable JSON hierarchy: ") + e.what());
            }
        }
        return AutomationError(ErrorKind::UnknownAgentError, "unexpected hierarchy payload", value);
    }

    if (!value.is_string()) {
        return AutomationError(ErrorKind::UnknownAgentError, "XML hierarchy is not a string", value);
    }
    return ui::parseXmlTree(value.get<std::string>());
}

// =============================================================================
// Gestures
// =============================================================================

Result<void> WdaClient::performActions(const std::string& session_id,
                                       const std::vector<PointerSequence>& sequences) {
    return callVoid("POST", sessionPath(session_id, "/actions"), encodeActions(sequences));
}

Result<void> WdaClient::gesture(const std::string& session_id,
                                const PointerSequence& sequence,
                                const std::string& legacy_path,
                                const json& legacy_body) {
    auto primary = performActions(session_id, {sequence});
    if (primary.is_ok()) return Ok();
    if (!primary.error().unsupported_endpoint) return primary.error();

    SPLOG_INFO(TAG, "actions endpoint unsupported, falling back to %s", legacy_path.c_str());
    return callVoid("POST", sessionPath(session_id, legacy_path), legacy_body);
}

Result<void> WdaClient::tap(const std::string& session_id, int x, int y) {
    if (auto ok = checkPoint(x, y); ok.is_err()) return ok;
    return gesture(session_id, tapSequence(x, y), "/wda/tap", {{"x", x}, {"y", y}});
}

Result<void> WdaClient::doubleTap(const std::string& session_id, int x, int y) {
    if (auto ok = checkPoint(x, y); ok.is_err()) return ok;
    return gesture(session_id, doubleTapSequence(x, y), "/wda/doubleTap", {{"x", x}, {"y", y}});
}

Result<void> WdaClient::longPress(const std::string& session_id, int x, int y, int duration_ms) {
    if (auto ok = checkPoint(x, y); ok.is_err()) return ok;
    if (duration_ms <= 0) {
        return AutomationError(ErrorKind::InvalidArgument, "long press duration must be positive");
    }
    return gesture(session_id, longPressSequence(x, y, duration_ms), "/wda/touchAndHold",
                   {{"x", x}, {"y", y}, {"duration", toSeconds(duration_ms)}});
}

Result<void> WdaClient::swipe(const std::string& session_id, int from_x, int from_y,
                              int to_x, int to_y, int duration_ms) {
    if (auto ok = checkPoint(from_x, from_y); ok.is_err()) return ok;
    if (auto ok = checkPoint(to_x, to_y); ok.is_err()) return ok;
    if (duration_ms < 0) {
        return AutomationError(ErrorKind::InvalidArgument, "swipe duration must be >= 0");
    }
    return gesture(session_id, swipeSequence(from_x, from_y, to_x, to_y, duration_ms),
                   "/wda/dragfromtoforduration",
                   {{"fromX", from_x}, {"fromY", from_y}, {"toX", to_x}, {"toY", to_y},
                    {"duration", toSeconds(duration_ms)}});
}

// =============================================================================
// Keyboard / hardware buttons
// =============================================================================

Result<void> WdaClient::typeText(const std::string& session_id, const std::string& text) {
    if (text.empty()) {
        return AutomationError(ErrorKind::InvalidArgument, "text is empty");
    }
    // The agent takes a list of characters; UTF-8 sequences stay together
    json chars = json::array();
    for (size_t i = 0; i < text.size();) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if (lead >= 0xF0) len = 4;
        else if (lead >= 0xE0) len = 3;
        else if (lead >= 0xC0) len = 2;
        chars.push_back(text.substr(i, len));
        i += len;
    }
    return callVoid("POST", sessionPath(session_id, "/wda/keys"), json{{"value", chars}});
}

Result<void> WdaClient::pressButton(const std::string& session_id, const std::string& name) {
    if (name != "home" && name != "volumeUp" && name != "volumeDown") {
        return AutomationError(ErrorKind::InvalidArgument,
                               "unknown button '" + name + "' (home, volumeUp, volumeDown)");
    }
    return callVoid("POST", sessionPath(session_id, "/wda/pressButton"), json{{"name", name}});
}

// =============================================================================
// Apps
// =============================================================================

Result<void> WdaClient::launchApp(const std::string& session_id, const std::string& bundle_id) {
    if (auto ok = checkBundleId(bundle_id); ok.is_err()) return ok;
    SPLOG_INFO(TAG, "launch %s", bundle_id.c_str());
    return callVoid("POST", sessionPath(session_id, "/wda/apps/launch"), json{{"bundleId", bundle_id}});
}

Result<bool> WdaClient::terminateApp(const std::string& session_id, const std::string& bundle_id) {
    if (auto ok = checkBundleId(bundle_id); ok.is_err()) return ok.error();
    auto r = call("POST", sessionPath(session_id, "/wda/apps/terminate"), json{{"bundleId", bundle_id}});
    if (r.is_err()) return r.error();
    return r.value().is_boolean() ? r.value().get<bool>() : true;
}

Result<void> WdaClient::activateApp(const std::string& session_id, const std::string& bundle_id) {
    if (auto ok = checkBundleId(bundle_id); ok.is_err()) return ok;
    return callVoid("POST", sessionPath(session_id, "/wda/apps/activate"), json{{"bundleId", bundle_id}});
}

Result<AppState> WdaClient::appState(const std::string& session_id, const std::string& bundle_id) {
    if (auto ok = checkBundleId(bundle_id); ok.is_err()) return ok.error();
    auto r = call("POST", sessionPath(session_id, "/wda/apps/state"), json{{"bundleId", bundle_id}});
    if (r.is_err()) return r.error();
    if (!r.value().is_number_integer()) {
        return AutomationError(ErrorKind::UnknownAgentError, "app state is not an integer", r.value());
    }
    int code = r.value().get<int>();
    if (code < 0 || code > 4) code = 0;
    return static_cast<AppState>(code);
}

Result<json> WdaClient::listApps(const std::string& session_id) {
    auto r = call("GET", sessionPath(session_id, "/wda/apps/list"));
    if (r.is_err()) return r.error();
    if (r.value().is_null()) return json::array();
    return std::move(r.value());
}

// =============================================================================
// Simulated location
// =============================================================================

Result<void> WdaClient::setLocation(const std::string& session_id, const GeoLocation& location) {
    if (location.latitude < -90.0 || location.latitude > 90.0 ||
        location.longitude < -180.0 || location.longitude > 180.0) {
        return AutomationError(ErrorKind::InvalidArgument, "latitude/longitude out of range");
    }
    return callVoid("POST", sessionPath(session_id, "/wda/simulatedLocation"),
                    json{{"latitude", location.latitude}, {"longitude", location.longitude}});
}

Result<GeoLocation> WdaClient::getLocation(const std::string& session_id) {
    auto r = call("GET", sessionPath(session_id, "/wda/simulatedLocation"));
    if (r.is_err()) return r.error();

    const json& v = r.value();
    if (!v.is_object() || !v.contains("latitude") || !v["latitude"].is_number() ||
        !v.contains("longitude") || !v["longitude"].is_number()) {
        return AutomationError(ErrorKind::NoSuchElement, "no simulated location is set", v);
    }
    return GeoLocation{v["latitude"].get<double>(), v["longitude"].get<double>()};
}

Result<void> WdaClient::clearLocation(const std::string& session_id) {
    return callVoid("DELETE", sessionPath(session_id, "/wda/simulatedLocation"));
}

// =============================================================================
// Clipboard
// =============================================================================

Result<std::string> WdaClient::getClipboard(const std::string& session_id) {
    auto r = call("POST", sessionPath(session_id, "/wda/getPasteboard"),
                  json{{"contentType", "plaintext"}});
    if (r.is_err()) return r.error();
    if (!r.value().is_string()) return std::string();

    auto bytes = base64Decode(r.value().get<std::string>());
    if (!bytes) {
        return AutomationError(ErrorKind::UnknownAgentError, "pasteboard payload is not base64",
                               r.value());
    }
    return std::string(bytes->begin(), bytes->end());
}

Result<void> WdaClient::setClipboard(const std::string& session_id, const std::string& text) {
    return callVoid("POST", sessionPath(session_id, "/wda/setPasteboard"),
                    json{{"content", base64Encode(text)}, {"contentType", "plaintext"}});
}

// =============================================================================
// Device
// =============================================================================

Result<WindowSize> WdaClient::getWindowSize(const std::string& session_id) {
    auto r = call("GET", sessionPath(session_id, "/window/size"));
    if (r.is_err()) return r.error();

    const json& v = r.value();
    if (!v.is_object() || !v.contains("width") || !v.contains("height") ||
        !v["width"].is_number() || !v["height"].is_number()) {
        return AutomationError(ErrorKind::UnknownAgentError, "malformed window size", v);
    }
    return WindowSize{static_cast<int>(v["width"].get<double>()),
                      static_cast<int>(v["height"].get<double>())};
}

Result<std::string> WdaClient::getOrientation(const std::string& session_id) {
    auto r = call("GET", sessionPath(session_id, "/orientation"));
    if (r.is_err()) return r.error();
    return valueAsString(r.value());
}

Result<std::string> WdaClient::getAppearance() {
    auto r = call("GET", "/wda/device/info");
    if (r.is_err()) return r.error();

    const json& v = r.value();
    if (v.is_object() && v.contains("userInterfaceStyle")) {
        return valueAsString(v["userInterfaceStyle"]);
    }
    return std::string("unknown");
}

Result<void> WdaClient::setAppearance(const std::string& session_id, const std::string& style) {
    if (style != "light" && style != "dark") {
        return AutomationError(ErrorKind::InvalidArgument,
                               "appearance must be 'light' or 'dark', got '" + style + "'");
    }
    return callVoid("POST", sessionPath(session_id, "/wda/device/appearance"), json{{"name", style}});
}

Result<void> WdaClient::biometricMatch(const std::string& session_id, bool match) {
    return callVoid("POST", sessionPath(session_id, "/wda/touch_id"), json{{"match", match}});
}

// =============================================================================
// Screen recording
// =============================================================================

Result<json> WdaClient::startRecording(const json& options) {
    return call("POST", "/wda/video/start", options.is_object() ? options : json::object());
}

Result<json> WdaClient::stopRecording() {
    return call("POST", "/wda/video/stop", json::object());
}

// =============================================================================
// Screenshot
// =============================================================================

Result<std::vector<uint8_t>> WdaClient::screenshot() {
    auto r = call("GET", "/screenshot");
    if (r.is_err()) return r.error();
    if (!r.value().is_string()) {
        return AutomationError(ErrorKind::UnknownAgentError, "screenshot payload is not a string");
    }
    auto bytes = base64Decode(r.value().get<std::string>());
    if (!bytes || bytes->empty()) {
        return AutomationError(ErrorKind::UnknownAgentError, "screenshot payload is not base64");
    }
    return std::move(*bytes);
}

// =============================================================================
// Alerts
// =============================================================================

Result<std::string> WdaClient::getAlertText(const std::string& session_id) {
    auto r = call("GET", sessionPath(session_id, "/alert/text"));
    if (r.is_err()) return r.error();
    return valueAsString(r.value());
}

Result<void> WdaClient::acceptAlert(const std::string& session_id) {
    return callVoid("POST", sessionPath(session_id, "/alert/accept"), json::object());
}

Result<void> WdaClient::dismissAlert(const std::string& session_id) {
    return callVoid("POST", sessionPath(session_id, "/alert/dismiss"), json::object());
}

} // namespace simpilot::wda
