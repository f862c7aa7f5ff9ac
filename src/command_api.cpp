// =============================================================================
// SimPilot - Command API Implementation
// =============================================================================
#include "command_api.hpp"
#include "simpilot_log.hpp"

#include <cmath>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <thread>

static constexpr const char* TAG = "command_api";

namespace simpilot {

using json = nlohmann::json;

namespace {

std::string deviceId(const json& params) {
    return params.at("device_id").get<std::string>();
}

// json の数値を int へ。範囲外は std::out_of_range
int toInt(const json& value, const char* key) {
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a number");
    }
    constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
    constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
    if (value.is_number_unsigned()) {
        const auto v = value.get<unsigned long long>();
        if (v > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw std::out_of_range(std::string("'") + key + "' is out of range for int");
        }
        return static_cast<int>(v);
    }
    if (value.is_number_integer()) {
        const auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw std::out_of_range(std::string("'") + key + "' is out of range for int");
        }
        return static_cast<int>(v);
    }
    const double v = value.get<double>();
    if (!std::isfinite(v) || v < kMin || v > kMax) {
        throw std::out_of_range(std::string("'") + key + "' is out of range for int");
    }
    return static_cast<int>(v);
}

int intParam(const json& params, const char* key) {
    return toInt(params.at(key), key);
}

int intParamOr(const json& params, const char* key, int fallback) {
    if (!params.contains(key) || params[key].is_null()) return fallback;
    return toInt(params[key], key);
}

std::optional<int> optionalInt(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    return toInt(params[key], key);
}

Timeout timeoutOf(const json& params) {
    if (params.contains("timeout_ms") && !params["timeout_ms"].is_null()) {
        const int ms = intParam(params, "timeout_ms");
        if (ms > 0) return std::chrono::milliseconds(ms);
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> optionalParam(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    return params.at(key).get<T>();
}

} // namespace

CommandApi::CommandApi(AutomationService& service) : service_(service) {
    registerHandlers();
}

// ---------------------------------------------------------------------------
// Handler table
// ---------------------------------------------------------------------------
void CommandApi::registerHandlers() {
    auto& s = service_;

    // --- Device lifecycle ---
    handlers_["list_devices"] = [&s](const json&) { return s.listDevices(); };
    handlers_["boot_device"] = [&s](const json& p) { return s.bootDevice(deviceId(p)); };
    handlers_["shutdown_device"] = [&s](const json& p) { return s.shutdownDevice(deviceId(p)); };
    handlers_["install_app"] = [&s](const json& p) {
        return s.installApp(deviceId(p), p.at("app_path").get<std::string>());
    };
    handlers_["uninstall_app"] = [&s](const json& p) {
        return s.uninstallApp(deviceId(p), p.at("bundle_id").get<std::string>());
    };
    handlers_["status_bar_override"] = [&s](const json& p) {
        simctl::StatusBarOverride values;
        values.time = optionalParam<std::string>(p, "time");
        values.battery_level = optionalInt(p, "battery_level");
        values.battery_state = optionalParam<std::string>(p, "battery_state");
        values.cellular_bars = optionalInt(p, "cellular_bars");
        values.wifi_bars = optionalInt(p, "wifi_bars");
        values.data_network = optionalParam<std::string>(p, "data_network");
        return s.statusBarOverride(deviceId(p), values);
    };
    handlers_["status_bar_clear"] = [&s](const json& p) { return s.statusBarClear(deviceId(p)); };

    // --- Bridge ---
    handlers_["start_bridge"] = [&s](const json& p) { return s.startBridge(deviceId(p)); };
    handlers_["stop_bridge"] = [&s](const json& p) { return s.stopBridge(deviceId(p)); };
    handlers_["reset_session"] = [&s](const json& p) { return s.resetSession(deviceId(p)); };
    handlers_["bridge_status"] = [&s](const json& p) {
        return s.bridgeStatus(optionalParam<std::string>(p, "device_id").value_or(""));
    };
    handlers_["health"] = [&s](const json& p) { return s.health(deviceId(p)); };

    // --- UI tree ---
    handlers_["get_ui_tree"] = [&s](const json& p) -> Reply {
        const std::string format = p.value("format", "json");
        if (format != "json" && format != "xml") {
            return AutomationError(ErrorKind::InvalidArgument, "format must be 'json' or 'xml'");
        }
        return s.getUiTree(deviceId(p), format == "xml" ? ui::TreeFormat::Xml : ui::TreeFormat::Json,
                           timeoutOf(p));
    };
    handlers_["find_element"] = [&s](const json& p) -> Reply {
        auto predicate = ui::parsePredicate(p.at("predicate"));
        if (predicate.is_err()) return predicate.error();
        return s.findElement(deviceId(p), predicate.value(), timeoutOf(p));
    };
    handlers_["tap_element"] = [&s](const json& p) -> Reply {
        const bool by_index = p.contains("index") && !p["index"].is_null();
        const bool by_predicate = p.contains("predicate") && !p["predicate"].is_null();
        if (by_index == by_predicate) {
            return AutomationError(ErrorKind::InvalidArgument,
                                   "tap_element takes exactly one of 'index' or 'predicate'");
        }
        if (by_index) {
            return s.tapElement(deviceId(p), intParam(p, "index"), timeoutOf(p));
        }
        auto predicate = ui::parsePredicate(p.at("predicate"));
        if (predicate.is_err()) return predicate.error();
        return s.tapElement(deviceId(p), predicate.value(), timeoutOf(p));
    };

    // --- Gestures / input ---
    handlers_["tap"] = [&s](const json& p) {
        return s.tap(deviceId(p), intParam(p, "x"), intParam(p, "y"), timeoutOf(p));
    };
    handlers_["double_tap"] = [&s](const json& p) {
        return s.doubleTap(deviceId(p), intParam(p, "x"), intParam(p, "y"), timeoutOf(p));
    };
    handlers_["long_press"] = [&s](const json& p) {
        return s.longPress(deviceId(p), intParam(p, "x"), intParam(p, "y"),
                           intParamOr(p, "duration_ms", wda::kLongPressDefaultMs), timeoutOf(p));
    };
    handlers_["swipe"] = [&s](const json& p) {
        return s.swipe(deviceId(p),
                       intParam(p, "from_x"), intParam(p, "from_y"),
                       intParam(p, "to_x"), intParam(p, "to_y"),
                       intParamOr(p, "duration_ms", wda::kSwipeDefaultMs), timeoutOf(p));
    };
    handlers_["type_text"] = [&s](const json& p) {
        return s.typeText(deviceId(p), p.at("text").get<std::string>(), timeoutOf(p));
    };
    handlers_["press_button"] = [&s](const json& p) {
        return s.pressButton(deviceId(p), p.at("name").get<std::string>(), timeoutOf(p));
    };

    // --- Apps ---
    handlers_["launch_app"] = [&s](const json& p) {
        return s.launchApp(deviceId(p), p.at("bundle_id").get<std::string>(), timeoutOf(p));
    };
    handlers_["terminate_app"] = [&s](const json& p) {
        return s.terminateApp(deviceId(p), p.at("bundle_id").get<std::string>(), timeoutOf(p));
    };
    handlers_["activate_app"] = [&s](const json& p) {
        return s.activateApp(deviceId(p), p.at("bundle_id").get<std::string>(), timeoutOf(p));
    };
    handlers_["app_state"] = [&s](const json& p) {
        return s.appState(deviceId(p), p.at("bundle_id").get<std::string>(), timeoutOf(p));
    };
    handlers_["list_apps"] = [&s](const json& p) { return s.listApps(deviceId(p), timeoutOf(p)); };

    // --- System ---
    handlers_["set_location"] = [&s](const json& p) {
        return s.setLocation(deviceId(p), p.at("latitude").get<double>(),
                             p.at("longitude").get<double>(), timeoutOf(p));
    };
    handlers_["get_location"] = [&s](const json& p) { return s.getLocation(deviceId(p), timeoutOf(p)); };
    handlers_["clear_location"] = [&s](const json& p) { return s.clearLocation(deviceId(p), timeoutOf(p)); };
    handlers_["get_clipboard"] = [&s](const json& p) { return s.getClipboard(deviceId(p), timeoutOf(p)); };
    handlers_["set_clipboard"] = [&s](const json& p) {
        return s.setClipboard(deviceId(p), p.at("text").get<std::string>(), timeoutOf(p));
    };
    handlers_["get_window_size"] = [&s](const json& p) { return s.getWindowSize(deviceId(p), timeoutOf(p)); };
    handlers_["get_orientation"] = [&s](const json& p) { return s.getOrientation(deviceId(p), timeoutOf(p)); };
    handlers_["get_appearance"] = [&s](const json& p) { return s.getAppearance(deviceId(p), timeoutOf(p)); };
    handlers_["set_appearance"] = [&s](const json& p) {
        return s.setAppearance(deviceId(p), p.at("appearance").get<std::string>(), timeoutOf(p));
    };
    handlers_["biometric_match"] = [&s](const json& p) {
        return s.biometricMatch(deviceId(p), p.value("match", true), timeoutOf(p));
    };

    // --- Recording ---
    handlers_["start_recording"] = [&s](const json& p) {
        const json options = p.contains("options") && p["options"].is_object()
                                 ? p["options"] : json::object();
        return s.startRecording(deviceId(p), options);
    };
    handlers_["stop_recording"] = [&s](const json& p) { return s.stopRecording(deviceId(p)); };

    // --- Alerts ---
    handlers_["get_alert_text"] = [&s](const json& p) { return s.getAlertText(deviceId(p), timeoutOf(p)); };
    handlers_["accept_alert"] = [&s](const json& p) { return s.acceptAlert(deviceId(p), timeoutOf(p)); };
    handlers_["dismiss_alert"] = [&s](const json& p) { return s.dismissAlert(deviceId(p), timeoutOf(p)); };

    // --- Screenshot ---
    handlers_["get_screenshot"] = [&s](const json& p) {
        ScreenshotRequest request;
        request.scale = optionalParam<double>(p, "scale");
        request.format = optionalParam<std::string>(p, "format");
        request.quality = optionalInt(p, "quality");
        request.source = optionalParam<std::string>(p, "source");
        request.include_data = p.value("include_data", false);
        return s.getScreenshot(deviceId(p), request);
    };
}

std::vector<std::string> CommandApi::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) names.push_back(name);
    return names;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
Reply CommandApi::handle(const std::string& method, const json& params) {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return AutomationError(ErrorKind::InvalidArgument, "unknown method: " + method);
    }
    if (!params.is_object()) {
        return AutomationError(ErrorKind::InvalidArgument, "params must be a JSON object");
    }

    try {
        return it->second(params);
    } catch (const json::exception& e) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "invalid params for " + method + ": " + e.what());
    } catch (const std::logic_error& e) {
        return AutomationError(ErrorKind::InvalidArgument,
                               "invalid params for " + method + ": " + e.what());
    }
}

std::string CommandApi::dispatch(const std::string& json_line) {
    json id = nullptr;
    try {
        auto req = json::parse(json_line);
        if (!req.is_object()) {
            return makeError(id, AutomationError(ErrorKind::InvalidArgument,
                                                 "request must be a JSON object"));
        }
        if (req.contains("id")) id = req["id"];

        if (!req.contains("method") || !req["method"].is_string()) {
            return makeError(id, AutomationError(ErrorKind::InvalidArgument, "missing method"));
        }
        const std::string method = req["method"].get<std::string>();
        const json params = req.contains("params") && !req["params"].is_null()
                                ? req["params"] : json::object();

        SPLOG_INFO(TAG, "RPC: method=%s id=%s", method.c_str(), id.dump().c_str());

        Reply reply = handle(method, params);
        if (reply.is_err()) {
            SPLOG_DEBUG(TAG, "RPC %s failed: %s", method.c_str(), reply.error().message.c_str());
            return makeError(id, reply.error());
        }
        return makeResult(id, reply.value());

    } catch (const json::exception& e) {
        return makeError(id, AutomationError(ErrorKind::InvalidArgument,
                                             std::string("JSON parse error: ") + e.what()));
    } catch (const std::exception& e) {
        SPLOG_ERROR(TAG, "internal error: %s", e.what());
        return makeError(id, AutomationError(ErrorKind::UnknownAgentError,
                                             std::string("internal error: ") + e.what()));
    }
}

// ---------------------------------------------------------------------------
// Response builders
// ---------------------------------------------------------------------------
std::string CommandApi::makeResult(const json& id, const json& result) {
    return json{{"id", id}, {"result", result}}.dump();
}

std::string CommandApi::makeError(const json& id, const AutomationError& error) {
    return json{{"id", id}, {"error", error.toJson()}}.dump();
}

// ---------------------------------------------------------------------------
// Stream loop
// ---------------------------------------------------------------------------
std::string CommandApi::laneKey(const std::string& json_line) {
    auto req = json::parse(json_line, nullptr, false);
    if (!req.is_object() || !req.contains("params") || !req["params"].is_object()) return "";
    const json& params = req["params"];
    if (!params.contains("device_id") || !params["device_id"].is_string()) return "";
    return params["device_id"].get<std::string>();
}

void CommandApi::serve(std::istream& in, std::ostream& out) {
    size_t requests = 0;
    std::string line;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        const std::string key = laneKey(line);
        enqueue(key, std::move(line), out);
        ++requests;
    }

    // 入力終了: 残りを流し切ってから全ワーカーを join
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(lanes_mutex_);
        for (auto& [key, lane] : lanes_) {
            if (lane->worker.joinable()) workers.push_back(std::move(lane->worker));
        }
    }
    for (auto& t : workers) t.join();
    {
        std::lock_guard<std::mutex> lock(lanes_mutex_);
        lanes_.clear();
    }
    SPLOG_INFO(TAG, "input closed after %zu requests", requests);
}

void CommandApi::enqueue(const std::string& key, std::string request, std::ostream& out) {
    std::lock_guard<std::mutex> lock(lanes_mutex_);
    retireIdleLanes(key);

    auto& slot = lanes_[key];
    if (!slot) slot = std::make_unique<Lane>();
    Lane* lane = slot.get();
    lane->pending.push_back(std::move(request));
    if (lane->active) return;

    // 前のワーカーは active=false にした後はレーンに触れない
    if (lane->worker.joinable()) lane->worker.join();
    lane->active = true;
    lane->worker = std::thread(&CommandApi::drain, this, lane, std::ref(out));
}

void CommandApi::drain(Lane* lane, std::ostream& out) {
    for (;;) {
        std::string request;
        {
            std::lock_guard<std::mutex> lock(lanes_mutex_);
            if (lane->pending.empty()) {
                lane->active = false;
                return;
            }
            request = std::move(lane->pending.front());
            lane->pending.pop_front();
        }

        const std::string response = dispatch(request);
        std::lock_guard<std::mutex> lock(out_mutex_);
        out << response << '\n';
        out.flush();
    }
}

// lanes_mutex_ 保持中に呼ぶ
void CommandApi::retireIdleLanes(const std::string& keep) {
    for (auto it = lanes_.begin(); it != lanes_.end();) {
        Lane& lane = *it->second;
        if (it->first != keep && !lane.active && lane.pending.empty()) {
            if (lane.worker.joinable()) lane.worker.join();
            it = lanes_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace simpilot
