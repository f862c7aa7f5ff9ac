// =============================================================================
// SimPilot - Bridge Implementation
// =============================================================================
#include "bridge/bridge.hpp"
#include "simpilot_log.hpp"

#include <ctime>

static constexpr const char* TAG = "Bridge";

namespace simpilot::bridge {

using json = nlohmann::json;

const char* bridgeStateName(BridgeState state) {
    switch (state) {
        case BridgeState::Disconnected: return "disconnected";
        case BridgeState::Connecting:   return "connecting";
        case BridgeState::Active:       return "active";
        case BridgeState::Expired:      return "expired";
    }
    return "disconnected";
}

// =============================================================================
// FifoGate
// =============================================================================

FifoGate::Ticket::Ticket(FifoGate& gate) : gate_(gate) {
    std::unique_lock<std::mutex> lock(gate_.mutex_);
    const uint64_t mine = gate_.next_ticket_++;
    gate_.cv_.wait(lock, [&] { return gate_.serving_ == mine; });
}

FifoGate::Ticket::~Ticket() {
    {
        std::lock_guard<std::mutex> lock(gate_.mutex_);
        ++gate_.serving_;
    }
    gate_.cv_.notify_all();
}

bool FifoGate::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serving_ != next_ticket_;
}

// =============================================================================
// BridgeStatus
// =============================================================================

json BridgeStatus::toJson() const {
    json j = {
        {"device_id", device_id},
        {"agent_url", agent_url},
        {"state", bridgeStateName(state)},
        {"busy", busy},
        {"recording", recording},
    };
    j["session_id"] = session_id.empty() ? json(nullptr) : json(session_id);

    if (last_used.time_since_epoch().count() == 0) {
        j["last_used"] = nullptr;
    } else {
        std::time_t t = std::chrono::system_clock::to_time_t(last_used);
        std::tm tm_buf{};
        gmtime_r(&t, &tm_buf);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
        j["last_used"] = buf;
    }
    return j;
}

// =============================================================================
// Bridge
// =============================================================================

Bridge::Bridge(std::string device_id,
               std::shared_ptr<wda::Transport> transport,
               std::chrono::milliseconds timeout,
               json capabilities)
    : device_id_(std::move(device_id)),
      client_(std::move(transport), timeout),
      capabilities_(std::move(capabilities)) {}

Bridge::~Bridge() {
    if (state() == BridgeState::Disconnected) return;
    auto r = stop();
    if (r.is_err()) {
        SPLOG_WARN(TAG, "[%s] teardown: %s", device_id_.c_str(), r.error().message.c_str());
    }
}

void Bridge::setStateCallback(StateCallback cb) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_cb_ = std::move(cb);
}

BridgeState Bridge::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string Bridge::sessionId() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_id_;
}

bool Bridge::recording() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return recording_;
}

BridgeStatus Bridge::status() const {
    BridgeStatus s;
    s.device_id = device_id_;
    s.agent_url = client_.baseUrl();
    s.busy = gate_.busy();
    std::lock_guard<std::mutex> lock(state_mutex_);
    s.state = state_;
    s.session_id = session_id_;
    s.recording = recording_;
    s.last_used = last_used_;
    return s;
}

void Bridge::transition(BridgeState to) {
    BridgeState from;
    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = state_;
        state_ = to;
        cb = state_cb_;
    }
    if (from == to) return;

    SPLOG_INFO(TAG, "[%s] %s -> %s", device_id_.c_str(), bridgeStateName(from), bridgeStateName(to));
    if (cb) cb(device_id_, from, to);
}

void Bridge::touch() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_used_ = std::chrono::system_clock::now();
}

Result<void> Bridge::checkUsable(const char* op) const {
    switch (state()) {
        case BridgeState::Active:
            return Ok();
        case BridgeState::Expired:
            return AutomationError(ErrorKind::SessionExpired,
                                   std::string(op) + ": session for " + device_id_ +
                                   " has expired; call reset_session before retrying");
        case BridgeState::Disconnected:
        case BridgeState::Connecting:
            break;
    }
    return AutomationError(ErrorKind::InvalidArgument,
                           std::string(op) + ": bridge for " + device_id_ +
                           " is not connected; start the bridge first");
}

void Bridge::noteFailure(const char* op, AutomationError& err) {
    if (!err.is(ErrorKind::SessionExpired)) {
        SPLOG_DEBUG(TAG, "[%s] %s failed: %s (%s)", device_id_.c_str(), op,
                    errorKindName(err.kind), err.message.c_str());
        return;
    }

    SPLOG_WARN(TAG, "[%s] %s: agent reports session expired (%s)", device_id_.c_str(), op,
               err.message.c_str());
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        recording_ = false;
    }
    transition(BridgeState::Expired);
    err.message = "session for " + device_id_ + " expired (" + err.message +
                  "); call reset_session to reconnect";
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void> Bridge::connectLocked() {
    transition(BridgeState::Connecting);

    auto created = client_.createSession(capabilities_);
    if (created.is_err()) {
        SPLOG_ERROR(TAG, "[%s] session create failed at %s: %s", device_id_.c_str(),
                    client_.baseUrl().c_str(), created.error().message.c_str());
        transition(BridgeState::Disconnected);
        return created.error();
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_id_ = created.value();
        recording_ = false;
    }
    touch();
    SPLOG_INFO(TAG, "[%s] session %s", device_id_.c_str(), created.value().c_str());
    transition(BridgeState::Active);
    return Ok();
}

void Bridge::disconnectLocked(const char* reason) {
    const std::string sid = sessionId();
    if (!sid.empty()) {
        auto deleted = client_.deleteSession(sid);
        if (deleted.is_err()) {
            // The agent may already be gone; the handle is dropped either way
            SPLOG_WARN(TAG, "[%s] %s: delete session %s failed: %s", device_id_.c_str(), reason,
                       sid.c_str(), deleted.error().message.c_str());
        }
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_id_.clear();
        recording_ = false;
    }
}

Result<void> Bridge::start() {
    FifoGate::Ticket ticket(gate_);

    switch (state()) {
        case BridgeState::Active:
            return Ok();
        case BridgeState::Expired:
            disconnectLocked("start");
            break;
        case BridgeState::Disconnected:
        case BridgeState::Connecting:
            break;
    }
    SPLOG_INFO(TAG, "[%s] starting against %s", device_id_.c_str(), client_.baseUrl().c_str());
    return connectLocked();
}

Result<void> Bridge::stop() {
    FifoGate::Ticket ticket(gate_);

    if (state() == BridgeState::Disconnected) return Ok();
    disconnectLocked("stop");
    transition(BridgeState::Disconnected);
    return Ok();
}

Result<void> Bridge::resetSession() {
    FifoGate::Ticket ticket(gate_);

    SPLOG_INFO(TAG, "[%s] resetting session", device_id_.c_str());
    disconnectLocked("reset");
    return connectLocked();
}

bool Bridge::health() {
    FifoGate::Ticket ticket(gate_);
    return client_.getHealth();
}

// =============================================================================
// Element workflows
// =============================================================================

Result<ui::UiTreeIndex> Bridge::uiTree(ui::TreeFormat format,
                                       std::optional<std::chrono::milliseconds> timeout) {
    return run<ui::UiTreeIndex>("ui_tree",
        [format](wda::WdaClient& client, const std::string& sid) -> Result<ui::UiTreeIndex> {
            auto tree = client.getUiTree(sid, format);
            if (tree.is_err()) return tree.error();
            return ui::UiTreeIndex::build(tree.value());
        }, timeout);
}

Result<ui::IndexedElement> Bridge::findElement(const ui::Predicate& predicate,
                                               std::optional<std::chrono::milliseconds> timeout) {
    return run<ui::IndexedElement>("find_element",
        [&predicate](wda::WdaClient& client, const std::string& sid) -> Result<ui::IndexedElement> {
            auto tree = client.getUiTree(sid);
            if (tree.is_err()) return tree.error();
            return ui::UiTreeIndex::build(tree.value()).find(predicate);
        }, timeout);
}

Result<ui::IndexedElement> Bridge::tapElement(int index,
                                              std::optional<std::chrono::milliseconds> timeout) {
    return run<ui::IndexedElement>("tap_element",
        [index](wda::WdaClient& client, const std::string& sid) -> Result<ui::IndexedElement> {
            auto tree = client.getUiTree(sid);
            if (tree.is_err()) return tree.error();

            auto element = ui::UiTreeIndex::build(tree.value()).at(index);
            if (element.is_err()) return element.error();

            const auto& frame = element.value().info.frame;
            auto tapped = client.tap(sid, frame.center_x(), frame.center_y());
            if (tapped.is_err()) return tapped.error();
            return element;
        }, timeout);
}

Result<ui::IndexedElement> Bridge::tapElement(const ui::Predicate& predicate,
                                              std::optional<std::chrono::milliseconds> timeout) {
    return run<ui::IndexedElement>("tap_element",
        [&predicate](wda::WdaClient& client, const std::string& sid) -> Result<ui::IndexedElement> {
            auto tree = client.getUiTree(sid);
            if (tree.is_err()) return tree.error();

            auto element = ui::UiTreeIndex::build(tree.value()).find(predicate);
            if (element.is_err()) return element.error();

            const auto& frame = element.value().info.frame;
            auto tapped = client.tap(sid, frame.center_x(), frame.center_y());
            if (tapped.is_err()) return tapped.error();
            return element;
        }, timeout);
}

Result<void> Bridge::tap(int x, int y, std::optional<std::chrono::milliseconds> timeout) {
    return run<void>("tap",
        [x, y](wda::WdaClient& client, const std::string& sid) { return client.tap(sid, x, y); },
        timeout);
}

// =============================================================================
// Screen recording
// =============================================================================

Result<json> Bridge::startRecording(const json& options) {
    return run<json>("start_recording",
        [this, &options](wda::WdaClient& client, const std::string&) -> Result<json> {
            if (recording()) {
                return AutomationError(ErrorKind::InvalidArgument,
                                       "recording already in progress on " + device_id_);
            }
            auto started = client.startRecording(options);
            if (started.is_err()) return started.error();

            std::lock_guard<std::mutex> lock(state_mutex_);
            recording_ = true;
            return started;
        });
}

Result<json> Bridge::stopRecording() {
    return run<json>("stop_recording",
        [this](wda::WdaClient& client, const std::string&) -> Result<json> {
            if (!recording()) {
                return AutomationError(ErrorKind::InvalidArgument,
                                       "no recording in progress on " + device_id_ +
                                       "; call start_recording first");
            }
            auto stopped = client.stopRecording();
            if (stopped.is_err()) return stopped.error();

            std::lock_guard<std::mutex> lock(state_mutex_);
            recording_ = false;
            return stopped;
        });
}

} // namespace simpilot::bridge
