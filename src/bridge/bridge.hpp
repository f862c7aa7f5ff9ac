#pragma once
// =============================================================================
// SimPilot - Bridge: per-device agent session state machine
// =============================================================================
//   Disconnected --start--> Connecting --session ok--> Active
//        ^                      |  (create failed)        |
//        +----------------------+                         | SessionExpired
//        +--------------------stop------------------------+ from any op
//                                                         v
//   Connecting <--------------resetSession-------------- Expired
//
// Expired: every operation fails immediately with SessionExpired (no network).
// Disconnected: operations fail with InvalidArgument.
//
// Operations on one Bridge run one at a time in submission order (FIFO
// ticket gate). Bridges for different devices never block each other.
// =============================================================================

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "ui/ui_tree.hpp"
#include "wda/wda_client.hpp"

namespace simpilot::bridge {

enum class BridgeState : uint8_t {
    Disconnected = 0,
    Connecting,
    Active,
    Expired,
};

const char* bridgeStateName(BridgeState state);

// =============================================================================
// FifoGate: チケット順に1操作ずつ通す
// =============================================================================
class FifoGate {
public:
    // 取得で順番待ち、破棄で次のチケットへ
    class Ticket {
    public:
        explicit Ticket(FifoGate& gate);
        ~Ticket();
        Ticket(const Ticket&) = delete;
        Ticket& operator=(const Ticket&) = delete;

    private:
        FifoGate& gate_;
    };

    // 実行中または待機中の操作があるか
    bool busy() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
};

struct BridgeStatus {
    std::string device_id;
    std::string agent_url;
    BridgeState state = BridgeState::Disconnected;
    std::string session_id;
    bool busy = false;
    bool recording = false;
    std::chrono::system_clock::time_point last_used{};

    nlohmann::json toJson() const;
};

class Bridge {
public:
    using StateCallback =
        std::function<void(const std::string& device_id, BridgeState from, BridgeState to)>;

    template<typename T>
    using Operation = std::function<Result<T>(wda::WdaClient& client, const std::string& session_id)>;

    Bridge(std::string device_id,
           std::shared_ptr<wda::Transport> transport,
           std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
           nlohmann::json capabilities = nlohmann::json::object());
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    void setStateCallback(StateCallback cb);

    // --- Lifecycle ---
    Result<void> start();
    Result<void> stop();
    // Delete (failure tolerated) then create a fresh session
    Result<void> resetSession();
    bool health();

    // --- Introspection (never waits for the gate) ---
    const std::string& deviceId() const { return device_id_; }
    BridgeState state() const;
    std::string sessionId() const;
    bool busy() const { return gate_.busy(); }
    BridgeStatus status() const;

    // Runs fn with the live session inside the gate. A SessionExpired result
    // moves the Bridge to Expired.
    template<typename T>
    Result<T> run(const char* op, const Operation<T>& fn,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
        FifoGate::Ticket ticket(gate_);

        auto usable = checkUsable(op);
        if (usable.is_err()) return usable.error();

        TimeoutScope scope(client_, timeout);
        Result<T> result = fn(client_, sessionId());
        touch();
        if (result.is_err()) noteFailure(op, result.error());
        return result;
    }

    // --- Element workflows (fresh snapshot per call) ---
    Result<ui::UiTreeIndex> uiTree(ui::TreeFormat format = ui::TreeFormat::Json,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<ui::IndexedElement> findElement(const ui::Predicate& predicate,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<ui::IndexedElement> tapElement(int index,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    Result<ui::IndexedElement> tapElement(const ui::Predicate& predicate,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    Result<void> tap(int x, int y, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // --- Screen recording ---
    Result<nlohmann::json> startRecording(const nlohmann::json& options = nlohmann::json::object());
    Result<nlohmann::json> stopRecording();
    bool recording() const;

private:
    // Restores the client's default timeout on scope exit
    class TimeoutScope {
    public:
        TimeoutScope(wda::WdaClient& client, std::optional<std::chrono::milliseconds> timeout)
            : client_(client), saved_(client.timeout()) {
            if (timeout && timeout->count() > 0) client_.setTimeout(*timeout);
        }
        ~TimeoutScope() { client_.setTimeout(saved_); }

    private:
        wda::WdaClient& client_;
        std::chrono::milliseconds saved_;
    };

    Result<void> checkUsable(const char* op) const;
    void noteFailure(const char* op, AutomationError& err);
    void transition(BridgeState to);
    void touch();

    // Gate must be held
    Result<void> connectLocked();
    void disconnectLocked(const char* reason);

    std::string device_id_;
    wda::WdaClient client_;
    nlohmann::json capabilities_;
    FifoGate gate_;

    mutable std::mutex state_mutex_;
    BridgeState state_ = BridgeState::Disconnected;
    std::string session_id_;
    bool recording_ = false;
    std::chrono::system_clock::time_point last_used_{};
    StateCallback state_cb_;
};

} // namespace simpilot::bridge
