#include "bridge/bridge_registry.hpp"
#include "simpilot_log.hpp"

namespace simpilot::bridge {

BridgeRegistry::BridgeRegistry(config::AppConfig config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory)) {
    if (!factory_) {
        const auto connect_timeout = std::chrono::milliseconds(config_.agent.connect_timeout_ms);
        factory_ = [connect_timeout](const std::string& host, int port) {
            return std::make_shared<wda::HttpTransport>(host, port, connect_timeout);
        };
    }
}

BridgeRegistry::~BridgeRegistry() {
    std::map<std::string, std::shared_ptr<Bridge>> bridges;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bridges.swap(bridges_);
    }
    for (auto& [id, bridge] : bridges) {
        auto r = bridge->stop();
        if (r.is_err()) {
            SPLOG_WARN("Registry", "stop %s: %s", id.c_str(), r.error().message.c_str());
        }
        bridge->setStateCallback(nullptr);
    }
}

// =============================================================================
// 登録・検索
// =============================================================================

std::shared_ptr<Bridge> BridgeRegistry::getOrCreate(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = bridges_.find(device_id);
    if (it != bridges_.end()) {
        return it->second;  // 既存
    }

    // 新規登録
    const int port = config_.agentPortFor(device_id);
    auto bridge = std::make_shared<Bridge>(device_id,
                                           factory_(config_.agent.host, port),
                                           std::chrono::milliseconds(config_.agent.timeout_ms));
    bridge->setStateCallback([this](const std::string& id, BridgeState from, BridgeState to) {
        notify(id, from, to);
    });
    bridges_[device_id] = bridge;
    SPLOG_INFO("Registry", "New bridge: %s -> %s:%d", device_id.c_str(),
               config_.agent.host.c_str(), port);
    return bridge;
}

std::shared_ptr<Bridge> BridgeRegistry::find(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bridges_.find(device_id);
    return (it != bridges_.end()) ? it->second : nullptr;
}

bool BridgeRegistry::remove(const std::string& device_id) {
    std::shared_ptr<Bridge> bridge;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bridges_.find(device_id);
        if (it == bridges_.end()) return false;
        bridge = it->second;
        bridges_.erase(it);
    }

    // レジストリのロック外で停止（実行中の操作を待つ）
    auto r = bridge->stop();
    if (r.is_err()) {
        SPLOG_WARN("Registry", "stop %s: %s", device_id.c_str(), r.error().message.c_str());
    }
    bridge->setStateCallback(nullptr);
    SPLOG_INFO("Registry", "Removed bridge: %s", device_id.c_str());
    return true;
}

std::vector<BridgeStatus> BridgeRegistry::list() const {
    std::vector<std::shared_ptr<Bridge>> bridges;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bridges.reserve(bridges_.size());
        for (const auto& [id, bridge] : bridges_) {
            bridges.push_back(bridge);
        }
    }

    std::vector<BridgeStatus> result;
    result.reserve(bridges.size());
    for (const auto& bridge : bridges) {
        result.push_back(bridge->status());
    }
    return result;
}

size_t BridgeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bridges_.size();
}

// =============================================================================
// 変更通知
// =============================================================================

void BridgeRegistry::setChangeCallback(ChangeCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    change_cb_ = std::move(cb);
}

void BridgeRegistry::notify(const std::string& device_id, BridgeState from, BridgeState to) {
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(cb_mutex_);
        cb = change_cb_;
    }
    if (cb) cb(device_id, from, to);
}

} // namespace simpilot::bridge
