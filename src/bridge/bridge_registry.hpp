#pragma once
// =============================================================================
// BridgeRegistry: 端末ID -> Bridge の中央レジストリ
// =============================================================================
// 最上位コンテキストが所有し参照で渡す（グローバル状態は持たない）。
// Bridge は shared_ptr で返すので、remove 後も実行中の操作は安全に終わる。
// =============================================================================

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "bridge/bridge.hpp"
#include "config_loader.hpp"
#include "wda/http_transport.hpp"

namespace simpilot::bridge {

class BridgeRegistry {
public:
    using TransportFactory =
        std::function<std::shared_ptr<wda::Transport>(const std::string& host, int port)>;
    using ChangeCallback = Bridge::StateCallback;

    // factory 省略時は HttpTransport
    explicit BridgeRegistry(config::AppConfig config, TransportFactory factory = nullptr);
    ~BridgeRegistry();

    BridgeRegistry(const BridgeRegistry&) = delete;
    BridgeRegistry& operator=(const BridgeRegistry&) = delete;

    // --- 登録・検索 ---
    // 既存なら既存を返す
    std::shared_ptr<Bridge> getOrCreate(const std::string& device_id);
    // 見つからなければ nullptr
    std::shared_ptr<Bridge> find(const std::string& device_id) const;
    // stop してから登録解除。存在しなければ false
    bool remove(const std::string& device_id);

    std::vector<BridgeStatus> list() const;
    size_t size() const;

    // --- 変更通知 ---
    void setChangeCallback(ChangeCallback cb);

    const config::AppConfig& config() const { return config_; }

private:
    void notify(const std::string& device_id, BridgeState from, BridgeState to);

    config::AppConfig config_;
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Bridge>> bridges_;

    std::mutex cb_mutex_;
    ChangeCallback change_cb_;
};

} // namespace simpilot::bridge
