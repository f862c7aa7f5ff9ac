#pragma once
// =============================================================================
// SimPilot - Command API
// =============================================================================
// JSON-line protocol over any stream pair (stdin/stdout in main).
//
// Protocol: each request is one line of JSON terminated by \n
// Request:  {"id": 1, "method": "tap", "params": {"device_id": "ABCD-...", "x": 100, "y": 200}}
// Response: {"id": 1, "result": {"status": "ok"}}
//       or  {"id": 1, "error": {"kind": "SessionExpired", "message": "...", "raw": {...}}}
//
// Agent operations accept an optional "timeout_ms" parameter.
// =============================================================================

#include <deque>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "automation_service.hpp"

namespace simpilot {

class CommandApi {
public:
    explicit CommandApi(AutomationService& service);

    // One request line -> one response line (no trailing newline)
    std::string dispatch(const std::string& json_line);

    // Routes an already-parsed request
    Reply handle(const std::string& method, const nlohmann::json& params);

    std::vector<std::string> methods() const;

    // Reads requests until EOF. Requests for one device run in read order on
    // that device's lane; different devices run concurrently. Responses are
    // written whole, in completion order.
    void serve(std::istream& in, std::ostream& out);

    // Lane key of a request line: params.device_id, or "" when absent/unparsable
    static std::string laneKey(const std::string& json_line);

    static std::string makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static std::string makeError(const nlohmann::json& id, const AutomationError& error);

private:
    using Handler = std::function<Reply(const nlohmann::json& params)>;
    void registerHandlers();

    // 端末ごとの直列キュー（ワーカーは空になったら終了）
    struct Lane {
        std::deque<std::string> pending;
        bool active = false;
        std::thread worker;
    };

    void enqueue(const std::string& key, std::string request, std::ostream& out);
    void drain(Lane* lane, std::ostream& out);
    void retireIdleLanes(const std::string& keep);

    AutomationService& service_;
    std::map<std::string, Handler> handlers_;
    std::mutex out_mutex_;

    std::mutex lanes_mutex_;
    std::map<std::string, std::unique_ptr<Lane>> lanes_;
};

} // namespace simpilot
