#pragma once
// =============================================================================
// SimPilot - Agent HTTP Transport
// =============================================================================
// One request, one response. Connect/read timeouts apply per call; network
// failures come back as TransportError and are never retried here, because
// not every agent call is idempotent (app launch, taps).
// =============================================================================

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::wda {

struct HttpResponse {
    int status = 0;
    nlohmann::json body;  // parsed JSON, a JSON string for non-JSON bodies, null when empty
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<HttpResponse, TransportError> send(
        const std::string& method,
        const std::string& path,
        const std::optional<nlohmann::json>& body,
        std::chrono::milliseconds timeout) = 0;

    virtual std::string base_url() const = 0;
};

class HttpTransport : public Transport {
public:
    HttpTransport(std::string host, int port,
                  std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(5000));

    Result<HttpResponse, TransportError> send(
        const std::string& method,
        const std::string& path,
        const std::optional<nlohmann::json>& body,
        std::chrono::milliseconds timeout) override;

    std::string base_url() const override;

    // Parses a response body the way send() does (exposed for tests)
    static nlohmann::json parseBody(const std::string& text);

private:
    std::string host_;
    int port_;
    std::chrono::milliseconds connect_timeout_;
};

} // namespace simpilot::wda
