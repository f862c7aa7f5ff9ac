// =============================================================================
// SimPilot - Agent HTTP Transport Implementation
// =============================================================================
#include "wda/http_transport.hpp"
#include "simpilot_log.hpp"

#include <httplib.h>

#include <algorithm>

static constexpr const char* TAG = "transport";

namespace simpilot::wda {

namespace {

void applyTimeout(httplib::Client& cli, std::chrono::milliseconds connect,
                  std::chrono::milliseconds read) {
    auto split = [](std::chrono::milliseconds d, time_t& sec, time_t& usec) {
        sec = static_cast<time_t>(d.count() / 1000);
        usec = static_cast<time_t>((d.count() % 1000) * 1000);
    };
    time_t sec = 0, usec = 0;
    split(connect, sec, usec);
    cli.set_connection_timeout(sec, usec);
    split(read, sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);
}

} // namespace

HttpTransport::HttpTransport(std::string host, int port,
                             std::chrono::milliseconds connect_timeout)
    : host_(std::move(host)), port_(port), connect_timeout_(connect_timeout) {}

std::string HttpTransport::base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

nlohmann::json HttpTransport::parseBody(const std::string& text) {
    if (text.empty()) return nullptr;
    auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return text;
    return parsed;
}

Result<HttpResponse, TransportError> HttpTransport::send(
    const std::string& method,
    const std::string& path,
    const std::optional<nlohmann::json>& body,
    std::chrono::milliseconds timeout)
{
    // A fresh client per call keeps concurrent bridges (and health checks)
    // from sharing socket state.
    httplib::Client cli(host_, port_);
    applyTimeout(cli, std::min(connect_timeout_, timeout), timeout);

    const std::string payload = body ? body->dump() : std::string();
    const char* content_type = "application/json";

    SPLOG_DEBUG(TAG, "%s %s%s %s", method.c_str(), base_url().c_str(), path.c_str(),
                payload.size() > 512 ? "(large body)" : payload.c_str());

    auto start = std::chrono::steady_clock::now();
    httplib::Result res{nullptr, httplib::Error::Unknown};
    if (method == "GET") {
        res = cli.Get(path);
    } else if (method == "POST") {
        res = cli.Post(path, body ? payload : std::string("{}"), content_type);
    } else if (method == "DELETE") {
        res = body ? cli.Delete(path, payload, content_type) : cli.Delete(path);
    } else if (method == "PUT") {
        res = cli.Put(path, payload, content_type);
    } else {
        return TransportError(TransportError::Kind::Other, "unsupported HTTP method: " + method);
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (!res) {
        const auto err = res.error();
        std::string what = httplib::to_string(err) + " (" + method + " " + path + ")";
        switch (err) {
            case httplib::Error::Connection:
                if (elapsed >= std::min(connect_timeout_, timeout)) {
                    SPLOG_WARN(TAG, "connect to %s timed out: %s", base_url().c_str(), what.c_str());
                    return TransportError(TransportError::Kind::Timeout, what);
                }
                SPLOG_WARN(TAG, "connect to %s failed: %s", base_url().c_str(), what.c_str());
                return TransportError(TransportError::Kind::ConnectionRefused, what);
            case httplib::Error::Read:
            case httplib::Error::Write:
                // httplib reports an expired read deadline as a read error
                if (elapsed >= timeout - std::chrono::milliseconds(50)) {
                    SPLOG_WARN(TAG, "timeout after %lldms: %s",
                               static_cast<long long>(elapsed.count()), what.c_str());
                    return TransportError(TransportError::Kind::Timeout, what);
                }
                return TransportError(TransportError::Kind::Other, what);
            default:
                return TransportError(TransportError::Kind::Other, what);
        }
    }

    HttpResponse out;
    out.status = res->status;
    out.body = parseBody(res->body);
    SPLOG_TRACE(TAG, "-> %d (%zu bytes, %lldms)", out.status, res->body.size(),
                static_cast<long long>(elapsed.count()));
    return out;
}

} // namespace simpilot::wda
