// =============================================================================
// SimPilot - Result Type and Error Taxonomy
// =============================================================================
// Result<T, E> carries either a success value or an error value. Nothing in
// the automation core throws across module boundaries; failures travel as
// one of the error structs below.
//
// Usage:
//   Result<std::string> createSession(...) {
//       if (refused) return AutomationError(ErrorKind::ConnectionRefused, "agent down");
//       return session_id;
//   }
//
//   auto r = client.createSession(caps);
//   if (r.is_err()) SPLOG_WARN("tag", "%s", r.error().message.c_str());
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace simpilot {

// =============================================================================
// Error Types
// =============================================================================

// Closed taxonomy surfaced to callers
enum class ErrorKind {
    NoSuchElement,
    SessionExpired,
    ConnectionRefused,
    InvalidArgument,
    UnknownAgentError,
    Timeout,
    DeviceManagementError,
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::NoSuchElement:         return "NoSuchElement";
        case ErrorKind::SessionExpired:        return "SessionExpired";
        case ErrorKind::ConnectionRefused:     return "ConnectionRefused";
        case ErrorKind::InvalidArgument:       return "InvalidArgument";
        case ErrorKind::UnknownAgentError:     return "UnknownAgentError";
        case ErrorKind::Timeout:               return "Timeout";
        case ErrorKind::DeviceManagementError: return "DeviceManagementError";
    }
    return "UnknownAgentError";
}

// Agent-side failure, after normalization
struct AutomationError {
    ErrorKind kind = ErrorKind::UnknownAgentError;
    std::string message;
    nlohmann::json raw;              // agent payload when available (null otherwise)
    int http_status = 0;
    bool unsupported_endpoint = false;

    AutomationError() = default;
    explicit AutomationError(ErrorKind k, std::string msg,
                             nlohmann::json raw_payload = nullptr, int status = 0)
        : kind(k), message(std::move(msg)), raw(std::move(raw_payload)), http_status(status) {}

    bool is(ErrorKind k) const { return kind == k; }

    nlohmann::json toJson() const {
        nlohmann::json j = {{"kind", errorKindName(kind)}, {"message", message}};
        if (!raw.is_null()) j["raw"] = raw;
        if (http_status != 0) j["http_status"] = http_status;
        return j;
    }
};

// Network-level failure reported by the transport, before reclassification
struct TransportError {
    enum class Kind { ConnectionRefused, Timeout, Other };
    Kind kind = Kind::Other;
    std::string message;

    TransportError() = default;
    explicit TransportError(Kind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

// simctl invocation failure (non-zero exit, unreadable output, bad input)
struct DeviceError {
    std::string message;
    int exit_code = 0;
    std::string stderr_text;

    DeviceError() = default;
    explicit DeviceError(std::string msg, int code = 0, std::string err = {})
        : message(std::move(msg)), exit_code(code), stderr_text(std::move(err)) {}

    AutomationError toAutomationError() const {
        nlohmann::json raw = nlohmann::json::object();
        raw["exit_code"] = exit_code;
        if (!stderr_text.empty()) raw["stderr"] = stderr_text;
        return AutomationError(ErrorKind::DeviceManagementError, message, raw);
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

struct OkTag {};
inline OkTag Ok() { return {}; }

template<typename T, typename E = AutomationError>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    T& value() & {
        if (is_err()) throw std::logic_error("value() on error result");
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::logic_error("value() on error result");
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::logic_error("value() on error result");
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}
    Result(OkTag) : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

} // namespace simpilot
