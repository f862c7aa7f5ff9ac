// =============================================================================
// SimPilot - Agent Error Normalizer Implementation
// =============================================================================
#include "wda/error_normalizer.hpp"
#include "simpilot_log.hpp"

#include <algorithm>
#include <cctype>

static constexpr const char* TAG = "normalizer";

namespace simpilot::wda {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isStringKey(const nlohmann::json& obj, const char* key) {
    return obj.is_object() && obj.contains(key) && obj[key].is_string();
}

struct PhraseRule {
    const char* phrase;
    ErrorKind kind;
    bool unsupported;
};

// Order matters: session-specific phrases must win over the generic
// "not found", and "unhandled endpoint: /session/..." must not read as a
// session failure.
const PhraseRule kPhraseRules[] = {
    {"unknown command",              ErrorKind::UnknownAgentError, true},
    {"unhandled endpoint",           ErrorKind::UnknownAgentError, true},
    {"unknown method",               ErrorKind::UnknownAgentError, true},
    {"not implemented",              ErrorKind::UnknownAgentError, true},
    {"unsupported operation",        ErrorKind::UnknownAgentError, true},
    {"invalid session id",           ErrorKind::SessionExpired,    false},
    {"no such session",              ErrorKind::SessionExpired,    false},
    {"session does not exist",       ErrorKind::SessionExpired,    false},
    {"session not found",            ErrorKind::SessionExpired,    false},
    {"session is either terminated", ErrorKind::SessionExpired,    false},
    {"no such element",              ErrorKind::NoSuchElement,     false},
    {"no such alert",                ErrorKind::NoSuchElement,     false},
    {"no alert",                     ErrorKind::NoSuchElement,     false},
    {"not found",                    ErrorKind::NoSuchElement,     false},
    {"unable to find",               ErrorKind::NoSuchElement,     false},
    {"could not be located",         ErrorKind::NoSuchElement,     false},
    {"session",                      ErrorKind::SessionExpired,    false},
    {"invalid argument",             ErrorKind::InvalidArgument,   false},
    {"invalid element state",        ErrorKind::InvalidArgument,   false},
    {"timeout",                      ErrorKind::Timeout,           false},
    {"timed out",                    ErrorKind::Timeout,           false},
};

} // namespace

// =============================================================================
// Envelope matchers
// =============================================================================

std::optional<ErrorEnvelope> matchTopLevel(const nlohmann::json& body) {
    if (!isStringKey(body, "error") || !isStringKey(body, "message")) return std::nullopt;
    return ErrorEnvelope{"top-level", body["error"].get<std::string>(),
                         body["message"].get<std::string>()};
}

std::optional<ErrorEnvelope> matchNestedValue(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("value")) return std::nullopt;
    const auto& value = body["value"];
    if (!isStringKey(value, "error") || !isStringKey(value, "message")) return std::nullopt;
    return ErrorEnvelope{"nested-value", value["error"].get<std::string>(),
                         value["message"].get<std::string>()};
}

std::optional<ErrorEnvelope> matchLegacyStatus(const nlohmann::json& body) {
    if (!body.is_object() || !body.contains("status") || !body["status"].is_number_integer()) {
        return std::nullopt;
    }
    if (!body.contains("value") || !isStringKey(body["value"], "message")) return std::nullopt;
    int status = body["status"].get<int>();
    if (status == 0) return std::nullopt;
    return ErrorEnvelope{"legacy-status", legacyStatusIdentifier(status),
                         body["value"]["message"].get<std::string>()};
}

const std::vector<EnvelopeMatcher>& envelopeMatchers() {
    static const std::vector<EnvelopeMatcher> matchers = {
        matchTopLevel,
        matchNestedValue,
        matchLegacyStatus,
    };
    return matchers;
}

std::string legacyStatusIdentifier(int status) {
    switch (status) {
        case 6:  return "invalid session id";
        case 7:  return "no such element";
        case 9:  return "unknown command";
        case 12: return "invalid element state";
        case 13: return "unknown error";
        case 21: return "timeout";
        case 27: return "no such alert";
        case 61: return "invalid argument";
        default: return "";
    }
}

// =============================================================================
// Classification
// =============================================================================

ErrorKind classifyText(const std::string& text, bool* unsupported) {
    const std::string lower = toLower(text);
    for (const auto& rule : kPhraseRules) {
        if (lower.find(rule.phrase) != std::string::npos) {
            if (unsupported) *unsupported = rule.unsupported;
            return rule.kind;
        }
    }
    if (unsupported) *unsupported = false;
    return ErrorKind::UnknownAgentError;
}

bool isErrorResponse(int http_status, const nlohmann::json& body) {
    if (http_status >= 400) return true;
    if (isStringKey(body, "error")) return true;
    if (body.is_object() && body.contains("value") && isStringKey(body["value"], "error")) {
        return true;
    }
    if (body.is_object() && body.contains("status") && body["status"].is_number_integer() &&
        body["status"].get<int>() != 0) {
        return true;
    }
    return false;
}

AutomationError normalizeError(int http_status, const nlohmann::json& body) {
    for (const auto& matcher : envelopeMatchers()) {
        auto envelope = matcher(body);
        if (!envelope) continue;

        bool unsupported = false;
        ErrorKind kind = classifyText(envelope->identifier + " " + envelope->message, &unsupported);
        std::string message = envelope->message.empty() ? envelope->identifier : envelope->message;
        SPLOG_DEBUG(TAG, "%s envelope: '%s' -> %s", envelope->shape.c_str(),
                    envelope->identifier.c_str(), errorKindName(kind));

        AutomationError err(kind, message, body, http_status);
        err.unsupported_endpoint = unsupported;
        return err;
    }

    // No known envelope: keep the payload for diagnosis
    std::string message = "agent returned HTTP " + std::to_string(http_status);
    if (body.is_string()) {
        message += ": " + body.get<std::string>().substr(0, 200);
    }
    SPLOG_WARN(TAG, "unrecognized error envelope (HTTP %d)", http_status);
    AutomationError err(ErrorKind::UnknownAgentError, message, body, http_status);
    err.unsupported_endpoint =
        http_status == 404 || http_status == 405 || http_status == 501;
    return err;
}

AutomationError fromTransportError(const TransportError& err) {
    switch (err.kind) {
        case TransportError::Kind::Timeout:
            return AutomationError(ErrorKind::Timeout, "agent request timed out: " + err.message);
        case TransportError::Kind::ConnectionRefused:
        case TransportError::Kind::Other:
            break;
    }
    return AutomationError(ErrorKind::ConnectionRefused, "agent unreachable: " + err.message);
}

} // namespace simpilot::wda
