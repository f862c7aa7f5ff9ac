#pragma once
// =============================================================================
// SimPilot - Agent Error Normalizer
// =============================================================================
// The agent does not version its error envelope and each endpoint family
// answers in its own shape. Known shapes, in priority order:
//   1. {"error": "...", "message": "..."}
//   2. {"value": {"error": "...", "message": "..."}}
//   3. {"status": <int != 0>, "value": {"message": "..."}}   (legacy JSONWP)
// The first shape whose required keys are all present wins. The extracted
// identifier/message is then matched against known phrases to pick the kind.
// =============================================================================

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace simpilot::wda {

// Identifier + message pulled out of one envelope shape
struct ErrorEnvelope {
    std::string shape;       // "top-level", "nested-value", "legacy-status"
    std::string identifier;  // W3C error code ("no such element", ...)
    std::string message;
};

using EnvelopeMatcher = std::function<std::optional<ErrorEnvelope>(const nlohmann::json&)>;

// Ordered matchers, tried first to last
const std::vector<EnvelopeMatcher>& envelopeMatchers();

std::optional<ErrorEnvelope> matchTopLevel(const nlohmann::json& body);
std::optional<ErrorEnvelope> matchNestedValue(const nlohmann::json& body);
std::optional<ErrorEnvelope> matchLegacyStatus(const nlohmann::json& body);

// JSONWP numeric status -> W3C identifier ("" for unknown codes)
std::string legacyStatusIdentifier(int status);

// True if the response must be treated as a failure
bool isErrorResponse(int http_status, const nlohmann::json& body);

// Map a failed response to the automation error taxonomy. The raw body is
// kept on the returned error.
AutomationError normalizeError(int http_status, const nlohmann::json& body);

// Kind selection from free text (exposed for tests)
ErrorKind classifyText(const std::string& text, bool* unsupported = nullptr);

// Transport failure -> automation error
AutomationError fromTransportError(const TransportError& err);

} // namespace simpilot::wda
