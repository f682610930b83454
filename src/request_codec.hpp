#pragma once
#include <chrono>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "gesture.hpp"
#include "http_transport.hpp"
#include "result.hpp"

namespace droidpilot {

// =============================================================================
// Map-route method references
// =============================================================================

// Zero-argument method, serialized as the bare name
struct NamedCall {
    std::string name;
};

// Method with arguments, serialized as {"method_name", "arguments": [...]}
struct ParameterizedCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::array();
};

using MethodRef = std::variant<NamedCall, ParameterizedCall>;

inline MethodRef call(std::string name) {
    return NamedCall{std::move(name)};
}

// Scalar arguments are wrapped in a one-element array, arrays are used as-is
MethodRef call(std::string name, nlohmann::json arguments);

// Validate a loosely typed argument: a string is a NamedCall, a one-key
// object {method: value} a ParameterizedCall. Anything else is a Format error.
Result<MethodRef> methodRefFromJson(const nlohmann::json& arg);

// Same for a whole argument list; stops at the first malformed entry
Result<std::vector<MethodRef>> methodRefsFromJson(const nlohmann::json& args);

nlohmann::json toJson(const MethodRef& ref);

// {"query", "operation": {"method_name", "arguments": [...]}}
nlohmann::json makeMapParameters(const std::string& query, const std::string& method_name,
                                 const std::vector<MethodRef>& method_args);

// =============================================================================
// Request encoding
// =============================================================================

namespace codec {

constexpr const char* ROUTE_ACTION  = "";
constexpr const char* ROUTE_MAP     = "map";
constexpr const char* ROUTE_GESTURE = "gesture";
constexpr const char* ROUTE_PING    = "ping";
constexpr const char* ROUTE_READY   = "ready";
constexpr const char* ROUTE_KILL    = "kill";

// Added to a gesture's own timeout for the HTTP call
constexpr std::chrono::seconds GESTURE_TIMEOUT_MARGIN{10};

HttpRequest encodeAction(const std::string& command, const nlohmann::json& arguments);

HttpRequest encodeMap(const std::string& query, const std::string& method_name,
                      const std::vector<MethodRef>& method_args);

HttpRequest encodeGesture(const GestureDescriptor& gesture);

// Transport budget for a bound gesture: its timeout plus the margin
std::chrono::milliseconds gestureRequestTimeout(const GestureDescriptor& gesture);

// =============================================================================
// Response decoding
// =============================================================================

// Malformed JSON is a Parse error carrying the raw body
Result<nlohmann::json> parseBody(const std::string& body);

// "success" must be true; otherwise Protocol error with "message" verbatim.
// Returns the whole decoded response.
Result<nlohmann::json> decodeAction(const std::string& body);

// "outcome" must be "SUCCESS"; otherwise Protocol error with reason/details.
// Returns "results".
Result<nlohmann::json> decodeMap(const std::string& body, const std::string& query,
                                 const std::string& method_name);

// "outcome" must be "SUCCESS"; otherwise Protocol error with reason
Result<void> decodeGesture(const std::string& body);

} // namespace codec
} // namespace droidpilot
