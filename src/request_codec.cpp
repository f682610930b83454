#include "request_codec.hpp"

namespace droidpilot {

using json = nlohmann::json;

namespace {

// Optional string field; non-string values are dumped as JSON
std::string stringField(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return {};
    const json& v = obj[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

// Ruby-style truthiness: absent, null and false are falsy
bool truthy(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return false;
    const json& v = obj[key];
    return !(v.is_null() || (v.is_boolean() && !v.get<bool>()));
}

bool outcomeSucceeded(const json& obj) {
    return obj.is_object() && obj.contains("outcome") &&
           obj["outcome"].is_string() && obj["outcome"].get<std::string>() == "SUCCESS";
}

HttpRequest jsonRequest(const char* route, const json& parameters) {
    return HttpRequest(route, parameters.dump());
}

} // anonymous namespace

// =============================================================================
// MethodRef
// =============================================================================

MethodRef call(std::string name, json arguments) {
    if (!arguments.is_array()) {
        arguments = json::array({std::move(arguments)});
    }
    return ParameterizedCall{std::move(name), std::move(arguments)};
}

Result<MethodRef> methodRefFromJson(const json& arg) {
    if (arg.is_string()) {
        return Ok(MethodRef{NamedCall{arg.get<std::string>()}});
    }

    if (arg.is_object()) {
        if (arg.size() > 1) {
            return Err<MethodRef>(ErrorKind::Format,
                                  "Cannot map '" + arg.dump() + "'. More than one key (method name) is not allowed.");
        }
        if (arg.empty()) {
            return Err<MethodRef>(ErrorKind::Format,
                                  "Cannot map '" + arg.dump() + "'. No key (method name) is given.");
        }
        auto it = arg.begin();
        return Ok(call(it.key(), it.value()));
    }

    return Err<MethodRef>(ErrorKind::Format,
                          "Invalid value for map: '" + arg.dump() + "' (" + arg.type_name() + ")");
}

Result<std::vector<MethodRef>> methodRefsFromJson(const json& args) {
    std::vector<MethodRef> refs;
    if (args.is_null()) return Ok(std::move(refs));
    if (!args.is_array()) {
        return Err<std::vector<MethodRef>>(ErrorKind::Format,
                                           "Map arguments must be a list, got " + std::string(args.type_name()));
    }
    for (const auto& arg : args) {
        refs.push_back(DP_TRY(methodRefFromJson(arg)));
    }
    return Ok(std::move(refs));
}

json toJson(const MethodRef& ref) {
    if (const auto* named = std::get_if<NamedCall>(&ref)) {
        return named->name;
    }
    const auto& param = std::get<ParameterizedCall>(ref);
    return json{{"method_name", param.name}, {"arguments", param.arguments}};
}

json makeMapParameters(const std::string& query, const std::string& method_name,
                       const std::vector<MethodRef>& method_args) {
    json converted = json::array();
    for (const auto& ref : method_args) {
        converted.push_back(toJson(ref));
    }
    return json{
        {"query", query},
        {"operation", {{"method_name", method_name}, {"arguments", converted}}},
    };
}

namespace codec {

// =============================================================================
// Encoding
// =============================================================================

HttpRequest encodeAction(const std::string& command, const json& arguments) {
    json args = arguments.is_array() ? arguments : json::array({arguments});
    if (arguments.is_null()) args = json::array();
    return jsonRequest(ROUTE_ACTION, json{{"command", command}, {"arguments", args}});
}

HttpRequest encodeMap(const std::string& query, const std::string& method_name,
                      const std::vector<MethodRef>& method_args) {
    return jsonRequest(ROUTE_MAP, makeMapParameters(query, method_name, method_args));
}

HttpRequest encodeGesture(const GestureDescriptor& gesture) {
    return jsonRequest(ROUTE_GESTURE, gesture.toJson());
}

std::chrono::milliseconds gestureRequestTimeout(const GestureDescriptor& gesture) {
    return gesture.timeout().value_or(std::chrono::milliseconds{0}) +
           std::chrono::duration_cast<std::chrono::milliseconds>(GESTURE_TIMEOUT_MARGIN);
}

// =============================================================================
// Decoding
// =============================================================================

Result<json> parseBody(const std::string& body) {
    try {
        return Ok(json::parse(body));
    } catch (const json::parse_error& e) {
        return Err<json>(ErrorKind::Parse, std::string("Malformed JSON response: ") + e.what(), body);
    }
}

Result<json> decodeAction(const std::string& body) {
    json result = DP_TRY(parseBody(body));

    if (!truthy(result, "success")) {
        return Err<json>(ErrorKind::Protocol, stringField(result, "message"), body);
    }
    return Ok(std::move(result));
}

Result<json> decodeMap(const std::string& body, const std::string& query,
                       const std::string& method_name) {
    json result = DP_TRY(parseBody(body));

    if (!outcomeSucceeded(result)) {
        return Err<json>(ErrorKind::Protocol,
                         "mapping \"" + query + "\" with \"" + method_name +
                         "\" failed because: " + stringField(result, "reason"),
                         stringField(result, "details"));
    }
    return Ok(result.contains("results") ? result["results"] : json(nullptr));
}

Result<void> decodeGesture(const std::string& body) {
    json result = DP_TRY(parseBody(body));

    if (!outcomeSucceeded(result)) {
        return Error(ErrorKind::Protocol,
                     "Failed to perform gesture. " + stringField(result, "reason"), body);
    }
    return Ok();
}

} // namespace codec
} // namespace droidpilot
