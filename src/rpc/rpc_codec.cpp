#include "rpc/rpc_codec.hpp"

#include "core/errors/status_codes.hpp"

namespace octavius::rpc {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;
using core::errors::StatusCode;
using nlohmann::json;

namespace {

OctaviusError malformed_frame(const std::string& reason) {
    return OctaviusError{ErrorCategory::Internal, "rpc: malformed frame: " + reason,
                         "malformed_frame"};
}

OctaviusError invalid_payload(const std::string& reason) {
    return OctaviusError{ErrorCategory::Input, "rpc: invalid payload: " + reason,
                         "invalid_payload"};
}

std::string string_or_empty(const json& doc, const char* key) {
    if (doc.contains(key) && doc.at(key).is_string()) {
        return doc.at(key).get<std::string>();
    }
    return "";
}

}  // namespace

std::string encode_request(const RpcRequest& request) {
    json frame;
    frame["method"] = request.method;
    frame["payload"] = request.payload;
    return frame.dump();
}

core::errors::Result<RpcRequest> decode_request(const std::string& frame) {
    const json doc = json::parse(frame, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return malformed_frame("request is not a JSON object");
    }
    if (!doc.contains("method") || !doc.at("method").is_string()) {
        return malformed_frame("request has no method");
    }

    RpcRequest request;
    request.method = doc.at("method").get<std::string>();
    if (doc.contains("payload")) {
        if (!doc.at("payload").is_object()) {
            return malformed_frame("request payload is not an object");
        }
        request.payload = doc.at("payload");
    }
    return request;
}

std::string encode_response(const core::errors::Result<json>& outcome) {
    json frame;
    if (!core::errors::is_error(outcome)) {
        frame["code"] = core::errors::to_string(StatusCode::Ok);
        frame["payload"] = core::errors::get_value(outcome);
        return frame.dump();
    }

    const auto& error = core::errors::get_error(outcome);
    frame["code"] = core::errors::to_string(core::errors::to_status_code(error.category));
    frame["message"] = error.message;
    frame["error_code"] = error.code;
    frame["hint"] = error.hint;
    return frame.dump();
}

core::errors::Result<json> decode_response(const std::string& frame) {
    const json doc = json::parse(frame, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return malformed_frame("response is not a JSON object");
    }

    const auto code = core::errors::parse_status_code(string_or_empty(doc, "code"));
    if (!code.has_value()) {
        return malformed_frame("response has an unknown status code");
    }

    if (code.value() == StatusCode::Ok) {
        if (!doc.contains("payload") || !doc.at("payload").is_object()) {
            return malformed_frame("OK response has no payload object");
        }
        return doc.at("payload");
    }

    OctaviusError error{core::errors::to_error_category(code.value()),
                        string_or_empty(doc, "message")};
    const std::string error_code = string_or_empty(doc, "error_code");
    if (!error_code.empty()) {
        error.code = error_code;
    }
    error.hint = string_or_empty(doc, "hint");
    return error;
}

json metadata_to_json(const protocol::Metadata& metadata) {
    json payload;
    payload["name"] = metadata.name;
    payload["author"] = metadata.author;
    payload["image_name"] = metadata.image_name;
    payload["description"] = metadata.description;
    return payload;
}

core::errors::Result<protocol::Metadata> metadata_from_json(const json& payload) {
    if (!payload.is_object()) {
        return invalid_payload("metadata must be an object");
    }
    for (const char* key : {"name", "author", "image_name", "description"}) {
        if (payload.contains(key) && !payload.at(key).is_string()) {
            return invalid_payload(std::string("metadata field '") + key +
                                   "' must be a string");
        }
    }

    protocol::Metadata metadata;
    metadata.name = string_or_empty(payload, "name");
    metadata.author = string_or_empty(payload, "author");
    metadata.image_name = string_or_empty(payload, "image_name");
    metadata.description = string_or_empty(payload, "description");
    return metadata;
}

json arguments_to_json(const protocol::JobArguments& arguments) {
    json payload = json::object();
    for (const auto& [key, value] : arguments) {
        payload[key] = value;
    }
    return payload;
}

core::errors::Result<protocol::JobArguments> arguments_from_json(const json& payload) {
    if (!payload.is_object()) {
        return invalid_payload("arguments must be an object");
    }
    protocol::JobArguments arguments;
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!it.value().is_string()) {
            return invalid_payload("argument '" + it.key() + "' must be a string");
        }
        arguments.emplace(it.key(), it.value().get<std::string>());
    }
    return arguments;
}

}  // namespace octavius::rpc
