#include "registry/metadata_codec.hpp"

#include <nlohmann/json.hpp>

namespace octavius::registry {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;
using nlohmann::json;

namespace {

OctaviusError decode_failure(const std::string& reason) {
    return OctaviusError{ErrorCategory::Internal,
                         "metadata: unable to decode stored record: " + reason,
                         "decode_failed"};
}

bool read_optional_field(const json& doc, const char* key, std::string& out) {
    if (!doc.contains(key)) {
        return true;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return false;
    }
    out = value.get<std::string>();
    return true;
}

}  // namespace

std::string encode_metadata(const protocol::Metadata& metadata) {
    // nlohmann::json objects keep keys sorted, so the output is stable.
    json doc;
    doc["name"] = metadata.name;
    doc["author"] = metadata.author;
    doc["image_name"] = metadata.image_name;
    doc["description"] = metadata.description;
    return doc.dump();
}

core::errors::Result<protocol::Metadata> decode_metadata(const std::string& bytes) {
    const json doc = json::parse(bytes, nullptr, false);
    if (doc.is_discarded()) {
        return decode_failure("not valid JSON");
    }
    if (!doc.is_object()) {
        return decode_failure("expected a JSON object");
    }

    if (!doc.contains("name") || !doc.at("name").is_string()) {
        return decode_failure("missing string field 'name'");
    }

    protocol::Metadata metadata;
    metadata.name = doc.at("name").get<std::string>();
    if (!read_optional_field(doc, "author", metadata.author)) {
        return decode_failure("field 'author' is not a string");
    }
    if (!read_optional_field(doc, "image_name", metadata.image_name)) {
        return decode_failure("field 'image_name' is not a string");
    }
    if (!read_optional_field(doc, "description", metadata.description)) {
        return decode_failure("field 'description' is not a string");
    }
    return metadata;
}

}  // namespace octavius::registry
