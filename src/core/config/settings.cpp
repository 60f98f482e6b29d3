#include "core/config/settings.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

namespace octavius::core::config {

using errors::ErrorCategory;
using errors::OctaviusError;
using nlohmann::json;

namespace {

OctaviusError invalid_config(const std::string& message) {
    return OctaviusError{ErrorCategory::Input, message, "invalid_config",
                         "Check the configuration file passed with --config."};
}

errors::Result<std::string> read_string(const json& doc, const char* key,
                                        const std::string& fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    const auto& value = doc.at(key);
    if (!value.is_string()) {
        return invalid_config(std::string("'") + key + "' must be a string");
    }
    return value.get<std::string>();
}

errors::Result<std::uint32_t> read_millis(const json& doc, const char* key,
                                          const std::uint32_t fallback) {
    if (!doc.contains(key)) {
        return fallback;
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        return invalid_config(std::string("'") + key +
                              "' must be a non-negative integer");
    }
    const auto millis = value.get<std::uint64_t>();
    if (millis > std::numeric_limits<std::uint32_t>::max()) {
        return invalid_config(std::string("'") + key + "' is larger than " +
                              std::to_string(std::numeric_limits<std::uint32_t>::max()));
    }
    return static_cast<std::uint32_t>(millis);
}

}  // namespace

errors::Result<Settings> parse_settings(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return invalid_config("Configuration is not valid JSON");
    }
    if (!doc.is_object()) {
        return invalid_config("Configuration must be a JSON object");
    }

    Settings settings;

    auto level = read_string(doc, "log_level", "info");
    if (errors::is_error(level)) {
        return errors::get_error(level);
    }
    const auto parsed_level = logging::parse_log_level(errors::get_value(level));
    if (!parsed_level.has_value()) {
        return invalid_config("Unknown log_level: " + errors::get_value(level));
    }
    settings.log_level = parsed_level.value();

    auto store_path = read_string(doc, "store_path", settings.store_path.string());
    if (errors::is_error(store_path)) {
        return errors::get_error(store_path);
    }
    if (errors::get_value(store_path).empty()) {
        return invalid_config("'store_path' cannot be empty");
    }
    settings.store_path = errors::get_value(store_path);

    auto mode = read_string(doc, "registration_mode",
                            registry::to_string(settings.registration_mode));
    if (errors::is_error(mode)) {
        return errors::get_error(mode);
    }
    const auto parsed_mode = registry::parse_registration_mode(errors::get_value(mode));
    if (!parsed_mode.has_value()) {
        return invalid_config("Unknown registration_mode: " + errors::get_value(mode));
    }
    settings.registration_mode = parsed_mode.value();

    auto runtime = read_string(doc, "container_runtime", settings.container_runtime);
    if (errors::is_error(runtime)) {
        return errors::get_error(runtime);
    }
    if (errors::get_value(runtime).empty()) {
        return invalid_config("'container_runtime' cannot be empty");
    }
    settings.container_runtime = errors::get_value(runtime);

    auto timeout = read_millis(doc, "execution_timeout_ms", settings.execution_timeout_ms);
    if (errors::is_error(timeout)) {
        return errors::get_error(timeout);
    }
    settings.execution_timeout_ms = errors::get_value(timeout);

    auto deadline = read_millis(doc, "call_deadline_ms", settings.call_deadline_ms);
    if (errors::is_error(deadline)) {
        return errors::get_error(deadline);
    }
    settings.call_deadline_ms = errors::get_value(deadline);

    return settings;
}

errors::Result<Settings> load_settings(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return invalid_config("Unable to open configuration file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return invalid_config("I/O error while reading configuration file: " +
                              path.string());
    }

    auto parsed = parse_settings(buffer.str());
    if (errors::is_error(parsed)) {
        return errors::with_context(errors::get_error(parsed), path.string());
    }
    return parsed;
}

}  // namespace octavius::core::config
