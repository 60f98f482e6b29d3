#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "registry/registration_mode.hpp"

namespace octavius::core::config {

    // Process configuration. Every key in the JSON file is optional.
    struct Settings {
        logging::LogLevel log_level = logging::LogLevel::INFO;
        std::filesystem::path store_path = ".octavius/store.json";
        registry::RegistrationMode registration_mode = registry::RegistrationMode::CheckThenPut;
        std::string container_runtime = "docker";
        std::uint32_t execution_timeout_ms = 600000;
        std::uint32_t call_deadline_ms = 0;  // 0 = no deadline
    };

    errors::Result<Settings> parse_settings(const std::string& json_text);

    errors::Result<Settings> load_settings(const std::filesystem::path& path);

}  // namespace octavius::core::config
