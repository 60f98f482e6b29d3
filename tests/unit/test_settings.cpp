#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/config/settings.hpp"

namespace {

using octavius::core::config::load_settings;
using octavius::core::config::parse_settings;
using octavius::core::errors::ErrorCategory;
using octavius::core::errors::get_error;
using octavius::core::errors::get_value;
using octavius::core::errors::is_error;
using octavius::core::logging::LogLevel;
using octavius::registry::RegistrationMode;

TEST(SettingsTest, EmptyObjectYieldsDefaults) {
    auto parsed = parse_settings("{}");
    ASSERT_FALSE(is_error(parsed));
    const auto& settings = get_value(parsed);
    EXPECT_EQ(settings.log_level, LogLevel::INFO);
    EXPECT_EQ(settings.store_path, std::filesystem::path(".octavius/store.json"));
    EXPECT_EQ(settings.registration_mode, RegistrationMode::CheckThenPut);
    EXPECT_EQ(settings.container_runtime, "docker");
    EXPECT_EQ(settings.execution_timeout_ms, 600000u);
    EXPECT_EQ(settings.call_deadline_ms, 0u);
}

TEST(SettingsTest, ParsesEveryKey) {
    auto parsed = parse_settings(R"({
        "log_level": "debug",
        "store_path": "/var/lib/octavius/store.json",
        "registration_mode": "conditional_write",
        "container_runtime": "podman",
        "execution_timeout_ms": 1500,
        "call_deadline_ms": 30000
    })");
    ASSERT_FALSE(is_error(parsed));
    const auto& settings = get_value(parsed);
    EXPECT_EQ(settings.log_level, LogLevel::DEBUG);
    EXPECT_EQ(settings.store_path, std::filesystem::path("/var/lib/octavius/store.json"));
    EXPECT_EQ(settings.registration_mode, RegistrationMode::ConditionalWrite);
    EXPECT_EQ(settings.container_runtime, "podman");
    EXPECT_EQ(settings.execution_timeout_ms, 1500u);
    EXPECT_EQ(settings.call_deadline_ms, 30000u);
}

TEST(SettingsTest, RejectsUnknownValuesAndWrongTypes) {
    for (const std::string text :
         {"not json", "[]", R"({"log_level": "loud"})", R"({"registration_mode": "cas"})",
          R"({"execution_timeout_ms": -1})", R"({"store_path": 3})",
          R"({"container_runtime": ""})", R"({"execution_timeout_ms": 4294967296})",
          R"({"call_deadline_ms": 4294967297})"}) {
        auto parsed = parse_settings(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).category, ErrorCategory::Input) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_config") << text;
    }
}

TEST(SettingsTest, AcceptsLargestMillisecondValue) {
    auto parsed = parse_settings(R"({"execution_timeout_ms": 4294967295})");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed).execution_timeout_ms, 4294967295u);
}

TEST(SettingsTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      (octavius::core::config::generate_id("settings") + ".json");
    {
        std::ofstream out(path);
        out << R"({"container_runtime": "nerdctl"})";
    }

    auto loaded = load_settings(path);
    std::error_code ec;
    std::filesystem::remove(path, ec);

    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).container_runtime, "nerdctl");
}

TEST(SettingsTest, MissingFileIsInputError) {
    auto loaded = load_settings("/definitely/not/here/octavius.json");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "invalid_config");
}

}  // namespace
