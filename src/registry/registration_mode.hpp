#pragma once
#include <optional>
#include <string>

namespace octavius::registry {

// How register_job turns "create if absent" into store calls.
enum class RegistrationMode {
    CheckThenPut,     // get, then put: concurrent registrations can both succeed
    ConditionalWrite  // single put_if_absent call
};

inline std::string to_string(const RegistrationMode mode) {
    switch (mode) {
        case RegistrationMode::CheckThenPut:
            return "check_then_put";
        case RegistrationMode::ConditionalWrite:
            return "conditional_write";
        default:
            return "unknown";
    }
}

inline std::optional<RegistrationMode> parse_registration_mode(const std::string& text) {
    if (text == "check_then_put") return RegistrationMode::CheckThenPut;
    if (text == "conditional_write") return RegistrationMode::ConditionalWrite;
    return std::nullopt;
}

}  // namespace octavius::registry
