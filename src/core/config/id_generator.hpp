#pragma once
#include <random>
#include <sstream>
#include <string>

namespace octavius::core::config {

    // Generates an 8-character hex ID with the given prefix, e.g. "exec-1f03a9bc"
    inline std::string generate_id(const std::string& prefix) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << prefix << "-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    inline std::string generate_request_id() {
        return generate_id("req");
    }

    inline std::string generate_execution_id() {
        return generate_id("exec");
    }

} // namespace octavius::core::config
