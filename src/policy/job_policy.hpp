#pragma once

#include <cstddef>
#include <string>
#include "core/errors/octavius_errors.hpp"

namespace octavius::policy {

struct NamingPolicy {
    std::size_t max_job_name_length = 253;
};

// Input checks shared by the registry, the coordinator and the CLI.
class JobPolicy {
public:
    explicit JobPolicy(NamingPolicy naming_policy = {});

    // Job names become key suffixes, so '/' is rejected to keep the
    // "metadata/" namespace flat. Spaces are allowed ("test data").
    core::errors::Result<std::string> validate_job_name(const std::string& name) const;

    core::errors::Result<std::string> validate_image_name(const std::string& image) const;

    core::errors::Result<std::string> validate_argument_key(const std::string& key) const;

private:
    static bool has_space_or_control(const std::string& value);
    static bool has_control(const std::string& value);

    NamingPolicy naming_policy_;
};

}  // namespace octavius::policy
