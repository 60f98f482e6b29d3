#include "policy/job_policy.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace octavius::policy {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;

JobPolicy::JobPolicy(NamingPolicy naming_policy)
    : naming_policy_(std::move(naming_policy)) {}

bool JobPolicy::has_space_or_control(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::isspace(c) != 0 || std::iscntrl(c) != 0;
    });
}

bool JobPolicy::has_control(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](const unsigned char c) {
        return std::iscntrl(c) != 0;
    });
}

core::errors::Result<std::string> JobPolicy::validate_job_name(
    const std::string& name) const {
    if (name.empty()) {
        return OctaviusError{ErrorCategory::Input, "Job name cannot be empty.",
                             "empty_job_name"};
    }
    if (name.size() > naming_policy_.max_job_name_length) {
        return OctaviusError{ErrorCategory::Input,
                             "Job name is longer than " +
                                 std::to_string(naming_policy_.max_job_name_length) +
                                 " characters.",
                             "invalid_job_name"};
    }
    if (name.find('/') != std::string::npos) {
        return OctaviusError{ErrorCategory::Input,
                             "Job name cannot contain '/': " + name,
                             "invalid_job_name"};
    }
    if (has_control(name)) {
        return OctaviusError{ErrorCategory::Input,
                             "Job name cannot contain control characters.",
                             "invalid_job_name"};
    }
    return name;
}

core::errors::Result<std::string> JobPolicy::validate_image_name(
    const std::string& image) const {
    if (image.empty()) {
        return OctaviusError{ErrorCategory::Input, "Image name cannot be empty.",
                             "missing_image_reference"};
    }
    if (has_space_or_control(image)) {
        return OctaviusError{ErrorCategory::Input,
                             "Image name cannot contain whitespace: " + image,
                             "invalid_image_reference"};
    }
    return image;
}

core::errors::Result<std::string> JobPolicy::validate_argument_key(
    const std::string& key) const {
    if (key.empty()) {
        return OctaviusError{ErrorCategory::Input, "Argument name cannot be empty.",
                             "malformed_argument"};
    }
    if (key.find('=') != std::string::npos || has_space_or_control(key)) {
        return OctaviusError{ErrorCategory::Input,
                             "Argument name contains '=' or whitespace: " + key,
                             "malformed_argument"};
    }
    return key;
}

}  // namespace octavius::policy
