#pragma once

#include <memory>
#include <string>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/job_policy.hpp"
#include "protocol/job_metadata.hpp"
#include "registry/registration_mode.hpp"
#include "store/key_value_store.hpp"

namespace octavius::registry {

// Maps job names to Metadata under the "metadata/" key namespace.
// Holds no state of its own; every call goes to the store.
class JobRegistry {
public:
    static constexpr const char* kKeyPrefix = "metadata/";
    static constexpr const char* kAlreadyPresentMessage = "metadata: key already present";

    explicit JobRegistry(std::shared_ptr<store::KeyValueStore> store,
                         RegistrationMode mode = RegistrationMode::CheckThenPut,
                         core::logging::Logger& logger = core::logging::Logger::get());

    // Stores metadata under "metadata/<name>" unless the key already holds a
    // value. The stored record's name is always the key name.
    core::errors::Result<protocol::Metadata> register_job(
        const core::context::CallContext& ctx, const std::string& name,
        const protocol::Metadata& metadata) const;

    core::errors::Result<protocol::Metadata> fetch(
        const core::context::CallContext& ctx, const std::string& name) const;

    core::errors::Result<protocol::JobList> list(
        const core::context::CallContext& ctx) const;

    RegistrationMode mode() const { return mode_; }

    static std::string key_for(const std::string& name);

private:
    core::errors::Result<protocol::Metadata> check_then_put(
        const core::context::CallContext& ctx, const std::string& key,
        const protocol::Metadata& record) const;
    core::errors::Result<protocol::Metadata> conditional_write(
        const core::context::CallContext& ctx, const std::string& key,
        const protocol::Metadata& record) const;

    std::shared_ptr<store::KeyValueStore> store_;
    RegistrationMode mode_;
    core::logging::Logger& logger_;
    policy::JobPolicy policy_;
};

}  // namespace octavius::registry
