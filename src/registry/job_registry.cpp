#include "registry/job_registry.hpp"

#include <utility>
#include "registry/metadata_codec.hpp"

namespace octavius::registry {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;

namespace {

OctaviusError already_present(const std::string& key) {
    return OctaviusError{ErrorCategory::AlreadyExists,
                         JobRegistry::kAlreadyPresentMessage, "key_already_present",
                         "Pick another job name; '" + key + "' is taken."};
}

}  // namespace

JobRegistry::JobRegistry(std::shared_ptr<store::KeyValueStore> store,
                         const RegistrationMode mode,
                         core::logging::Logger& logger)
    : store_(std::move(store)), mode_(mode), logger_(logger) {}

std::string JobRegistry::key_for(const std::string& name) {
    return std::string(kKeyPrefix) + name;
}

core::errors::Result<protocol::Metadata> JobRegistry::register_job(
    const core::context::CallContext& ctx, const std::string& name,
    const protocol::Metadata& metadata) const {
    const auto valid_name = policy_.validate_job_name(name);
    if (core::errors::is_error(valid_name)) {
        return core::errors::get_error(valid_name);
    }

    protocol::Metadata record = metadata;
    record.name = name;

    const std::string key = key_for(name);
    auto stored = mode_ == RegistrationMode::ConditionalWrite
                      ? conditional_write(ctx, key, record)
                      : check_then_put(ctx, key, record);
    if (core::errors::is_error(stored)) {
        logger_.warn("JobRegistry: register " + key + " failed: " +
                     core::errors::get_error(stored).message);
        return stored;
    }

    logger_.info("JobRegistry: registered " + key + " (image " + record.image_name + ")");
    return stored;
}

core::errors::Result<protocol::Metadata> JobRegistry::check_then_put(
    const core::context::CallContext& ctx, const std::string& key,
    const protocol::Metadata& record) const {
    // Not atomic: two callers can both see the key absent and both write,
    // last writer wins. RegistrationMode::ConditionalWrite closes the window.
    auto existing = store_->get(ctx, key);
    if (core::errors::is_error(existing)) {
        return core::errors::as_internal(core::errors::get_error(existing),
                                         "register_job: get " + key);
    }
    const auto& current = core::errors::get_value(existing);
    if (current.has_value() && !current->empty()) {
        return already_present(key);
    }

    const auto written = store_->put(ctx, key, encode_metadata(record));
    if (core::errors::is_error(written)) {
        return core::errors::as_internal(core::errors::get_error(written),
                                         "register_job: put " + key);
    }
    return record;
}

core::errors::Result<protocol::Metadata> JobRegistry::conditional_write(
    const core::context::CallContext& ctx, const std::string& key,
    const protocol::Metadata& record) const {
    auto inserted = store_->put_if_absent(ctx, key, encode_metadata(record));
    if (core::errors::is_error(inserted)) {
        return core::errors::as_internal(core::errors::get_error(inserted),
                                         "register_job: put_if_absent " + key);
    }
    if (!core::errors::get_value(inserted)) {
        return already_present(key);
    }
    return record;
}

core::errors::Result<protocol::Metadata> JobRegistry::fetch(
    const core::context::CallContext& ctx, const std::string& name) const {
    const auto valid_name = policy_.validate_job_name(name);
    if (core::errors::is_error(valid_name)) {
        return core::errors::get_error(valid_name);
    }

    const std::string key = key_for(name);
    auto value = store_->get(ctx, key);
    if (core::errors::is_error(value)) {
        return core::errors::as_internal(core::errors::get_error(value),
                                         "fetch: get " + key);
    }

    const auto& bytes = core::errors::get_value(value);
    if (!bytes.has_value() || bytes->empty()) {
        return OctaviusError{ErrorCategory::NotFound,
                             "metadata: no job registered as '" + name + "'",
                             "job_not_found",
                             "Run 'octavius list' to see registered jobs."};
    }

    auto decoded = decode_metadata(bytes.value());
    if (core::errors::is_error(decoded)) {
        return core::errors::with_context(core::errors::get_error(decoded),
                                          "fetch " + key);
    }
    if (core::errors::get_value(decoded).name != name) {
        return OctaviusError{ErrorCategory::Internal,
                             "fetch " + key + ": stored record is named '" +
                                 core::errors::get_value(decoded).name + "'",
                             "record_key_mismatch"};
    }
    return decoded;
}

core::errors::Result<protocol::JobList> JobRegistry::list(
    const core::context::CallContext& ctx) const {
    auto scanned = store_->scan(ctx, kKeyPrefix);
    if (core::errors::is_error(scanned)) {
        return core::errors::as_internal(core::errors::get_error(scanned),
                                         std::string("list: scan ") + kKeyPrefix);
    }

    const std::string prefix(kKeyPrefix);
    protocol::JobList job_list;
    for (const auto& entry : core::errors::get_value(scanned)) {
        if (entry.first.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        job_list.jobs.push_back(entry.first.substr(prefix.size()));
    }
    logger_.debug("JobRegistry: listed " + std::to_string(job_list.jobs.size()) + " jobs");
    return job_list;
}

}  // namespace octavius::registry
