#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include "store/key_value_store.hpp"

namespace octavius::store {

// Keeps every entry in one JSON object on disk. Each mutation rewrites the file
// through a uniquely named, fsynced temporary sibling and a rename; each read
// reloads it. Every operation holds an flock on "<file>.lock" (shared for reads,
// exclusive for writes), so separate processes sharing the file serialize too.
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path file_path);

    core::errors::Result<std::optional<std::string>> get(
        const core::context::CallContext& ctx, const std::string& key) override;

    core::errors::Status put(const core::context::CallContext& ctx,
                             const std::string& key,
                             const std::string& value) override;

    core::errors::Result<bool> put_if_absent(const core::context::CallContext& ctx,
                                             const std::string& key,
                                             const std::string& value) override;

    core::errors::Result<std::vector<KeyValue>> scan(
        const core::context::CallContext& ctx, const std::string& prefix) override;

    const std::filesystem::path& file_path() const { return file_path_; }

private:
    using Entries = std::map<std::string, std::string>;

    core::errors::Result<Entries> load() const;
    core::errors::Status save(const Entries& entries) const;
    core::errors::Status ensure_parent() const;

    std::filesystem::path file_path_;
    std::filesystem::path lock_path_;
    mutable std::mutex mutex_;
};

}  // namespace octavius::store
