#pragma once

#include <map>
#include <mutex>
#include "store/key_value_store.hpp"

namespace octavius::store {

class InMemoryKeyValueStore : public KeyValueStore {
public:
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

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> entries_;
};

}  // namespace octavius::store
