#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/context/call_context.hpp"
#include "core/errors/octavius_errors.hpp"

namespace octavius::store {

using KeyValue = std::pair<std::string, std::string>;

// Linearizable key-value backend. Single-key operations are atomic.
// Implementations must be safe for concurrent use without external locking.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    // nullopt when the key is absent.
    virtual core::errors::Result<std::optional<std::string>> get(
        const core::context::CallContext& ctx, const std::string& key) = 0;

    virtual core::errors::Status put(const core::context::CallContext& ctx,
                                     const std::string& key,
                                     const std::string& value) = 0;

    // Writes only when the key is absent or holds an empty value. Returns false
    // when a non-empty value was present.
    virtual core::errors::Result<bool> put_if_absent(
        const core::context::CallContext& ctx, const std::string& key,
        const std::string& value) = 0;

    // Every entry whose key starts with prefix, in the store's scan order.
    virtual core::errors::Result<std::vector<KeyValue>> scan(
        const core::context::CallContext& ctx, const std::string& prefix) = 0;
};

}  // namespace octavius::store
