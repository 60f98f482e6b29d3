#include "store/in_memory_store.hpp"

namespace octavius::store {

core::errors::Result<std::optional<std::string>> InMemoryKeyValueStore::get(
    const core::context::CallContext& ctx, const std::string& key) {
    const auto live = ctx.check("get " + key);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

core::errors::Status InMemoryKeyValueStore::put(
    const core::context::CallContext& ctx, const std::string& key,
    const std::string& value) {
    const auto live = ctx.check("put " + key);
    if (core::errors::is_error(live)) {
        return live;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
    return core::errors::ok();
}

core::errors::Result<bool> InMemoryKeyValueStore::put_if_absent(
    const core::context::CallContext& ctx, const std::string& key,
    const std::string& value) {
    const auto live = ctx.check("put_if_absent " + key);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = entries_[key];
    if (!slot.empty()) {
        return false;
    }
    slot = value;
    return true;
}

core::errors::Result<std::vector<KeyValue>> InMemoryKeyValueStore::scan(
    const core::context::CallContext& ctx, const std::string& prefix) {
    const auto live = ctx.check("scan " + prefix);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyValue> matches;
    for (auto it = entries_.lower_bound(prefix);
         it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
         ++it) {
        matches.emplace_back(it->first, it->second);
    }
    return matches;
}

std::size_t InMemoryKeyValueStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace octavius::store
