#include "store/file_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace octavius::store {

using core::errors::ErrorCategory;
using core::errors::OctaviusError;
using nlohmann::json;

namespace {

OctaviusError io_error(const std::string& what, const std::string& path,
                       const std::string& code) {
    return OctaviusError{ErrorCategory::Internal,
                         what + ": " + path + " (" + std::strerror(errno) + ")", code};
}

// flock on a sidecar file. Closing the descriptor releases the lock.
class FileLock {
public:
    FileLock() = default;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    ~FileLock() {
        if (fd_ >= 0) {
            static_cast<void>(::close(fd_));
        }
    }

    // A shared lock on a store whose directory does not exist yet holds
    // nothing; there is no file to read either.
    core::errors::Status acquire(const std::filesystem::path& path, const bool exclusive) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            if (errno == ENOENT && !exclusive) {
                return core::errors::ok();
            }
            return io_error("Unable to open store lock", path.string(), "store_lock_failed");
        }
        while (::flock(fd_, exclusive ? LOCK_EX : LOCK_SH) != 0) {
            if (errno != EINTR) {
                return io_error("Unable to lock store", path.string(), "store_lock_failed");
            }
        }
        return core::errors::ok();
    }

private:
    int fd_ = -1;
};

bool write_all(const int fd, const std::string& text) {
    std::size_t offset = 0;
    while (offset < text.size()) {
        const ssize_t n = ::write(fd, text.data() + offset, text.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

core::errors::Status sync_directory(const std::filesystem::path& dir) {
    const std::string name = dir.empty() ? std::string(".") : dir.string();
    const int fd = ::open(name.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return io_error("Unable to open store directory", name, "store_write_failed");
    }
    const bool synced = ::fsync(fd) == 0 || errno == EINVAL;
    const std::string reason = synced ? std::string() : std::strerror(errno);
    static_cast<void>(::close(fd));
    if (!synced) {
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to sync store directory: " + name + " (" + reason + ")",
                             "store_write_failed"};
    }
    return core::errors::ok();
}

}  // namespace

FileKeyValueStore::FileKeyValueStore(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    lock_path_ = file_path_;
    lock_path_ += ".lock";
}

core::errors::Result<FileKeyValueStore::Entries> FileKeyValueStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_path_, ec)) {
        if (ec) {
            return OctaviusError{ErrorCategory::Internal,
                                 "Unable to stat store file: " + file_path_.string(),
                                 "store_read_failed"};
        }
        return Entries{};
    }

    std::ifstream in(file_path_);
    if (!in.is_open()) {
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to open store file: " + file_path_.string(),
                             "store_read_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return OctaviusError{ErrorCategory::Internal,
                             "I/O error while reading store file: " + file_path_.string(),
                             "store_read_failed"};
    }

    const std::string text = buffer.str();
    if (text.empty()) {
        return Entries{};
    }

    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return OctaviusError{ErrorCategory::Internal,
                             "Store file is corrupt: " + file_path_.string(),
                             "store_corrupt"};
    }

    Entries entries;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_string()) {
            return OctaviusError{ErrorCategory::Internal,
                                 "Store file holds a non-string value under key: " +
                                     it.key(),
                                 "store_corrupt"};
        }
        entries.emplace(it.key(), it.value().get<std::string>());
    }
    return entries;
}

core::errors::Status FileKeyValueStore::ensure_parent() const {
    const auto parent = file_path_.parent_path();
    if (parent.empty()) {
        return core::errors::ok();
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to create store directory: " + parent.string(),
                             "store_write_failed"};
    }
    return core::errors::ok();
}

core::errors::Status FileKeyValueStore::save(const Entries& entries) const {
    json doc = json::object();
    for (const auto& [key, value] : entries) {
        doc[key] = value;
    }
    const std::string text = doc.dump(2) + "\n";

    const std::string pattern = file_path_.string() + ".tmp.XXXXXX";
    std::vector<char> temp_name(pattern.begin(), pattern.end());
    temp_name.push_back('\0');
    const int fd = ::mkostemp(temp_name.data(), O_CLOEXEC);
    if (fd < 0) {
        return io_error("Unable to create temporary store file", pattern,
                        "store_write_failed");
    }
    const std::filesystem::path temp_path(temp_name.data());

    const bool written = ::fchmod(fd, 0644) == 0 && write_all(fd, text) && ::fsync(fd) == 0;
    const std::string reason = written ? std::string() : std::strerror(errno);
    const bool closed = ::close(fd) == 0;
    if (!written || !closed) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to write store file: " + temp_path.string() +
                                 (reason.empty() ? std::string() : " (" + reason + ")"),
                             "store_write_failed"};
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, file_path_, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        return OctaviusError{ErrorCategory::Internal,
                             "Unable to replace store file: " + file_path_.string() +
                                 " (" + ec.message() + ")",
                             "store_write_failed"};
    }
    return sync_directory(file_path_.parent_path());
}

core::errors::Result<std::optional<std::string>> FileKeyValueStore::get(
    const core::context::CallContext& ctx, const std::string& key) {
    const auto live = ctx.check("get " + key);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock;
    const auto locked = file_lock.acquire(lock_path_, false);
    if (core::errors::is_error(locked)) {
        return core::errors::get_error(locked);
    }
    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    const auto& entries = core::errors::get_value(loaded);
    const auto it = entries.find(key);
    if (it == entries.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

core::errors::Status FileKeyValueStore::put(const core::context::CallContext& ctx,
                                            const std::string& key,
                                            const std::string& value) {
    const auto live = ctx.check("put " + key);
    if (core::errors::is_error(live)) {
        return live;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto parent = ensure_parent();
    if (core::errors::is_error(parent)) {
        return parent;
    }
    FileLock file_lock;
    const auto locked = file_lock.acquire(lock_path_, true);
    if (core::errors::is_error(locked)) {
        return locked;
    }
    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto entries = core::errors::take_value(std::move(loaded));
    entries[key] = value;
    return save(entries);
}

core::errors::Result<bool> FileKeyValueStore::put_if_absent(
    const core::context::CallContext& ctx, const std::string& key,
    const std::string& value) {
    const auto live = ctx.check("put_if_absent " + key);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto parent = ensure_parent();
    if (core::errors::is_error(parent)) {
        return core::errors::get_error(parent);
    }
    FileLock file_lock;
    const auto locked = file_lock.acquire(lock_path_, true);
    if (core::errors::is_error(locked)) {
        return core::errors::get_error(locked);
    }
    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }
    auto entries = core::errors::take_value(std::move(loaded));
    auto& slot = entries[key];
    if (!slot.empty()) {
        return false;
    }
    slot = value;

    const auto saved = save(entries);
    if (core::errors::is_error(saved)) {
        return core::errors::get_error(saved);
    }
    return true;
}

core::errors::Result<std::vector<KeyValue>> FileKeyValueStore::scan(
    const core::context::CallContext& ctx, const std::string& prefix) {
    const auto live = ctx.check("scan " + prefix);
    if (core::errors::is_error(live)) {
        return core::errors::get_error(live);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock;
    const auto locked = file_lock.acquire(lock_path_, false);
    if (core::errors::is_error(locked)) {
        return core::errors::get_error(locked);
    }
    auto loaded = load();
    if (core::errors::is_error(loaded)) {
        return core::errors::get_error(loaded);
    }

    std::vector<KeyValue> matches;
    for (const auto& [key, value] : core::errors::get_value(loaded)) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            matches.emplace_back(key, value);
        }
    }
    return matches;
}

}  // namespace octavius::store
