#include "vinforge/core/store/file_store.hpp"

#include <string>
#include <system_error>
#include <utility>
#include <cerrno>
#include <cstring>
// POSIX / Linux
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>

#include "vinforge/core/config/sequence.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace vinforge::core::store {

namespace {

// Writes the whole buffer, retrying on EINTR and short writes
[[nodiscard]] bool write_all(int fd, const char* data, std::size_t size) noexcept {
    while (size > 0) {
        const ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

// Makes a completed rename durable
[[nodiscard]] bool fsync_directory(const std::filesystem::path& dir) noexcept {
    const std::string d = dir.empty() ? std::string(".") : dir.string();
    const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return false;
    }
    const bool ok = (::fsync(fd) == 0);
    ::close(fd);
    return ok;
}

} // namespace


FileStore::FileStore(std::filesystem::path path)
    : path_(std::move(path))
{
    VF_DEBUG("[FileStore] using " << path_.string());
}

// -----------------------------------------------------------------------------
// Document codec
// -----------------------------------------------------------------------------

std::string FileStore::serialize(const Snapshot& counters) {
    std::string out;
    out.reserve(16 + counters.size() * 24);
    out += "{";
    bool first = true;
    for (const auto& [prefix, value] : counters) {
        out += first ? "\n  " : ",\n  ";
        first = false;
        lcr::json::append_key(out, prefix);
        lcr::json::append(out, value);
    }
    out += counters.empty() ? "}\n" : "\n}\n";
    return out;
}

Status FileStore::parse(std::string_view document, Snapshot& out) {
    out.clear();
    simdjson::dom::parser parser;
    simdjson::padded_string padded(document);
    simdjson::dom::element root;
    if (parser.parse(padded).get(root)) {
        return Status::Corrupted;
    }
    simdjson::dom::object obj;
    if (root.get(obj)) {
        return Status::Corrupted;
    }
    for (auto field : obj) {
        std::uint64_t value = 0;
        if (field.value.get(value)) {
            return Status::Corrupted;
        }
        if (value > config::sequence::MAX_COUNTER_VALUE) {
            return Status::Corrupted;
        }
        // A hand-edited file may repeat a key; never let a counter go backwards
        auto& slot = out[std::string(field.key)];
        if (value > slot) slot = value;
    }
    return Status::Ok;
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------

Status FileStore::ensure_loaded_() {
    if (loaded_) {
        return Status::Ok;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            VF_ERROR("[FileStore] cannot stat " << path_.string() << ": " << ec.message());
            return Status::Corrupted;
        }
        VF_INFO("[FileStore] No sequence file at " << path_.string() << ". Starting with empty sequences.");
        counters_.clear();
        loaded_ = true;
        return Status::Ok;
    }

    simdjson::padded_string json;
    if (simdjson::padded_string::load(path_.string()).get(json)) {
        VF_ERROR("[FileStore] cannot read " << path_.string());
        return Status::Corrupted;
    }

    Snapshot parsed;
    if (parse(std::string_view(json.data(), json.size()), parsed) != Status::Ok) {
        VF_ERROR("[FileStore] " << path_.string() << " is not a valid sequence document; refusing to continue");
        return Status::Corrupted;
    }

    counters_ = std::move(parsed);
    loaded_ = true;
    VF_INFO("[FileStore] Loaded " << counters_.size() << " sequences from " << path_.string());
    return Status::Ok;
}

Status FileStore::persist_(const Snapshot& counters) {
    const std::filesystem::path dir = path_.parent_path();
    std::error_code ec;
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            VF_ERROR("[FileStore] cannot create " << dir.string() << ": " << ec.message());
            return Status::PersistFailed;
        }
    }

    const std::string document = serialize(counters);
    const std::string tmp = path_.string() + ".tmp";

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        VF_ERROR("[FileStore] open(" << tmp << ") failed: " << std::strerror(errno));
        return Status::PersistFailed;
    }
    if (!write_all(fd, document.data(), document.size())) {
        VF_ERROR("[FileStore] write(" << tmp << ") failed: " << std::strerror(errno));
        ::close(fd);
        ::unlink(tmp.c_str());
        return Status::PersistFailed;
    }
    if (::fsync(fd) != 0) {
        VF_ERROR("[FileStore] fsync(" << tmp << ") failed: " << std::strerror(errno));
        ::close(fd);
        ::unlink(tmp.c_str());
        return Status::PersistFailed;
    }
    if (::close(fd) != 0) {
        VF_ERROR("[FileStore] close(" << tmp << ") failed: " << std::strerror(errno));
        ::unlink(tmp.c_str());
        return Status::PersistFailed;
    }
    if (::rename(tmp.c_str(), path_.c_str()) != 0) {
        VF_ERROR("[FileStore] rename(" << tmp << ") failed: " << std::strerror(errno));
        ::unlink(tmp.c_str());
        return Status::PersistFailed;
    }
    if (!fsync_directory(dir)) {
        // The new content is in place; only its durability across power loss is in doubt
        VF_WARN("[FileStore] fsync of directory " << dir.string() << " failed: " << std::strerror(errno));
    }
    return Status::Ok;
}

// -----------------------------------------------------------------------------
// SequenceStore API
// -----------------------------------------------------------------------------

Outcome FileStore::allocate_next(std::string_view prefix, Deadline deadline) {
    if (!is_valid_prefix(prefix)) {
        return Outcome{Status::InvalidPrefix, 0};
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return Outcome{Status::Timeout, 0};
    }
    if (Status s = ensure_loaded_(); s != Status::Ok) {
        return Outcome{s, 0};
    }

    const std::string key(prefix);
    auto it = counters_.find(key);
    const std::uint64_t current = (it != counters_.end()) ? it->second : 0;
    if (current >= config::sequence::MAX_COUNTER_VALUE) {
        VF_ERROR("[FileStore] Sequence " << prefix << " is at " << current << " and cannot be incremented");
        return Outcome{Status::CounterExhausted, 0};
    }
    const std::uint64_t next = current + 1;

    // Memory changes only after the new document is on disk
    Snapshot staged = counters_;
    staged[key] = next;
    if (Status s = persist_(staged); s != Status::Ok) {
        return Outcome{s, 0};
    }
    counters_ = std::move(staged);

    lock.unlock();
    report_sequence_limit(name(), prefix, next);
    return Outcome{Status::Ok, next};
}

Outcome FileStore::read_current(std::string_view prefix, Deadline deadline) {
    if (!is_valid_prefix(prefix)) {
        return Outcome{Status::InvalidPrefix, 0};
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return Outcome{Status::Timeout, 0};
    }
    if (Status s = ensure_loaded_(); s != Status::Ok) {
        return Outcome{s, 0};
    }
    auto it = counters_.find(std::string(prefix));
    return Outcome{Status::Ok, it == counters_.end() ? 0 : it->second};
}

Status FileStore::reset(std::string_view prefix, std::uint64_t value, Deadline deadline) {
    if (!is_valid_prefix(prefix)) {
        return Status::InvalidPrefix;
    }
    if (value > config::sequence::MAX_COUNTER_VALUE) {
        return Status::InvalidValue;
    }
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return Status::Timeout;
    }
    if (Status s = ensure_loaded_(); s != Status::Ok) {
        return s;
    }

    Snapshot next = counters_;
    next[std::string(prefix)] = value;
    if (Status s = persist_(next); s != Status::Ok) {
        return s;
    }
    counters_ = std::move(next);

    VF_WARN("[FileStore] Sequence " << prefix << " reset to " << value
            << ". Codes already issued above this value may be reissued.");
    return Status::Ok;
}

SnapshotOutcome FileStore::snapshot(Deadline deadline) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return SnapshotOutcome{Status::Timeout, {}};
    }
    if (Status s = ensure_loaded_(); s != Status::Ok) {
        return SnapshotOutcome{s, {}};
    }
    return SnapshotOutcome{Status::Ok, counters_};
}

Status FileStore::clear_all(Deadline deadline) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_until(deadline)) {
        return Status::Timeout;
    }
    // A corrupted file is replaced here on purpose: clearing is an explicit operator decision
    if (Status s = persist_(Snapshot{}); s != Status::Ok) {
        return s;
    }
    counters_.clear();
    loaded_ = true;

    VF_WARN("[FileStore] All sequences cleared. Every prefix restarts at 1.");
    return Status::Ok;
}

} // namespace vinforge::core::store
