#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <mutex>
#include <cstdint>

#include "vinforge/core/store/sequence_store.hpp"


namespace vinforge::core::store {

// ============================================================================
//  class FileStore
//  ----------------------------------------------------------------------------
//  Durable single-process SequenceStore backed by one JSON document:
//
//      {
//        "LZSHCKZSWS": 4073,
//        "LFVAB123XS": 12
//      }
//
//  Responsibilities:
//  -----------------
//      • Load the document lazily on first access (missing file = empty store).
//      • Keep the in-memory map as the source of truth between writes.
//      • Persist every mutation before the call returns: temp file, fsync,
//        rename over the original, fsync of the directory.
//
//  Thread Safety:
//  --------------
//      • One store-wide timed mutex serialises every operation, so
//        "read current, add one, write back" is a single atomic unit inside
//        the process. Lock acquisition honours the caller's deadline.
//      • There is NO cross-process guarantee. Two processes sharing the file
//        will reissue numbers. Use RemoteStore for multi-instance deployments.
//
//  Invariants:
//  -----------
//      • A value is returned to a caller only after it is on disk.
//      • A failed persist leaves both file and memory at the previous state.
//      • Counters never exceed MAX_COUNTER_VALUE; a counter at the bound
//        reports CounterExhausted instead of wrapping.
//      • A file that exists but cannot be parsed is reported as Corrupted and
//        is never overwritten implicitly.
// ----------------------------------------------------------------------------
class FileStore final : public SequenceStore {
public:
    explicit FileStore(std::filesystem::path path);
    ~FileStore() override = default;

    using SequenceStore::allocate_next;
    using SequenceStore::read_current;
    using SequenceStore::reset;
    using SequenceStore::snapshot;
    using SequenceStore::clear_all;

    [[nodiscard]] Backend kind() const noexcept override { return Backend::File; }
    [[nodiscard]] std::string_view name() const noexcept override { return "FileStore"; }

    [[nodiscard]] Outcome allocate_next(std::string_view prefix, Deadline deadline) override;
    [[nodiscard]] Outcome read_current(std::string_view prefix, Deadline deadline) override;
    [[nodiscard]] Status reset(std::string_view prefix, std::uint64_t value, Deadline deadline) override;
    [[nodiscard]] SnapshotOutcome snapshot(Deadline deadline) override;
    [[nodiscard]] Status clear_all(Deadline deadline) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Document codec, exposed for tooling and tests
    [[nodiscard]] static std::string serialize(const Snapshot& counters);
    [[nodiscard]] static Status parse(std::string_view document, Snapshot& out);

private:
    [[nodiscard]] Status ensure_loaded_();
    [[nodiscard]] Status persist_(const Snapshot& counters);

private:
    std::filesystem::path path_;
    std::timed_mutex mutex_;
    Snapshot counters_;
    bool loaded_ = false;
};

} // namespace vinforge::core::store
