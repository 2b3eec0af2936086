#pragma once

#include <map>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <cmath>

#include "vinforge/core/store/status.hpp"
#include "vinforge/core/config/sequence.hpp"
#include "lcr/log/logger.hpp"

/*
===============================================================================
SequenceStore
===============================================================================

Abstract capability allocating strictly increasing sequence numbers per
identifier prefix.

Contract:
  • allocate_next(prefix) atomically reads the counter, adds one, persists the
    new value and returns it. Two callers never observe the same value, no
    matter how many threads (or, for the remote backend, processes) race.
  • read_current(prefix) returns the last persisted value, or 0 for an unknown
    prefix. It never increments.
  • reset(prefix, value) force-sets a counter. This can reissue numbers that
    are already in the field and is always logged at warning level.
  • clear_all() drops every counter. Same warning applies.
  • snapshot() / statistics() are read-only aggregates over all prefixes.

Every operation honours a caller-supplied deadline.

Counters are only ever mutated through this interface.

Implementations:
  • FileStore         : single-process durable JSON file
  • RemoteStore<C>    : remote key-value service with atomic INCR
===============================================================================
*/

namespace vinforge::core::store {

using Clock    = std::chrono::steady_clock;
using Deadline = Clock::time_point;

[[nodiscard]]
inline Deadline deadline_after(std::chrono::milliseconds timeout) noexcept {
    return Clock::now() + timeout;
}

[[nodiscard]]
inline Deadline default_deadline() noexcept {
    return deadline_after(config::sequence::DEFAULT_OPERATION_TIMEOUT);
}

// Result of a single-counter operation. `value` is meaningful only when ok().
struct Outcome {
    Status status = Status::Ok;
    std::uint64_t value = 0;

    [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }
};

struct Statistics {
    std::uint64_t total_prefixes = 0;
    std::uint64_t total_issued = 0;
    std::uint64_t max_sequence = 0;
    double average_sequence = 0.0;   // rounded to two decimals
};

// prefix -> counter, ordered by prefix
using Snapshot = std::map<std::string, std::uint64_t>;

struct SnapshotOutcome {
    Status status = Status::Ok;
    Snapshot counters;

    [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }
};

struct StatisticsOutcome {
    Status status = Status::Ok;
    Statistics stats;

    [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }
};


[[nodiscard]]
inline Statistics compute_statistics(const Snapshot& counters) noexcept {
    Statistics s;
    if (counters.empty()) {
        return s;
    }
    for (const auto& [prefix, value] : counters) {
        s.total_issued += value;
        if (value > s.max_sequence) s.max_sequence = value;
    }
    s.total_prefixes = counters.size();
    const double avg = static_cast<double>(s.total_issued) / static_cast<double>(s.total_prefixes);
    s.average_sequence = std::round(avg * 100.0) / 100.0;
    return s;
}

// Prefixes are used verbatim as file keys and remote keys. Reject anything
// that could not round-trip or that would act as a KEYS glob.
[[nodiscard]]
inline bool is_valid_prefix(std::string_view prefix) noexcept {
    if (prefix.empty() || prefix.size() > 64) {
        return false;
    }
    for (char c : prefix) {
        const bool alnum = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        if (!alnum && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

// Emits the soft-limit warnings for a freshly allocated value.
// Never fails: the value is still handed out.
inline void report_sequence_limit(std::string_view store_name, std::string_view prefix, std::uint64_t value) {
    using namespace config::sequence;
    if (value > MAX_SEQUENCE) {
        VF_WARN("[" << store_name << "] Sequence " << prefix << " reached " << value
                << ", beyond the limit (" << MAX_SEQUENCE << "). Rotate to a new prefix.");
    }
    else if (value >= SEQUENCE_WARNING_THRESHOLD && (value == SEQUENCE_WARNING_THRESHOLD || value % 1000 == 0)) {
        VF_WARN("[" << store_name << "] Sequence " << prefix << " at " << value
                << ", approaching the limit (" << MAX_SEQUENCE << "). Consider rotating the prefix.");
    }
}


class SequenceStore {
public:
    virtual ~SequenceStore() = default;

    [[nodiscard]] virtual Backend kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual Outcome allocate_next(std::string_view prefix, Deadline deadline) = 0;
    [[nodiscard]] virtual Outcome read_current(std::string_view prefix, Deadline deadline) = 0;
    [[nodiscard]] virtual Status reset(std::string_view prefix, std::uint64_t value, Deadline deadline) = 0;
    [[nodiscard]] virtual SnapshotOutcome snapshot(Deadline deadline) = 0;
    [[nodiscard]] virtual Status clear_all(Deadline deadline) = 0;

    [[nodiscard]] StatisticsOutcome statistics(Deadline deadline) {
        SnapshotOutcome snap = snapshot(deadline);
        if (!snap.ok()) {
            return StatisticsOutcome{snap.status, {}};
        }
        return StatisticsOutcome{Status::Ok, compute_statistics(snap.counters)};
    }

    // -------------------------------------------------------------------------
    // Overloads applying the default operation timeout
    // -------------------------------------------------------------------------
    [[nodiscard]] Outcome allocate_next(std::string_view prefix) {
        return allocate_next(prefix, default_deadline());
    }

    [[nodiscard]] Outcome read_current(std::string_view prefix) {
        return read_current(prefix, default_deadline());
    }

    [[nodiscard]] Status reset(std::string_view prefix, std::uint64_t value = 0) {
        return reset(prefix, value, default_deadline());
    }

    [[nodiscard]] SnapshotOutcome snapshot() {
        return snapshot(default_deadline());
    }

    [[nodiscard]] Status clear_all() {
        return clear_all(default_deadline());
    }

    [[nodiscard]] StatisticsOutcome statistics() {
        return statistics(default_deadline());
    }

protected:
    SequenceStore() = default;
    SequenceStore(const SequenceStore&) = delete;
    SequenceStore& operator=(const SequenceStore&) = delete;
};

} // namespace vinforge::core::store
