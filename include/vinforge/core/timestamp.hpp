#pragma once

#include <chrono>
#include <string>
#include <cstdio>

namespace vinforge::core {

// ============================================================================
// Timestamp type (UTC, millisecond resolution)
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

// Calendar year of now(), UTC
[[nodiscard]] inline int current_year() noexcept {
    using namespace std::chrono;
    const year_month_day ymd{floor<days>(now())};
    return static_cast<int>(ymd.year());
}


// ============================================================================
// ISO-8601 formatter (always UTC)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.sssZ
// ============================================================================
[[nodiscard]] inline std::string to_string(const Timestamp& ts) {
    using namespace std::chrono;

    sys_days d = floor<days>(ts);
    year_month_day ymd{d};

    auto tod = ts - d; // time of day
    auto h = floor<hours>(tod);
    auto m = floor<minutes>(tod - h);
    auto s = floor<seconds>(tod - h - m);
    auto ms = duration_cast<milliseconds>(tod - h - m - s).count();

    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                  int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  int(h.count()), int(m.count()), int(s.count()),
                  static_cast<long long>(ms));

    return std::string(buf);
}

} // namespace vinforge::core
