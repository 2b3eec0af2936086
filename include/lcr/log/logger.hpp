#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Human-readable severity names
[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Parses "trace | debug | info | warn | error | fatal" (lower case).
// Unknown names leave `out` untouched and return false.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if (name == "trace")      { out = Level::Trace; return true; }
    if (name == "debug")      { out = Level::Debug; return true; }
    if (name == "info")       { out = Level::Info;  return true; }
    if (name == "warn")       { out = Level::Warn;  return true; }
    if (name == "warning")    { out = Level::Warn;  return true; }
    if (name == "error")      { out = Level::Error; return true; }
    if (name == "fatal")      { out = Level::Fatal; return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stderr by default, stdout is kept for tool output)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // Number of lines emitted at Warn or above since start (or last reset)
    [[nodiscard]] std::uint64_t warning_count() const noexcept {
        return warnings_.load(std::memory_order_relaxed);
    }

    void reset_warning_count() noexcept { warnings_.store(0, std::memory_order_relaxed); }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (lvl >= Level::Warn) {
            warnings_.fetch_add(1, std::memory_order_relaxed);
        }
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << to_string(lvl) << "] " << msg;
        if (color) os << "\033[0m"; // reset
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cerr)
        , level_(Level::Info)
        , color_enabled_(false)
    {}

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::atomic<std::uint64_t> warnings_{0};
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
#define VF_LOG_LEVEL(lvl) ::lcr::log::LogStream((lvl))

#define VF_TRACE(msg)  VF_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define VF_DEBUG(msg)  VF_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define VF_INFO(msg)   VF_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define VF_WARN(msg)   VF_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define VF_ERROR(msg)  VF_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define VF_FATAL(msg)  VF_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
