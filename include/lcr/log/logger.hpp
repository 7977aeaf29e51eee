#pragma once

#include <mutex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <thread>

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
    Fatal,
    Off
};

// Maps "trace" | "debug" | "info" | "warn" | "error" | "fatal" | "off" to a level.
// Returns false (and leaves `out` untouched) on unknown names.
[[nodiscard]]
inline bool parse_level(std::string_view name, Level& out) noexcept {
    if (name == "trace")      out = Level::Trace;
    else if (name == "debug") out = Level::Debug;
    else if (name == "info")  out = Level::Info;
    else if (name == "warn")  out = Level::Warn;
    else if (name == "error") out = Level::Error;
    else if (name == "fatal") out = Level::Fatal;
    else if (name == "off")   out = Level::Off;
    else return false;
    return true;
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

    void set_level(Level lvl) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = lvl;
    }

    Level level() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return lvl >= level_ && lvl != Level::Off;
    }

    // Enable or disable colored output
    void enable_color(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        color_enabled_ = on;
    }

    // Include the emitting thread id in each line (off by default)
    void enable_thread_id(bool on) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        thread_id_enabled_ = on;
    }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lvl < level_ || lvl == Level::Off) return;
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] ";
        if (thread_id_enabled_) os << "(" << std::this_thread::get_id() << ") ";
        os << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(true)
        , thread_id_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   return "OFF";
        }
        return "?????";
    }

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            case Level::Off:   return "\033[0m";
        }
        return "\033[0m";
    }

    // Wall-clock timestamp with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    bool thread_id_enabled_;
    mutable std::mutex mutex_;
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
// Disabled levels skip message formatting entirely.
#define TM_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define TM_TRACE(msg)  TM_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define TM_DEBUG(msg)  TM_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define TM_INFO(msg)   TM_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define TM_WARN(msg)   TM_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define TM_ERROR(msg)  TM_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define TM_FATAL(msg)  TM_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
