#pragma once

#include <mutex>
#include <cstdint>
#include <ctime>
#include <cstdio>
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

// Accepts "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Unknown names resolve to Info.
[[nodiscard]]
inline Level level_from_string(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// Writes to std::cerr by default: stdout belongs to the structured
// result records emitted by command line tools.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    void set_level(std::string_view name) noexcept { level_ = level_from_string(name); }

    Level level() const noexcept { return level_; }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level_; }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cerr),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
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

    // Millisecond resolution: wait loops are reasoned about in sub-second steps
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
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
// The level check short-circuits formatting of disabled messages.
#define WD_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define WD_TRACE(msg)  WD_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define WD_DEBUG(msg)  WD_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define WD_INFO(msg)   WD_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define WD_WARN(msg)   WD_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define WD_ERROR(msg)  WD_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define WD_FATAL(msg)  WD_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
