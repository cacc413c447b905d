#pragma once

#include <atomic>
#include <mutex>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

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

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal" | "off".
// Unknown names resolve to Info.
[[nodiscard]]
inline Level level_from_string(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// The level is atomic so the hot path can filter without the sink mutex.
// Background loop, transport receive thread and application threads all
// log through the same instance.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    [[nodiscard]]
    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level() && lvl != Level::Off; }

    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Sink setter (stdout by default). Tests redirect into a stringstream.
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        const std::string ts = timestamp();
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << ts << " [" << level_name(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << '\n';
        if (lvl >= Level::Warn) {
            os.flush();
        }
    }

private:
    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(true)
    {}

    static const char* level_name(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO ";
            case Level::Warn:  return "WARN ";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   break;
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   break;
        }
        return "\033[0m";
    }

    // "YYYY-mm-dd HH:MM:SS.mmm" in local time
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%.*s.%03d", static_cast<int>(n), buf, static_cast<int>(ms));
        return out;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

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
// Logging macros
// ---------------------------------------------------------
// The message expression is only evaluated when the level is enabled.
#define LS_LOG_LEVEL(lvl, msg)                                              \
    do {                                                                    \
        if (::lcr::log::Logger::instance().enabled((lvl))) {                \
            ::lcr::log::LogStream((lvl)) << msg;                            \
        }                                                                   \
    } while (0)

#define LS_TRACE(msg)  LS_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define LS_DEBUG(msg)  LS_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define LS_INFO(msg)   LS_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define LS_WARN(msg)   LS_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define LS_ERROR(msg)  LS_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define LS_FATAL(msg)  LS_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
