//! # argrun Logging
//!
//! Structured, module-tagged logging shared by the library and its hosts:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-component filtering ("process", "assemble", ...)
//! - Console, File, Null and Multi sinks
//! - Thread-safe dispatch (the process supervisor logs from reader threads)
//! - Compile-time level elision via ARGRUN_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! ARGRUN_LOG_INFO("process", "spawned pid " << pid << " for " << argv[0]);
//! ARGRUN_LOG_DEBUG("state", "selected subcommand " << name);
//! ```

#ifndef ARGRUN_LOG_HPP
#define ARGRUN_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace argrun::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name. Unrecognized names map to LogLevel::Info.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "process")
    std::string message;
    const char* file; ///< __FILE__
    int line;         ///< __LINE__
    int64_t timestamp_ms;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }

private:
    bool colors_enabled_;

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Flushes automatically on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Renders a record as "HH:MM:SS.mmm LEVEL [module] message" (without
/// trailing newline).
std::string format_text(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter parsed from specs like "process=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A bare module name enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use, so library
/// code may log before the host calls `Logger::init()`.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (tests install a capture sink afterwards).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file and -q/--quiet
/// from argv, falling back to the ARGRUN_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef ARGRUN_MIN_LOG_LEVEL
#define ARGRUN_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define ARGRUN_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= ARGRUN_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::argrun::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define ARGRUN_LOG_TRACE(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Trace, module, msg)
#define ARGRUN_LOG_DEBUG(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Debug, module, msg)
#define ARGRUN_LOG_INFO(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Info, module, msg)
#define ARGRUN_LOG_WARN(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Warn, module, msg)
#define ARGRUN_LOG_ERROR(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Error, module, msg)
#define ARGRUN_LOG_FATAL(module, msg) ARGRUN_LOG_IMPL(::argrun::log::LogLevel::Fatal, module, msg)

} // namespace argrun::log

#endif // ARGRUN_LOG_HPP
