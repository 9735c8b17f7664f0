//! # lintkit Logging
//!
//! Diagnostics about the engine itself: rule registration, configuration
//! problems and per-call decisions. Violations are not logged; they are
//! returned to the host.
//!
//! Every message carries a module tag (`"lint"`, `"source"`). A message is
//! written when its level reaches the module's level, or the global level
//! when the module has none.
//!
//! ```cpp
//! log::Logger::instance().set_module_level("lint", log::LogLevel::Trace);
//! LINTKIT_LOG_TRACE("lint", "Realigning call at " << offset);
//! ```

#ifndef LINTKIT_LOG_HPP
#define LINTKIT_LOG_HPP

#include <atomic>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace lintkit::log {

enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Off };

/// Upper-case name of a level ("TRACE" ... "OFF").
[[nodiscard]] const char* level_name(LogLevel level);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

/// Writes one line per record, `lintkit: LEVEL [module] message`.
///
/// Defaults to stderr. The stream must outlive the sink.
class ConsoleSink : public LogSink {
public:
    ConsoleSink();
    explicit ConsoleSink(std::ostream& out) : out_(&out) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream* out_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Starts with one stderr `ConsoleSink` at `Warn`.
///
/// Sinks are called under a mutex, so a sink sees one record at a time.
class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// True if a record at `level` from `module` would be written.
    [[nodiscard]] bool enabled(LogLevel level, std::string_view module) const;

    void write(LogLevel level, std::string_view module, std::string message, const char* file,
               int line);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    /// Overrides the level of one module, in either direction.
    void set_module_level(std::string module, LogLevel level);

    /// Restores the stderr sink at `Warn` with no module overrides.
    void reset();

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();
    void flush();

private:
    Logger();

    void update_floor();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    // Lowest level anything can be written at; lets enabled() skip the lock.
    std::atomic<LogLevel> floor_{LogLevel::Warn};
    std::map<std::string, LogLevel, std::less<>> module_levels_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

} // namespace lintkit::log

/// Logs `msg` (a stream expression) when the level is enabled for `module`.
/// The message is only built when it will be written.
#define LINTKIT_LOG(level, module, msg)                                                            \
    do {                                                                                           \
        auto& lintkit_logger_ = ::lintkit::log::Logger::instance();                                \
        if (lintkit_logger_.enabled(level, module)) {                                              \
            std::ostringstream lintkit_message_;                                                   \
            lintkit_message_ << msg;                                                               \
            lintkit_logger_.write(level, module, lintkit_message_.str(), __FILE__, __LINE__);      \
        }                                                                                          \
    } while (0)

#define LINTKIT_LOG_TRACE(module, msg) LINTKIT_LOG(::lintkit::log::LogLevel::Trace, module, msg)
#define LINTKIT_LOG_DEBUG(module, msg) LINTKIT_LOG(::lintkit::log::LogLevel::Debug, module, msg)
#define LINTKIT_LOG_INFO(module, msg) LINTKIT_LOG(::lintkit::log::LogLevel::Info, module, msg)
#define LINTKIT_LOG_WARN(module, msg) LINTKIT_LOG(::lintkit::log::LogLevel::Warn, module, msg)
#define LINTKIT_LOG_ERROR(module, msg) LINTKIT_LOG(::lintkit::log::LogLevel::Error, module, msg)

#endif // LINTKIT_LOG_HPP
