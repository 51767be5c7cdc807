//! # exprc Logging
//!
//! Every message carries a module tag (`normalize`, `codegen`, `registry`,
//! `driver`, `cli`), so a filter such as `normalize=trace,*=warn` opens up a
//! single stage of the pipeline. Batch workers log from several threads at
//! once; sinks are written under one lock.
//!
//! ```cpp
//! EXPRC_LOG_DEBUG("registry", "reused " << name << " for " << original_text);
//! ```

#ifndef EXPRC_LOG_HPP
#define EXPRC_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace exprc::log {

enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Case-insensitive; "warning" is accepted for Warn and anything unknown is Info.
[[nodiscard]] auto parse_level(std::string_view text) -> LogLevel;

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view module;
    std::string message;
    int64_t timestamp_ms = 0; ///< Milliseconds since the epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< `{"ts":...,"level":...,"module":...,"msg":...}`
};

/// One line, without the newline.
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format) -> std::string;

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

/// A sink that renders each record as one line in a configurable format.
class LineSink : public LogSink {
public:
    void write(const LogRecord& record) override;

    void set_format(LogFormat format) {
        format_ = format;
    }

protected:
    virtual void write_line(const std::string& line, const LogRecord& record) = 0;

    LogFormat format_ = LogFormat::Text;
};

/// stderr. Colors are used only when stderr is a terminal.
class ConsoleSink : public LineSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void flush() override;

protected:
    void write_line(const std::string& line, const LogRecord& record) override;

private:
    bool colors_;
};

/// Error and Fatal records are flushed as soon as they are written.
class FileSink : public LineSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    [[nodiscard]] bool is_open() const {
        return file_.is_open();
    }

    void flush() override;

protected:
    void write_line(const std::string& line, const LogRecord& record) override;

private:
    std::ofstream file_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds parsed from `module=level,...`. `*=level` sets the
/// default and a bare module name means Trace for that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold of any module.
    [[nodiscard]] LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> overrides_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty for console only
    bool colors = true;
};

/// Process-wide logger. Until init() runs it logs Info and above to stderr.
class Logger {
public:
    static auto instance() -> Logger&;
    static void init(const LogConfig& config);

    [[nodiscard]] bool enabled(LogLevel level, std::string_view module) const;
    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();
    void set_level(LogLevel level);
    void set_filter(std::string_view spec);
    void flush();

private:
    Logger();

    std::atomic<LogLevel> threshold_{LogLevel::Info};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads -v/-vv/-vvv, -q, --log-level=, --log-filter=, --log-file= and
/// --log-format= from argv. Without a level or filter flag, EXPRC_LOG is used.
[[nodiscard]] LogConfig parse_log_options(int argc, char* argv[]);

[[nodiscard]] bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out (0 = Trace ... 6 = Off)
#ifndef EXPRC_MIN_LOG_LEVEL
#define EXPRC_MIN_LOG_LEVEL 0
#endif

#define EXPRC_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= EXPRC_MIN_LOG_LEVEL &&                                      \
            ::exprc::log::Logger::instance().enabled(level, module_str)) {                         \
            std::ostringstream exprc_log_stream_;                                                  \
            exprc_log_stream_ << msg;                                                              \
            ::exprc::log::Logger::instance().log(level, module_str, exprc_log_stream_.str());      \
        }                                                                                          \
    } while (0)

#define EXPRC_LOG_TRACE(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Trace, module, msg)
#define EXPRC_LOG_DEBUG(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Debug, module, msg)
#define EXPRC_LOG_INFO(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Info, module, msg)
#define EXPRC_LOG_WARN(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Warn, module, msg)
#define EXPRC_LOG_ERROR(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Error, module, msg)
#define EXPRC_LOG_FATAL(module, msg) EXPRC_LOG_IMPL(::exprc::log::LogLevel::Fatal, module, msg)

} // namespace exprc::log

#endif // EXPRC_LOG_HPP
