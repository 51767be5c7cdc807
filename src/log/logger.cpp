//! # Logger Implementation

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <unistd.h>

namespace exprc::log {

namespace {

struct LevelInfo {
    std::string_view name;
    std::string_view color;
};

// Indexed by LogLevel
constexpr std::array<LevelInfo, 7> LEVELS = {{
    {"TRACE", "\033[90m"},
    {"DEBUG", "\033[36m"},
    {"INFO", "\033[32m"},
    {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"},
    {"FATAL", "\033[1;31m"},
    {"OFF", ""},
}};

auto level_info(LogLevel level) -> const LevelInfo& {
    return LEVELS[static_cast<size_t>(level)];
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Local wall-clock time of `ms` as HH:MM:SS.mmm.
auto clock_text(int64_t ms) -> std::string {
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm local{};
    localtime_r(&secs, &local);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(ms % 1000));
    return buf;
}

void append_quoted(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char escape[16];
                std::snprintf(escape, sizeof(escape), "\\u%04x", static_cast<unsigned>(c));
                out += escape;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

auto stderr_has_colors() -> bool {
    if (isatty(STDERR_FILENO) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    return level_info(level).name.data();
}

auto parse_level(std::string_view text) -> LogLevel {
    if (iequals(text, "warning")) {
        return LogLevel::Warn;
    }
    for (size_t i = 0; i < LEVELS.size(); ++i) {
        if (iequals(text, LEVELS[i].name)) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

auto format_record(const LogRecord& record, LogFormat format) -> std::string {
    std::string out;
    if (format == LogFormat::JSON) {
        out = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":";
        append_quoted(out, level_name(record.level));
        out += ",\"module\":";
        append_quoted(out, record.module);
        out += ",\"msg\":";
        append_quoted(out, record.message);
        out += '}';
        return out;
    }

    std::string level = level_name(record.level);
    level.resize(std::max<size_t>(level.size(), 5), ' ');
    out = clock_text(record.timestamp_ms) + ' ' + level + " [";
    out += record.module;
    out += "] ";
    out += record.message;
    return out;
}

// ============================================================================
// Sinks
// ============================================================================

void LineSink::write(const LogRecord& record) {
    write_line(format_record(record, format_), record);
}

ConsoleSink::ConsoleSink(bool use_colors) : colors_(use_colors && stderr_has_colors()) {}

void ConsoleSink::write_line(const std::string& line, const LogRecord& record) {
    if (colors_ && format_ == LogFormat::Text) {
        std::cerr << level_info(record.level).color << line << "\033[0m\n";
    } else {
        std::cerr << line << '\n';
    }
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc) {}

void FileSink::write_line(const std::string& line, const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    overrides_.clear();

    size_t start = 0;
    while (start <= spec.size()) {
        size_t end = spec.find(',', start);
        if (end == std::string_view::npos) {
            end = spec.size();
        }
        std::string_view entry = spec.substr(start, end - start);
        start = end + 1;

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            if (!entry.empty()) {
                overrides_.insert_or_assign(std::string(entry), LogLevel::Trace);
            }
            continue;
        }
        std::string_view module = entry.substr(0, eq);
        LogLevel level = parse_level(entry.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            overrides_.insert_or_assign(std::string(module), level);
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = overrides_.find(module);
    LogLevel threshold = it != overrides_.end() ? it->second : default_level_;
    return level >= threshold;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& entry : overrides_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }
    logger.threshold_ = logger.filter_.min_level();

    logger.sinks_.clear();
    auto console = std::make_unique<ConsoleSink>(config.colors);
    console->set_format(config.format);
    logger.sinks_.push_back(std::move(console));

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->is_open()) {
            std::cerr << "exprc: cannot open log file '" << config.log_file << "'\n";
            return;
        }
        file->set_format(config.format);
        logger.sinks_.push_back(std::move(file));
    }
}

bool Logger::enabled(LogLevel level, std::string_view module) const {
    if (level < threshold_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.timestamp_ms = now_ms();

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    threshold_ = filter_.min_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    threshold_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace exprc::log
