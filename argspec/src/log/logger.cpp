//! # Logger Implementation

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace argspec::log {

namespace {

constexpr const char* RESET = "\033[0m";

auto stderr_supports_color() -> bool {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

auto level_color(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

/// Local wall-clock time as `HH:MM:SS.mmm`.
auto clock_text(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &seconds);
#else
    localtime_r(&seconds, &parts);
#endif
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d", parts.tm_hour, parts.tm_min,
                  parts.tm_sec, static_cast<int>(timestamp_ms % 1000));
    return buffer;
}

void append_escaped(std::string& out, std::string_view text) {
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
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    static constexpr const char* NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN",
                                            "ERROR", "FATAL", "OFF"};
    auto index = static_cast<int>(level);
    return index >= 0 && index <= static_cast<int>(LogLevel::Off) ? NAMES[index] : "???";
}

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string_view candidate = level_name(level);
        bool same = candidate.size() == name.size() &&
                    std::equal(name.begin(), name.end(), candidate.begin(), [](char a, char b) {
                        return std::toupper(static_cast<unsigned char>(a)) == b;
                    });
        if (same) {
            return level;
        }
    }
    return std::nullopt;
}

auto epoch_ms() -> int64_t {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

auto format_record(const LogRecord& record, LogFormat format, bool colors) -> std::string {
    std::string line;
    if (format == LogFormat::JSON) {
        line += "{\"ts\":" + std::to_string(record.timestamp_ms);
        line += ",\"level\":\"";
        line += level_name(record.level);
        line += "\",\"module\":\"";
        append_escaped(line, record.module);
        line += "\",\"msg\":\"";
        append_escaped(line, record.message);
        line += "\"}\n";
        return line;
    }

    std::string level = level_name(record.level);
    level.resize(5, ' ');
    line += clock_text(record.timestamp_ms);
    line += ' ';
    line += colors ? level_color(record.level) + level + RESET : level;
    line += " [";
    line += record.module;
    line += "] ";
    line += record.message;
    line += '\n';
    return line;
}

// ============================================================================
// Sinks
// ============================================================================

void StreamSink::write(const LogRecord& record) {
    if (out_ != nullptr) {
        // One insertion per record keeps concurrent lines whole.
        *out_ << format_record(record, format_, colors_);
    }
}

void StreamSink::flush() {
    if (out_ != nullptr) {
        out_->flush();
    }
}

ConsoleSink::ConsoleSink(LogFormat format, bool colors)
    : StreamSink(std::cerr, format, colors && stderr_supports_color()) {}

FileSink::FileSink(const std::string& path, bool append, LogFormat format)
    : StreamSink(format, false),
      file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {
    if (file_.is_open()) {
        attach(file_);
    }
}

void FileSink::write(const LogRecord& record) {
    StreamSink::write(record);
    if (record.level >= LogLevel::Error) {
        flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

bool LogFilter::parse(std::string_view spec) {
    modules_.clear();
    bool all_known = true;

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            set_module_level(entry, LogLevel::Trace);
            continue;
        }

        auto level = parse_level(entry.substr(eq + 1));
        if (!level) {
            all_known = false;
            continue;
        }
        std::string_view module = entry.substr(0, eq);
        if (module == "*") {
            default_level_ = *level;
        } else {
            set_module_level(module, *level);
        }
    }
    return all_known;
}

void LogFilter::set_module_level(std::string_view module, LogLevel level) {
    for (auto& [name, threshold] : modules_) {
        if (name == module) {
            threshold = level;
            return;
        }
    }
    modules_.emplace_back(std::string(module), level);
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    for (const auto& [name, threshold] : modules_) {
        if (name == module) {
            return level >= threshold;
        }
    }
    return level >= default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel lowest = default_level_;
    for (const auto& entry : modules_) {
        lowest = std::min(lowest, entry.second);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }

    logger.sinks_.clear();
    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.format, config.colors));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, true, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter(level);
}

auto Logger::level() const -> LogLevel {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.default_level();
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace argspec::log
