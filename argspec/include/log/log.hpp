//! # Logging
//!
//! Module-tagged diagnostics for argspec. Every record carries a level and
//! a module tag; the process-wide `Logger` checks both against its
//! `LogFilter` and hands accepted records to its sinks.
//!
//! ## Modules
//!
//! | Tag | Emitted by |
//! |-----|------------|
//! | `spec` | compiler and item builders |
//! | `parser` | spec file loading |
//! | `cli` | the `argspec` driver |
//!
//! ## Usage
//!
//! ```cpp
//! ARGSPEC_LOG_DEBUG("spec", "Compiling subcommand " << quote(key));
//! ```
//!
//! The message expression is only evaluated when the record passes the
//! filter. Until `Logger::init()` runs there are no sinks and the
//! threshold is `Warn`, so embedding the library prints nothing.

#ifndef ARGSPEC_LOG_HPP
#define ARGSPEC_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace argspec::log {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Threshold only, never the level of a record
};

/// Upper-case name ("TRACE" through "OFF").
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. Unknown names yield `nullopt`.
[[nodiscard]] auto parse_level(std::string_view name) -> std::optional<LogLevel>;

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< `{"ts":...,"level":"...","module":"...","msg":"..."}`
};

/// Renders one record as a single line, trailing newline included.
/// `colors` wraps the level name in ANSI codes (text format only).
[[nodiscard]] auto format_record(const LogRecord& record, LogFormat format, bool colors = false)
    -> std::string;

[[nodiscard]] auto epoch_ms() -> int64_t;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes formatted lines to a stream owned by someone else.
class StreamSink : public LogSink {
public:
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::Text, bool colors = false)
        : out_(&out), format_(format), colors_(colors) {}

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto format() const -> LogFormat {
        return format_;
    }

protected:
    StreamSink(LogFormat format, bool colors) : format_(format), colors_(colors) {}

    void attach(std::ostream& out) {
        out_ = &out;
    }

private:
    std::ostream* out_ = nullptr;
    LogFormat format_;
    bool colors_;
};

/// stderr. Colors are used only when stderr is a color-capable terminal.
class ConsoleSink : public StreamSink {
public:
    explicit ConsoleSink(LogFormat format = LogFormat::Text, bool colors = true);
};

/// A log file. Error and Fatal records are flushed immediately.
class FileSink : public StreamSink {
public:
    explicit FileSink(const std::string& path, bool append = true,
                      LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds with a default for unlisted modules.
///
/// Specs look like `"spec=trace,parser,*=warn"`: `module=level` sets one
/// module, a bare module name enables everything for it, and `*=level`
/// sets the default.
class LogFilter {
public:
    explicit LogFilter(LogLevel default_level = LogLevel::Info) : default_level_(default_level) {}

    /// Replaces the module thresholds with those in `spec`. Entries with an
    /// unknown level name are skipped; returns false if any were.
    bool parse(std::string_view spec);

    void set_module_level(std::string_view module, LogLevel level);

    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest threshold of any module or the default.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_;
    std::vector<std::pair<std::string, LogLevel>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Per-module thresholds on top of `level`
    std::string log_file;    ///< Extra file sink when non-empty
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. All members are thread-safe.
class Logger {
public:
    /// Replaces sinks and thresholds according to `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    [[nodiscard]] bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message,
             const char* file, int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// One threshold for every module; module overrides are dropped.
    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    /// Installs module thresholds from a filter spec, keeping the default.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogFilter filter_{LogLevel::Warn};
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command-Line Configuration
// ============================================================================

/// Builds a `LogConfig` from argv:
///
/// | Option | Effect |
/// |--------|--------|
/// | `--log-level=LEVEL` | threshold |
/// | `--log-filter=SPEC` | per-module thresholds |
/// | `--log-file=PATH` | extra file sink |
/// | `--log-format=text\|json` | line format |
/// | `-v`, `-vv`, `-vvv`, `--verbose` | Info, Debug, Trace |
/// | `-q`, `--quiet` | Error |
///
/// Without a level or filter option, `ARGSPEC_LOG` is consulted: a value
/// containing `=` or `,` is a filter spec, anything else a level name.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for the arguments `parse_log_options()` consumes.
bool is_log_option(std::string_view arg);

} // namespace argspec::log

// ============================================================================
// Macros
// ============================================================================

/// Records below this level are compiled out.
#ifndef ARGSPEC_MIN_LOG_LEVEL
#define ARGSPEC_MIN_LOG_LEVEL 0
#endif

#define ARGSPEC_LOG_AT(lvl, module, msg)                                                           \
    do {                                                                                           \
        if constexpr (static_cast<int>(lvl) >= ARGSPEC_MIN_LOG_LEVEL) {                            \
            auto& argspec_logger_ = ::argspec::log::Logger::instance();                            \
            if (argspec_logger_.should_log(lvl, module)) {                                         \
                std::ostringstream argspec_msg_;                                                   \
                argspec_msg_ << msg;                                                               \
                argspec_logger_.log(lvl, module, argspec_msg_.str(), __FILE__, __LINE__);          \
            }                                                                                      \
        }                                                                                          \
    } while (false)

#define ARGSPEC_LOG_TRACE(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Trace, module, msg)
#define ARGSPEC_LOG_DEBUG(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Debug, module, msg)
#define ARGSPEC_LOG_INFO(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Info, module, msg)
#define ARGSPEC_LOG_WARN(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Warn, module, msg)
#define ARGSPEC_LOG_ERROR(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Error, module, msg)
#define ARGSPEC_LOG_FATAL(module, msg) ARGSPEC_LOG_AT(::argspec::log::LogLevel::Fatal, module, msg)

#endif // ARGSPEC_LOG_HPP
