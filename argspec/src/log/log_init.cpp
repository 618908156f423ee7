//! # Log Options
//!
//! Maps the `argspec` logging flags and `ARGSPEC_LOG` onto a `LogConfig`.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>

namespace argspec::log {

namespace {

/// `--name=value` options, matched by prefix.
enum class ValueOption { Level, Filter, File, Format };

struct ValueOptionName {
    std::string_view prefix;
    ValueOption option;
};

constexpr ValueOptionName VALUE_OPTIONS[] = {
    {"--log-level=", ValueOption::Level},
    {"--log-filter=", ValueOption::Filter},
    {"--log-file=", ValueOption::File},
    {"--log-format=", ValueOption::Format},
};

auto match_value_option(std::string_view arg, std::string_view& value)
    -> std::optional<ValueOption> {
    for (const auto& entry : VALUE_OPTIONS) {
        if (arg.starts_with(entry.prefix)) {
            value = arg.substr(entry.prefix.size());
            return entry.option;
        }
    }
    return std::nullopt;
}

/// Verbosity requested by `-v`, `-vv`, ... or `--verbose`; 0 for anything else.
auto verbosity(std::string_view arg) -> int {
    if (arg == "--verbose") {
        return 1;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto is_quiet(std::string_view arg) -> bool {
    return arg == "-q" || arg == "--quiet";
}

auto verbosity_level(int count) -> LogLevel {
    if (count >= 3) {
        return LogLevel::Trace;
    }
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

} // namespace

bool is_log_option(std::string_view arg) {
    std::string_view value;
    return match_value_option(arg, value).has_value() || is_quiet(arg) || verbosity(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    bool quiet = false;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::string_view value;

        if (auto option = match_value_option(arg, value)) {
            switch (*option) {
            case ValueOption::Level:
                if (auto level = parse_level(value)) {
                    explicit_level = level;
                }
                break;
            case ValueOption::Filter:
                config.filter_spec = std::string(value);
                break;
            case ValueOption::File:
                config.log_file = std::string(value);
                break;
            case ValueOption::Format:
                config.format = (value == "json" || value == "JSON") ? LogFormat::JSON
                                                                     : LogFormat::Text;
                break;
            }
        } else if (is_quiet(arg)) {
            quiet = true;
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // Precedence: --log-level, then -q, then -v.
    if (explicit_level) {
        config.level = *explicit_level;
    } else if (quiet) {
        config.level = LogLevel::Error;
    } else if (verbose > 0) {
        config.level = verbosity_level(verbose);
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("ARGSPEC_LOG");
        std::string_view env_value = env != nullptr ? env : "";
        if (env_value.find_first_of("=,") != std::string_view::npos) {
            config.filter_spec = std::string(env_value);
        } else if (auto level = parse_level(env_value)) {
            config.level = *level;
        }
    }

    return config;
}

} // namespace argspec::log
