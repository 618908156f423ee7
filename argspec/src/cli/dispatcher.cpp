//! # CLI Command Dispatcher
//!
//! ```text
//! argspec_main()
//!   +- --help, -h     -> print_usage()
//!   +- --version, -V  -> print_version()
//!   +- check <file>   -> run_check()
//!   +- dump <file>    -> run_dump()
//! ```
//!
//! Logging options (`--log-level=`, `-v`, `-q`, ...) are accepted anywhere
//! and consumed before dispatch.

#include "cli/commands/cmd_spec.hpp"
#include "cli/driver.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace argspec::cli {

void print_usage() {
    std::cout << "argspec " << VERSION << "\n\n";
    std::cout << "Usage: argspec <command> [options] <file>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Compile a spec document and report errors\n";
    std::cout << "  dump      Compile a spec document and print the tree as JSON\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h           Show this help\n";
    std::cout << "  --version, -V        Show version\n";
    std::cout << "  --strict             Also reject names that shadow inherited globals\n";
    std::cout << "  -v, -vv, -vvv        Increase log verbosity\n";
    std::cout << "  -q, --quiet          Only log errors\n";
    std::cout << "  --log-level=LEVEL    trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=SPEC    Per-module levels, e.g. spec=trace,*=warn\n";
    std::cout << "  --log-file=PATH      Also write logs to PATH\n";
    std::cout << "  --log-format=FORMAT  text or json\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  ARGSPEC_LOG          Log level or filter used when no log option is given\n";
}

void print_version() {
    std::cout << "argspec " << VERSION << "\n";
}

} // namespace argspec::cli

int argspec_main(int argc, char* argv[]) {
    using namespace argspec;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> positional;
    bool strict = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--strict") {
            strict = true;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        cli::print_usage();
        return 0;
    }

    const std::string& command = positional[0];
    ARGSPEC_LOG_DEBUG("cli", "Command: " << command);

    if (command == "--help" || command == "-h") {
        cli::print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        cli::print_version();
        return 0;
    }

    if (command == "check" || command == "dump") {
        if (positional.size() != 2) {
            std::cerr << "Usage: argspec " << command << " <file> [--strict]\n";
            return 1;
        }
        return command == "check" ? cli::run_check(positional[1], strict)
                                  : cli::run_dump(positional[1], strict);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'argspec --help' for usage.\n";
    return 1;
}
