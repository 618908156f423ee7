#ifndef ARGSPEC_SPEC_COMPILER_HPP
#define ARGSPEC_SPEC_COMPILER_HPP

#include "common.hpp"
#include "spec/command_spec.hpp"
#include "spec/spec_value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace argspec::spec {

// Category of a compile failure
enum class CompileErrorKind {
    Structural, // A level, list or item is not a mapping with unique keys
    Field,      // A scalar or item property was rejected by its builder
    Ordering,   // A required argument follows an optional one
    Conflict,   // Two flags/options share a short or long name
    Limit,      // Subcommand nesting exceeds CompileOptions::max_depth
};

[[nodiscard]] auto compile_error_kind_name(CompileErrorKind kind) -> const char*;

// Compile error, located by the chain of subcommand keys leading to it
struct CompileError {
    CompileErrorKind kind;
    std::string message;
    std::vector<std::string> subcommand_path; // Outermost first

    [[nodiscard]] static auto make(CompileErrorKind kind, std::string message) -> CompileError;

    // Prefixes the path with the key of the subcommand the error came out of
    [[nodiscard]] auto within_subcommand(const std::string& key) && -> CompileError;

    // `error building subcommand "a": error building subcommand "b": <message>`
    [[nodiscard]] auto to_string() const -> std::string;
};

struct CompileOptions {
    // Also check short/long conflicts after inherited globals are merged
    // into a subcommand. Off by default: a subcommand may then shadow an
    // inherited global name without error.
    bool check_inherited_conflicts = false;

    // Maximum subcommand nesting below the root
    size_t max_depth = 64;
};

// Compiles raw command-line specifications into CommandSpec trees.
//
// The compiler holds only its options; compiles are independent and may
// run concurrently on separate instances or on the same const instance.
class SpecCompiler {
public:
    SpecCompiler() = default;
    explicit SpecCompiler(CompileOptions options) : options_(options) {}

    // Compiles a root level given as any spec value (must be a map)
    [[nodiscard]] auto compile(const SpecValue& raw) const -> Result<CommandSpec, CompileError>;

    // Compiles a root level given as a keyed map
    [[nodiscard]] auto compile(const RawSpec& raw) const -> Result<CommandSpec, CompileError>;

    [[nodiscard]] auto options() const -> const CompileOptions& {
        return options_;
    }

private:
    CompileOptions options_;

    [[nodiscard]] auto compile_level(const SpecValue& raw, const GlobalProps& inherited,
                                     size_t depth) const -> Result<CommandSpec, CompileError>;

    [[nodiscard]] auto compile_subcommands(const SpecValue* raw, const GlobalProps& globals,
                                           size_t depth) const
        -> Result<std::vector<CommandSpec>, CompileError>;
};

// Convenience wrapper using default options
[[nodiscard]] auto compile(const SpecValue& raw) -> Result<CommandSpec, CompileError>;

// First paragraph of `about` (split on "\n\n"), trimmed
[[nodiscard]] auto derive_summary(const std::string& about) -> std::string;

} // namespace argspec::spec

#endif // ARGSPEC_SPEC_COMPILER_HPP
