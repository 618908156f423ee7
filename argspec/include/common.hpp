//! # Common Definitions
//!
//! Vocabulary shared by every argspec module: the version constant, the
//! `Result` alias that fallible operations return, and `Box` for the owned
//! children of recursive values such as `SpecValue`.
//!
//! Nothing in the library throws for invalid input. Parsers, builders and
//! the compiler return `Result<T, E>` whose error alternative describes the
//! first problem found.

#ifndef ARGSPEC_COMMON_HPP
#define ARGSPEC_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace argspec {

constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result
// ============================================================================

/// Either a value or an error. `T` and `E` must be distinct types.
///
/// ```cpp
/// auto parsed = spec::parse_spec(text);
/// if (is_err(parsed)) {
///     std::cerr << unwrap_err(parsed).to_string() << "\n";
///     return 1;
/// }
/// const spec::SpecValue& doc = unwrap(parsed);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// The value of a successful result. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// The error of a failed result. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Sole owner of a heap value; used where a type contains itself.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace argspec

#endif // ARGSPEC_COMMON_HPP
