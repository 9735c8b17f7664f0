//! # Common Definitions
//!
//! Types shared by every lintkit component: the location a violation is
//! reported at, and the `Result<T, E>` alias fallible operations return.
//! lintkit does not throw; callers test a result with `is_ok()`/`is_err()`
//! before reading it.

#ifndef LINTKIT_COMMON_HPP
#define LINTKIT_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace lintkit {

// ============================================================================
// Locations
// ============================================================================

/// Where a violation is reported: file, 1-based line and column, and the
/// byte offset the position was resolved from.
struct SourceLocation {
    std::string file;
    uint32_t line = 0;
    uint32_t column = 0; ///< Counted in Unicode scalar values.
    size_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Results
// ============================================================================

/// Either the value of a successful operation or the reason it failed.
///
/// ```cpp
/// auto loaded = source::SourceFile::from_file(path);
/// if (is_err(loaded)) {
///     LINTKIT_LOG_WARN("source", unwrap_err(loaded));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The success value. Only valid when `is_ok(result)`.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The failure value. Only valid when `is_err(result)`.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

} // namespace lintkit

#endif // LINTKIT_COMMON_HPP
