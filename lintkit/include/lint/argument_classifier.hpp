//! # Argument Classification
//!
//! Text-level facts about call arguments that layout rules need but the
//! parser does not record: whether an argument is a closure literal, whether
//! that closure spans several lines, and whether the call already passes its
//! last argument as a trailing closure.
//!
//! All checks are conservative. A missing body span, a range outside the
//! file or an offset that does not resolve answers `false`.

#ifndef LINTKIT_LINT_ARGUMENT_CLASSIFIER_HPP
#define LINTKIT_LINT_ARGUMENT_CLASSIFIER_HPP

#include "lint/call_site.hpp"
#include "source/source_file.hpp"

namespace lintkit::lint {

/// True if the argument's body starts with optional whitespace and `{`.
[[nodiscard]] bool is_closure(const Argument& argument, const source::SourceFile& file);

/// True if the argument's body starts and ends on different lines.
[[nodiscard]] bool is_multiline_closure(const Argument& argument, const source::SourceFile& file);

/// True if the call text does not end with `)`.
///
/// Trailing-closure syntax places the last argument after the closing
/// parenthesis, so the call's text ends with the closure's `}` instead.
[[nodiscard]] bool is_trailing_closure(const Call& call, const source::SourceFile& file);

} // namespace lintkit::lint

#endif // LINTKIT_LINT_ARGUMENT_CLASSIFIER_HPP
