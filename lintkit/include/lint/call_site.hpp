//! # Call-Site Descriptors
//!
//! Plain records describing one expression handed to a rule by the host
//! parser. Offsets are byte offsets into the enclosing `SourceFile`.
//!
//! ```text
//! foo(param1: 1, param2: { _ in })
//! ^   ^          ^       ^-------^
//! |   |          |       Argument::body
//! |   |          Argument::offset
//! |   Argument::offset
//! Call::offset                       (Call::length spans to the last byte)
//! ```

#ifndef LINTKIT_LINT_CALL_SITE_HPP
#define LINTKIT_LINT_CALL_SITE_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace lintkit::lint {

/// A contiguous run of bytes in a source file.
struct ByteRange {
    size_t offset = 0;
    size_t length = 0;

    /// One past the last byte.
    [[nodiscard]] auto end() const -> size_t {
        return offset + length;
    }
};

/// Kind of expression a descriptor was built from.
enum class ExpressionKind {
    Call,
    Argument,
    Array,
    Dictionary,
    Closure,
    Other,
};

/// One argument of a call, in source order.
///
/// `body` spans the argument's value expression (for `label: { ... }` it
/// starts at the brace). Arguments whose value the parser did not measure
/// carry no body.
struct Argument {
    size_t offset = 0;
    std::optional<ByteRange> body;
};

/// A call expression: the full byte range plus its arguments.
struct Call {
    ExpressionKind kind = ExpressionKind::Call;
    size_t offset = 0;
    size_t length = 0;
    std::vector<Argument> arguments;
};

} // namespace lintkit::lint

#endif // LINTKIT_LINT_CALL_SITE_HPP
