//! # Source Files
//!
//! This module provides the source text that rules inspect. It owns the file
//! content, indexes line starts, and translates byte offsets into the
//! line/column positions rules compare and report.
//!
//! ## Features
//!
//! - **UTF-8 aware columns**: columns count Unicode scalar values, so text
//!   that looks aligned on screen compares equal
//! - **Line tracking**: O(log n) line lookup from byte offsets
//! - **Checked slicing**: byte ranges outside the content are rejected
//!
//! ## Example
//!
//! ```cpp
//! SourceFile file = SourceFile::from_string("foo(a: 1,\n    b: 2)", "<test>");
//!
//! auto pos = file.position(14); // line 2, column 5
//! auto text = file.slice(0, 3); // "foo"
//! ```

#ifndef LINTKIT_SOURCE_SOURCE_FILE_HPP
#define LINTKIT_SOURCE_SOURCE_FILE_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lintkit::source {

/// A resolved line/column pair, both 1-based.
struct SourcePosition {
    uint32_t line = 0;
    uint32_t column = 0;

    [[nodiscard]] auto operator==(const SourcePosition& other) const -> bool = default;
};

/// A source file with offset-to-position lookup.
///
/// Upon construction the file builds an index of line start offsets. The
/// content is never modified afterwards, so one `SourceFile` may be read by
/// any number of threads at once.
///
/// String views returned by `content()` and `slice()` are valid as
/// long as the SourceFile object exists.
class SourceFile {
public:
    /// Constructs a source file from a path and content.
    SourceFile(std::string path, std::string content);

    /// Returns the entire content.
    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    /// Returns the path or identifier of this file.
    [[nodiscard]] auto path() const -> std::string_view {
        return path_;
    }

    /// Returns the length of the content in bytes.
    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Resolves a byte offset to a line/column position.
    ///
    /// The end-of-file offset (`length()`) is valid. Returns `std::nullopt`
    /// for offsets past the end.
    [[nodiscard]] auto position(size_t offset) const -> std::optional<SourcePosition>;

    /// Resolves a byte offset to a reportable location in this file.
    [[nodiscard]] auto location(size_t offset) const -> std::optional<SourceLocation>;

    /// Returns `length` bytes starting at `offset`.
    ///
    /// Returns `std::nullopt` unless the whole range lies inside the content.
    [[nodiscard]] auto slice(size_t offset, size_t length) const
        -> std::optional<std::string_view>;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<SourceFile, std::string>;

    /// Creates a source file from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> SourceFile;

private:
    std::string path_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace lintkit::source

#endif // LINTKIT_SOURCE_SOURCE_FILE_HPP
