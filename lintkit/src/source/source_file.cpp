#include "source/source_file.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace lintkit::source {

namespace {

// UTF-8 continuation bytes (10xxxxxx) do not start a new scalar value.
bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

SourceFile::SourceFile(std::string path, std::string content)
    : path_(std::move(path)), content_(std::move(content)) {
    build_line_index();
}

void SourceFile::build_line_index() {
    line_offsets_.clear();
    line_offsets_.push_back(0); // First line starts at offset 0

    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto SourceFile::position(size_t offset) const -> std::optional<SourcePosition> {
    if (offset > content_.size()) {
        return std::nullopt;
    }

    // Binary search for the line
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it; // line_offsets_ starts with 0, so upper_bound never returns begin()

    auto line_index = static_cast<uint32_t>(std::distance(line_offsets_.begin(), it));
    auto line_start = *it;

    uint32_t column = 1;
    for (size_t i = line_start; i < offset; ++i) {
        if (!is_continuation_byte(content_[i])) {
            ++column;
        }
    }

    return SourcePosition{.line = line_index + 1, .column = column};
}

auto SourceFile::location(size_t offset) const -> std::optional<SourceLocation> {
    auto pos = position(offset);
    if (!pos) {
        return std::nullopt;
    }
    return SourceLocation{.file = path_,
                          .line = pos->line,
                          .column = pos->column,
                          .offset = offset};
}

auto SourceFile::slice(size_t offset, size_t length) const -> std::optional<std::string_view> {
    if (offset > content_.size() || length > content_.size() - offset) {
        return std::nullopt;
    }
    return std::string_view(content_).substr(offset, length);
}

auto SourceFile::from_file(const std::string& path) -> Result<SourceFile, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    if (file.fail() && !file.eof()) {
        return "Failed to read file: " + path;
    }

    return SourceFile(path, buffer.str());
}

auto SourceFile::from_string(std::string content, std::string name) -> SourceFile {
    return SourceFile(std::move(name), std::move(content));
}

} // namespace lintkit::source
