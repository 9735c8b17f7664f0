#include "lint/argument_classifier.hpp"

#include <regex>

namespace lintkit::lint {

bool is_closure(const Argument& argument, const source::SourceFile& file) {
    if (!argument.body) {
        return false;
    }

    auto text = file.slice(argument.body->offset, argument.body->length);
    if (!text) {
        return false;
    }

    // match_continuous pins the match to the first byte of the body
    static const std::regex closure_open(R"(\s*\{)");
    return std::regex_search(text->begin(), text->end(), closure_open,
                             std::regex_constants::match_continuous);
}

bool is_multiline_closure(const Argument& argument, const source::SourceFile& file) {
    if (!argument.body) {
        return false;
    }

    auto start = file.position(argument.body->offset);
    auto end = file.position(argument.body->end());
    if (!start || !end) {
        return false;
    }

    return end->line > start->line;
}

bool is_trailing_closure(const Call& call, const source::SourceFile& file) {
    auto text = file.slice(call.offset, call.length);
    if (!text) {
        return false;
    }

    return !text->ends_with(')');
}

} // namespace lintkit::lint
