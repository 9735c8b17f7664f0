// Vertical parameter alignment on call

#include "lint/vertical_alignment.hpp"

#include "lint/argument_classifier.hpp"
#include "log/log.hpp"

#include <unordered_set>

namespace lintkit::lint {

namespace {

// State carried from one argument to the next during a single walk.
struct AlignmentState {
    source::SourcePosition reference;
    std::unordered_set<uint32_t> visited_lines;
    bool previous_was_multiline_closure = false;
};

bool is_misaligned(const Argument& argument, bool closure_argument, bool last_argument,
                   const Call& call, const source::SourceFile& file, AlignmentState& state) {
    auto position = file.position(argument.offset);
    if (!position || position->line <= state.reference.line) {
        return false;
    }

    bool first_visit = state.visited_lines.insert(position->line).second;
    if (position->column == state.reference.column || !first_visit) {
        return false;
    }

    // A closure spanning several lines shifts the alignment of what follows.
    if (state.previous_was_multiline_closure) {
        LINTKIT_LOG_TRACE("lint", "Realigning call at " << call.offset << " to line "
                                                        << position->line << " column "
                                                        << position->column);
        state.reference = *position;
        return false;
    }

    if (last_argument && closure_argument && is_trailing_closure(call, file)) {
        return false;
    }

    return true;
}

} // namespace

auto check_call_alignment(const Call& call, const source::SourceFile& file)
    -> std::vector<size_t> {
    const auto& arguments = call.arguments;
    if (arguments.size() < 2) {
        return {};
    }

    auto first_position = file.position(arguments.front().offset);
    if (!first_position) {
        return {};
    }

    AlignmentState state;
    state.reference = *first_position;

    std::vector<size_t> violations;
    for (size_t i = 0; i < arguments.size(); ++i) {
        const auto& argument = arguments[i];
        bool closure_argument = is_closure(argument, file);
        bool last_argument = i + 1 == arguments.size();

        if (is_misaligned(argument, closure_argument, last_argument, call, file, state)) {
            violations.push_back(argument.offset);
        }

        state.previous_was_multiline_closure =
            closure_argument && is_multiline_closure(argument, file);
    }

    return violations;
}

// ============================================================================
// Rule
// ============================================================================

auto VerticalParameterAlignmentOnCallRule::rule_description() -> const RuleDescription& {
    static const RuleDescription description{
        .identifier = "vertical_parameter_alignment_on_call",
        .name = "Vertical Parameter Alignment On Call",
        .description = "Function parameters should be aligned vertically if they're in multiple "
                       "lines in a method call.",
        .non_triggering_examples =
            {
                "foo(param1: 1, param2: bar\n"
                "    param3: false, param4: true)",
                "foo(param1: 1, param2: bar)",
                "foo(param1: 1, param2: bar\n"
                "    param3: false,\n"
                "    param4: true)",
                "foo(\n"
                "   param1: 1\n"
                ") { _ in }",
                "UIView.animate(withDuration: 0.4, animations: {\n"
                "    blurredImageView.alpha = 1\n"
                "}, completion: { _ in\n"
                "    self.hideLoading()\n"
                "})",
                "UIView.animate(withDuration: 0.4, animations: {\n"
                "    blurredImageView.alpha = 1\n"
                "},\n"
                "completion: { _ in\n"
                "    self.hideLoading()\n"
                "})",
                "foo(param1: 1, param2: { _ in },\n"
                "    param3: false, param4: true)",
                "foo({ _ in\n"
                "       bar()\n"
                "   },\n"
                "   completion: { _ in\n"
                "       baz()\n"
                "   }\n"
                ")",
            },
        .triggering_examples =
            {
                "foo(param1: 1, param2: bar\n"
                "                ↓param3: false, param4: true)",
                "foo(param1: 1, param2: bar\n"
                " ↓param3: false, param4: true)",
                "foo(param1: 1, param2: bar\n"
                "       ↓param3: false,\n"
                "       ↓param4: true)",
                "foo(param1: 1,\n"
                "       ↓param2: { _ in })",
                "foo(param1: 1,\n"
                "    param2: { _ in\n"
                "}, param3: 2,\n"
                " ↓param4: 0)",
                "foo(param1: 1, param2: { _ in },\n"
                "       ↓param3: false, param4: true)",
            },
    };
    return description;
}

auto VerticalParameterAlignmentOnCallRule::validate(const source::SourceFile& file,
                                                    const Call& call) const
    -> std::vector<StyleViolation> {
    if (call.kind != ExpressionKind::Call) {
        return {};
    }

    std::vector<StyleViolation> violations;
    for (size_t offset : check_call_alignment(call, file)) {
        auto location = file.location(offset);
        if (!location) {
            continue;
        }

        LINTKIT_LOG_TRACE("lint", "Misaligned argument at " << location->line << ":"
                                                            << location->column);
        violations.push_back({.rule_identifier = description().identifier,
                              .severity = configuration_.severity(),
                              .location = std::move(*location),
                              .reason = description().description});
    }
    return violations;
}

} // namespace lintkit::lint
