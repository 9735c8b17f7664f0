//! # Vertical Parameter Alignment On Call
//!
//! When a call spreads its arguments over several lines, every argument that
//! starts a new line should sit in the same column as the first argument:
//!
//! ```text
//! foo(param1: 1, param2: bar,
//!     param3: false, param4: true)     // aligned
//!
//! foo(param1: 1, param2: bar,
//!  ↓param3: false, param4: true)       // reported
//! ```
//!
//! ## Exemptions
//!
//! - Only the first argument on a line is judged.
//! - After a closure argument that spans several lines, the next argument
//!   starting a new line becomes the new reference column.
//! - A closure passed with trailing-closure syntax is never reported.

#ifndef LINTKIT_LINT_VERTICAL_ALIGNMENT_HPP
#define LINTKIT_LINT_VERTICAL_ALIGNMENT_HPP

#include "lint/call_site.hpp"
#include "lint/rule.hpp"
#include "source/source_file.hpp"

#include <vector>

namespace lintkit::lint {

/// Returns the start offsets of misaligned arguments, in source order.
///
/// Calls with fewer than two arguments, or whose first argument does not
/// resolve to a position, have no violations.
[[nodiscard]] auto check_call_alignment(const Call& call, const source::SourceFile& file)
    -> std::vector<size_t>;

class VerticalParameterAlignmentOnCallRule : public CallRule {
public:
    VerticalParameterAlignmentOnCallRule() = default;

    [[nodiscard]] static auto rule_description() -> const RuleDescription&;

    [[nodiscard]] auto description() const -> const RuleDescription& override {
        return rule_description();
    }

    [[nodiscard]] auto is_opt_in() const -> bool override {
        return true;
    }

    [[nodiscard]] auto configuration() const -> const SeverityConfiguration& override {
        return configuration_;
    }

    void set_configuration(SeverityConfiguration configuration) override {
        configuration_ = configuration;
    }

    [[nodiscard]] auto validate(const source::SourceFile& file, const Call& call) const
        -> std::vector<StyleViolation> override;

private:
    SeverityConfiguration configuration_{Severity::Warning};
};

} // namespace lintkit::lint

#endif // LINTKIT_LINT_VERTICAL_ALIGNMENT_HPP
