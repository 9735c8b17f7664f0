//! # Lint Rules
//!
//! This header defines the types every rule shares.
//!
//! ## Components
//!
//! | Type                    | Description                                |
//! |-------------------------|--------------------------------------------|
//! | `Severity`              | Warning or error                           |
//! | `SeverityConfiguration` | A rule's configurable severity             |
//! | `RuleDescription`       | Identifier, name, text and examples        |
//! | `StyleViolation`        | One reported issue with its location       |
//! | `CallRule`              | Interface for rules that inspect calls     |
//!
//! ## Examples
//!
//! Descriptions carry the examples shown in documentation. In triggering
//! examples the `↓` marker precedes each position the rule must report.

#ifndef LINTKIT_LINT_RULE_HPP
#define LINTKIT_LINT_RULE_HPP

#include "common.hpp"
#include "lint/call_site.hpp"
#include "source/source_file.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lintkit::lint {

// ============================================================================
// Severity
// ============================================================================

enum class Severity { Warning, Error };

/// Returns "warning" or "error".
[[nodiscard]] const char* severity_name(Severity severity);

/// The severity a rule reports with, overridable from configuration.
class SeverityConfiguration {
public:
    explicit SeverityConfiguration(Severity severity = Severity::Warning) : severity_(severity) {}

    [[nodiscard]] auto severity() const -> Severity {
        return severity_;
    }

    /// Applies a configured value (`warning` or `error`, any case, optionally
    /// quoted). An unrecognized value leaves the severity unchanged.
    auto apply(std::string_view value) -> Result<Severity, std::string>;

private:
    Severity severity_;
};

// ============================================================================
// Rule Description
// ============================================================================

struct RuleDescription {
    std::string identifier;
    std::string name;
    std::string description;
    std::vector<std::string> non_triggering_examples;
    std::vector<std::string> triggering_examples;
};

// ============================================================================
// Style Violation
// ============================================================================

struct StyleViolation {
    std::string rule_identifier;
    Severity severity;
    SourceLocation location;
    std::string reason;
};

// ============================================================================
// Call Rules
// ============================================================================

/// A rule that inspects one expression at a time.
class CallRule {
public:
    virtual ~CallRule() = default;

    [[nodiscard]] virtual auto description() const -> const RuleDescription& = 0;

    /// Opt-in rules only run when the configuration names them.
    [[nodiscard]] virtual auto is_opt_in() const -> bool {
        return false;
    }

    [[nodiscard]] virtual auto configuration() const -> const SeverityConfiguration& = 0;
    virtual void set_configuration(SeverityConfiguration configuration) = 0;

    /// Checks one expression. Expressions the rule does not handle yield no
    /// violations.
    [[nodiscard]] virtual auto validate(const source::SourceFile& file, const Call& call) const
        -> std::vector<StyleViolation> = 0;
};

} // namespace lintkit::lint

#endif // LINTKIT_LINT_RULE_HPP
