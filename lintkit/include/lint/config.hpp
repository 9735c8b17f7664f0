//! # Lint Configuration
//!
//! In-memory rule configuration. Loading it from a file is the host's job;
//! the host feeds each `rule.key = value` entry it reads to `apply_option()`.
//!
//! ## Options
//!
//! | Key        | Values              | Effect                            |
//! |------------|---------------------|-----------------------------------|
//! | `severity` | `warning`, `error`  | Overrides the rule's severity     |
//! | `enabled`  | `true`, `false`     | Opts a rule in, or disables it    |

#ifndef LINTKIT_LINT_CONFIG_HPP
#define LINTKIT_LINT_CONFIG_HPP

#include "common.hpp"
#include "lint/rule.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace lintkit::lint {

struct LintConfig {
    /// Opt-in rules the user enabled, by identifier.
    std::set<std::string> opt_in_rules;

    /// Rules that never run, by identifier.
    std::set<std::string> disabled_rules;

    /// Severity overrides, by identifier.
    std::map<std::string, SeverityConfiguration> severities;

    [[nodiscard]] bool is_rule_enabled(const RuleDescription& description, bool opt_in) const;

    /// Returns the severity override for a rule, if any.
    [[nodiscard]] auto severity_for(const std::string& identifier) const
        -> std::optional<SeverityConfiguration>;

    /// Applies one option. Returns whether the configuration changed, or an
    /// error for an unknown key or invalid value (the configuration is then
    /// left untouched).
    auto apply_option(std::string_view rule, std::string_view key, std::string_view value)
        -> Result<bool, std::string>;
};

/// Trims whitespace and surrounding double quotes, and lowercases the rest.
[[nodiscard]] std::string normalize_option_value(std::string_view value);

} // namespace lintkit::lint

#endif // LINTKIT_LINT_CONFIG_HPP
