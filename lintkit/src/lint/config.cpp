//! # Lint Configuration
//!
//! Severity parsing and option application for rules.
//!
//! ## Example
//!
//! ```cpp
//! LintConfig config;
//! config.apply_option("vertical_parameter_alignment_on_call", "enabled", "true");
//! config.apply_option("vertical_parameter_alignment_on_call", "severity", "\"error\"");
//! ```

#include "lint/config.hpp"

#include "log/log.hpp"

#include <cctype>

namespace lintkit::lint {

// ============================================================================
// Value Parsing
// ============================================================================

std::string normalize_option_value(std::string_view value) {
    // Trim
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    value = value.substr(start, value.find_last_not_of(" \t\r\n") - start + 1);

    // Remove quotes from string values
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }

    std::string result(value);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// ============================================================================
// Severity
// ============================================================================

const char* severity_name(Severity severity) {
    switch (severity) {
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "warning";
}

auto SeverityConfiguration::apply(std::string_view value) -> Result<Severity, std::string> {
    std::string normalized = normalize_option_value(value);
    if (normalized == "warning") {
        severity_ = Severity::Warning;
    } else if (normalized == "error") {
        severity_ = Severity::Error;
    } else {
        return "invalid severity '" + std::string(value) + "' (expected warning or error)";
    }
    return severity_;
}

// ============================================================================
// LintConfig
// ============================================================================

bool LintConfig::is_rule_enabled(const RuleDescription& description, bool opt_in) const {
    if (disabled_rules.contains(description.identifier)) {
        return false;
    }
    return !opt_in || opt_in_rules.contains(description.identifier);
}

auto LintConfig::severity_for(const std::string& identifier) const
    -> std::optional<SeverityConfiguration> {
    auto it = severities.find(identifier);
    if (it == severities.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto LintConfig::apply_option(std::string_view rule, std::string_view key, std::string_view value)
    -> Result<bool, std::string> {
    std::string identifier(rule);

    if (key == "severity") {
        SeverityConfiguration configuration = severity_for(identifier).value_or(
            SeverityConfiguration{});
        Severity previous = configuration.severity();
        bool had_override = severities.contains(identifier);

        auto result = configuration.apply(value);
        if (is_err(result)) {
            return unwrap_err(result);
        }

        severities.insert_or_assign(identifier, configuration);
        LINTKIT_LOG_DEBUG("lint", identifier << ": severity " << severity_name(unwrap(result)));
        return !had_override || previous != unwrap(result);
    }

    if (key == "enabled") {
        std::string normalized = normalize_option_value(value);
        bool changed = false;
        if (normalized == "true" || normalized == "on") {
            changed = disabled_rules.erase(identifier) > 0;
            changed = opt_in_rules.insert(identifier).second || changed;
        } else if (normalized == "false" || normalized == "off") {
            changed = opt_in_rules.erase(identifier) > 0;
            changed = disabled_rules.insert(identifier).second || changed;
        } else {
            return "invalid value '" + std::string(value) + "' for " + identifier +
                   ".enabled (expected true or false)";
        }
        LINTKIT_LOG_DEBUG("lint", identifier << ": enabled = " << normalized);
        return changed;
    }

    return "unknown option '" + std::string(key) + "' for rule " + identifier;
}

} // namespace lintkit::lint
