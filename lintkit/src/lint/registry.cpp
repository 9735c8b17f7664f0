//! # Rule Registry Implementation
//!
//! Rule registration, configuration and the `lint_calls()` runner.

#include "lint/registry.hpp"

#include "lint/vertical_alignment.hpp"
#include "log/log.hpp"

namespace lintkit::lint {

// ============================================================================
// Registration
// ============================================================================

auto RuleRegistry::with_builtin_rules() -> RuleRegistry {
    RuleRegistry registry;
    auto result = registry.register_rule(std::make_unique<VerticalParameterAlignmentOnCallRule>());
    if (is_err(result)) {
        LINTKIT_LOG_ERROR("lint", unwrap_err(result));
    }
    return registry;
}

auto RuleRegistry::register_rule(std::unique_ptr<CallRule> rule) -> Result<bool, std::string> {
    if (!rule) {
        return std::string("cannot register a null rule");
    }

    const std::string& identifier = rule->description().identifier;
    if (find(identifier) != nullptr) {
        return "rule '" + identifier + "' is already registered";
    }

    LINTKIT_LOG_DEBUG("lint", "Registered rule " << identifier
                                                 << (rule->is_opt_in() ? " (opt-in)" : ""));
    rules_.push_back(std::move(rule));
    return true;
}

auto RuleRegistry::find(std::string_view identifier) const -> const CallRule* {
    for (const auto& rule : rules_) {
        if (rule->description().identifier == identifier) {
            return rule.get();
        }
    }
    return nullptr;
}

void RuleRegistry::configure(const LintConfig& config) {
    for (const auto& [identifier, severity] : config.severities) {
        if (find(identifier) == nullptr) {
            LINTKIT_LOG_WARN("lint", "Severity configured for unknown rule " << identifier);
        }
    }

    for (auto& rule : rules_) {
        if (auto severity = config.severity_for(rule->description().identifier)) {
            rule->set_configuration(*severity);
        }
    }
}

// ============================================================================
// Running
// ============================================================================

auto lint_calls(const source::SourceFile& file, const std::vector<Call>& calls,
                const LintConfig& config, const RuleRegistry& registry) -> LintResult {
    std::vector<const CallRule*> enabled;
    for (const auto& rule : registry.rules()) {
        if (config.is_rule_enabled(rule->description(), rule->is_opt_in())) {
            enabled.push_back(rule.get());
        } else {
            LINTKIT_LOG_TRACE("lint", "Skipping disabled rule " << rule->description().identifier);
        }
    }

    LintResult result;
    for (const auto& call : calls) {
        for (const CallRule* rule : enabled) {
            for (auto& violation : rule->validate(file, call)) {
                if (violation.severity == Severity::Error) {
                    result.errors++;
                } else {
                    result.warnings++;
                }
                result.violations.push_back(std::move(violation));
            }
        }
    }

    LINTKIT_LOG_DEBUG("lint", file.path() << ": " << calls.size() << " calls, "
                                          << result.warnings << " warning(s), " << result.errors
                                          << " error(s)");
    return result;
}

} // namespace lintkit::lint
