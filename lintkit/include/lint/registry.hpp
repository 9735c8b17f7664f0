//! # Rule Registry
//!
//! Owns the rule objects, applies configuration to them, and runs the
//! enabled ones over the calls of a file.
//!
//! ## Lint Flow
//!
//! ```text
//! RuleRegistry::with_builtin_rules()
//!   ├─ configure(config)       - severity overrides
//!   └─ lint_calls(file, calls) - for each call, each enabled rule
//!         └─ CallRule::validate() -> StyleViolation
//! ```

#ifndef LINTKIT_LINT_REGISTRY_HPP
#define LINTKIT_LINT_REGISTRY_HPP

#include "common.hpp"
#include "lint/call_site.hpp"
#include "lint/config.hpp"
#include "lint/rule.hpp"
#include "source/source_file.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace lintkit::lint {

struct LintResult {
    std::vector<StyleViolation> violations;
    int warnings = 0;
    int errors = 0;
};

class RuleRegistry {
public:
    RuleRegistry() = default;

    /// A registry holding every rule lintkit ships.
    [[nodiscard]] static auto with_builtin_rules() -> RuleRegistry;

    /// Adds a rule. Fails for a null rule or if a rule with the same
    /// identifier exists.
    auto register_rule(std::unique_ptr<CallRule> rule) -> Result<bool, std::string>;

    /// Returns the rule with this identifier, or nullptr.
    [[nodiscard]] auto find(std::string_view identifier) const -> const CallRule*;

    [[nodiscard]] auto rules() const -> const std::vector<std::unique_ptr<CallRule>>& {
        return rules_;
    }

    /// Applies the configured severity overrides to the registered rules.
    void configure(const LintConfig& config);

private:
    std::vector<std::unique_ptr<CallRule>> rules_;
};

/// Runs every enabled rule over each call, in call order.
[[nodiscard]] auto lint_calls(const source::SourceFile& file, const std::vector<Call>& calls,
                              const LintConfig& config, const RuleRegistry& registry)
    -> LintResult;

} // namespace lintkit::lint

#endif // LINTKIT_LINT_REGISTRY_HPP
