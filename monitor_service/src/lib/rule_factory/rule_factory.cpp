#include "rule_factory.hpp"

#include <cmath>

#include <fmt/format.h>

#include "builtin_rules/builtin_rule.hpp"
#include "errors/errors.hpp"
#include "expression_rule/expression_rule.hpp"

namespace transaction_monitor {

RulePtr RuleFactory::CreateRule(const rules::RuleConfig& config) {
    if (config.name().empty()) {
        throw RuleConfigError("Rule without name");
    }
    if (!std::isfinite(config.weight()) || config.weight() < 0.0) {
        throw RuleConfigError(
            fmt::format("Rule {} has invalid weight {}", config.name(), config.weight()));
    }

    const auto& creators = GetCreators();
    auto it = creators.find(config.predicate_case());
    if (it == creators.end()) {
        throw RuleConfigError(fmt::format("Rule {} has no predicate", config.name()));
    }
    return it->second(config);
}

const std::unordered_map<int, RuleFactory::RuleCreator>& RuleFactory::GetCreators() {
    static const std::unordered_map<int, RuleCreator> creators = {
        {rules::RuleConfig::kBuiltin, [](const rules::RuleConfig& config) -> RulePtr {
            return std::make_unique<BuiltinRule>(config);
        }},
        {rules::RuleConfig::kExpression, [](const rules::RuleConfig& config) -> RulePtr {
            return std::make_unique<ExpressionRule>(config);
        }},
    };
    return creators;
}

}  // namespace transaction_monitor
