#pragma once

#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <rules/rule_config.pb.h>
#include <transaction/transaction.pb.h>

#include "rule_interface/IRule.hpp"

namespace transaction_monitor {

// Parameters of a built-in predicate with their defaults already applied.
class PredicateParams {
public:
    explicit PredicateParams(std::map<std::string, double> values);

    double Get(const std::string& name) const;
    int GetInt(const std::string& name) const;
    bool GetFlag(const std::string& name) const { return Get(name) != 0.0; }

private:
    std::map<std::string, double> values_;
};

using Predicate = std::function<bool(
    const transaction::Transaction&, const Context&, const PredicateParams&)>;

struct PredicateDefinition {
    std::map<std::string, double> defaults;
    Predicate predicate;
};

// Rule backed by a predicate compiled into the service and referenced by
// name from the rule set.
class BuiltinRule : public IRule {
public:
    // Throws RuleConfigError for an unknown predicate or parameter.
    explicit BuiltinRule(const rules::RuleConfig& rule_config);

    bool IsTriggered(const transaction::Transaction& transaction,
                     const Context& context) const override;

    const rules::RuleConfig& GetConfig() const override { return rule_config_; }

    static const std::unordered_map<std::string, PredicateDefinition>& GetPredicates();
    static std::vector<std::string> GetPredicateNames();
    // Predicate defaults overridden by the rule's params.
    static PredicateParams ResolveParams(const rules::RuleConfig& rule_config);

private:
    const rules::RuleConfig rule_config_;
    Predicate predicate_;
    PredicateParams params_;
};

}  // namespace transaction_monitor
