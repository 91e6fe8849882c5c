#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include <rules/rule_config.pb.h>

#include "rule_interface/IRule.hpp"

namespace transaction_monitor {

// Ordered, immutable-after-construction collection of rules. Several rule
// sets are concatenated; every rule is renamed to "<set>.<rule>".
class RuleCatalog {
public:
    RuleCatalog() = default;
    RuleCatalog(RuleCatalog&&) = default;
    RuleCatalog& operator=(RuleCatalog&&) = default;

    static RuleCatalog FromRuleSets(const std::vector<rules::RuleSet>& rule_sets);

    // Throws RuleConfigError on an invalid rule or a duplicate name.
    void Append(const rules::RuleSet& rule_set);
    void Add(RulePtr rule);

    const std::vector<RulePtr>& GetRules() const { return rules_; }
    size_t Size() const { return rules_.size(); }
    const IRule* Find(const std::string& name) const;

private:
    std::vector<RulePtr> rules_;
    std::unordered_set<std::string> names_;
};

// Rule sets are protobuf RuleSet messages stored as JSON.
rules::RuleSet ParseRuleSet(const std::string& json);
// Reads "<dir>/<name>.json"; the file's set name must match.
rules::RuleSet LoadRuleSet(const std::string& dir, const std::string& name);

}  // namespace transaction_monitor
