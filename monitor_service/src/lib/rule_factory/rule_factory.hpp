#pragma once

#include <functional>
#include <unordered_map>

#include <rules/rule_config.pb.h>

#include "rule_interface/IRule.hpp"

namespace transaction_monitor {

class RuleFactory {
public:
    // Throws RuleConfigError for a missing predicate, a negative weight or an
    // invalid predicate definition.
    static RulePtr CreateRule(const rules::RuleConfig& config);

private:
    using RuleCreator = std::function<RulePtr(const rules::RuleConfig&)>;
    static const std::unordered_map<int, RuleCreator>& GetCreators();
};

}  // namespace transaction_monitor
