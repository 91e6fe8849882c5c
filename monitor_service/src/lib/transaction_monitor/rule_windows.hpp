#pragma once

#include "context_assembler/context_assembler.hpp"
#include "rule_catalog/rule_catalog.hpp"

namespace transaction_monitor {

// Checks that every windowed signal a rule reads, through builtin predicate
// params or expression signal keys, is produced by the configured signal
// groups. Throws RuleConfigError naming the first offending rule.
void ValidateRuleWindows(const RuleCatalog& catalog, const SignalGroupsConfig& groups);

}  // namespace transaction_monitor
