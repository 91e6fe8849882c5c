#pragma once

#include <memory>
#include <vector>

#include <rules/assessment.pb.h>
#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "rule_catalog/rule_catalog.hpp"

namespace transaction_monitor {

using TriggeredRules = std::vector<rules::TriggeredRule>;

// Runs every rule of the catalog once, in catalog order. Stateless; a
// MalformedContextError raised by a rule aborts the run.
class RuleEvaluator {
public:
    explicit RuleEvaluator(std::shared_ptr<const RuleCatalog> catalog);

    TriggeredRules Run(const transaction::Transaction& transaction, const Context& context) const;

    const RuleCatalog& GetCatalog() const { return *catalog_; }

private:
    std::shared_ptr<const RuleCatalog> catalog_;
};

}  // namespace transaction_monitor
