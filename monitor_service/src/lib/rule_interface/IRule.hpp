#pragma once

#include <memory>

#include <rules/rule_config.pb.h>
#include <transaction/transaction.pb.h>

#include "context/context.hpp"

namespace transaction_monitor {

class IRule {
public:
    virtual ~IRule() = default;

    // Pure predicate. Absent or null signals never trigger; a signal of an
    // unexpected type throws MalformedContextError.
    virtual bool IsTriggered(
        const transaction::Transaction& transaction, const Context& context) const = 0;

    virtual const rules::RuleConfig& GetConfig() const = 0;
};

using RulePtr = std::unique_ptr<IRule>;

}  // namespace transaction_monitor
