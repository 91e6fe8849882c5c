#include "rule_evaluator.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

RuleEvaluator::RuleEvaluator(std::shared_ptr<const RuleCatalog> catalog)
    : catalog_(std::move(catalog)) {
    if (!catalog_) {
        throw std::invalid_argument("RuleEvaluator requires a catalog");
    }
}

TriggeredRules RuleEvaluator::Run(const transaction::Transaction& transaction,
                                  const Context& context) const {
    TriggeredRules triggered;
    for (const auto& rule : catalog_->GetRules()) {
        const auto& config = rule->GetConfig();
        bool is_triggered = false;
        try {
            is_triggered = rule->IsTriggered(transaction, context);
        } catch (const MalformedContextError& e) {
            LOG_ERROR() << fmt::format("Rule {} failed on transaction {}: {}", config.name(),
                                       transaction.transaction_id(), e.what());
            throw;
        }
        if (!is_triggered) continue;

        rules::TriggeredRule result;
        result.set_name(config.name());
        result.set_weight(config.weight());
        result.set_description(config.description());
        result.set_category(config.category());
        result.set_hard_override(config.hard_override());
        triggered.push_back(std::move(result));

        LOG_DEBUG() << "Rule " << config.name() << " triggered for transaction "
                    << transaction.transaction_id();
    }
    return triggered;
}

}  // namespace transaction_monitor
