#include "transaction_monitor.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "validation/transaction_validator.hpp"

namespace transaction_monitor {

TransactionMonitor::TransactionMonitor(ContextAssembler assembler,
                                       RuleEvaluator evaluator,
                                       RiskScorer scorer,
                                       DecisionEngine decision_engine,
                                       std::shared_ptr<AssessmentStore> store)
    : assembler_(std::move(assembler)),
      evaluator_(std::move(evaluator)),
      scorer_(std::move(scorer)),
      decision_engine_(std::move(decision_engine)),
      store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("TransactionMonitor requires an assessment store");
    }
}

rules::AssessmentResult TransactionMonitor::Evaluate(
    const transaction::Transaction& transaction) const {
    ValidateTransaction(transaction);

    if (auto existing = store_->FindByTransaction(transaction.transaction_id())) {
        LOG_INFO() << "Transaction " << transaction.transaction_id()
                   << " already assessed as " << existing->assessment_id();
        return *existing;
    }

    const auto context = assembler_.Build(transaction);
    const auto triggered = evaluator_.Run(transaction, context);
    const double score = scorer_.Score(triggered);
    const auto assessment = decision_engine_.Decide(transaction, score, triggered,
                                                    scorer_.GetVersion(), context);

    auto stored = store_->InsertOnce(assessment);
    LOG_INFO() << fmt::format(
        "Transaction {} assessed: decision={} score={:.3f} triggered_rules={} assessment={}",
        transaction.transaction_id(),
        rules::AssessmentResult::Decision_Name(stored.decision()), stored.risk_score(),
        stored.triggered_rules_size(), stored.assessment_id());
    return stored;
}

}  // namespace transaction_monitor
