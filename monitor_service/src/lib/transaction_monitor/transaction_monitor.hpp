#pragma once

#include <memory>

#include <rules/assessment.pb.h>
#include <transaction/transaction.pb.h>

#include "assessment_store/assessment_store.hpp"
#include "context_assembler/context_assembler.hpp"
#include "decision_engine/decision_engine.hpp"
#include "risk_scorer/risk_scorer.hpp"
#include "rule_evaluator/rule_evaluator.hpp"

namespace transaction_monitor {

// Entry point of the pipeline: assemble context, run rules, score, decide
// and persist. Safe to call concurrently; holds only read-only state.
class TransactionMonitor {
public:
    TransactionMonitor(ContextAssembler assembler,
                       RuleEvaluator evaluator,
                       RiskScorer scorer,
                       DecisionEngine decision_engine,
                       std::shared_ptr<AssessmentStore> store);

    // Returns the stored assessment. A retry for an already assessed
    // transaction returns the existing record. Throws InvalidTransactionError,
    // LedgerUnavailableError, MalformedContextError or PersistenceError; no
    // decision is reported unless it was stored.
    rules::AssessmentResult Evaluate(const transaction::Transaction& transaction) const;

    const RiskScorer& GetScorer() const { return scorer_; }
    AssessmentStore& GetStore() const { return *store_; }

private:
    ContextAssembler assembler_;
    RuleEvaluator evaluator_;
    RiskScorer scorer_;
    DecisionEngine decision_engine_;
    std::shared_ptr<AssessmentStore> store_;
};

}  // namespace transaction_monitor
