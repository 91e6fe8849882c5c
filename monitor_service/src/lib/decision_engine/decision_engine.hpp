#pragma once

#include <string>

#include <rules/assessment.pb.h>
#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "rule_evaluator/rule_evaluator.hpp"

namespace transaction_monitor {

struct DecisionConfig {
    double manual_review_threshold = 0.6;
};

class DecisionEngine {
public:
    explicit DecisionEngine(DecisionConfig config);

    // Any hard-override rule blocks; otherwise the score decides between
    // manual review and auto approval.
    rules::AssessmentResult::Decision Classify(double score, const TriggeredRules& triggered) const;

    // Builds the assessment record. Review status is APPROVED for automatic
    // approvals and PENDING otherwise.
    rules::AssessmentResult Decide(const transaction::Transaction& transaction,
                                   double score,
                                   const TriggeredRules& triggered,
                                   const std::string& scoring_version,
                                   const Context& context) const;

    static std::string MakeAssessmentId(const std::string& transaction_id);

private:
    DecisionConfig config_;
};

}  // namespace transaction_monitor
