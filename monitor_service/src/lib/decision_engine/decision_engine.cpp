#include "decision_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include <userver/formats/json/serialize.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/datetime.hpp>

#include "utils/time_utils.hpp"

namespace transaction_monitor {

DecisionEngine::DecisionEngine(DecisionConfig config)
    : config_(config) {
    if (!(config_.manual_review_threshold >= 0.0 && config_.manual_review_threshold <= 1.0)) {
        throw std::invalid_argument(fmt::format("manual review threshold {} is outside [0, 1]",
                                                config_.manual_review_threshold));
    }
}

rules::AssessmentResult::Decision DecisionEngine::Classify(
    double score, const TriggeredRules& triggered) const {
    const bool hard_override =
        std::any_of(triggered.begin(), triggered.end(),
                    [](const rules::TriggeredRule& rule) { return rule.hard_override(); });
    if (hard_override) {
        return rules::AssessmentResult::BLOCKED;
    }
    if (score >= config_.manual_review_threshold) {
        return rules::AssessmentResult::MANUAL_REVIEW;
    }
    return rules::AssessmentResult::AUTO_APPROVE;
}

rules::AssessmentResult DecisionEngine::Decide(const transaction::Transaction& transaction,
                                               double score,
                                               const TriggeredRules& triggered,
                                               const std::string& scoring_version,
                                               const Context& context) const {
    rules::AssessmentResult result;
    result.set_assessment_id(MakeAssessmentId(transaction.transaction_id()));
    result.set_transaction_id(transaction.transaction_id());
    result.set_risk_score(score);
    result.set_decision(Classify(score, triggered));
    result.set_review_status(result.decision() == rules::AssessmentResult::AUTO_APPROVE
                                 ? rules::AssessmentResult::APPROVED
                                 : rules::AssessmentResult::PENDING);
    for (const auto& rule : triggered) {
        *result.add_triggered_rules() = rule;
        if (rule.hard_override()) {
            LOG_WARNING() << fmt::format("Hard override {} blocks transaction {}", rule.name(),
                                         transaction.transaction_id());
        }
    }
    result.set_scoring_version(scoring_version);
    result.set_created_at(time_utils::FormatIso(userver::utils::datetime::Now()));
    result.set_context_snapshot(userver::formats::json::ToString(context.ToJson()));
    return result;
}

std::string DecisionEngine::MakeAssessmentId(const std::string& transaction_id) {
    return "ASMT-" + transaction_id;
}

}  // namespace transaction_monitor
