#pragma once

#include <optional>
#include <string>

#include <rules/assessment.pb.h>

namespace transaction_monitor {

// Write side of the pipeline. Every failure is a PersistenceError.
class AssessmentStore {
public:
    virtual ~AssessmentStore() = default;

    // Inserts the assessment unless one exists for the same transaction and
    // returns the stored record, so a retried evaluation never duplicates it.
    virtual rules::AssessmentResult InsertOnce(const rules::AssessmentResult& assessment) = 0;

    virtual std::optional<rules::AssessmentResult> FindByTransaction(
        const std::string& transaction_id) const = 0;

    // The only mutation after creation, performed by the reviewing process.
    virtual void UpdateReview(const std::string& assessment_id,
                              rules::AssessmentResult::ReviewStatus status,
                              const std::string& notes,
                              const std::string& reviewer_id) = 0;
};

namespace assessment_codec {

std::string DecisionToString(rules::AssessmentResult::Decision decision);
rules::AssessmentResult::Decision DecisionFromString(const std::string& decision);

std::string ReviewStatusToString(rules::AssessmentResult::ReviewStatus status);
rules::AssessmentResult::ReviewStatus ReviewStatusFromString(const std::string& status);

// Ordered list of {name, weight, description, category, hard_override}.
std::string TriggeredRulesToJson(const rules::AssessmentResult& assessment);
void TriggeredRulesFromJson(const std::string& json, rules::AssessmentResult& assessment);

}  // namespace assessment_codec

}  // namespace transaction_monitor
