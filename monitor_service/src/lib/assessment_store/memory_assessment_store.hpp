#pragma once

#include <unordered_map>

#include <userver/engine/mutex.hpp>

#include "assessment_store.hpp"

namespace transaction_monitor {

class MemoryAssessmentStore final : public AssessmentStore {
public:
    MemoryAssessmentStore() = default;

    rules::AssessmentResult InsertOnce(const rules::AssessmentResult& assessment) override;
    std::optional<rules::AssessmentResult> FindByTransaction(
        const std::string& transaction_id) const override;
    void UpdateReview(const std::string& assessment_id,
                      rules::AssessmentResult::ReviewStatus status,
                      const std::string& notes,
                      const std::string& reviewer_id) override;

    // Failure simulation: every call throws PersistenceError.
    void SetAvailable(bool available);
    size_t Size() const;

private:
    void CheckAvailable() const;

    mutable userver::engine::Mutex mutex_;
    bool available_ = true;
    // transaction_id -> assessment
    std::unordered_map<std::string, rules::AssessmentResult> assessments_;
};

}  // namespace transaction_monitor
