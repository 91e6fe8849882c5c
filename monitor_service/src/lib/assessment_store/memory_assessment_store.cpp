#include "memory_assessment_store.hpp"

#include <mutex>

#include <fmt/format.h>

#include <userver/utils/datetime.hpp>

#include "errors/errors.hpp"
#include "utils/time_utils.hpp"

namespace transaction_monitor {

void MemoryAssessmentStore::CheckAvailable() const {
    if (!available_) {
        throw PersistenceError("Assessment store is unavailable");
    }
}

rules::AssessmentResult MemoryAssessmentStore::InsertOnce(
    const rules::AssessmentResult& assessment) {
    std::lock_guard<userver::engine::Mutex> lock(mutex_);
    CheckAvailable();
    return assessments_.emplace(assessment.transaction_id(), assessment).first->second;
}

std::optional<rules::AssessmentResult> MemoryAssessmentStore::FindByTransaction(
    const std::string& transaction_id) const {
    std::lock_guard<userver::engine::Mutex> lock(mutex_);
    CheckAvailable();
    auto it = assessments_.find(transaction_id);
    if (it == assessments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryAssessmentStore::UpdateReview(const std::string& assessment_id,
                                         rules::AssessmentResult::ReviewStatus status,
                                         const std::string& notes,
                                         const std::string& reviewer_id) {
    // Validates the status before touching the record.
    assessment_codec::ReviewStatusToString(status);

    std::lock_guard<userver::engine::Mutex> lock(mutex_);
    CheckAvailable();
    for (auto& [transaction_id, assessment] : assessments_) {
        if (assessment.assessment_id() != assessment_id) continue;
        assessment.set_review_status(status);
        assessment.set_review_notes(notes);
        assessment.set_reviewer_id(reviewer_id);
        assessment.set_review_timestamp(time_utils::FormatIso(userver::utils::datetime::Now()));
        return;
    }
    throw PersistenceError(fmt::format("Assessment {} not found", assessment_id));
}

void MemoryAssessmentStore::SetAvailable(bool available) {
    std::lock_guard<userver::engine::Mutex> lock(mutex_);
    available_ = available;
}

size_t MemoryAssessmentStore::Size() const {
    std::lock_guard<userver::engine::Mutex> lock(mutex_);
    return assessments_.size();
}

}  // namespace transaction_monitor
