#include "postgres_assessment_store.hpp"

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/storages/postgres/exceptions.hpp>
#include <userver/storages/postgres/options.hpp>
#include <userver/storages/postgres/transaction.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

using userver::storages::postgres::ClusterHostType;

constexpr const char* kSelectAssessment =
    "SELECT assessment_id, transaction_id, risk_score, decision, review_status, "
    "triggered_rules, scoring_version, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') AS created_at, "
    "COALESCE(context_snapshot, '') AS context_snapshot, "
    "COALESCE(review_notes, '') AS review_notes, COALESCE(reviewer_id, '') AS reviewer_id, "
    "COALESCE(to_char(review_timestamp AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"'), '') "
    "AS review_timestamp "
    "FROM risk_assessments WHERE transaction_id = $1";

rules::AssessmentResult ReadAssessment(const userver::storages::postgres::Row& row) {
    rules::AssessmentResult assessment;
    assessment.set_assessment_id(row["assessment_id"].As<std::string>());
    assessment.set_transaction_id(row["transaction_id"].As<std::string>());
    assessment.set_risk_score(row["risk_score"].As<double>());
    assessment.set_decision(
        assessment_codec::DecisionFromString(row["decision"].As<std::string>()));
    assessment.set_review_status(
        assessment_codec::ReviewStatusFromString(row["review_status"].As<std::string>()));
    assessment_codec::TriggeredRulesFromJson(row["triggered_rules"].As<std::string>(), assessment);
    assessment.set_scoring_version(row["scoring_version"].As<std::string>());
    assessment.set_created_at(row["created_at"].As<std::string>());
    assessment.set_context_snapshot(row["context_snapshot"].As<std::string>());
    assessment.set_review_notes(row["review_notes"].As<std::string>());
    assessment.set_reviewer_id(row["reviewer_id"].As<std::string>());
    assessment.set_review_timestamp(row["review_timestamp"].As<std::string>());
    return assessment;
}

}  // namespace

PostgresAssessmentStore::PostgresAssessmentStore(
    userver::storages::postgres::ClusterPtr pg_cluster)
    : pg_cluster_(std::move(pg_cluster)) {}

rules::AssessmentResult PostgresAssessmentStore::InsertOnce(
    const rules::AssessmentResult& assessment) {
    const std::string decision = assessment_codec::DecisionToString(assessment.decision());
    const std::string review_status =
        assessment_codec::ReviewStatusToString(assessment.review_status());
    const std::string triggered_rules = assessment_codec::TriggeredRulesToJson(assessment);

    try {
        auto transaction = pg_cluster_->Begin(
            ClusterHostType::kMaster, userver::storages::postgres::TransactionOptions{});
        transaction.Execute(
            "INSERT INTO risk_assessments (assessment_id, transaction_id, risk_score, decision, "
            "review_status, triggered_rules, scoring_version, context_snapshot, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::timestamptz) "
            "ON CONFLICT (transaction_id) DO NOTHING",
            assessment.assessment_id(), assessment.transaction_id(), assessment.risk_score(),
            decision, review_status, triggered_rules, assessment.scoring_version(),
            assessment.context_snapshot(), assessment.created_at());
        auto result = transaction.Execute(kSelectAssessment, assessment.transaction_id());
        transaction.Commit();

        if (result.IsEmpty()) {
            throw PersistenceError(fmt::format("Assessment for transaction {} vanished after insert",
                                               assessment.transaction_id()));
        }
        return ReadAssessment(result[0]);
    } catch (const userver::storages::postgres::Error& e) {
        LOG_ERROR() << fmt::format("Failed to store assessment {}: {}", assessment.assessment_id(),
                                   e.what());
        throw PersistenceError(fmt::format("Failed to store assessment {}: {}",
                                           assessment.assessment_id(), e.what()));
    }
}

std::optional<rules::AssessmentResult> PostgresAssessmentStore::FindByTransaction(
    const std::string& transaction_id) const {
    try {
        auto result = pg_cluster_->Execute(ClusterHostType::kMaster, kSelectAssessment,
                                           transaction_id);
        if (result.IsEmpty()) {
            return std::nullopt;
        }
        return ReadAssessment(result[0]);
    } catch (const userver::storages::postgres::Error& e) {
        LOG_ERROR() << "Failed to read assessment of transaction " << transaction_id << ": "
                    << e.what();
        throw PersistenceError(fmt::format("Failed to read assessment of transaction {}: {}",
                                           transaction_id, e.what()));
    }
}

void PostgresAssessmentStore::UpdateReview(const std::string& assessment_id,
                                           rules::AssessmentResult::ReviewStatus status,
                                           const std::string& notes,
                                           const std::string& reviewer_id) {
    const std::string review_status = assessment_codec::ReviewStatusToString(status);
    std::size_t rows_affected = 0;
    try {
        auto result = pg_cluster_->Execute(
            ClusterHostType::kMaster,
            "UPDATE risk_assessments SET review_status = $2, review_notes = $3, reviewer_id = $4, "
            "review_timestamp = NOW() WHERE assessment_id = $1",
            assessment_id, review_status, notes, reviewer_id);
        rows_affected = result.RowsAffected();
    } catch (const userver::storages::postgres::Error& e) {
        LOG_ERROR() << "Failed to update review of " << assessment_id << ": " << e.what();
        throw PersistenceError(
            fmt::format("Failed to update review of {}: {}", assessment_id, e.what()));
    }
    if (rows_affected == 0) {
        throw PersistenceError(fmt::format("Assessment {} not found", assessment_id));
    }
}

}  // namespace transaction_monitor
