#pragma once

#include <userver/storages/postgres/cluster.hpp>

#include "assessment_store.hpp"

namespace transaction_monitor {

// risk_assessments table, see postgresql/schemas/monitor.sql.
class PostgresAssessmentStore final : public AssessmentStore {
public:
    explicit PostgresAssessmentStore(userver::storages::postgres::ClusterPtr pg_cluster);

    rules::AssessmentResult InsertOnce(const rules::AssessmentResult& assessment) override;
    std::optional<rules::AssessmentResult> FindByTransaction(
        const std::string& transaction_id) const override;
    void UpdateReview(const std::string& assessment_id,
                      rules::AssessmentResult::ReviewStatus status,
                      const std::string& notes,
                      const std::string& reviewer_id) override;

private:
    userver::storages::postgres::ClusterPtr pg_cluster_;
};

}  // namespace transaction_monitor
