#pragma once

#include <string>

#include <rules/assessment.pb.h>

#include "rule_evaluator/rule_evaluator.hpp"

namespace transaction_monitor {

struct ScoringConfig {
    double normalization_divisor = 10.0;
    // Stored on every assessment; a change of the divisor needs a new version.
    std::string version = "linear-v1";
};

// score = min(sum(weights) / divisor, 1.0). No state, no policy.
class RiskScorer {
public:
    explicit RiskScorer(ScoringConfig config);

    double Score(const TriggeredRules& triggered) const;

    // Recomputes the score of a stored assessment from its triggered rules.
    // Throws std::invalid_argument when it was scored by another version.
    double Rescore(const rules::AssessmentResult& assessment) const;

    const std::string& GetVersion() const { return config_.version; }

private:
    template <typename Weights>
    double Aggregate(Weights&& weights) const;

    ScoringConfig config_;
};

}  // namespace transaction_monitor
