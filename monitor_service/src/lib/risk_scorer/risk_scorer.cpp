#include "risk_scorer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

namespace transaction_monitor {

RiskScorer::RiskScorer(ScoringConfig config)
    : config_(std::move(config)) {
    if (!std::isfinite(config_.normalization_divisor) || config_.normalization_divisor <= 0.0) {
        throw std::invalid_argument(fmt::format("normalization divisor must be positive, got {}",
                                                config_.normalization_divisor));
    }
    if (config_.version.empty()) {
        throw std::invalid_argument("scoring version must not be empty");
    }
}

template <typename Weights>
double RiskScorer::Aggregate(Weights&& weights) const {
    // Summed in sorted order so the result does not depend on rule order.
    std::sort(weights.begin(), weights.end());
    double sum = 0.0;
    for (double weight : weights) {
        if (weight < 0.0) {
            throw std::invalid_argument(fmt::format("negative rule weight {}", weight));
        }
        sum += weight;
    }
    return std::min(sum / config_.normalization_divisor, 1.0);
}

double RiskScorer::Score(const TriggeredRules& triggered) const {
    std::vector<double> weights;
    weights.reserve(triggered.size());
    for (const auto& rule : triggered) weights.push_back(rule.weight());
    return Aggregate(weights);
}

double RiskScorer::Rescore(const rules::AssessmentResult& assessment) const {
    if (assessment.scoring_version() != config_.version) {
        throw std::invalid_argument(fmt::format("assessment {} was scored with '{}', scorer is '{}'",
                                                assessment.assessment_id(),
                                                assessment.scoring_version(), config_.version));
    }
    std::vector<double> weights;
    for (const auto& rule : assessment.triggered_rules()) weights.push_back(rule.weight());
    return Aggregate(weights);
}

}  // namespace transaction_monitor
