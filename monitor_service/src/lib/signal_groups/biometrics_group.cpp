#include "biometrics_group.hpp"

#include <userver/formats/json/value_builder.hpp>

#include "utils/stats.hpp"

namespace transaction_monitor {

namespace {

struct Metric {
    const char* name;
    std::optional<double> BehavioralSample::*field;
};

constexpr Metric kMetrics[] = {
    {"typing_speed_wpm", &BehavioralSample::typing_speed_wpm},
    {"mouse_velocity", &BehavioralSample::mouse_velocity},
    {"session_duration_seconds", &BehavioralSample::session_duration_seconds},
    {"copy_paste_count", &BehavioralSample::copy_paste_count},
};

}  // namespace

BiometricsGroup::BiometricsGroup(LedgerPtr ledger, BiometricsConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

ContextFragment BiometricsGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto behavioral = json_access::GetObject(input.metadata, "behavioral");
    fragment.SetBool("has_session", behavioral.has_value());
    if (!behavioral) {
        return fragment;
    }

    const auto samples = ledger_->GetBehavioralSamples(
        tx.account_id(), signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0));
    fragment.SetNumber("sample_size", static_cast<double>(samples.size()));
    if (static_cast<int>(samples.size()) < config_.min_samples) {
        fragment.SetBool("insufficient_history", true);
        fragment.SetNull("max_zscore");
        fragment.SetNull("is_anomalous");
        fragment.SetNull("autofill_flip");
        return fragment;
    }
    fragment.SetBool("insufficient_history", false);

    userver::formats::json::ValueBuilder deviating(userver::formats::common::Type::kArray);
    std::optional<double> max_zscore;
    int deviation_count = 0;
    for (const auto& metric : kMetrics) {
        const auto current = json_access::GetNumber(*behavioral, metric.name);
        std::vector<double> baseline;
        for (const auto& sample : samples) {
            if (const auto& value = sample.*metric.field) baseline.push_back(*value);
        }
        std::optional<double> zscore;
        if (current && !baseline.empty() &&
            static_cast<int>(baseline.size()) >= config_.min_samples) {
            zscore = stats::ZScore(*current, *stats::Mean(baseline), *stats::StdDev(baseline));
        }
        fragment.SetNumber(std::string{metric.name} + "_zscore", zscore);
        if (!zscore) continue;
        if (!max_zscore || *zscore > *max_zscore) max_zscore = zscore;
        if (*zscore > config_.zscore_threshold) {
            ++deviation_count;
            deviating.PushBack(std::string{metric.name});
        }
    }
    fragment.SetNumber("max_zscore", max_zscore);
    fragment.SetNumber("deviation_count", deviation_count);
    fragment.SetValue("deviating_metrics", deviating.ExtractValue());
    fragment.SetBool("is_anomalous", deviation_count > 0);

    int autofill_known = 0;
    int autofill_used = 0;
    for (const auto& sample : samples) {
        if (!sample.autofill_used) continue;
        ++autofill_known;
        if (*sample.autofill_used) ++autofill_used;
    }
    const auto current_autofill = json_access::GetBool(*behavioral, "autofill_used");
    if (autofill_known == 0 || autofill_known < config_.min_samples || !current_autofill) {
        fragment.SetNull("historical_autofill_ratio");
        fragment.SetBool("autofill_flip", false);
        return fragment;
    }
    const double ratio = static_cast<double>(autofill_used) / autofill_known;
    fragment.SetNumber("historical_autofill_ratio", ratio);
    fragment.SetBool("autofill_flip", (ratio >= config_.habit_high_ratio && !*current_autofill) ||
                                          (ratio <= config_.habit_low_ratio && *current_autofill));
    return fragment;
}

}  // namespace transaction_monitor
