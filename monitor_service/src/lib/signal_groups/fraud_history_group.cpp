#include "fraud_history_group.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "utils/stats.hpp"

namespace transaction_monitor {

FraudHistoryGroup::FraudHistoryGroup(LedgerPtr ledger, FraudHistoryConfig config)
    : ledger_(std::move(ledger)), config_(std::move(config)) {
    std::sort(config_.window_days.begin(), config_.window_days.end());
}

ContextFragment FraudHistoryGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    CollectParty("account", tx.account_id(), input.as_of, fragment);
    fragment.SetBool("has_counterparty", !tx.counterparty_id().empty());
    if (!tx.counterparty_id().empty()) {
        CollectParty("counterparty", tx.counterparty_id(), input.as_of, fragment);
    }
    return fragment;
}

void FraudHistoryGroup::CollectParty(const std::string& party, const std::string& entity_id,
                                     TimePoint as_of, ContextFragment& fragment) const {
    const auto flags = ledger_->GetFraudFlags(entity_id, signal_utils::AllHistory(as_of));
    auto key = [&party](std::string_view name) { return fmt::format("{}_{}", party, name); };

    fragment.SetNumber(key("flag_count"), static_cast<double>(flags.size()));
    for (int days : config_.window_days) {
        const auto window = signal_utils::Lookback(as_of, days * 24.0);
        const auto count = std::count_if(flags.begin(), flags.end(), [&](const FraudFlag& flag) {
            return window.Contains(flag.flagged_at);
        });
        fragment.SetNumber(key(fmt::format("flags_{}d", days)), static_cast<double>(count));
    }

    const auto confirmed = std::count_if(flags.begin(), flags.end(),
                                         [](const FraudFlag& flag) { return flag.confirmed; });
    fragment.SetNumber(key("confirmed_count"), static_cast<double>(confirmed));
    fragment.SetBool(key("has_prior_fraud"), !flags.empty());
    fragment.SetBool(key("is_repeat_offender"),
                     static_cast<int>(flags.size()) >= config_.repeat_offender_flags);

    if (flags.empty()) {
        fragment.SetNull(key("days_since_last_flag"));
        fragment.SetString(key("recency_bucket"), "none");
        fragment.SetNull(key("max_severity"));
        fragment.SetNull(key("escalating_severity"));
        return;
    }

    const double days_since_last = time_utils::DaysBetween(flags.back().flagged_at, as_of);
    std::string bucket = "older";
    for (int days : config_.window_days) {
        if (days_since_last <= days) {
            bucket = fmt::format("last_{}d", days);
            break;
        }
    }
    fragment.SetNumber(key("days_since_last_flag"), days_since_last);
    fragment.SetString(key("recency_bucket"), bucket);

    double max_severity = 0.0;
    std::vector<double> recent;
    std::vector<double> older;
    const auto recent_window = signal_utils::Lookback(as_of, config_.recent_days * 24.0);
    for (const auto& flag : flags) {
        max_severity = std::max(max_severity, flag.severity);
        (recent_window.Contains(flag.flagged_at) ? recent : older).push_back(flag.severity);
    }
    fragment.SetNumber(key("max_severity"), max_severity);
    if (recent.empty() || older.empty()) {
        fragment.SetNull(key("escalating_severity"));
    } else {
        fragment.SetBool(key("escalating_severity"), *stats::Mean(recent) > *stats::Mean(older));
    }
}

}  // namespace transaction_monitor
