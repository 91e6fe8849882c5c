#include "odd_hours_group.hpp"

namespace transaction_monitor {

OddHoursGroup::OddHoursGroup(LedgerPtr ledger, OddHoursConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

bool OddHoursGroup::IsOddHour(int hour) const {
    if (config_.start_hour > config_.end_hour) {
        return hour >= config_.start_hour || hour < config_.end_hour;
    }
    return hour >= config_.start_hour && hour < config_.end_hour;
}

ContextFragment OddHoursGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const int hour = time_utils::HourOfDay(input.as_of);
    const bool is_odd = IsOddHour(hour);
    const bool is_weekend = time_utils::IsWeekend(input.as_of);
    fragment.SetNumber("hour", hour);
    fragment.SetBool("is_odd_hour", is_odd);
    fragment.SetBool("is_weekend", is_weekend);

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(
            tx.account_id(), signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0)),
        tx);
    const auto sample_size = static_cast<int>(history.size());
    fragment.SetNumber("history_sample_size", sample_size);

    if (sample_size == 0 || sample_size < config_.min_history) {
        fragment.SetBool("insufficient_history", true);
        fragment.SetNull("historical_odd_hour_ratio");
        fragment.SetNull("historical_weekend_ratio");
        fragment.SetNull("hour_frequency");
        fragment.SetNull("deviates_from_pattern");
        fragment.SetNull("weekend_deviation");
        return fragment;
    }

    int odd = 0;
    int weekend = 0;
    int same_hour = 0;
    for (const auto& prior : history) {
        const auto at = *signal_utils::TransactionTime(prior);
        const int prior_hour = time_utils::HourOfDay(at);
        if (IsOddHour(prior_hour)) ++odd;
        if (time_utils::IsWeekend(at)) ++weekend;
        if (prior_hour == hour) ++same_hour;
    }
    const double odd_ratio = static_cast<double>(odd) / sample_size;
    const double weekend_ratio = static_cast<double>(weekend) / sample_size;

    fragment.SetBool("insufficient_history", false);
    fragment.SetNumber("historical_odd_hour_ratio", odd_ratio);
    fragment.SetNumber("historical_weekend_ratio", weekend_ratio);
    fragment.SetNumber("hour_frequency", static_cast<double>(same_hour) / sample_size);
    fragment.SetBool("deviates_from_pattern", is_odd && odd_ratio <= config_.rare_ratio);
    fragment.SetBool("weekend_deviation", is_weekend && weekend_ratio <= config_.rare_ratio);
    return fragment;
}

}  // namespace transaction_monitor
