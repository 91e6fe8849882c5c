#include "velocity_group.hpp"

#include <algorithm>
#include <cmath>

#include "utils/stats.hpp"

namespace transaction_monitor {

VelocityGroup::VelocityGroup(LedgerPtr ledger, VelocityConfig config)
    : ledger_(std::move(ledger)), config_(std::move(config)) {}

bool VelocityGroup::IsSmallDeposit(const transaction::Transaction& tx) const {
    if (!signal_utils::IsInbound(tx) || tx.amount() > config_.small_deposit_threshold) {
        return false;
    }
    if (config_.small_deposit_types.empty()) {
        return true;
    }
    return std::find(config_.small_deposit_types.begin(), config_.small_deposit_types.end(),
                     tx.transaction_type()) != config_.small_deposit_types.end();
}

ContextFragment VelocityGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    int max_window = 0;
    for (int hours : config_.window_hours) max_window = std::max(max_window, hours);
    const double lookback_hours = std::max<double>(config_.lookback_days * 24.0, max_window);

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(tx.account_id(),
                                        signal_utils::Lookback(input.as_of, lookback_hours)),
        tx);

    const bool current_is_small_deposit = IsSmallDeposit(tx);
    for (int hours : config_.window_hours) {
        const auto window = signal_utils::Lookback(input.as_of, hours);
        int count = 0;
        int small_deposits = current_is_small_deposit ? 1 : 0;
        for (const auto& prior : history) {
            if (!window.Contains(*signal_utils::TransactionTime(prior))) continue;
            ++count;
            if (IsSmallDeposit(prior)) ++small_deposits;
        }
        const auto suffix = signal_utils::WindowName(hours);
        fragment.SetNumber("tx_count_" + suffix, count);
        fragment.SetNumber("small_deposit_count_" + suffix, small_deposits);
    }
    fragment.SetBool("is_small_deposit", current_is_small_deposit);

    const auto period = signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0);
    int period_count = 0;
    std::vector<double> same_type_amounts;
    for (const auto& prior : history) {
        if (!period.Contains(*signal_utils::TransactionTime(prior))) continue;
        ++period_count;
        if (prior.transaction_type() == tx.transaction_type()) {
            same_type_amounts.push_back(prior.amount());
        }
    }
    fragment.SetNumber("total_tx_count_period", period_count);
    fragment.SetNumber("lookback_days", config_.lookback_days);
    fragment.SetNumber("same_type_count", static_cast<double>(same_type_amounts.size()));

    const auto mean = stats::Mean(same_type_amounts);
    const auto stddev = stats::StdDev(same_type_amounts);
    fragment.SetNumber("avg_amount", mean);
    fragment.SetNumber("stddev_amount", stddev);

    if (!mean) {
        fragment.SetNumber("amount_deviation", config_.cold_start_deviation);
        fragment.SetString("deviation_method", "no_history");
    } else if (auto z = stats::ZScore(tx.amount(), *mean, *stddev)) {
        fragment.SetNumber("amount_deviation", *z);
        fragment.SetString("deviation_method", "sigma");
    } else {
        fragment.SetNumber("amount_deviation", std::abs(tx.amount()) / std::max(*mean, 0.01));
        fragment.SetString("deviation_method", "ratio");
    }
    return fragment;
}

}  // namespace transaction_monitor
