#include "mule_group.hpp"

#include <algorithm>

namespace transaction_monitor {

namespace {

struct Flow {
    int incoming_count = 0;
    double incoming_total = 0.0;
    int outgoing_count = 0;
    double outgoing_total = 0.0;
};

struct Movement {
    TimePoint at;
    bool inbound;
};

// Pairs every inbound movement with the first outbound movement after it.
// One withdrawal may drain several deposits.
std::optional<double> AverageHoursToTransfer(const std::vector<Movement>& movements) {
    double total_hours = 0.0;
    int pairs = 0;
    for (size_t i = 0; i < movements.size(); ++i) {
        if (!movements[i].inbound) continue;
        for (size_t j = i + 1; j < movements.size(); ++j) {
            if (movements[j].inbound || movements[j].at <= movements[i].at) continue;
            total_hours += time_utils::HoursBetween(movements[i].at, movements[j].at);
            ++pairs;
            break;
        }
    }
    if (pairs == 0) return std::nullopt;
    return total_hours / pairs;
}

}  // namespace

MuleGroup::MuleGroup(LedgerPtr ledger, MuleConfig config)
    : ledger_(std::move(ledger)), config_(std::move(config)) {}

ContextFragment MuleGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    int max_window = config_.transfer_window_hours;
    for (int hours : config_.window_hours) max_window = std::max(max_window, hours);

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(tx.account_id(),
                                        signal_utils::Lookback(input.as_of, max_window)),
        tx);

    // The evaluated transaction is part of the flow it may complete.
    auto account_flow = [&](const TimeRange& window) {
        Flow flow;
        auto add = [&flow](const transaction::Transaction& item) {
            if (signal_utils::IsInbound(item)) {
                ++flow.incoming_count;
                flow.incoming_total += item.amount();
            } else if (signal_utils::IsOutbound(item)) {
                ++flow.outgoing_count;
                flow.outgoing_total += item.amount();
            }
        };
        for (const auto& prior : history) {
            if (window.Contains(*signal_utils::TransactionTime(prior))) add(prior);
        }
        add(tx);
        return flow;
    };

    for (int hours : config_.window_hours) {
        const auto flow = account_flow(signal_utils::Lookback(input.as_of, hours));
        const auto suffix = signal_utils::WindowName(hours);
        fragment.SetNumber("incoming_count_" + suffix, flow.incoming_count);
        fragment.SetNumber("incoming_total_" + suffix, flow.incoming_total);
        fragment.SetNumber("outgoing_count_" + suffix, flow.outgoing_count);
        fragment.SetNumber("outgoing_total_" + suffix, flow.outgoing_total);
        fragment.SetNumber(
            "avg_incoming_amount_" + suffix,
            flow.incoming_count > 0
                ? std::optional<double>{flow.incoming_total / flow.incoming_count}
                : std::nullopt);
        fragment.SetNumber("flow_through_ratio_" + suffix,
                           flow.incoming_total > 0.0 ? flow.outgoing_total / flow.incoming_total
                                                     : 0.0);
    }

    const auto transfer_window = signal_utils::Lookback(input.as_of, config_.transfer_window_hours);
    std::vector<Movement> movements;
    for (const auto& prior : history) {
        const auto at = *signal_utils::TransactionTime(prior);
        if (!transfer_window.Contains(at)) continue;
        if (signal_utils::IsInbound(prior) || signal_utils::IsOutbound(prior)) {
            movements.push_back({at, signal_utils::IsInbound(prior)});
        }
    }
    if (signal_utils::IsInbound(tx) || signal_utils::IsOutbound(tx)) {
        movements.push_back({input.as_of, signal_utils::IsInbound(tx)});
    }
    std::stable_sort(movements.begin(), movements.end(),
                     [](const Movement& lhs, const Movement& rhs) { return lhs.at < rhs.at; });
    fragment.SetNumber("avg_hours_to_transfer", AverageHoursToTransfer(movements));
    return fragment;
}

}  // namespace transaction_monitor
