#include "ato_group.hpp"

#include <algorithm>

namespace transaction_monitor {

AtoGroup::AtoGroup(LedgerPtr ledger, AtoConfig config)
    : ledger_(std::move(ledger)), config_(std::move(config)) {}

ContextFragment AtoGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    int max_window = 0;
    for (int hours : config_.window_hours) max_window = std::max(max_window, hours);

    auto changes = ledger_->GetAccountChanges(tx.account_id(),
                                              signal_utils::Lookback(input.as_of, max_window));
    changes.erase(std::remove_if(changes.begin(), changes.end(),
                                 [this](const AccountChange& change) {
                                     const auto& types = config_.tracked_change_types;
                                     return std::find(types.begin(), types.end(),
                                                      change.change_type) == types.end();
                                 }),
                  changes.end());

    for (int hours : config_.window_hours) {
        const auto window = signal_utils::Lookback(input.as_of, hours);
        const auto suffix = signal_utils::WindowName(hours);
        int count = 0;
        for (const auto& type : config_.tracked_change_types) {
            const bool changed = std::any_of(
                changes.begin(), changes.end(), [&](const AccountChange& change) {
                    return change.change_type == type && window.Contains(change.changed_at);
                });
            fragment.SetBool(type + "_change_" + suffix, changed);
        }
        for (const auto& change : changes) {
            if (window.Contains(change.changed_at)) ++count;
        }
        fragment.SetNumber("change_count_" + suffix, count);
    }

    fragment.SetBool("has_recent_change", !changes.empty());
    if (!signal_utils::IsOutbound(tx) || changes.empty()) {
        fragment.SetNull("hours_since_change");
        fragment.SetNull("last_change_type");
        fragment.SetNull("outbound_since_change");
        fragment.SetBool("is_first_outbound_after_change", false);
        return fragment;
    }

    const auto& latest = changes.back();
    auto since_change = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(tx.account_id(), TimeRange{latest.changed_at, input.as_of}),
        tx);
    const auto outbound = std::count_if(since_change.begin(), since_change.end(),
                                        [](const transaction::Transaction& item) {
                                            return signal_utils::IsOutbound(item);
                                        });

    fragment.SetNumber("hours_since_change", time_utils::HoursBetween(latest.changed_at, input.as_of));
    fragment.SetString("last_change_type", latest.change_type);
    fragment.SetNumber("outbound_since_change", static_cast<double>(outbound));
    fragment.SetBool("is_first_outbound_after_change", outbound == 0);
    return fragment;
}

}  // namespace transaction_monitor
