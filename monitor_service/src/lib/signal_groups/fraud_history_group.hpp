#pragma once

#include <vector>

#include "signal_group.hpp"

namespace transaction_monitor {

struct FraudHistoryConfig {
    std::vector<int> window_days{30, 90, 365};
    // Flags newer than this are "recent" for the escalation pattern.
    int recent_days = 90;
    int repeat_offender_flags = 2;
};

// Prior fraud flags raised against the account and the counterparty.
class FraudHistoryGroup final : public SignalGroup {
public:
    FraudHistoryGroup(LedgerPtr ledger, FraudHistoryConfig config);

    std::string_view GetName() const override { return "fraud_history"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    void CollectParty(const std::string& party, const std::string& entity_id,
                      TimePoint as_of, ContextFragment& fragment) const;

    LedgerPtr ledger_;
    FraudHistoryConfig config_;
};

}  // namespace transaction_monitor
