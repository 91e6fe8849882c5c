#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct RelationshipConfig {
    // Days since the last transaction with the counterparty.
    int active_days = 30;
    int recent_days = 90;
    int dormant_days = 180;

    int min_pattern_history = 3;
    double high_trust_score = 70.0;
    double medium_trust_score = 40.0;
};

// History of the account with the counterparty and a 0..100 social trust
// score built from five capped sub-factors.
class RelationshipGroup final : public SignalGroup {
public:
    RelationshipGroup(LedgerPtr ledger, RelationshipConfig config);

    std::string_view GetName() const override { return "relationship"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    RelationshipConfig config_;
};

}  // namespace transaction_monitor
