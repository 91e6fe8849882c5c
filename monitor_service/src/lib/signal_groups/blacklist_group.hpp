#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

// Watchlist matches of the account, the counterparty and the network and
// device identifiers carried by the transaction.
class BlacklistGroup final : public SignalGroup {
public:
    explicit BlacklistGroup(LedgerPtr ledger);

    std::string_view GetName() const override { return "blacklist"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
};

}  // namespace transaction_monitor
