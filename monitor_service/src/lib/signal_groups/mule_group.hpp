#pragma once

#include <vector>

#include "signal_group.hpp"

namespace transaction_monitor {

struct MuleConfig {
    std::vector<int> window_hours{24, 72, 168};
    // Window in which inbound transactions are paired with later outbound ones.
    int transfer_window_hours = 168;
};

// Inbound/outbound flow of the account: pass-through ratio and the time
// money stays in the account before moving on.
class MuleGroup final : public SignalGroup {
public:
    MuleGroup(LedgerPtr ledger, MuleConfig config);

    std::string_view GetName() const override { return "mule"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    MuleConfig config_;
};

}  // namespace transaction_monitor
