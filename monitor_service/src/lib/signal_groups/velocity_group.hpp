#pragma once

#include <string>
#include <vector>

#include "signal_group.hpp"

namespace transaction_monitor {

struct VelocityConfig {
    std::vector<int> window_hours{1, 6, 24, 168};
    double small_deposit_threshold = 50.0;
    // Inbound transaction types counted as small deposits; empty means any.
    std::vector<std::string> small_deposit_types;
    int lookback_days = 90;
    // Deviation reported when the account has no same-type history.
    double cold_start_deviation = 5.0;
};

// Transaction counts per window, small-deposit bursts and the deviation of
// the amount from the account's same-type history.
class VelocityGroup final : public SignalGroup {
public:
    VelocityGroup(LedgerPtr ledger, VelocityConfig config);

    std::string_view GetName() const override { return "velocity"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    bool IsSmallDeposit(const transaction::Transaction& tx) const;

    LedgerPtr ledger_;
    VelocityConfig config_;
};

}  // namespace transaction_monitor
