#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct CheckConfig {
    int lookback_days = 90;
    double amount_tolerance = 0.005;
};

// Check deposits presented more than once.
class CheckGroup final : public SignalGroup {
public:
    CheckGroup(LedgerPtr ledger, CheckConfig config);

    std::string_view GetName() const override { return "check"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    CheckConfig config_;
};

}  // namespace transaction_monitor
