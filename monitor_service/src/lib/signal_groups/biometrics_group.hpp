#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct BiometricsConfig {
    int lookback_days = 90;
    int min_samples = 5;
    double zscore_threshold = 2.0;
    // Established autofill habit: used in at least / at most this share of sessions.
    double habit_high_ratio = 0.8;
    double habit_low_ratio = 0.2;
};

// Session behaviour (typing, mouse, clipboard, autofill) against the
// account's historical baseline.
class BiometricsGroup final : public SignalGroup {
public:
    BiometricsGroup(LedgerPtr ledger, BiometricsConfig config);

    std::string_view GetName() const override { return "biometrics"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    BiometricsConfig config_;
};

}  // namespace transaction_monitor
