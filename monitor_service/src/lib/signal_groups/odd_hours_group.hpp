#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct OddHoursConfig {
    // [start, end) in UTC hours, wrapping across midnight when start > end.
    int start_hour = 22;
    int end_hour = 6;
    int lookback_days = 90;
    int min_history = 10;
    // A personal ratio at or below this marks the hour or weekend as unusual.
    double rare_ratio = 0.1;
};

// Time-of-day and weekend activity compared with the account's own habits.
class OddHoursGroup final : public SignalGroup {
public:
    OddHoursGroup(LedgerPtr ledger, OddHoursConfig config);

    std::string_view GetName() const override { return "odd_hours"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

    bool IsOddHour(int hour) const;

private:
    LedgerPtr ledger_;
    OddHoursConfig config_;
};

}  // namespace transaction_monitor
