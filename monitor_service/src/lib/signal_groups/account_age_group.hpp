#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct AccountAgeConfig {
    // Upper bounds in whole days, inclusive.
    int brand_new_days = 1;
    int new_days = 7;
    int young_days = 30;
    int established_days = 365;
    double large_amount = 10000.0;
};

// Maturity of the account and large transfers from young accounts.
class AccountAgeGroup final : public SignalGroup {
public:
    AccountAgeGroup(LedgerPtr ledger, AccountAgeConfig config);

    std::string_view GetName() const override { return "account_age"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    AccountAgeConfig config_;
};

}  // namespace transaction_monitor
