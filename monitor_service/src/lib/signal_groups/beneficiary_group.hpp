#pragma once

#include <string>
#include <vector>

#include "signal_group.hpp"

namespace transaction_monitor {

struct BeneficiaryConfig {
    std::vector<int> window_hours{24, 72, 168};
    double new_beneficiary_hours = 48.0;
    // Banking detail changes of a beneficiary inside this window are reported.
    int change_lookback_days = 30;
    std::vector<std::string> account_change_types{"account_number", "routing_number",
                                                  "bank_name"};
    std::vector<std::string> suspicious_change_sources{"email_request", "phone_request", "fax"};
    int off_hours_start = 22;
    int off_hours_end = 6;
};

// Freshly registered beneficiaries of the account, payments directed to
// them, and recent changes of the paid beneficiary's banking details.
class BeneficiaryGroup final : public SignalGroup {
public:
    BeneficiaryGroup(LedgerPtr ledger, BeneficiaryConfig config);

    std::string_view GetName() const override { return "beneficiary"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    void CollectRegistrations(const EvaluationInput& input, ContextFragment& fragment) const;
    void CollectChanges(const EvaluationInput& input,
                        const BeneficiaryRecord& beneficiary,
                        ContextFragment& fragment) const;

    LedgerPtr ledger_;
    BeneficiaryConfig config_;
};

}  // namespace transaction_monitor
