#pragma once

#include <string>
#include <vector>

#include "signal_group.hpp"

namespace transaction_monitor {

struct AtoConfig {
    std::vector<int> window_hours{24, 72, 168};
    std::vector<std::string> tracked_change_types{"phone", "device", "sim"};
};

// Credential and device changes that precede an outbound transaction.
class AtoGroup final : public SignalGroup {
public:
    AtoGroup(LedgerPtr ledger, AtoConfig config);

    std::string_view GetName() const override { return "ato"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    AtoConfig config_;
};

}  // namespace transaction_monitor
