#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

// Anonymising networks (VPN, proxy, Tor exit, hosting ranges) behind the
// transaction's IP address.
class VpnGroup final : public SignalGroup {
public:
    explicit VpnGroup(LedgerPtr ledger);

    std::string_view GetName() const override { return "vpn"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
};

}  // namespace transaction_monitor
