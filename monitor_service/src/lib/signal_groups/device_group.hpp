#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct DeviceConfig {
    int lookback_days = 90;
    int shared_window_days = 30;
    // Distinct accounts on one device, the current one included.
    int shared_device_accounts = 3;

    double emulator_confidence = 0.9;
    double rooted_confidence = 0.7;
    double shared_device_confidence = 0.8;
    double fingerprint_mismatch_confidence = 0.6;
    double new_device_confidence = 0.4;
};

// Device fingerprint of the session: unknown or shared devices, emulators
// and tampered environments.
class DeviceGroup final : public SignalGroup {
public:
    DeviceGroup(LedgerPtr ledger, DeviceConfig config);

    std::string_view GetName() const override { return "device"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    LedgerPtr ledger_;
    DeviceConfig config_;
};

}  // namespace transaction_monitor
