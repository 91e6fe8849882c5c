#pragma once

#include <chrono>
#include <vector>

#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "signal_groups/account_age_group.hpp"
#include "signal_groups/ato_group.hpp"
#include "signal_groups/beneficiary_group.hpp"
#include "signal_groups/biometrics_group.hpp"
#include "signal_groups/check_group.hpp"
#include "signal_groups/device_group.hpp"
#include "signal_groups/fraud_history_group.hpp"
#include "signal_groups/geo_group.hpp"
#include "signal_groups/mule_group.hpp"
#include "signal_groups/odd_hours_group.hpp"
#include "signal_groups/relationship_group.hpp"
#include "signal_groups/velocity_group.hpp"

namespace transaction_monitor {

struct SignalGroupsConfig {
    VelocityConfig velocity;
    MuleConfig mule;
    BeneficiaryConfig beneficiary;
    AtoConfig ato;
    OddHoursConfig odd_hours;
    GeoConfig geo;
    DeviceConfig device;
    BiometricsConfig biometrics;
    RelationshipConfig relationship;
    AccountAgeConfig account_age;
    FraudHistoryConfig fraud_history;
    CheckConfig check;
};

// Every signal group of the pipeline, in a fixed order.
std::vector<SignalGroupPtr> MakeSignalGroups(LedgerPtr ledger, const SignalGroupsConfig& config);

// Builds the context of one transaction. Groups run concurrently; a group
// not finished by the deadline is cancelled and its signals stay absent.
// A LedgerUnavailableError or any other failure of a group propagates.
class ContextAssembler {
public:
    ContextAssembler(std::vector<SignalGroupPtr> groups, std::chrono::milliseconds timeout);

    // Throws InvalidTransactionError before any group runs.
    Context Build(const transaction::Transaction& tx) const;

    const std::vector<SignalGroupPtr>& GetGroups() const { return groups_; }

private:
    std::vector<SignalGroupPtr> groups_;
    std::chrono::milliseconds timeout_;
};

}  // namespace transaction_monitor
