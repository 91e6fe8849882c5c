#include "ato_group.hpp"

#include <userver/utest/utest.hpp>

#include "ledger/memory_ledger.hpp"
#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::At;
using test_utils::CollectGroup;
using test_utils::HoursBefore;
using test_utils::Signal;
using test_utils::TransactionBuilder;

namespace {

const auto kNow = At("2024-03-13T12:00:00Z");

}  // namespace

UTEST(AtoGroup, OutboundShortlyAfterPhoneChange) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddAccountChange({"C1", "ACC-1", HoursBefore(kNow, 10), "phone"});
    ledger->AddAccountChange({"C2", "ACC-1", HoursBefore(kNow, 2), "email"});
    AtoGroup group{ledger, AtoConfig{}};

    const auto fragment = CollectGroup(group, TransactionBuilder("T1", "ACC-1").Amount(9000).Build());
    EXPECT_TRUE(Signal(fragment, "phone_change_24h").As<bool>());
    EXPECT_FALSE(Signal(fragment, "device_change_24h").As<bool>());
    EXPECT_DOUBLE_EQ(Signal(fragment, "change_count_72h").As<double>(), 1.0);
    EXPECT_TRUE(Signal(fragment, "has_recent_change").As<bool>());
    EXPECT_NEAR(Signal(fragment, "hours_since_change").As<double>(), 10.0, 1e-6);
    EXPECT_EQ(Signal(fragment, "last_change_type").As<std::string>(), "phone");
    EXPECT_TRUE(Signal(fragment, "is_first_outbound_after_change").As<bool>());
}

UTEST(AtoGroup, EarlierOutboundSinceChange) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddAccountChange({"C1", "ACC-1", HoursBefore(kNow, 30), "sim"});
    ledger->AddTransaction(
        TransactionBuilder("P1", "ACC-1").Amount(50).Timestamp(HoursBefore(kNow, 20)).Build());
    AtoGroup group{ledger, AtoConfig{}};

    const auto fragment = CollectGroup(group, TransactionBuilder("T1", "ACC-1").Build());
    EXPECT_FALSE(Signal(fragment, "sim_change_24h").As<bool>());
    EXPECT_TRUE(Signal(fragment, "sim_change_72h").As<bool>());
    EXPECT_DOUBLE_EQ(Signal(fragment, "outbound_since_change").As<double>(), 1.0);
    EXPECT_FALSE(Signal(fragment, "is_first_outbound_after_change").As<bool>());
}

UTEST(AtoGroup, InboundIsNotScored) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddAccountChange({"C1", "ACC-1", HoursBefore(kNow, 10), "device"});
    AtoGroup group{ledger, AtoConfig{}};

    const auto fragment = CollectGroup(group, TransactionBuilder("T1", "ACC-1").Credit().Build());
    EXPECT_TRUE(Signal(fragment, "device_change_24h").As<bool>());
    EXPECT_TRUE(Signal(fragment, "hours_since_change").IsNull());
    EXPECT_FALSE(Signal(fragment, "is_first_outbound_after_change").As<bool>());
}

}  // namespace transaction_monitor
