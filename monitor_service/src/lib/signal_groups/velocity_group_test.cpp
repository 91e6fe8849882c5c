#include "velocity_group.hpp"

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

transaction::Transaction Prior(const std::string& id, double hours_ago, double amount) {
    return TransactionBuilder(id, "ACC-1")
        .Amount(amount)
        .Timestamp(HoursBefore(kNow, hours_ago))
        .Build();
}

}  // namespace

UTEST(VelocityGroup, ColdStartUsesSentinelDeviation) {
    auto ledger = std::make_shared<MemoryLedger>();
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Amount(50000).Build());
    EXPECT_DOUBLE_EQ(Signal(fragment, "amount_deviation").As<double>(), 5.0);
    EXPECT_EQ(Signal(fragment, "deviation_method").As<std::string>(), "no_history");
    EXPECT_TRUE(Signal(fragment, "avg_amount").IsNull());
    EXPECT_TRUE(Signal(fragment, "stddev_amount").IsNull());
    EXPECT_DOUBLE_EQ(Signal(fragment, "total_tx_count_period").As<double>(), 0.0);
}

UTEST(VelocityGroup, SingleSameTypeTransactionFallsBackToRatio) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddTransaction(Prior("P1", 48, 1000));
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Amount(5000).Build());
    EXPECT_DOUBLE_EQ(Signal(fragment, "stddev_amount").As<double>(), 0.0);
    EXPECT_EQ(Signal(fragment, "deviation_method").As<std::string>(), "ratio");
    EXPECT_DOUBLE_EQ(Signal(fragment, "amount_deviation").As<double>(), 5.0);
}

UTEST(VelocityGroup, SigmaDeviation) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddTransaction(Prior("P1", 72, 100));
    ledger->AddTransaction(Prior("P2", 48, 200));
    ledger->AddTransaction(Prior("P3", 30, 300));
    // Other types do not form the baseline.
    ledger->AddTransaction(
        TransactionBuilder("P4", "ACC-1").Type("ACH").Amount(90000).Timestamp(HoursBefore(kNow, 20)).Build());
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Amount(500).Build());
    EXPECT_EQ(Signal(fragment, "deviation_method").As<std::string>(), "sigma");
    EXPECT_DOUBLE_EQ(Signal(fragment, "same_type_count").As<double>(), 3.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "avg_amount").As<double>(), 200.0);
    EXPECT_NEAR(Signal(fragment, "amount_deviation").As<double>(), 3.674, 1e-3);
}

UTEST(VelocityGroup, WindowCounts) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddTransaction(Prior("P1", 0.5, 10));
    ledger->AddTransaction(Prior("P2", 3, 10));
    ledger->AddTransaction(Prior("P3", 20, 10));
    ledger->AddTransaction(Prior("P4", 100, 10));
    ledger->AddTransaction(Prior("P5", 1000, 10));
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto fragment = CollectGroup(group, TransactionBuilder("T1", "ACC-1").Build());
    EXPECT_DOUBLE_EQ(Signal(fragment, "tx_count_1h").As<double>(), 1.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "tx_count_6h").As<double>(), 2.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "tx_count_24h").As<double>(), 3.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "tx_count_168h").As<double>(), 4.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "total_tx_count_period").As<double>(), 5.0);
}

UTEST(VelocityGroup, IgnoresTheEvaluatedTransactionInTheLedger) {
    auto ledger = std::make_shared<MemoryLedger>();
    const auto tx = TransactionBuilder("T1", "ACC-1").Timestamp(kNow).Build();
    ledger->AddTransaction(tx);
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto fragment = CollectGroup(group, tx);
    EXPECT_DOUBLE_EQ(Signal(fragment, "tx_count_1h").As<double>(), 0.0);
}

UTEST(VelocityGroup, SmallDepositBurst) {
    auto ledger = std::make_shared<MemoryLedger>();
    for (int i = 0; i < 3; ++i) {
        ledger->AddTransaction(TransactionBuilder("D" + std::to_string(i), "ACC-1")
                                   .Credit()
                                   .Type("ACH")
                                   .Amount(1.0 + i)
                                   .Timestamp(HoursBefore(kNow, 2 + i))
                                   .Build());
    }
    ledger->AddTransaction(
        TransactionBuilder("D9", "ACC-1").Credit().Amount(900).Timestamp(HoursBefore(kNow, 1)).Build());
    VelocityGroup group{ledger, VelocityConfig{}};

    const auto withdrawal =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Amount(2000).Build());
    EXPECT_DOUBLE_EQ(Signal(withdrawal, "small_deposit_count_24h").As<double>(), 3.0);
    EXPECT_FALSE(Signal(withdrawal, "is_small_deposit").As<bool>());

    const auto deposit =
        CollectGroup(group, TransactionBuilder("T2", "ACC-1").Credit().Amount(0.5).Build());
    EXPECT_TRUE(Signal(deposit, "is_small_deposit").As<bool>());
    EXPECT_DOUBLE_EQ(Signal(deposit, "small_deposit_count_24h").As<double>(), 4.0);
}

}  // namespace transaction_monitor
