#include "odd_hours_group.hpp"

#include <userver/utest/utest.hpp>

#include "ledger/memory_ledger.hpp"
#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::At;
using test_utils::CollectGroup;
using test_utils::DaysBefore;
using test_utils::Signal;
using test_utils::TransactionBuilder;

TEST(OddHoursGroup, WindowWrapsAroundMidnight) {
    OddHoursGroup group{nullptr, OddHoursConfig{}};
    EXPECT_TRUE(group.IsOddHour(22));
    EXPECT_TRUE(group.IsOddHour(23));
    EXPECT_TRUE(group.IsOddHour(0));
    EXPECT_TRUE(group.IsOddHour(5));
    EXPECT_FALSE(group.IsOddHour(6));
    EXPECT_FALSE(group.IsOddHour(12));
    EXPECT_FALSE(group.IsOddHour(21));

    OddHoursConfig daytime;
    daytime.start_hour = 9;
    daytime.end_hour = 17;
    OddHoursGroup office{nullptr, daytime};
    EXPECT_TRUE(office.IsOddHour(9));
    EXPECT_FALSE(office.IsOddHour(17));
    EXPECT_FALSE(office.IsOddHour(2));
}

UTEST(OddHoursGroup, DeviatesFromDaytimeHabit) {
    const auto now = At("2024-03-13T02:30:00Z");
    auto ledger = std::make_shared<MemoryLedger>();
    for (int day = 1; day <= 12; ++day) {
        // Always around lunch time.
        ledger->AddTransaction(TransactionBuilder("P" + std::to_string(day), "ACC-1")
                                   .Timestamp(DaysBefore(At("2024-03-13T12:00:00Z"), day))
                                   .Build());
    }
    OddHoursGroup group{ledger, OddHoursConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Timestamp(now).Build());
    EXPECT_DOUBLE_EQ(Signal(fragment, "hour").As<double>(), 2.0);
    EXPECT_TRUE(Signal(fragment, "is_odd_hour").As<bool>());
    EXPECT_FALSE(Signal(fragment, "insufficient_history").As<bool>());
    EXPECT_DOUBLE_EQ(Signal(fragment, "historical_odd_hour_ratio").As<double>(), 0.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "hour_frequency").As<double>(), 0.0);
    EXPECT_TRUE(Signal(fragment, "deviates_from_pattern").As<bool>());
    EXPECT_FALSE(Signal(fragment, "weekend_deviation").As<bool>());
}

UTEST(OddHoursGroup, NightOwlIsNotFlagged) {
    const auto now = At("2024-03-13T23:00:00Z");
    auto ledger = std::make_shared<MemoryLedger>();
    for (int day = 1; day <= 10; ++day) {
        ledger->AddTransaction(TransactionBuilder("P" + std::to_string(day), "ACC-1")
                                   .Timestamp(DaysBefore(now, day))
                                   .Build());
    }
    OddHoursGroup group{ledger, OddHoursConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Timestamp(now).Build());
    EXPECT_DOUBLE_EQ(Signal(fragment, "historical_odd_hour_ratio").As<double>(), 1.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "hour_frequency").As<double>(), 1.0);
    EXPECT_FALSE(Signal(fragment, "deviates_from_pattern").As<bool>());
}

UTEST(OddHoursGroup, InsufficientHistoryLeavesDeviationUnknown) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddTransaction(
        TransactionBuilder("P1", "ACC-1").Timestamp(At("2024-03-12T12:00:00Z")).Build());
    OddHoursGroup group{ledger, OddHoursConfig{}};

    const auto fragment = CollectGroup(
        group, TransactionBuilder("T1", "ACC-1").Timestamp(At("2024-03-16T03:00:00Z")).Build());
    EXPECT_TRUE(Signal(fragment, "is_weekend").As<bool>());
    EXPECT_TRUE(Signal(fragment, "insufficient_history").As<bool>());
    EXPECT_DOUBLE_EQ(Signal(fragment, "history_sample_size").As<double>(), 1.0);
    EXPECT_TRUE(Signal(fragment, "deviates_from_pattern").IsNull());
}

UTEST(OddHoursGroup, NoHistoryWithoutMinimumIsInsufficient) {
    auto ledger = std::make_shared<MemoryLedger>();
    OddHoursConfig config;
    config.min_history = 0;
    OddHoursGroup group{ledger, config};

    const auto fragment = CollectGroup(
        group, TransactionBuilder("T1", "ACC-1").Timestamp(At("2024-03-13T03:00:00Z")).Build());
    EXPECT_TRUE(Signal(fragment, "insufficient_history").As<bool>());
    EXPECT_TRUE(Signal(fragment, "historical_odd_hour_ratio").IsNull());
}

}  // namespace transaction_monitor
