#include "relationship_group.hpp"

#include <userver/utest/utest.hpp>

#include "ledger/memory_ledger.hpp"
#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::At;
using test_utils::CollectGroup;
using test_utils::DaysBefore;
using test_utils::Signal;
using test_utils::TransactionBuilder;

namespace {

const auto kNow = At("2024-03-13T12:00:00Z");

}  // namespace

UTEST(RelationshipGroup, NewCounterpartyHasLowTrust) {
    auto ledger = std::make_shared<MemoryLedger>();
    RelationshipGroup group{ledger, RelationshipConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Counterparty("BEN-1").Build());
    EXPECT_TRUE(Signal(fragment, "is_new_counterparty").As<bool>());
    EXPECT_EQ(Signal(fragment, "status").As<std::string>(), "new");
    EXPECT_DOUBLE_EQ(Signal(fragment, "social_trust_score").As<double>(), 0.0);
    EXPECT_EQ(Signal(fragment, "trust_level").As<std::string>(), "low");
}

UTEST(RelationshipGroup, SteadyVerifiedRelationship) {
    auto ledger = std::make_shared<MemoryLedger>();
    BeneficiaryRecord beneficiary;
    beneficiary.beneficiary_id = "BEN-1";
    beneficiary.account_id = "ACC-1";
    beneficiary.registered_at = DaysBefore(kNow, 60);
    beneficiary.verified = true;
    ledger->AddBeneficiary(beneficiary);
    for (int days : {24, 17, 10, 3}) {
        ledger->AddTransaction(TransactionBuilder("P" + std::to_string(days), "ACC-1")
                                   .Counterparty("BEN-1")
                                   .Amount(500)
                                   .Timestamp(DaysBefore(kNow, days))
                                   .Build());
    }
    RelationshipGroup group{ledger, RelationshipConfig{}};

    const auto fragment = CollectGroup(
        group, TransactionBuilder("T1", "ACC-1")
                   .Counterparty("BEN-1")
                   .Amount(500)
                   .Metadata(R"({"counterparty_in_contacts": true, "social": {"mutual_connections": 1}})")
                   .Build());
    EXPECT_EQ(Signal(fragment, "status").As<std::string>(), "active");
    EXPECT_DOUBLE_EQ(Signal(fragment, "prior_transaction_count").As<double>(), 4.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "trust_registration_points").As<double>(), 20.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "trust_history_points").As<double>(), 18.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "trust_contacts_points").As<double>(), 20.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "trust_social_points").As<double>(), 2.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "trust_pattern_points").As<double>(), 20.0);
    EXPECT_DOUBLE_EQ(Signal(fragment, "social_trust_score").As<double>(), 80.0);
    EXPECT_EQ(Signal(fragment, "trust_level").As<std::string>(), "high");
}

UTEST(RelationshipGroup, DormantReactivation) {
    auto ledger = std::make_shared<MemoryLedger>();
    ledger->AddTransaction(TransactionBuilder("P1", "ACC-1")
                               .Counterparty("BEN-1")
                               .Timestamp(DaysBefore(kNow, 200))
                               .Build());
    RelationshipGroup group{ledger, RelationshipConfig{}};

    const auto fragment =
        CollectGroup(group, TransactionBuilder("T1", "ACC-1").Counterparty("BEN-1").Build());
    EXPECT_EQ(Signal(fragment, "status").As<std::string>(), "dormant");
    EXPECT_TRUE(Signal(fragment, "is_dormant_reactivation").As<bool>());
    EXPECT_NEAR(Signal(fragment, "days_since_last_transaction").As<double>(), 200.0, 1e-6);
}

UTEST(RelationshipGroup, NoCounterparty) {
    auto ledger = std::make_shared<MemoryLedger>();
    RelationshipGroup group{ledger, RelationshipConfig{}};

    const auto fragment = CollectGroup(group, TransactionBuilder("T1", "ACC-1").Build());
    EXPECT_FALSE(Signal(fragment, "has_counterparty").As<bool>());
    EXPECT_TRUE(Signal(fragment, "social_trust_score").IsNull());
}

}  // namespace transaction_monitor
