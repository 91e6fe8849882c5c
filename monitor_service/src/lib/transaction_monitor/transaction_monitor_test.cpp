#include "transaction_monitor.hpp"

#include <algorithm>

#include <userver/formats/json/serialize.hpp>
#include <userver/utest/utest.hpp>

#include "assessment_store/memory_assessment_store.hpp"
#include "errors/errors.hpp"
#include "ledger/memory_ledger.hpp"
#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::At;
using test_utils::DaysBefore;
using test_utils::HoursBefore;
using test_utils::TransactionBuilder;

namespace {

using namespace std::chrono_literals;

const auto kNow = At("2024-03-13T12:00:00Z");

const std::vector<std::string> kRuleSets = {
    "core",         "money_mule",    "beneficiary", "account_takeover", "geolocation",
    "device_network", "behavioral", "relationship", "account_profile",  "check_fraud"};

std::shared_ptr<const RuleCatalog> ShippedCatalog() {
    std::vector<rules::RuleSet> rule_sets;
    for (const auto& name : kRuleSets) {
        rule_sets.push_back(LoadRuleSet(TRANSACTION_MONITOR_RULE_SETS_DIR, name));
    }
    return std::make_shared<const RuleCatalog>(RuleCatalog::FromRuleSets(rule_sets));
}

struct Pipeline {
    std::shared_ptr<MemoryLedger> ledger = std::make_shared<MemoryLedger>();
    std::shared_ptr<MemoryAssessmentStore> store = std::make_shared<MemoryAssessmentStore>();

    TransactionMonitor MakeMonitor() const {
        return TransactionMonitor{
            ContextAssembler{MakeSignalGroups(ledger, SignalGroupsConfig{}), 2000ms},
            RuleEvaluator{ShippedCatalog()}, RiskScorer{ScoringConfig{}},
            DecisionEngine{DecisionConfig{}}, store};
    }
};

std::vector<std::string> Names(const rules::AssessmentResult& assessment) {
    std::vector<std::string> names;
    for (const auto& rule : assessment.triggered_rules()) names.push_back(rule.name());
    return names;
}

bool HasRule(const rules::AssessmentResult& assessment, const std::string& name) {
    const auto names = Names(assessment);
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Twenty modest card payments spread over the last two months.
void AddRoutineHistory(MemoryLedger& ledger, const std::string& account_id) {
    for (int i = 0; i < 20; ++i) {
        ledger.AddTransaction(TransactionBuilder("H" + std::to_string(i), account_id)
                                  .Amount(80 + 5 * (i % 4))
                                  .Type("CARD")
                                  .Counterparty("MERCHANT-" + std::to_string(i % 3))
                                  .Timestamp(DaysBefore(kNow, 3 * i + 2))
                                  .Build());
    }
}

}  // namespace

UTEST(TransactionMonitor, LargeTransferFromBrandNewAccount) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-NEW", HoursBefore(kNow, 12), "standard", "active"});
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(
        TransactionBuilder("TX-A", "ACC-NEW").Amount(50000).Timestamp(kNow).Build());

    EXPECT_EQ(result.decision(), rules::AssessmentResult::MANUAL_REVIEW);
    EXPECT_EQ(result.review_status(), rules::AssessmentResult::PENDING);
    EXPECT_GE(result.risk_score(), 0.9);
    EXPECT_TRUE(HasRule(result, "core.large_amount"));
    EXPECT_TRUE(HasRule(result, "core.amount_deviation"));
    EXPECT_TRUE(HasRule(result, "core.low_activity_large_transfer"));
    EXPECT_TRUE(HasRule(result, "account_profile.brand_new_account"));
    EXPECT_TRUE(HasRule(result, "account_profile.young_account_large_transaction"));
    EXPECT_FALSE(HasRule(result, "device_network.blacklist_match"));

    const auto snapshot =
        Context::FromJson(userver::formats::json::FromString(result.context_snapshot()));
    EXPECT_EQ(snapshot.GetBool("account_age.is_brand_new_account"), true);
    EXPECT_EQ(snapshot.GetString("account_age.account_age_risk_level"), "critical");

    EXPECT_EQ(result.assessment_id(), "ASMT-TX-A");
    EXPECT_EQ(result.scoring_version(), "linear-v1");
    EXPECT_DOUBLE_EQ(monitor.GetScorer().Rescore(result), result.risk_score());
}

UTEST(TransactionMonitor, PaymentToFreshBeneficiary) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 400), "standard", "active"});
    AddRoutineHistory(*pipeline.ledger, "ACC-1");
    BeneficiaryRecord beneficiary;
    beneficiary.beneficiary_id = "BEN-9";
    beneficiary.account_id = "ACC-1";
    beneficiary.registered_at = HoursBefore(kNow, 2);
    beneficiary.registered_by = "ACC-1";
    pipeline.ledger->AddBeneficiary(beneficiary);
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(TransactionBuilder("TX-B", "ACC-1")
                                             .Amount(45000)
                                             .Counterparty("BEN-9")
                                             .Timestamp(kNow)
                                             .Build());

    EXPECT_EQ(result.decision(), rules::AssessmentResult::MANUAL_REVIEW);
    EXPECT_GE(result.risk_score(), 0.7);
    EXPECT_TRUE(HasRule(result, "core.large_amount"));
    EXPECT_TRUE(HasRule(result, "beneficiary.new_beneficiary_payment"));
    EXPECT_TRUE(HasRule(result, "relationship.new_counterparty"));
    EXPECT_TRUE(HasRule(result, "relationship.low_social_trust"));
    EXPECT_FALSE(HasRule(result, "account_profile.new_account"));

    const auto snapshot =
        Context::FromJson(userver::formats::json::FromString(result.context_snapshot()));
    EXPECT_EQ(snapshot.GetBool("beneficiary.is_new_beneficiary"), true);
    EXPECT_NEAR(snapshot.GetNumber("beneficiary.beneficiary_age_hours").value_or(-1), 2.0, 0.01);
    EXPECT_EQ(snapshot.GetString("velocity.deviation_method"), "no_history");
}

UTEST(TransactionMonitor, RoutinePaymentIsApproved) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 900), "standard", "active"});
    AddRoutineHistory(*pipeline.ledger, "ACC-1");
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(TransactionBuilder("TX-C", "ACC-1")
                                             .Amount(90)
                                             .Type("CARD")
                                             .Counterparty("MERCHANT-1")
                                             .Timestamp(kNow)
                                             .Build());

    EXPECT_EQ(result.decision(), rules::AssessmentResult::AUTO_APPROVE);
    EXPECT_EQ(result.review_status(), rules::AssessmentResult::APPROVED);
    EXPECT_LT(result.risk_score(), 0.6);
}

UTEST(TransactionMonitor, BlacklistedIpIsBlocked) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 900), "standard", "active"});
    AddRoutineHistory(*pipeline.ledger, "ACC-1");
    BlacklistEntry entry;
    entry.entity_type = "ip";
    entry.entity_value = "203.0.113.7";
    entry.reason = "credential stuffing";
    entry.severity = "high";
    pipeline.ledger->AddBlacklistEntry(entry);
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(TransactionBuilder("TX-D", "ACC-1")
                                             .Amount(90)
                                             .Type("CARD")
                                             .Counterparty("MERCHANT-1")
                                             .Timestamp(kNow)
                                             .Metadata(R"({"ip_address": "203.0.113.7"})")
                                             .Build());

    EXPECT_EQ(result.decision(), rules::AssessmentResult::BLOCKED);
    EXPECT_EQ(result.review_status(), rules::AssessmentResult::PENDING);
    EXPECT_TRUE(HasRule(result, "device_network.blacklist_match"));
}

UTEST(TransactionMonitor, DuplicateCheckDeposit) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 900), "standard", "active"});
    AddRoutineHistory(*pipeline.ledger, "ACC-1");
    pipeline.ledger->AddTransaction(TransactionBuilder("TX-CHK-1", "ACC-1")
                                        .Credit()
                                        .Type("CHECK")
                                        .Amount(2500)
                                        .Timestamp(DaysBefore(kNow, 4))
                                        .Metadata(R"({"check": {"check_number": "10042"}})")
                                        .Build());
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(TransactionBuilder("TX-CHK-2", "ACC-1")
                                             .Credit()
                                             .Type("CHECK")
                                             .Amount(2500)
                                             .Timestamp(kNow)
                                             .Metadata(R"({"check": {"check_number": 10042}})")
                                             .Build());

    EXPECT_TRUE(HasRule(result, "check_fraud.duplicate_check"));
    EXPECT_EQ(result.decision(), rules::AssessmentResult::MANUAL_REVIEW);

    const auto snapshot =
        Context::FromJson(userver::formats::json::FromString(result.context_snapshot()));
    const auto duplicates = snapshot.GetList("check.duplicate_checks");
    ASSERT_TRUE(duplicates.has_value());
    ASSERT_EQ(duplicates->GetSize(), 1u);
    EXPECT_EQ((*duplicates)[0]["transaction_id"].As<std::string>(), "TX-CHK-1");
}

UTEST(TransactionMonitor, MalformedHistoryDoesNotAbortEvaluation) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 900), "standard", "active"});
    AddRoutineHistory(*pipeline.ledger, "ACC-1");
    pipeline.ledger->AddTransaction(TransactionBuilder("TX-BAD", "ACC-1")
                                        .Timestamp(DaysBefore(kNow, 1))
                                        .Metadata("{not json")
                                        .Build());
    const auto monitor = pipeline.MakeMonitor();

    const auto result = monitor.Evaluate(TransactionBuilder("TX-H", "ACC-1")
                                             .Amount(90)
                                             .Type("CARD")
                                             .Counterparty("MERCHANT-1")
                                             .Timestamp(kNow)
                                             .Metadata(R"({"geolocation": {"country": "US"}})")
                                             .Build());

    EXPECT_EQ(pipeline.store->Size(), 1u);
    const auto snapshot =
        Context::FromJson(userver::formats::json::FromString(result.context_snapshot()));
    const auto skipped = snapshot.GetNumber("assembler.skipped_records");
    ASSERT_TRUE(skipped.has_value());
    EXPECT_GE(*skipped, 1.0);
    EXPECT_EQ(snapshot.GetNumber("geo.skipped_records"), 1.0);
}

UTEST(TransactionMonitor, DeterministicForSameLedger) {
    Pipeline first;
    Pipeline second;
    second.ledger = first.ledger;
    first.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 20), "standard", "active"});
    AddRoutineHistory(*first.ledger, "ACC-1");

    const auto tx = TransactionBuilder("TX-E", "ACC-1")
                        .Amount(12000)
                        .Counterparty("BEN-NEW")
                        .Timestamp(kNow)
                        .Metadata(R"({"ip_address": "198.51.100.20", "geolocation": {"country": "US"}})")
                        .Build();
    const auto a = first.MakeMonitor().Evaluate(tx);
    const auto b = second.MakeMonitor().Evaluate(tx);

    EXPECT_EQ(a.risk_score(), b.risk_score());
    EXPECT_EQ(a.decision(), b.decision());
    EXPECT_EQ(Names(a), Names(b));
}

UTEST(TransactionMonitor, RetryReturnsStoredAssessment) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-NEW", HoursBefore(kNow, 12), "standard", "active"});
    const auto monitor = pipeline.MakeMonitor();
    const auto tx = TransactionBuilder("TX-F", "ACC-NEW").Amount(50000).Timestamp(kNow).Build();

    const auto first = monitor.Evaluate(tx);
    // The ledger changes between attempts; the stored decision stands.
    pipeline.ledger->AddAccount({"ACC-NEW", DaysBefore(kNow, 3000), "standard", "active"});
    const auto retry = monitor.Evaluate(tx);

    EXPECT_EQ(pipeline.store->Size(), 1u);
    EXPECT_EQ(retry.assessment_id(), first.assessment_id());
    EXPECT_EQ(retry.created_at(), first.created_at());
    EXPECT_EQ(retry.risk_score(), first.risk_score());
}

UTEST(TransactionMonitor, NoDecisionWithoutPersistence) {
    Pipeline pipeline;
    pipeline.ledger->AddAccount({"ACC-1", DaysBefore(kNow, 900), "standard", "active"});
    pipeline.store->SetAvailable(false);
    const auto monitor = pipeline.MakeMonitor();

    EXPECT_THROW(monitor.Evaluate(TransactionBuilder("TX-G", "ACC-1").Build()), PersistenceError);
    pipeline.store->SetAvailable(true);
    EXPECT_EQ(pipeline.store->Size(), 0u);
}

UTEST(TransactionMonitor, FailuresAreReported) {
    Pipeline pipeline;
    const auto monitor = pipeline.MakeMonitor();

    auto invalid = TransactionBuilder("TX-H", "ACC-1").Build();
    invalid.clear_account_id();
    EXPECT_THROW(monitor.Evaluate(invalid), InvalidTransactionError);

    pipeline.ledger->SetAvailable(false);
    EXPECT_THROW(monitor.Evaluate(TransactionBuilder("TX-I", "ACC-1").Build()),
                 LedgerUnavailableError);
    EXPECT_EQ(pipeline.store->Size(), 0u);
}

}  // namespace transaction_monitor
