#include "decision_engine.hpp"

#include <userver/formats/json/serialize.hpp>
#include <userver/utest/utest.hpp>

#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::TransactionBuilder;

namespace {

rules::TriggeredRule Triggered(const std::string& name, double weight, bool hard_override = false) {
    rules::TriggeredRule rule;
    rule.set_name(name);
    rule.set_weight(weight);
    rule.set_hard_override(hard_override);
    return rule;
}

}  // namespace

UTEST(DecisionEngine, ScoreThreshold) {
    const DecisionEngine engine{DecisionConfig{}};
    EXPECT_EQ(engine.Classify(0.0, {}), rules::AssessmentResult::AUTO_APPROVE);
    EXPECT_EQ(engine.Classify(0.59, {}), rules::AssessmentResult::AUTO_APPROVE);
    EXPECT_EQ(engine.Classify(0.6, {}), rules::AssessmentResult::MANUAL_REVIEW);
    EXPECT_EQ(engine.Classify(1.0, {}), rules::AssessmentResult::MANUAL_REVIEW);
}

UTEST(DecisionEngine, HardOverrideBlocksAtAnyScore) {
    const DecisionEngine engine{DecisionConfig{}};
    const TriggeredRules triggered = {Triggered("geo.low", 0.0, true)};
    EXPECT_EQ(engine.Classify(0.0, triggered), rules::AssessmentResult::BLOCKED);
    EXPECT_EQ(engine.Classify(1.0, triggered), rules::AssessmentResult::BLOCKED);
}

UTEST(DecisionEngine, BuildsAssessmentRecord) {
    const DecisionEngine engine{DecisionConfig{}};
    const auto tx = TransactionBuilder("TX-42", "ACC-1").Build();
    ContextFragment fragment{"velocity"};
    fragment.SetNumber("tx_count_24h", 3);
    Context context;
    context.Merge(fragment);

    const TriggeredRules triggered = {Triggered("core.large_amount", 1.5),
                                      Triggered("beneficiary.new_beneficiary_payment", 3.5)};
    const auto result = engine.Decide(tx, 0.5, triggered, "linear-v1", context);

    EXPECT_EQ(result.assessment_id(), "ASMT-TX-42");
    EXPECT_EQ(result.transaction_id(), "TX-42");
    EXPECT_DOUBLE_EQ(result.risk_score(), 0.5);
    EXPECT_EQ(result.decision(), rules::AssessmentResult::AUTO_APPROVE);
    EXPECT_EQ(result.review_status(), rules::AssessmentResult::APPROVED);
    EXPECT_EQ(result.scoring_version(), "linear-v1");
    ASSERT_EQ(result.triggered_rules_size(), 2);
    EXPECT_EQ(result.triggered_rules(1).name(), "beneficiary.new_beneficiary_payment");
    EXPECT_FALSE(result.created_at().empty());

    const auto snapshot =
        Context::FromJson(userver::formats::json::FromString(result.context_snapshot()));
    EXPECT_EQ(snapshot.GetNumber("velocity.tx_count_24h"), 3.0);
}

UTEST(DecisionEngine, NonApprovedDecisionsArePending) {
    const DecisionEngine engine{DecisionConfig{}};
    const auto tx = TransactionBuilder("TX-1", "ACC-1").Build();

    const auto review = engine.Decide(tx, 0.7, {}, "linear-v1", Context{});
    EXPECT_EQ(review.decision(), rules::AssessmentResult::MANUAL_REVIEW);
    EXPECT_EQ(review.review_status(), rules::AssessmentResult::PENDING);

    const auto blocked =
        engine.Decide(tx, 0.1, {Triggered("x.blacklist", 10.0, true)}, "linear-v1", Context{});
    EXPECT_EQ(blocked.decision(), rules::AssessmentResult::BLOCKED);
    EXPECT_EQ(blocked.review_status(), rules::AssessmentResult::PENDING);
}

UTEST(DecisionEngine, ThresholdMustBeProbability) {
    EXPECT_THROW(DecisionEngine(DecisionConfig{1.5}), std::invalid_argument);
    EXPECT_THROW(DecisionEngine(DecisionConfig{-0.1}), std::invalid_argument);
    EXPECT_NO_THROW(DecisionEngine(DecisionConfig{0.0}));
}

}  // namespace transaction_monitor
