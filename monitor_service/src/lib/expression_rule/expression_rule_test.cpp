#include "expression_rule.hpp"

#include <stdexcept>

#include <google/protobuf/util/json_util.h>

#include <userver/utest/utest.hpp>

#include "errors/errors.hpp"
#include "testing/fixtures.hpp"

namespace transaction_monitor {

using test_utils::TransactionBuilder;

namespace {

rules::RuleConfig Rule(const std::string& expression_json) {
    rules::RuleConfig config;
    const auto status = google::protobuf::util::JsonStringToMessage(
        R"({"name": "test_rule", "weight": 1.0, "expression": )" + expression_json + "}", &config);
    if (!status.ok()) {
        throw std::invalid_argument(status.ToString());
    }
    return config;
}

Context MakeContext() {
    ContextFragment fragment{"velocity"};
    fragment.SetNumber("tx_count_24h", 12);
    fragment.SetBool("is_small_deposit", false);
    fragment.SetString("deviation_method", "sigma");
    fragment.SetNumber("avg_amount", std::nullopt);
    Context context;
    context.Merge(fragment);
    return context;
}

constexpr const char* kLargeAndBusy = R"({"logical": {"operator": "AND", "operands": [
    {"comparison": {"left": {"field": {"field": "AMOUNT"}}, "operator": "GREATER_THAN_OR_EQUAL",
                    "right": {"literal": {"number_value": 5000}}}},
    {"comparison": {"left": {"signal": {"key": "velocity.tx_count_24h"}}, "operator": "GREATER_THAN",
                    "right": {"literal": {"number_value": 10}}}}]}})";

}  // namespace

TEST(ExpressionRule, FieldsAndSignals) {
    const ExpressionRule rule{Rule(kLargeAndBusy)};
    const auto context = MakeContext();
    EXPECT_TRUE(rule.IsTriggered(TransactionBuilder("T1", "ACC-1").Amount(6000).Build(), context));
    EXPECT_FALSE(rule.IsTriggered(TransactionBuilder("T1", "ACC-1").Amount(4000).Build(), context));
}

TEST(ExpressionRule, DirectionAndLike) {
    const ExpressionRule rule{Rule(R"({"logical": {"operator": "OR", "operands": [
        {"comparison": {"left": {"field": {"field": "DIRECTION"}}, "operator": "EQUAL",
                        "right": {"literal": {"string_value": "CREDIT"}}}},
        {"comparison": {"left": {"field": {"field": "DESCRIPTION"}}, "operator": "LIKE",
                        "right": {"literal": {"string_value": "gift card"}}}}]}})")};

    auto tx = TransactionBuilder("T1", "ACC-1").Debit().Build();
    EXPECT_FALSE(rule.IsTriggered(tx, Context{}));
    tx.set_description("urgent gift card purchase");
    EXPECT_TRUE(rule.IsTriggered(tx, Context{}));
    EXPECT_TRUE(rule.IsTriggered(TransactionBuilder("T2", "ACC-1").Credit().Build(), Context{}));
}

TEST(ExpressionRule, AbsentOperandsNeverTrigger) {
    const auto tx = TransactionBuilder("T1", "ACC-1").Build();
    const auto context = MakeContext();

    const ExpressionRule null_signal{Rule(R"({"comparison": {
        "left": {"signal": {"key": "velocity.avg_amount"}}, "operator": "LESS_THAN",
        "right": {"literal": {"number_value": 100}}}})")};
    EXPECT_FALSE(null_signal.IsTriggered(tx, context));

    const ExpressionRule missing_flag{Rule(R"({"signal": {"key": "geo.is_impossible_travel"}})")};
    EXPECT_FALSE(missing_flag.IsTriggered(tx, context));

    const ExpressionRule no_counterparty{Rule(R"({"comparison": {
        "left": {"field": {"field": "COUNTERPARTY_ID"}}, "operator": "NOT_EQUAL",
        "right": {"literal": {"string_value": "BEN-1"}}}})")};
    EXPECT_FALSE(no_counterparty.IsTriggered(tx, context));

    // NOT inverts the comparison result, absent or not.
    const ExpressionRule negated{Rule(R"({"logical": {"operator": "NOT", "operands": [
        {"comparison": {"left": {"signal": {"key": "velocity.avg_amount"}}, "operator": "LESS_THAN",
                        "right": {"literal": {"number_value": 100}}}}]}})")};
    EXPECT_TRUE(negated.IsTriggered(tx, context));
}

TEST(ExpressionRule, MistypedSignalsAreMalformed) {
    const auto tx = TransactionBuilder("T1", "ACC-1").Build();
    const auto context = MakeContext();

    const ExpressionRule mismatch{Rule(R"({"comparison": {
        "left": {"signal": {"key": "velocity.deviation_method"}}, "operator": "GREATER_THAN",
        "right": {"literal": {"number_value": 3}}}})")};
    EXPECT_THROW(mismatch.IsTriggered(tx, context), MalformedContextError);

    const ExpressionRule not_a_flag{Rule(R"({"signal": {"key": "velocity.tx_count_24h"}})")};
    EXPECT_THROW(not_a_flag.IsTriggered(tx, context), MalformedContextError);
}

TEST(ExpressionRule, RejectsNonBooleanTrees) {
    EXPECT_THROW(ExpressionRule{Rule(R"({"literal": {"number_value": 1}})")}, RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"field": {"field": "AMOUNT"}})")}, RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"field": {"field": "AMOUNT"}}, "right": {"literal": {"number_value": 1}}}})")},
                 RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"logical": {"operator": "NOT", "operands": [
        {"signal": {"key": "a.b"}}, {"signal": {"key": "a.c"}}]}})")},
                 RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"logical": {"operator": "AND", "operands": []}})")},
                 RuleConfigError);

    rules::RuleConfig no_expression;
    no_expression.set_name("empty");
    EXPECT_THROW(ExpressionRule{no_expression}, RuleConfigError);
}

TEST(ExpressionRule, RejectsMistypedComparisons) {
    // LIKE against a number.
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"signal": {"key": "velocity.deviation_method"}}, "operator": "LIKE",
        "right": {"literal": {"number_value": 3}}}})")},
                 RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"field": {"field": "AMOUNT"}}, "operator": "LIKE",
        "right": {"signal": {"key": "velocity.deviation_method"}}}})")},
                 RuleConfigError);
    // Ordering of strings and booleans.
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"signal": {"key": "account_age.account_status"}}, "operator": "GREATER_THAN",
        "right": {"literal": {"string_value": "active"}}}})")},
                 RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"signal": {"key": "geo.is_high_risk"}}, "operator": "LESS_THAN",
        "right": {"literal": {"bool_value": true}}}})")},
                 RuleConfigError);
    // Operands of known different types.
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"field": {"field": "AMOUNT"}}, "operator": "EQUAL",
        "right": {"literal": {"string_value": "5000"}}}})")},
                 RuleConfigError);
    EXPECT_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"field": {"field": "TRANSACTION_TYPE"}}, "operator": "NOT_EQUAL",
        "right": {"literal": {"bool_value": false}}}})")},
                 RuleConfigError);

    // Signal operands stay open until evaluation.
    EXPECT_NO_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"signal": {"key": "geo.country"}}, "operator": "LIKE",
        "right": {"literal": {"string_value": "U"}}}})")});
    EXPECT_NO_THROW(ExpressionRule{Rule(R"({"comparison": {
        "left": {"signal": {"key": "geo.is_high_risk"}}, "operator": "NOT_EQUAL",
        "right": {"literal": {"bool_value": false}}}})")});
}

}  // namespace transaction_monitor
