#include "rule_catalog.hpp"

#include <userver/fs/blocking/temp_directory.hpp>
#include <userver/fs/blocking/write.hpp>
#include <userver/utest/utest.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

const std::vector<std::string> kRuleSets = {
    "core",         "money_mule",    "beneficiary", "account_takeover", "geolocation",
    "device_network", "behavioral", "relationship", "account_profile",  "check_fraud"};

constexpr const char* kSmallSet = R"({
    "name": "demo",
    "rules": [
        {"name": "large", "weight": 1.5,
         "builtin": {"predicate": "amount_threshold", "params": {"min_amount": 10000}}},
        {"name": "flagged", "weight": 2.0, "hard_override": true,
         "expression": {"signal": {"key": "blacklist.is_blacklisted"}}}
    ]
})";

}  // namespace

UTEST(RuleCatalog, PrefixesRulesWithSetName) {
    const auto catalog = RuleCatalog::FromRuleSets({ParseRuleSet(kSmallSet)});

    ASSERT_EQ(catalog.Size(), 2u);
    EXPECT_EQ(catalog.GetRules()[0]->GetConfig().name(), "demo.large");
    EXPECT_EQ(catalog.GetRules()[1]->GetConfig().name(), "demo.flagged");
    ASSERT_NE(catalog.Find("demo.flagged"), nullptr);
    EXPECT_TRUE(catalog.Find("demo.flagged")->GetConfig().hard_override());
    EXPECT_EQ(catalog.Find("large"), nullptr);
}

UTEST(RuleCatalog, RejectsDuplicates) {
    const auto rule_set = ParseRuleSet(kSmallSet);
    EXPECT_THROW(RuleCatalog::FromRuleSets({rule_set, rule_set}), RuleConfigError);

    auto other = rule_set;
    other.set_name("other");
    EXPECT_EQ(RuleCatalog::FromRuleSets({rule_set, other}).Size(), 4u);
}

UTEST(RuleCatalog, RejectsInvalidRules) {
    EXPECT_THROW(ParseRuleSet(R"({"name": "x", "rules": [{"name": "a", "wieght": 1}]})"),
                 RuleConfigError);
    EXPECT_THROW(ParseRuleSet("not json"), RuleConfigError);

    const auto negative = ParseRuleSet(R"({"name": "x", "rules": [{"name": "a", "weight": -1,
        "builtin": {"predicate": "new_country"}}]})");
    EXPECT_THROW(RuleCatalog::FromRuleSets({negative}), RuleConfigError);

    const auto no_predicate = ParseRuleSet(R"({"name": "x", "rules": [{"name": "a", "weight": 1}]})");
    EXPECT_THROW(RuleCatalog::FromRuleSets({no_predicate}), RuleConfigError);

    const auto unnamed = ParseRuleSet(R"({"name": "x", "rules": [{"weight": 1,
        "builtin": {"predicate": "new_country"}}]})");
    EXPECT_THROW(RuleCatalog::FromRuleSets({unnamed}), RuleConfigError);

    const auto anonymous_set = ParseRuleSet(R"({"rules": []})");
    EXPECT_THROW(RuleCatalog::FromRuleSets({anonymous_set}), RuleConfigError);
}

UTEST(RuleCatalog, LoadsShippedRuleSets) {
    std::vector<rules::RuleSet> rule_sets;
    for (const auto& name : kRuleSets) {
        rule_sets.push_back(LoadRuleSet(TRANSACTION_MONITOR_RULE_SETS_DIR, name));
    }
    const auto catalog = RuleCatalog::FromRuleSets(rule_sets);
    EXPECT_GT(catalog.Size(), 40u);

    ASSERT_NE(catalog.Find("device_network.blacklist_match"), nullptr);
    EXPECT_TRUE(catalog.Find("device_network.blacklist_match")->GetConfig().hard_override());
    ASSERT_NE(catalog.Find("geolocation.blocked_location"), nullptr);
    EXPECT_TRUE(catalog.Find("geolocation.blocked_location")->GetConfig().hard_override());
    ASSERT_NE(catalog.Find("core.large_amount"), nullptr);
    EXPECT_FALSE(catalog.Find("core.large_amount")->GetConfig().hard_override());

    for (const auto& rule : catalog.GetRules()) {
        EXPECT_GE(rule->GetConfig().weight(), 0.0) << rule->GetConfig().name();
        EXPECT_FALSE(rule->GetConfig().category().empty()) << rule->GetConfig().name();
    }
}

UTEST(RuleCatalog, FileMustDeclareItsName) {
    const auto dir = userver::fs::blocking::TempDirectory::Create();
    userver::fs::blocking::RewriteFileContents(dir.GetPath() + "/renamed.json", kSmallSet);

    EXPECT_THROW(LoadRuleSet(dir.GetPath(), "renamed"), RuleConfigError);
    EXPECT_THROW(LoadRuleSet(dir.GetPath(), "missing_set"), RuleConfigError);
    EXPECT_EQ(LoadRuleSet(TRANSACTION_MONITOR_RULE_SETS_DIR, "core").name(), "core");
}

}  // namespace transaction_monitor
