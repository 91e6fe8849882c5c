#include "rule_catalog.hpp"

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>

#include <userver/logging/log.hpp>

#include "errors/errors.hpp"
#include "rule_factory/rule_factory.hpp"

namespace transaction_monitor {

RuleCatalog RuleCatalog::FromRuleSets(const std::vector<rules::RuleSet>& rule_sets) {
    RuleCatalog catalog;
    for (const auto& rule_set : rule_sets) {
        catalog.Append(rule_set);
    }
    return catalog;
}

void RuleCatalog::Append(const rules::RuleSet& rule_set) {
    if (rule_set.name().empty()) {
        throw RuleConfigError("Rule set without name");
    }
    for (const auto& rule : rule_set.rules()) {
        if (rule.name().empty()) {
            throw RuleConfigError(fmt::format("Rule set {} has a rule without name", rule_set.name()));
        }
        rules::RuleConfig config = rule;
        config.set_name(fmt::format("{}.{}", rule_set.name(), rule.name()));
        Add(RuleFactory::CreateRule(config));
    }
    LOG_INFO() << fmt::format("Loaded rule set {} with {} rules", rule_set.name(),
                              rule_set.rules_size());
}

void RuleCatalog::Add(RulePtr rule) {
    const auto& name = rule->GetConfig().name();
    if (!names_.insert(name).second) {
        throw RuleConfigError(fmt::format("Duplicate rule name {}", name));
    }
    rules_.push_back(std::move(rule));
}

const IRule* RuleCatalog::Find(const std::string& name) const {
    for (const auto& rule : rules_) {
        if (rule->GetConfig().name() == name) return rule.get();
    }
    return nullptr;
}

rules::RuleSet ParseRuleSet(const std::string& json) {
    rules::RuleSet rule_set;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    auto status = google::protobuf::util::JsonStringToMessage(json, &rule_set, options);
    if (!status.ok()) {
        throw RuleConfigError(fmt::format("Invalid rule set JSON: {}", status.ToString()));
    }
    return rule_set;
}

rules::RuleSet LoadRuleSet(const std::string& dir, const std::string& name) {
    const std::string path = dir + "/" + name + ".json";
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RuleConfigError(fmt::format("Cannot open rule set file {}", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto rule_set = ParseRuleSet(buffer.str());
    if (rule_set.name() != name) {
        throw RuleConfigError(fmt::format("Rule set file {} declares set '{}'", path, rule_set.name()));
    }
    return rule_set;
}

}  // namespace transaction_monitor
