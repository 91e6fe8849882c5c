#include "assessment_store.hpp"

#include <fmt/format.h>

#include <userver/formats/json/exception.hpp>
#include <userver/formats/json/serialize.hpp>
#include <userver/formats/json/value_builder.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor::assessment_codec {

std::string DecisionToString(rules::AssessmentResult::Decision decision) {
    switch (decision) {
        case rules::AssessmentResult::AUTO_APPROVE:
            return "auto_approve";
        case rules::AssessmentResult::MANUAL_REVIEW:
            return "manual_review";
        case rules::AssessmentResult::BLOCKED:
            return "blocked";
        default:
            throw PersistenceError(fmt::format("Cannot store decision {}", static_cast<int>(decision)));
    }
}

rules::AssessmentResult::Decision DecisionFromString(const std::string& decision) {
    if (decision == "auto_approve") return rules::AssessmentResult::AUTO_APPROVE;
    if (decision == "manual_review") return rules::AssessmentResult::MANUAL_REVIEW;
    if (decision == "blocked") return rules::AssessmentResult::BLOCKED;
    throw PersistenceError(fmt::format("Unknown stored decision '{}'", decision));
}

std::string ReviewStatusToString(rules::AssessmentResult::ReviewStatus status) {
    switch (status) {
        case rules::AssessmentResult::PENDING:
            return "pending";
        case rules::AssessmentResult::APPROVED:
            return "approved";
        case rules::AssessmentResult::REJECTED:
            return "rejected";
        case rules::AssessmentResult::ESCALATED:
            return "escalated";
        default:
            throw PersistenceError(
                fmt::format("Cannot store review status {}", static_cast<int>(status)));
    }
}

rules::AssessmentResult::ReviewStatus ReviewStatusFromString(const std::string& status) {
    if (status == "pending") return rules::AssessmentResult::PENDING;
    if (status == "approved") return rules::AssessmentResult::APPROVED;
    if (status == "rejected") return rules::AssessmentResult::REJECTED;
    if (status == "escalated") return rules::AssessmentResult::ESCALATED;
    throw PersistenceError(fmt::format("Unknown stored review status '{}'", status));
}

std::string TriggeredRulesToJson(const rules::AssessmentResult& assessment) {
    userver::formats::json::ValueBuilder list(userver::formats::common::Type::kArray);
    for (const auto& rule : assessment.triggered_rules()) {
        userver::formats::json::ValueBuilder item;
        item["name"] = rule.name();
        item["weight"] = rule.weight();
        item["description"] = rule.description();
        item["category"] = rule.category();
        item["hard_override"] = rule.hard_override();
        list.PushBack(std::move(item));
    }
    return userver::formats::json::ToString(list.ExtractValue());
}

void TriggeredRulesFromJson(const std::string& json, rules::AssessmentResult& assessment) {
    try {
        const auto list = userver::formats::json::FromString(json);
        if (!list.IsArray()) {
            throw PersistenceError(fmt::format(
                "Stored triggered rules of {} are not a JSON array", assessment.assessment_id()));
        }
        for (const auto& item : list) {
            auto* rule = assessment.add_triggered_rules();
            rule->set_name(item["name"].As<std::string>());
            rule->set_weight(item["weight"].As<double>());
            rule->set_description(item["description"].As<std::string>(""));
            rule->set_category(item["category"].As<std::string>(""));
            rule->set_hard_override(item["hard_override"].As<bool>(false));
        }
    } catch (const userver::formats::json::Exception& e) {
        throw PersistenceError(fmt::format("Stored triggered rules of {} are malformed: {}",
                                           assessment.assessment_id(), e.what()));
    }
}

}  // namespace transaction_monitor::assessment_codec
