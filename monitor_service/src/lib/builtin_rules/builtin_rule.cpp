#include "builtin_rule.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "errors/errors.hpp"
#include "signal_groups/signal_group.hpp"

namespace transaction_monitor {

namespace {

using transaction::Transaction;

bool Flag(const Context& context, std::string_view key) {
    return context.GetBool(key).value_or(false);
}

bool AtLeast(const Context& context, std::string_view key, double threshold) {
    const auto value = context.GetNumber(key);
    return value && *value >= threshold;
}

bool AtMost(const Context& context, std::string_view key, double threshold) {
    const auto value = context.GetNumber(key);
    return value && *value <= threshold;
}

std::string Hours(const PredicateParams& params, const std::string& name) {
    return signal_utils::WindowName(params.GetInt(name));
}

int SeverityOf(const Context& context, std::string_view key) {
    const auto severity = context.GetString(key);
    return severity ? signal_utils::SeverityRank(*severity) : 0;
}

bool IsOutbound(const Transaction& tx) {
    return signal_utils::IsOutbound(tx);
}

// Beneficiary change counters exist for 24h, 7d and 30d.
std::string ChangeCounterKey(int window_hours) {
    if (window_hours <= 24) return "beneficiary.changes_24h";
    if (window_hours <= 7 * 24) return "beneficiary.changes_7d";
    return "beneficiary.changes_30d";
}

std::unordered_map<std::string, PredicateDefinition> MakePredicates() {
    std::unordered_map<std::string, PredicateDefinition> predicates;

    // Transaction profile.
    predicates["amount_threshold"] = {
        {{"min_amount", 10000.0}, {"outbound_only", 0.0}},
        [](const Transaction& tx, const Context&, const PredicateParams& p) {
            return tx.amount() >= p.Get("min_amount") && (!p.GetFlag("outbound_only") || IsOutbound(tx));
        }};
    predicates["high_velocity"] = {
        {{"window_hours", 24.0}, {"max_count", 10.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            const auto count = ctx.GetNumber("velocity.tx_count_" + Hours(p, "window_hours"));
            return count && *count > p.Get("max_count");
        }};
    predicates["amount_deviation"] = {
        {{"min_deviation", 3.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(ctx, "velocity.amount_deviation", p.Get("min_deviation"));
        }};
    predicates["low_activity_large_transfer"] = {
        {{"max_prior_count", 5.0}, {"min_amount", 5000.0}, {"min_multiple", 5.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            if (!IsOutbound(tx) || tx.amount() < p.Get("min_amount")) return false;
            if (!AtMost(ctx, "velocity.total_tx_count_period", p.Get("max_prior_count"))) {
                return false;
            }
            const auto average = ctx.GetNumber("velocity.avg_amount");
            return !average || tx.amount() >= *average * p.Get("min_multiple");
        }};
    predicates["small_deposit_burst"] = {
        {{"window_hours", 24.0}, {"min_count", 3.0}, {"min_withdrawal", 1000.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            if (!AtLeast(ctx, "velocity.small_deposit_count_" + Hours(p, "window_hours"),
                         p.Get("min_count"))) {
                return false;
            }
            return IsOutbound(tx) && tx.amount() >= p.Get("min_withdrawal");
        }};

    // Money mule.
    predicates["money_mule_flow_through"] = {
        {{"window_hours", 72.0}, {"min_ratio", 0.8}, {"min_incoming_count", 3.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            const auto window = Hours(p, "window_hours");
            return AtLeast(ctx, "mule.incoming_count_" + window, p.Get("min_incoming_count")) &&
                   AtLeast(ctx, "mule.flow_through_ratio_" + window, p.Get("min_ratio"));
        }};
    predicates["rapid_pass_through"] = {
        {{"max_hours", 24.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) && AtMost(ctx, "mule.avg_hours_to_transfer", p.Get("max_hours"));
        }};

    // Beneficiaries.
    predicates["new_beneficiary_payment"] = {
        {{"min_amount", 0.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) && tx.amount() >= p.Get("min_amount") &&
                   Flag(ctx, "beneficiary.is_new_beneficiary");
        }};
    predicates["bulk_beneficiary_registration"] = {
        {{"window_hours", 24.0}, {"min_count", 3.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(ctx, "beneficiary.added_count_" + Hours(p, "window_hours"),
                           p.Get("min_count"));
        }};
    predicates["beneficiary_recent_change"] = {
        {{"window_hours", 168.0}, {"min_changes", 1.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) &&
                   AtLeast(ctx, ChangeCounterKey(p.GetInt("window_hours")), p.Get("min_changes"));
        }};
    predicates["beneficiary_unverified_change"] = {
        {{"min_count", 1.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) &&
                   AtLeast(ctx, "beneficiary.unverified_changes_7d", p.Get("min_count"));
        }};
    predicates["beneficiary_suspicious_change_source"] = {
        {{"min_count", 1.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) &&
                   AtLeast(ctx, "beneficiary.suspicious_source_changes_7d", p.Get("min_count"));
        }};
    predicates["beneficiary_change_off_hours"] = {
        {{"min_count", 1.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            const double count =
                ctx.GetNumber("beneficiary.weekend_changes_7d").value_or(0.0) +
                ctx.GetNumber("beneficiary.off_hours_changes_7d").value_or(0.0);
            return IsOutbound(tx) && count >= p.Get("min_count");
        }};
    predicates["first_payment_after_change"] = {
        {},
        [](const Transaction& tx, const Context& ctx, const PredicateParams&) {
            return IsOutbound(tx) && Flag(ctx, "beneficiary.first_payment_after_change");
        }};

    // Account takeover.
    predicates["credential_change_before_outbound"] = {
        {{"max_hours", 72.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return IsOutbound(tx) && AtMost(ctx, "ato.hours_since_change", p.Get("max_hours"));
        }};
    predicates["first_outbound_after_change"] = {
        {{"max_hours", 168.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return Flag(ctx, "ato.is_first_outbound_after_change") &&
                   AtMost(ctx, "ato.hours_since_change", p.Get("max_hours"));
        }};

    // Time of day.
    predicates["odd_hour_deviation"] = {
        {{"include_weekend", 0.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return Flag(ctx, "odd_hours.deviates_from_pattern") ||
                   (p.GetFlag("include_weekend") && Flag(ctx, "odd_hours.weekend_deviation"));
        }};

    // Geolocation.
    predicates["high_risk_location"] = {
        {{"min_severity_rank", 3.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            if (!Flag(ctx, "geo.is_high_risk_location")) return false;
            return Flag(ctx, "geo.is_sanctioned") || Flag(ctx, "geo.is_embargoed") ||
                   SeverityOf(ctx, "geo.high_risk_severity") >= p.GetInt("min_severity_rank");
        }};
    predicates["blocked_location"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "geo.block_by_default");
        }};
    predicates["new_country"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "geo.is_new_country");
        }};
    predicates["primary_country_deviation"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "geo.deviates_from_primary_country");
        }};
    predicates["impossible_travel"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "geo.is_impossible_travel");
        }};

    // Watchlists and networks.
    predicates["blacklist_match"] = {
        {{"min_severity_rank", 0.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return Flag(ctx, "blacklist.is_blacklisted") &&
                   SeverityOf(ctx, "blacklist.max_severity") >= p.GetInt("min_severity_rank");
        }};
    predicates["anonymized_network"] = {
        {{"min_confidence", 0.5}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return Flag(ctx, "vpn.is_anonymized") &&
                   AtLeast(ctx, "vpn.max_confidence", p.Get("min_confidence"));
        }};

    // Devices and sessions.
    predicates["new_device"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "device.is_new_device");
        }};
    predicates["shared_device"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "device.is_shared_device");
        }};
    predicates["risky_device"] = {
        {{"min_confidence", 0.7}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(ctx, "device.max_risk_confidence", p.Get("min_confidence"));
        }};
    predicates["behavioral_anomaly"] = {
        {{"min_deviations", 1.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(ctx, "biometrics.deviation_count", p.Get("min_deviations"));
        }};
    predicates["behavioral_flip"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "biometrics.autofill_flip");
        }};

    // Relationship.
    predicates["new_counterparty"] = {
        {{"min_amount", 0.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return tx.amount() >= p.Get("min_amount") &&
                   Flag(ctx, "relationship.is_new_counterparty");
        }};
    predicates["dormant_reactivation"] = {
        {{"min_amount", 0.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return tx.amount() >= p.Get("min_amount") &&
                   Flag(ctx, "relationship.is_dormant_reactivation");
        }};
    predicates["low_social_trust"] = {
        {{"max_score", 40.0}, {"min_amount", 0.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            const auto score = ctx.GetNumber("relationship.social_trust_score");
            return score && *score < p.Get("max_score") && tx.amount() >= p.Get("min_amount");
        }};

    // Account profile.
    predicates["brand_new_account"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "account_age.is_brand_new_account");
        }};
    predicates["new_account"] = {
        {{"min_amount", 0.0}},
        [](const Transaction& tx, const Context& ctx, const PredicateParams& p) {
            return tx.amount() >= p.Get("min_amount") && Flag(ctx, "account_age.is_new_account");
        }};
    predicates["young_account_large_transaction"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "account_age.is_large_transaction_young_account");
        }};
    predicates["prior_fraud_account"] = {
        {{"window_days", 365.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(ctx, fmt::format("fraud_history.account_flags_{}d", p.GetInt("window_days")),
                           1.0);
        }};
    predicates["prior_fraud_counterparty"] = {
        {{"window_days", 365.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return AtLeast(
                ctx, fmt::format("fraud_history.counterparty_flags_{}d", p.GetInt("window_days")),
                1.0);
        }};
    predicates["repeat_offender"] = {
        {{"include_counterparty", 1.0}},
        [](const Transaction&, const Context& ctx, const PredicateParams& p) {
            return Flag(ctx, "fraud_history.account_is_repeat_offender") ||
                   (p.GetFlag("include_counterparty") &&
                    Flag(ctx, "fraud_history.counterparty_is_repeat_offender"));
        }};
    predicates["escalating_severity"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "fraud_history.account_escalating_severity") ||
                   Flag(ctx, "fraud_history.counterparty_escalating_severity");
        }};

    // Checks.
    predicates["duplicate_check"] = {
        {},
        [](const Transaction&, const Context& ctx, const PredicateParams&) {
            return Flag(ctx, "check.is_duplicate_check");
        }};

    return predicates;
}

}  // namespace

PredicateParams::PredicateParams(std::map<std::string, double> values)
    : values_(std::move(values)) {}

double PredicateParams::Get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw RuleConfigError(fmt::format("Predicate parameter '{}' is not declared", name));
    }
    return it->second;
}

int PredicateParams::GetInt(const std::string& name) const {
    return static_cast<int>(std::lround(Get(name)));
}

const std::unordered_map<std::string, PredicateDefinition>& BuiltinRule::GetPredicates() {
    static const std::unordered_map<std::string, PredicateDefinition> predicates = MakePredicates();
    return predicates;
}

std::vector<std::string> BuiltinRule::GetPredicateNames() {
    std::vector<std::string> names;
    for (const auto& [name, definition] : GetPredicates()) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

namespace {

const PredicateDefinition& FindDefinition(const rules::RuleConfig& config) {
    if (!config.has_builtin()) {
        throw RuleConfigError(fmt::format("Rule {} has no builtin predicate", config.name()));
    }
    const auto& predicates = BuiltinRule::GetPredicates();
    auto it = predicates.find(config.builtin().predicate());
    if (it == predicates.end()) {
        throw RuleConfigError(fmt::format("Rule {} references unknown predicate '{}'",
                                          config.name(), config.builtin().predicate()));
    }
    return it->second;
}

std::map<std::string, double> MergeParams(const rules::RuleConfig& config,
                                          const PredicateDefinition& definition) {
    auto values = definition.defaults;
    for (const auto& param : config.builtin().params()) {
        auto it = values.find(param.first);
        if (it == values.end()) {
            throw RuleConfigError(fmt::format("Rule {}: predicate '{}' has no parameter '{}'",
                                              config.name(), config.builtin().predicate(),
                                              param.first));
        }
        it->second = param.second;
    }
    return values;
}

}  // namespace

BuiltinRule::BuiltinRule(const rules::RuleConfig& rule_config)
    : rule_config_(rule_config),
      predicate_(FindDefinition(rule_config).predicate),
      params_(ResolveParams(rule_config)) {}

PredicateParams BuiltinRule::ResolveParams(const rules::RuleConfig& rule_config) {
    return PredicateParams{MergeParams(rule_config, FindDefinition(rule_config))};
}

bool BuiltinRule::IsTriggered(const transaction::Transaction& transaction,
                              const Context& context) const {
    return predicate_(transaction, context, params_);
}

}  // namespace transaction_monitor
