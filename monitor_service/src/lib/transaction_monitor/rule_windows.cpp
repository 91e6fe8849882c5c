#include "rule_windows.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "builtin_rules/builtin_rule.hpp"
#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

// Signal keys of the form "<group>.<stem><N><unit>".
struct WindowedSignal {
    std::string_view group;
    std::string_view stem;
    char unit;
    const std::vector<int>* windows;
};

struct WindowedPredicate {
    std::string_view predicate;
    std::string_view param;
    char unit;
    const std::vector<int>* windows;
};

void RequireWindow(const std::string& rule, int window, char unit,
                   const std::vector<int>& windows) {
    if (std::find(windows.begin(), windows.end(), window) == windows.end()) {
        throw RuleConfigError(fmt::format(
            "Rule {} reads a {}{} window; configured windows are [{}]", rule, window, unit,
            fmt::join(windows, ", ")));
    }
}

void CollectSignalKeys(const rules::Expression& expr, std::vector<std::string>& keys) {
    switch (expr.expr_case()) {
        case rules::Expression::kSignal:
            keys.push_back(expr.signal().key());
            return;
        case rules::Expression::kComparison:
            CollectSignalKeys(expr.comparison().left(), keys);
            CollectSignalKeys(expr.comparison().right(), keys);
            return;
        case rules::Expression::kLogical:
            for (const auto& operand : expr.logical().operands()) {
                CollectSignalKeys(operand, keys);
            }
            return;
        default:
            return;
    }
}

// Window length encoded in the key, if the key is one of the windowed signals.
std::optional<int> KeyWindow(std::string_view key, const WindowedSignal& signal) {
    const auto dot = key.find('.');
    if (dot == std::string_view::npos || key.substr(0, dot) != signal.group) {
        return std::nullopt;
    }
    const auto name = key.substr(dot + 1);
    if (name.substr(0, signal.stem.size()) != signal.stem) {
        return std::nullopt;
    }
    const auto window = name.substr(signal.stem.size());
    if (window.size() < 2 || window.size() > 6 || window.back() != signal.unit) {
        return std::nullopt;
    }
    const auto digits = window.substr(0, window.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    return std::stoi(std::string{digits});
}

}  // namespace

void ValidateRuleWindows(const RuleCatalog& catalog, const SignalGroupsConfig& groups) {
    const std::vector<WindowedPredicate> predicates = {
        {"high_velocity", "window_hours", 'h', &groups.velocity.window_hours},
        {"small_deposit_burst", "window_hours", 'h', &groups.velocity.window_hours},
        {"money_mule_flow_through", "window_hours", 'h', &groups.mule.window_hours},
        {"bulk_beneficiary_registration", "window_hours", 'h', &groups.beneficiary.window_hours},
        {"prior_fraud_account", "window_days", 'd', &groups.fraud_history.window_days},
        {"prior_fraud_counterparty", "window_days", 'd', &groups.fraud_history.window_days},
    };
    const std::vector<WindowedSignal> signals = {
        {"velocity", "tx_count_", 'h', &groups.velocity.window_hours},
        {"velocity", "small_deposit_count_", 'h', &groups.velocity.window_hours},
        {"mule", "incoming_count_", 'h', &groups.mule.window_hours},
        {"mule", "incoming_total_", 'h', &groups.mule.window_hours},
        {"mule", "outgoing_count_", 'h', &groups.mule.window_hours},
        {"mule", "outgoing_total_", 'h', &groups.mule.window_hours},
        {"mule", "avg_incoming_amount_", 'h', &groups.mule.window_hours},
        {"mule", "flow_through_ratio_", 'h', &groups.mule.window_hours},
        {"beneficiary", "added_count_", 'h', &groups.beneficiary.window_hours},
        {"beneficiary", "top_source_ip_count_", 'h', &groups.beneficiary.window_hours},
        {"beneficiary", "top_registered_by_count_", 'h', &groups.beneficiary.window_hours},
        {"beneficiary", "new_beneficiary_payment_ratio_", 'h', &groups.beneficiary.window_hours},
        {"ato", "change_count_", 'h', &groups.ato.window_hours},
        {"fraud_history", "account_flags_", 'd', &groups.fraud_history.window_days},
        {"fraud_history", "counterparty_flags_", 'd', &groups.fraud_history.window_days},
    };

    for (const auto& rule : catalog.GetRules()) {
        const auto& config = rule->GetConfig();
        if (config.has_builtin()) {
            const auto it = std::find_if(
                predicates.begin(), predicates.end(), [&config](const WindowedPredicate& p) {
                    return p.predicate == config.builtin().predicate();
                });
            if (it != predicates.end()) {
                const auto params = BuiltinRule::ResolveParams(config);
                RequireWindow(config.name(), params.GetInt(std::string{it->param}), it->unit,
                              *it->windows);
            }
        }
        if (config.has_expression()) {
            std::vector<std::string> keys;
            CollectSignalKeys(config.expression(), keys);
            for (const auto& key : keys) {
                for (const auto& signal : signals) {
                    if (const auto window = KeyWindow(key, signal)) {
                        RequireWindow(config.name(), *window, signal.unit, *signal.windows);
                    }
                }
            }
        }
    }
}

}  // namespace transaction_monitor
