#include "relationship_group.hpp"

#include <algorithm>

#include "utils/stats.hpp"

namespace transaction_monitor {

namespace {

// Points for pattern consistency: the lower the coefficient of variation,
// the steadier the relationship.
double ConsistencyPoints(std::optional<double> cv) {
    if (!cv) return 0.0;
    if (*cv <= 0.25) return 10.0;
    if (*cv <= 0.5) return 6.0;
    if (*cv <= 1.0) return 3.0;
    return 0.0;
}

}  // namespace

RelationshipGroup::RelationshipGroup(LedgerPtr ledger, RelationshipConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

ContextFragment RelationshipGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    fragment.SetBool("has_counterparty", !tx.counterparty_id().empty());
    if (tx.counterparty_id().empty()) {
        return fragment;
    }

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetCounterpartyTransactions(tx.account_id(), tx.counterparty_id(),
                                             signal_utils::AllHistory(input.as_of)),
        tx);

    const auto prior_count = static_cast<int>(history.size());
    fragment.SetNumber("prior_transaction_count", prior_count);
    fragment.SetBool("is_new_counterparty", prior_count == 0);

    std::optional<double> days_since_last;
    if (prior_count == 0) {
        fragment.SetString("status", "new");
        fragment.SetNull("days_since_first_transaction");
        fragment.SetNull("days_since_last_transaction");
        fragment.SetBool("is_dormant_reactivation", false);
    } else {
        const auto first = *signal_utils::TransactionTime(history.front());
        const auto last = *signal_utils::TransactionTime(history.back());
        days_since_last = time_utils::DaysBetween(last, input.as_of);
        const char* status = "dormant";
        if (*days_since_last <= config_.active_days) {
            status = "active";
        } else if (*days_since_last <= config_.recent_days) {
            status = "recent";
        } else if (*days_since_last < config_.dormant_days) {
            status = "inactive";
        }
        fragment.SetString("status", status);
        fragment.SetNumber("days_since_first_transaction",
                           time_utils::DaysBetween(first, input.as_of));
        fragment.SetNumber("days_since_last_transaction", *days_since_last);
        fragment.SetBool("is_dormant_reactivation", *days_since_last >= config_.dormant_days);
    }

    // Registration: registered +10, verified +10.
    double registration = 0.0;
    if (auto beneficiary = ledger_->GetBeneficiary(tx.counterparty_id())) {
        registration += 10.0;
        if (beneficiary->verified) registration += 10.0;
    }
    registration = std::min(registration, 20.0);

    // History: 2 points per prior transaction up to 15, +10 if active, +5 if recent.
    double history_points = std::min(prior_count * 2.0, 15.0);
    if (days_since_last) {
        if (*days_since_last <= config_.active_days) {
            history_points += 10.0;
        } else if (*days_since_last <= config_.recent_days) {
            history_points += 5.0;
        }
    }
    history_points = std::min(history_points, 25.0);

    const double contacts =
        json_access::GetBool(input.metadata, "counterparty_in_contacts").value_or(false) ? 20.0
                                                                                         : 0.0;

    // Social: 2 points per mutual connection up to 10, 1 per shared group up to 5.
    double social = 0.0;
    if (auto social_info = json_access::GetObject(input.metadata, "social")) {
        const double mutual =
            json_access::GetNumber(*social_info, "mutual_connections").value_or(0.0);
        const double groups = json_access::GetNumber(*social_info, "shared_groups").value_or(0.0);
        social = std::min(std::max(mutual, 0.0) * 2.0, 10.0) + std::min(std::max(groups, 0.0), 5.0);
    }
    social = std::min(social, 15.0);

    // Pattern consistency over amounts and inter-transaction gaps, 10 each.
    double pattern = 0.0;
    if (prior_count >= config_.min_pattern_history) {
        std::vector<double> amounts;
        std::vector<double> gaps;
        std::optional<TimePoint> previous;
        for (const auto& prior : history) {
            amounts.push_back(prior.amount());
            const auto at = *signal_utils::TransactionTime(prior);
            if (previous) gaps.push_back(time_utils::HoursBetween(*previous, at));
            previous = at;
        }
        pattern = ConsistencyPoints(stats::CoefficientOfVariation(amounts)) +
                  ConsistencyPoints(stats::CoefficientOfVariation(gaps));
    }
    pattern = std::min(pattern, 20.0);

    const double score = registration + history_points + contacts + social + pattern;
    fragment.SetNumber("trust_registration_points", registration);
    fragment.SetNumber("trust_history_points", history_points);
    fragment.SetNumber("trust_contacts_points", contacts);
    fragment.SetNumber("trust_social_points", social);
    fragment.SetNumber("trust_pattern_points", pattern);
    fragment.SetNumber("social_trust_score", score);
    if (score >= config_.high_trust_score) {
        fragment.SetString("trust_level", "high");
    } else if (score >= config_.medium_trust_score) {
        fragment.SetString("trust_level", "medium");
    } else {
        fragment.SetString("trust_level", "low");
    }
    return fragment;
}

}  // namespace transaction_monitor
