#include "beneficiary_group.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace transaction_monitor {

namespace {

// Most frequent value; ties resolve to the lexicographically smallest one.
std::optional<std::pair<std::string, int>> MostCommon(const std::vector<std::string>& values) {
    std::map<std::string, int> counts;
    for (const auto& value : values) {
        if (!value.empty()) ++counts[value];
    }
    std::optional<std::pair<std::string, int>> best;
    for (const auto& [value, count] : counts) {
        if (!best || count > best->second) best.emplace(value, count);
    }
    return best;
}

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

BeneficiaryGroup::BeneficiaryGroup(LedgerPtr ledger, BeneficiaryConfig config)
    : ledger_(std::move(ledger)), config_(std::move(config)) {}

ContextFragment BeneficiaryGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    CollectRegistrations(input, fragment);

    auto beneficiary_id = json_access::GetString(input.metadata, "beneficiary_id");
    if (!beneficiary_id && !tx.counterparty_id().empty()) {
        beneficiary_id = tx.counterparty_id();
    }
    std::optional<BeneficiaryRecord> beneficiary;
    if (beneficiary_id) {
        beneficiary = ledger_->GetBeneficiary(*beneficiary_id);
    }

    fragment.SetBool("counterparty_is_beneficiary", beneficiary.has_value());
    if (!beneficiary) {
        fragment.SetBool("is_new_beneficiary", false);
        fragment.SetNull("beneficiary_age_hours");
        fragment.SetNull("beneficiary_verified");
        return fragment;
    }

    const double age_hours = time_utils::HoursBetween(beneficiary->registered_at, input.as_of);
    fragment.SetNumber("beneficiary_age_hours", age_hours);
    fragment.SetBool("is_new_beneficiary",
                     age_hours >= 0.0 && age_hours <= config_.new_beneficiary_hours);
    fragment.SetBool("beneficiary_verified", beneficiary->verified);

    CollectChanges(input, *beneficiary, fragment);
    return fragment;
}

void BeneficiaryGroup::CollectRegistrations(const EvaluationInput& input,
                                            ContextFragment& fragment) const {
    const auto& tx = input.transaction;
    int max_window = 0;
    for (int hours : config_.window_hours) max_window = std::max(max_window, hours);
    const auto lookback = signal_utils::Lookback(input.as_of, max_window);

    const auto registered = ledger_->GetRegisteredBeneficiaries(tx.account_id(), lookback);
    auto payments = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(tx.account_id(), lookback), tx);
    payments.erase(std::remove_if(payments.begin(), payments.end(),
                                  [](const transaction::Transaction& item) {
                                      return !signal_utils::IsOutbound(item);
                                  }),
                   payments.end());

    for (int hours : config_.window_hours) {
        const auto window = signal_utils::Lookback(input.as_of, hours);
        std::set<std::string> fresh_ids;
        std::vector<std::string> source_ips;
        std::vector<std::string> registered_by;
        for (const auto& beneficiary : registered) {
            if (!window.Contains(beneficiary.registered_at)) continue;
            fresh_ids.insert(beneficiary.beneficiary_id);
            source_ips.push_back(beneficiary.source_ip);
            registered_by.push_back(beneficiary.registered_by);
        }

        int total_payments = 0;
        int fresh_payments = 0;
        auto count_payment = [&](const transaction::Transaction& payment) {
            ++total_payments;
            if (fresh_ids.count(payment.counterparty_id())) ++fresh_payments;
        };
        for (const auto& payment : payments) {
            if (window.Contains(*signal_utils::TransactionTime(payment))) count_payment(payment);
        }
        if (signal_utils::IsOutbound(tx)) count_payment(tx);

        const auto suffix = signal_utils::WindowName(hours);
        fragment.SetNumber("added_count_" + suffix, static_cast<double>(fresh_ids.size()));

        const auto top_ip = MostCommon(source_ips);
        fragment.SetString("top_source_ip_" + suffix,
                           top_ip ? std::optional<std::string>{top_ip->first} : std::nullopt);
        fragment.SetNumber("top_source_ip_count_" + suffix, top_ip ? top_ip->second : 0);

        const auto top_user = MostCommon(registered_by);
        fragment.SetString("top_registered_by_" + suffix,
                           top_user ? std::optional<std::string>{top_user->first} : std::nullopt);
        fragment.SetNumber("top_registered_by_count_" + suffix, top_user ? top_user->second : 0);

        fragment.SetNumber("new_beneficiary_payment_ratio_" + suffix,
                           total_payments > 0
                               ? std::optional<double>{static_cast<double>(fresh_payments) /
                                                       total_payments}
                               : std::nullopt);
    }
}

void BeneficiaryGroup::CollectChanges(const EvaluationInput& input,
                                      const BeneficiaryRecord& beneficiary,
                                      ContextFragment& fragment) const {
    const auto lookback = signal_utils::Lookback(input.as_of, config_.change_lookback_days * 24.0);
    auto changes = ledger_->GetBeneficiaryChanges(beneficiary.beneficiary_id, lookback);
    changes.erase(std::remove_if(changes.begin(), changes.end(),
                                 [this](const BeneficiaryChange& change) {
                                     return !Contains(config_.account_change_types,
                                                      change.change_type);
                                 }),
                  changes.end());

    const auto same_day = signal_utils::Lookback(input.as_of, 24);
    const auto recent = signal_utils::Lookback(input.as_of, 7 * 24);
    int changes_24h = 0;
    int changes_7d = 0;
    int unverified = 0;
    int suspicious_source = 0;
    int weekend = 0;
    int off_hours = 0;
    for (const auto& change : changes) {
        if (same_day.Contains(change.changed_at)) ++changes_24h;
        if (!recent.Contains(change.changed_at)) continue;
        ++changes_7d;
        if (!change.verified) ++unverified;
        if (Contains(config_.suspicious_change_sources, change.change_source)) ++suspicious_source;
        if (time_utils::IsWeekend(change.changed_at)) ++weekend;
        const int hour = time_utils::HourOfDay(change.changed_at);
        if (hour >= config_.off_hours_start || hour < config_.off_hours_end) ++off_hours;
    }

    fragment.SetNumber("changes_24h", changes_24h);
    fragment.SetNumber("changes_7d", changes_7d);
    fragment.SetNumber("changes_30d", static_cast<double>(changes.size()));
    fragment.SetNumber("unverified_changes_7d", unverified);
    fragment.SetNumber("suspicious_source_changes_7d", suspicious_source);
    fragment.SetNumber("weekend_changes_7d", weekend);
    fragment.SetNumber("off_hours_changes_7d", off_hours);
    fragment.SetNumber("hours_since_last_change",
                       changes.empty() ? std::nullopt
                                       : std::optional<double>{time_utils::HoursBetween(
                                             changes.back().changed_at, input.as_of)});

    if (!beneficiary.last_payment_at) {
        fragment.SetNull("days_since_last_payment");
        fragment.SetBool("first_payment_after_change", !changes.empty());
        return;
    }
    fragment.SetNumber("days_since_last_payment",
                       time_utils::DaysBetween(*beneficiary.last_payment_at, input.as_of));
    const auto since_payment = ledger_->GetBeneficiaryChanges(
        beneficiary.beneficiary_id, TimeRange{*beneficiary.last_payment_at, input.as_of});
    fragment.SetBool("first_payment_after_change",
                     std::any_of(since_payment.begin(), since_payment.end(),
                                 [this](const BeneficiaryChange& change) {
                                     return Contains(config_.account_change_types,
                                                     change.change_type);
                                 }));
}

}  // namespace transaction_monitor
