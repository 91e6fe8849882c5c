#include "account_age_group.hpp"

#include <algorithm>
#include <cmath>

namespace transaction_monitor {

AccountAgeGroup::AccountAgeGroup(LedgerPtr ledger, AccountAgeConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

ContextFragment AccountAgeGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto account = ledger_->GetAccount(tx.account_id());
    fragment.SetBool("has_account", account.has_value());
    if (!account) {
        return fragment;
    }

    const double age_days =
        std::max(0.0, std::floor(time_utils::DaysBetween(account->created_at, input.as_of)));

    const char* bucket = "mature";
    const char* risk_level = "minimal";
    if (age_days <= config_.brand_new_days) {
        bucket = "brand_new";
        risk_level = "critical";
    } else if (age_days <= config_.new_days) {
        bucket = "new";
        risk_level = "high";
    } else if (age_days <= config_.young_days) {
        bucket = "young";
        risk_level = "medium";
    } else if (age_days <= config_.established_days) {
        bucket = "established";
        risk_level = "low";
    }

    const bool is_young = age_days <= config_.young_days;
    fragment.SetNumber("age_days", age_days);
    fragment.SetString("age_bucket", bucket);
    fragment.SetString("account_age_risk_level", risk_level);
    fragment.SetBool("is_brand_new_account", age_days <= config_.brand_new_days);
    fragment.SetBool("is_new_account", age_days <= config_.new_days);
    fragment.SetBool("is_young_account", is_young);
    fragment.SetBool("is_large_transaction_young_account",
                     is_young && tx.amount() >= config_.large_amount);
    fragment.SetString("risk_tier", account->risk_tier.empty()
                                        ? std::nullopt
                                        : std::optional<std::string>{account->risk_tier});
    fragment.SetString("account_status", account->status.empty()
                                             ? std::nullopt
                                             : std::optional<std::string>{account->status});
    return fragment;
}

}  // namespace transaction_monitor
