#include "check_group.hpp"

#include <cmath>

#include <fmt/format.h>

#include <userver/formats/json/value_builder.hpp>

namespace transaction_monitor {

namespace {

struct CheckDetails {
    std::string number;
    double amount;
};

// Check numbers arrive both as strings and as JSON numbers.
std::optional<CheckDetails> ReadCheck(const JsonValue& metadata, double fallback_amount) {
    const auto check = json_access::GetObject(metadata, "check");
    if (!check) return std::nullopt;

    std::optional<std::string> number = json_access::GetString(*check, "check_number");
    if (!number) {
        if (auto numeric = json_access::GetNumber(*check, "check_number")) {
            number = fmt::format("{:.0f}", *numeric);
        }
    }
    if (!number || number->empty()) return std::nullopt;
    return CheckDetails{*number,
                        json_access::GetNumber(*check, "check_amount").value_or(fallback_amount)};
}

}  // namespace

CheckGroup::CheckGroup(LedgerPtr ledger, CheckConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

ContextFragment CheckGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto current = ReadCheck(input.metadata, tx.amount());
    fragment.SetBool("is_check_deposit", current.has_value());
    if (!current) {
        return fragment;
    }
    fragment.SetString("check_number", current->number);
    fragment.SetNumber("check_amount", current->amount);

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(
            tx.account_id(), signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0)),
        tx);

    userver::formats::json::ValueBuilder duplicates(userver::formats::common::Type::kArray);
    int duplicate_count = 0;
    int skipped = 0;
    for (const auto& prior : history) {
        const auto metadata = signal_utils::HistoricalMetadata(prior, GetName());
        if (!metadata) {
            ++skipped;
            continue;
        }
        const auto check = ReadCheck(*metadata, prior.amount());
        if (!check || check->number != current->number ||
            std::abs(check->amount - current->amount) > config_.amount_tolerance) {
            continue;
        }
        ++duplicate_count;
        userver::formats::json::ValueBuilder duplicate;
        duplicate["transaction_id"] = prior.transaction_id();
        duplicate["timestamp"] = prior.timestamp();
        duplicate["amount"] = check->amount;
        duplicates.PushBack(std::move(duplicate));
    }

    fragment.SetValue("duplicate_checks", duplicates.ExtractValue());
    fragment.SetNumber("duplicate_count", duplicate_count);
    fragment.SetBool("is_duplicate_check", duplicate_count > 0);
    fragment.SetNumber("skipped_records", skipped);
    return fragment;
}

}  // namespace transaction_monitor
