#include "fixtures.hpp"

#include <stdexcept>

#include "validation/transaction_validator.hpp"

namespace transaction_monitor::test_utils {

TimePoint At(const std::string& iso) {
    auto tp = time_utils::ParseTimestamp(iso);
    if (!tp) {
        throw std::invalid_argument("bad test timestamp: " + iso);
    }
    return *tp;
}

TimePoint HoursBefore(TimePoint tp, double hours) {
    return tp - std::chrono::duration_cast<TimePoint::duration>(
                    std::chrono::duration<double, std::ratio<3600>>(hours));
}

TimePoint DaysBefore(TimePoint tp, double days) {
    return HoursBefore(tp, days * 24.0);
}

TransactionBuilder::TransactionBuilder(std::string transaction_id, std::string account_id) {
    tx_.set_transaction_id(std::move(transaction_id));
    tx_.set_account_id(std::move(account_id));
    tx_.set_amount(100.0);
    tx_.set_direction(transaction::Transaction::DEBIT);
    tx_.set_transaction_type("WIRE");
    tx_.set_timestamp("2024-03-13T12:00:00Z");
}

TransactionBuilder& TransactionBuilder::Amount(double amount) {
    tx_.set_amount(amount);
    return *this;
}

TransactionBuilder& TransactionBuilder::Credit() {
    tx_.set_direction(transaction::Transaction::CREDIT);
    return *this;
}

TransactionBuilder& TransactionBuilder::Debit() {
    tx_.set_direction(transaction::Transaction::DEBIT);
    return *this;
}

TransactionBuilder& TransactionBuilder::Type(std::string transaction_type) {
    tx_.set_transaction_type(std::move(transaction_type));
    return *this;
}

TransactionBuilder& TransactionBuilder::Timestamp(TimePoint tp) {
    tx_.set_timestamp(time_utils::FormatIso(tp));
    return *this;
}

TransactionBuilder& TransactionBuilder::Counterparty(std::string counterparty_id) {
    tx_.set_counterparty_id(std::move(counterparty_id));
    return *this;
}

TransactionBuilder& TransactionBuilder::Metadata(std::string json) {
    tx_.set_metadata(std::move(json));
    return *this;
}

ContextFragment CollectGroup(const SignalGroup& group, const transaction::Transaction& tx) {
    const auto validated = ValidateTransaction(tx);
    return group.Collect(EvaluationInput{tx, validated.metadata, validated.as_of});
}

Context ContextOf(const SignalGroup& group, const transaction::Transaction& tx) {
    Context context;
    context.Merge(CollectGroup(group, tx));
    return context;
}

JsonValue Signal(const ContextFragment& fragment, const std::string& name) {
    const auto& signals = fragment.GetSignals();
    auto it = signals.find(fragment.GetPrefix() + "." + name);
    if (it == signals.end()) {
        return JsonValue{};
    }
    return it->second;
}

}  // namespace transaction_monitor::test_utils
