#include "transaction_validator.hpp"

#include <cmath>

#include <fmt/format.h>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

void RequireField(const std::string& value, std::string_view field, const std::string& tx_id) {
    if (value.empty()) {
        throw InvalidTransactionError(
            fmt::format("transaction '{}': missing required field '{}'", tx_id, field));
    }
}

}  // namespace

ValidatedTransaction ValidateTransaction(const transaction::Transaction& tx) {
    RequireField(tx.transaction_id(), "transaction_id", tx.transaction_id());
    RequireField(tx.account_id(), "account_id", tx.transaction_id());
    RequireField(tx.transaction_type(), "transaction_type", tx.transaction_id());
    RequireField(tx.timestamp(), "timestamp", tx.transaction_id());

    if (tx.direction() != transaction::Transaction::CREDIT &&
        tx.direction() != transaction::Transaction::DEBIT) {
        throw InvalidTransactionError(
            fmt::format("transaction '{}': direction must be CREDIT or DEBIT", tx.transaction_id()));
    }
    if (!std::isfinite(tx.amount()) || tx.amount() < 0.0) {
        throw InvalidTransactionError(fmt::format("transaction '{}': invalid amount {}",
                                                  tx.transaction_id(), tx.amount()));
    }

    auto as_of = time_utils::ParseTimestamp(tx.timestamp());
    if (!as_of) {
        throw InvalidTransactionError(fmt::format("transaction '{}': unparsable timestamp '{}'",
                                                  tx.transaction_id(), tx.timestamp()));
    }

    auto metadata = ParseMetadata(tx.metadata());
    if (!metadata.has_value()) {
        throw InvalidTransactionError(fmt::format("transaction '{}': invalid metadata: {}",
                                                  tx.transaction_id(), metadata.error()));
    }
    return ValidatedTransaction{*as_of, metadata.value()};
}

}  // namespace transaction_monitor
