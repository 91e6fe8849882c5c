#pragma once

#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "utils/time_utils.hpp"

namespace transaction_monitor {

struct ValidatedTransaction {
    time_utils::TimePoint as_of;
    JsonValue metadata;
};

// Checks the required fields of an incoming transaction and parses its
// timestamp and metadata. Throws InvalidTransactionError.
ValidatedTransaction ValidateTransaction(const transaction::Transaction& tx);

}  // namespace transaction_monitor
