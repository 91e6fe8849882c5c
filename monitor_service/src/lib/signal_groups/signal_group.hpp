#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "ledger/ledger.hpp"

namespace transaction_monitor {

struct EvaluationInput {
    const transaction::Transaction& transaction;
    // Parsed metadata of the evaluated transaction, always an object.
    const JsonValue& metadata;
    // Reference time of every window: the transaction timestamp.
    TimePoint as_of;
};

// Independent unit of context assembly. A group reads only the evaluated
// transaction and the ledger, never the output of another group, and writes
// only keys under its own prefix.
class SignalGroup {
public:
    virtual ~SignalGroup() = default;

    // Also the key prefix of every signal the group produces.
    virtual std::string_view GetName() const = 0;

    virtual ContextFragment Collect(const EvaluationInput& input) const = 0;
};

using SignalGroupPtr = std::unique_ptr<SignalGroup>;
using LedgerPtr = std::shared_ptr<const TransactionLedger>;

namespace signal_utils {

bool IsInbound(const transaction::Transaction& tx);
bool IsOutbound(const transaction::Transaction& tx);

TimeRange Lookback(TimePoint as_of, double hours);
TimeRange AllHistory(TimePoint as_of);

std::optional<TimePoint> TransactionTime(const transaction::Transaction& tx);

// Drops the evaluated transaction (if the ledger already holds it) and
// records without a parsable timestamp.
std::vector<transaction::Transaction> PriorTransactions(
    std::vector<transaction::Transaction> history, const transaction::Transaction& current);

// Parses the metadata of a historical record. A malformed record is logged
// and skipped by the calling group only.
std::optional<JsonValue> HistoricalMetadata(
    const transaction::Transaction& tx, std::string_view group);

// low=1, medium=2, high=3, critical=4, anything else 0.
int SeverityRank(const std::string& severity);

// Window suffix used in signal names, e.g. 24 -> "24h".
std::string WindowName(int hours);

}  // namespace signal_utils

}  // namespace transaction_monitor
