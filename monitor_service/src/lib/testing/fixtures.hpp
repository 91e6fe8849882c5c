#pragma once

#include <string>

#include <transaction/transaction.pb.h>

#include "context/context.hpp"
#include "ledger/ledger.hpp"
#include "signal_groups/signal_group.hpp"

namespace transaction_monitor::test_utils {

// Parses "YYYY-MM-DDTHH:MM:SSZ"; throws std::invalid_argument on a typo.
TimePoint At(const std::string& iso);

TimePoint HoursBefore(TimePoint tp, double hours);
TimePoint DaysBefore(TimePoint tp, double days);

class TransactionBuilder {
public:
    TransactionBuilder(std::string transaction_id, std::string account_id);

    TransactionBuilder& Amount(double amount);
    TransactionBuilder& Credit();
    TransactionBuilder& Debit();
    TransactionBuilder& Type(std::string transaction_type);
    TransactionBuilder& Timestamp(TimePoint tp);
    TransactionBuilder& Counterparty(std::string counterparty_id);
    TransactionBuilder& Metadata(std::string json);

    transaction::Transaction Build() const { return tx_; }

private:
    transaction::Transaction tx_;
};

// Validates the transaction and runs one group on it outside the assembler.
ContextFragment CollectGroup(const SignalGroup& group, const transaction::Transaction& tx);

// Context holding only the given group's signals.
Context ContextOf(const SignalGroup& group, const transaction::Transaction& tx);

// Reads a signal of a fragment. Absent keys are null.
JsonValue Signal(const ContextFragment& fragment, const std::string& name);

}  // namespace transaction_monitor::test_utils
