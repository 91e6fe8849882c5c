#pragma once

#include <stdexcept>
#include <string>

namespace transaction_monitor {

// Ledger outage or query failure. Aborts the evaluation.
class LedgerUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Input transaction misses a required field or carries unparsable data.
class InvalidTransactionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// A rule found a signal of an unexpected type.
class MalformedContextError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The assessment could not be stored; the decision must not be reported.
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RuleConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace transaction_monitor
