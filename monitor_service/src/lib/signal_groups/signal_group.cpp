#include "signal_group.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

namespace transaction_monitor::signal_utils {

bool IsInbound(const transaction::Transaction& tx) {
    return tx.direction() == transaction::Transaction::CREDIT;
}

bool IsOutbound(const transaction::Transaction& tx) {
    return tx.direction() == transaction::Transaction::DEBIT;
}

TimeRange Lookback(TimePoint as_of, double hours) {
    const auto span = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double, std::ratio<3600>>(hours));
    return TimeRange{as_of - span, as_of};
}

TimeRange AllHistory(TimePoint as_of) {
    return TimeRange{TimePoint{}, as_of};
}

std::optional<TimePoint> TransactionTime(const transaction::Transaction& tx) {
    return time_utils::ParseTimestamp(tx.timestamp());
}

std::vector<transaction::Transaction> PriorTransactions(
    std::vector<transaction::Transaction> history, const transaction::Transaction& current) {
    history.erase(
        std::remove_if(history.begin(), history.end(),
                       [&](const transaction::Transaction& tx) {
                           return tx.transaction_id() == current.transaction_id() ||
                                  !TransactionTime(tx).has_value();
                       }),
        history.end());
    return history;
}

std::optional<JsonValue> HistoricalMetadata(
    const transaction::Transaction& tx, std::string_view group) {
    auto parsed = ParseMetadata(tx.metadata());
    if (!parsed.has_value()) {
        LOG_WARNING() << fmt::format(
            "Skipping transaction {} in signal group {}: malformed metadata ({})",
            tx.transaction_id(), group, parsed.error());
        return std::nullopt;
    }
    return parsed.value();
}

int SeverityRank(const std::string& severity) {
    if (severity == "low") return 1;
    if (severity == "medium") return 2;
    if (severity == "high") return 3;
    if (severity == "critical") return 4;
    return 0;
}

std::string WindowName(int hours) {
    return fmt::format("{}h", hours);
}

}  // namespace transaction_monitor::signal_utils
