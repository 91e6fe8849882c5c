#include "postgres_ledger.hpp"

#include <optional>

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/storages/postgres/exceptions.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

using userver::storages::postgres::ClusterHostType;

constexpr const char* kTransactionColumns =
    "transaction_id, account_id, COALESCE(counterparty_id, '') AS counterparty_id, amount, "
    "direction, transaction_type, EXTRACT(EPOCH FROM times_tamp)::bigint AS ts, "
    "COALESCE(description, '') AS description, COALESCE(tx_metadata, '') AS tx_metadata";

transaction::Transaction::Direction StringToDirection(const std::string& str) {
    if (str == "credit") return transaction::Transaction::CREDIT;
    if (str == "debit") return transaction::Transaction::DEBIT;
    return transaction::Transaction::DIRECTION_UNSPECIFIED;
}

TimePoint FromEpoch(int64_t seconds) {
    return time_utils::FromEpochSeconds(seconds);
}

std::optional<TimePoint> FromNullableEpoch(const std::optional<int64_t>& seconds) {
    if (!seconds) return std::nullopt;
    return FromEpoch(*seconds);
}

int64_t Epoch(TimePoint tp) {
    return time_utils::ToEpochSeconds(tp);
}

}  // namespace

PostgresLedger::PostgresLedger(userver::storages::postgres::ClusterPtr pg_cluster)
    : pg_cluster_(std::move(pg_cluster)) {}

template <typename... Args>
userver::storages::postgres::ResultSet PostgresLedger::Execute(
    const char* query_name, const std::string& sql, const Args&... args) const {
    try {
        return pg_cluster_->Execute(ClusterHostType::kSlave, sql, args...);
    } catch (const userver::storages::postgres::Error& e) {
        LOG_ERROR() << fmt::format("Ledger query {} failed: {}", query_name, e.what());
        throw LedgerUnavailableError(fmt::format("Ledger query {} failed: {}", query_name, e.what()));
    }
}

std::vector<transaction::Transaction> PostgresLedger::ReadTransactions(
    const userver::storages::postgres::ResultSet& result) const {
    std::vector<transaction::Transaction> history;
    history.reserve(result.Size());
    for (const auto& row : result) {
        transaction::Transaction tx;
        tx.set_transaction_id(row["transaction_id"].As<std::string>());
        tx.set_account_id(row["account_id"].As<std::string>());
        tx.set_counterparty_id(row["counterparty_id"].As<std::string>());
        tx.set_amount(row["amount"].As<double>());
        tx.set_direction(StringToDirection(row["direction"].As<std::string>()));
        tx.set_transaction_type(row["transaction_type"].As<std::string>());
        tx.set_timestamp(std::to_string(row["ts"].As<int64_t>()));
        tx.set_description(row["description"].As<std::string>());
        tx.set_metadata(row["tx_metadata"].As<std::string>());
        history.push_back(std::move(tx));
    }
    return history;
}

std::optional<AccountRecord> PostgresLedger::GetAccount(const std::string& account_id) const {
    auto result = Execute(
        "GetAccount",
        "SELECT account_id, EXTRACT(EPOCH FROM creation_date)::bigint AS created, "
        "COALESCE(risk_tier, '') AS risk_tier, COALESCE(status, '') AS status "
        "FROM accounts WHERE account_id = $1",
        account_id);
    if (result.IsEmpty()) {
        return std::nullopt;
    }
    const auto row = result[0];
    AccountRecord account;
    account.account_id = row["account_id"].As<std::string>();
    account.created_at = FromEpoch(row["created"].As<int64_t>());
    account.risk_tier = row["risk_tier"].As<std::string>();
    account.status = row["status"].As<std::string>();
    return account;
}

std::vector<transaction::Transaction> PostgresLedger::GetAccountTransactions(
    const std::string& account_id, const TimeRange& range) const {
    auto result = Execute(
        "GetAccountTransactions",
        fmt::format("SELECT {} FROM transactions "
                    "WHERE account_id = $1 AND times_tamp > to_timestamp($2) "
                    "AND times_tamp <= to_timestamp($3) ORDER BY times_tamp",
                    kTransactionColumns),
        account_id, Epoch(range.since), Epoch(range.until));
    auto history = ReadTransactions(result);
    LOG_DEBUG() << "Retrieved " << history.size() << " transactions for account " << account_id;
    return history;
}

std::vector<transaction::Transaction> PostgresLedger::GetCounterpartyTransactions(
    const std::string& account_id,
    const std::string& counterparty_id,
    const TimeRange& range) const {
    auto result = Execute(
        "GetCounterpartyTransactions",
        fmt::format("SELECT {} FROM transactions "
                    "WHERE account_id = $1 AND counterparty_id = $2 "
                    "AND times_tamp > to_timestamp($3) AND times_tamp <= to_timestamp($4) "
                    "ORDER BY times_tamp",
                    kTransactionColumns),
        account_id, counterparty_id, Epoch(range.since), Epoch(range.until));
    return ReadTransactions(result);
}

std::optional<BeneficiaryRecord> PostgresLedger::GetBeneficiary(
    const std::string& beneficiary_id) const {
    auto result = Execute(
        "GetBeneficiary",
        "SELECT beneficiary_id, account_id, EXTRACT(EPOCH FROM registration_date)::bigint AS registered, "
        "COALESCE(source_ip, '') AS source_ip, COALESCE(registered_by, '') AS registered_by, verified, "
        "EXTRACT(EPOCH FROM last_payment_date)::bigint AS last_payment "
        "FROM beneficiaries WHERE beneficiary_id = $1",
        beneficiary_id);
    if (result.IsEmpty()) {
        return std::nullopt;
    }
    const auto row = result[0];
    BeneficiaryRecord beneficiary;
    beneficiary.beneficiary_id = row["beneficiary_id"].As<std::string>();
    beneficiary.account_id = row["account_id"].As<std::string>();
    beneficiary.registered_at = FromEpoch(row["registered"].As<int64_t>());
    beneficiary.source_ip = row["source_ip"].As<std::string>();
    beneficiary.registered_by = row["registered_by"].As<std::string>();
    beneficiary.verified = row["verified"].As<bool>();
    beneficiary.last_payment_at = FromNullableEpoch(row["last_payment"].As<std::optional<int64_t>>());
    return beneficiary;
}

std::vector<BeneficiaryRecord> PostgresLedger::GetRegisteredBeneficiaries(
    const std::string& account_id, const TimeRange& range) const {
    auto result = Execute(
        "GetRegisteredBeneficiaries",
        "SELECT beneficiary_id, account_id, EXTRACT(EPOCH FROM registration_date)::bigint AS registered, "
        "COALESCE(source_ip, '') AS source_ip, COALESCE(registered_by, '') AS registered_by, verified, "
        "EXTRACT(EPOCH FROM last_payment_date)::bigint AS last_payment "
        "FROM beneficiaries WHERE account_id = $1 "
        "AND registration_date > to_timestamp($2) AND registration_date <= to_timestamp($3) "
        "ORDER BY registration_date",
        account_id, Epoch(range.since), Epoch(range.until));
    std::vector<BeneficiaryRecord> beneficiaries;
    for (const auto& row : result) {
        BeneficiaryRecord beneficiary;
        beneficiary.beneficiary_id = row["beneficiary_id"].As<std::string>();
        beneficiary.account_id = row["account_id"].As<std::string>();
        beneficiary.registered_at = FromEpoch(row["registered"].As<int64_t>());
        beneficiary.source_ip = row["source_ip"].As<std::string>();
        beneficiary.registered_by = row["registered_by"].As<std::string>();
        beneficiary.verified = row["verified"].As<bool>();
        beneficiary.last_payment_at = FromNullableEpoch(row["last_payment"].As<std::optional<int64_t>>());
        beneficiaries.push_back(std::move(beneficiary));
    }
    return beneficiaries;
}

std::vector<BeneficiaryChange> PostgresLedger::GetBeneficiaryChanges(
    const std::string& beneficiary_id, const TimeRange& range) const {
    auto result = Execute(
        "GetBeneficiaryChanges",
        "SELECT change_id, beneficiary_id, EXTRACT(EPOCH FROM changed_at)::bigint AS changed, "
        "change_type, COALESCE(change_source, '') AS change_source, verified "
        "FROM beneficiary_change_history WHERE beneficiary_id = $1 "
        "AND changed_at > to_timestamp($2) AND changed_at <= to_timestamp($3) ORDER BY changed_at",
        beneficiary_id, Epoch(range.since), Epoch(range.until));
    std::vector<BeneficiaryChange> changes;
    for (const auto& row : result) {
        changes.push_back(BeneficiaryChange{
            row["change_id"].As<std::string>(),
            row["beneficiary_id"].As<std::string>(),
            FromEpoch(row["changed"].As<int64_t>()),
            row["change_type"].As<std::string>(),
            row["change_source"].As<std::string>(),
            row["verified"].As<bool>()});
    }
    return changes;
}

std::vector<AccountChange> PostgresLedger::GetAccountChanges(
    const std::string& account_id, const TimeRange& range) const {
    auto result = Execute(
        "GetAccountChanges",
        "SELECT change_id, account_id, EXTRACT(EPOCH FROM changed_at)::bigint AS changed, change_type "
        "FROM account_change_history WHERE account_id = $1 "
        "AND changed_at > to_timestamp($2) AND changed_at <= to_timestamp($3) ORDER BY changed_at",
        account_id, Epoch(range.since), Epoch(range.until));
    std::vector<AccountChange> changes;
    for (const auto& row : result) {
        changes.push_back(AccountChange{
            row["change_id"].As<std::string>(),
            row["account_id"].As<std::string>(),
            FromEpoch(row["changed"].As<int64_t>()),
            row["change_type"].As<std::string>()});
    }
    return changes;
}

std::vector<DeviceSession> PostgresLedger::GetAccountSessions(
    const std::string& account_id, const TimeRange& range) const {
    auto result = Execute(
        "GetAccountSessions",
        "SELECT session_id, account_id, device_id, COALESCE(fingerprint, '') AS fingerprint, "
        "COALESCE(ip_address, '') AS ip_address, EXTRACT(EPOCH FROM started_at)::bigint AS started "
        "FROM device_sessions WHERE account_id = $1 "
        "AND started_at > to_timestamp($2) AND started_at <= to_timestamp($3) ORDER BY started_at",
        account_id, Epoch(range.since), Epoch(range.until));
    std::vector<DeviceSession> sessions;
    for (const auto& row : result) {
        sessions.push_back(DeviceSession{
            row["session_id"].As<std::string>(),
            row["account_id"].As<std::string>(),
            row["device_id"].As<std::string>(),
            row["fingerprint"].As<std::string>(),
            row["ip_address"].As<std::string>(),
            FromEpoch(row["started"].As<int64_t>())});
    }
    return sessions;
}

std::vector<DeviceSession> PostgresLedger::GetDeviceSessions(
    const std::string& device_id, const TimeRange& range) const {
    auto result = Execute(
        "GetDeviceSessions",
        "SELECT session_id, account_id, device_id, COALESCE(fingerprint, '') AS fingerprint, "
        "COALESCE(ip_address, '') AS ip_address, EXTRACT(EPOCH FROM started_at)::bigint AS started "
        "FROM device_sessions WHERE device_id = $1 "
        "AND started_at > to_timestamp($2) AND started_at <= to_timestamp($3) ORDER BY started_at",
        device_id, Epoch(range.since), Epoch(range.until));
    std::vector<DeviceSession> sessions;
    for (const auto& row : result) {
        sessions.push_back(DeviceSession{
            row["session_id"].As<std::string>(),
            row["account_id"].As<std::string>(),
            row["device_id"].As<std::string>(),
            row["fingerprint"].As<std::string>(),
            row["ip_address"].As<std::string>(),
            FromEpoch(row["started"].As<int64_t>())});
    }
    return sessions;
}

std::vector<BlacklistEntry> PostgresLedger::FindBlacklistEntries(
    const std::string& entity_type, const std::string& entity_value) const {
    auto result = Execute(
        "FindBlacklistEntries",
        "SELECT entity_type, entity_value, COALESCE(reason, '') AS reason, severity, active, "
        "EXTRACT(EPOCH FROM expires_at)::bigint AS expires "
        "FROM blacklist WHERE entity_type = $1 AND entity_value = $2",
        entity_type, entity_value);
    std::vector<BlacklistEntry> entries;
    for (const auto& row : result) {
        BlacklistEntry entry;
        entry.entity_type = row["entity_type"].As<std::string>();
        entry.entity_value = row["entity_value"].As<std::string>();
        entry.reason = row["reason"].As<std::string>();
        entry.severity = row["severity"].As<std::string>();
        entry.active = row["active"].As<bool>();
        entry.expires_at = FromNullableEpoch(row["expires"].As<std::optional<int64_t>>());
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<VpnProxyEntry> PostgresLedger::FindVpnProxyEntries(const std::string& ip_address) const {
    auto result = Execute(
        "FindVpnProxyEntries",
        "SELECT network::text AS network, COALESCE(provider, '') AS provider, kind, confidence "
        "FROM vpn_proxy_ranges WHERE $1::inet <<= network",
        ip_address);
    std::vector<VpnProxyEntry> entries;
    for (const auto& row : result) {
        entries.push_back(VpnProxyEntry{
            row["network"].As<std::string>(),
            row["provider"].As<std::string>(),
            row["kind"].As<std::string>(),
            row["confidence"].As<double>()});
    }
    return entries;
}

std::vector<HighRiskLocation> PostgresLedger::FindHighRiskLocations(
    const std::string& country, const std::string& city) const {
    auto result = Execute(
        "FindHighRiskLocations",
        "SELECT country, COALESCE(city, '') AS city, severity, sanctioned, embargoed, "
        "high_fraud_rate, block_by_default FROM high_risk_locations "
        "WHERE country = $1 AND (city IS NULL OR city = '' OR city = $2)",
        country, city);
    std::vector<HighRiskLocation> locations;
    for (const auto& row : result) {
        locations.push_back(HighRiskLocation{
            row["country"].As<std::string>(),
            row["city"].As<std::string>(),
            row["severity"].As<std::string>(),
            row["sanctioned"].As<bool>(),
            row["embargoed"].As<bool>(),
            row["high_fraud_rate"].As<bool>(),
            row["block_by_default"].As<bool>()});
    }
    return locations;
}

std::vector<BehavioralSample> PostgresLedger::GetBehavioralSamples(
    const std::string& account_id, const TimeRange& range) const {
    auto result = Execute(
        "GetBehavioralSamples",
        "SELECT account_id, EXTRACT(EPOCH FROM captured_at)::bigint AS captured, typing_speed_wpm, "
        "mouse_velocity, session_duration_seconds, copy_paste_count, autofill_used "
        "FROM behavioral_biometrics WHERE account_id = $1 "
        "AND captured_at > to_timestamp($2) AND captured_at <= to_timestamp($3) ORDER BY captured_at",
        account_id, Epoch(range.since), Epoch(range.until));
    std::vector<BehavioralSample> samples;
    for (const auto& row : result) {
        BehavioralSample sample;
        sample.account_id = row["account_id"].As<std::string>();
        sample.captured_at = FromEpoch(row["captured"].As<int64_t>());
        sample.typing_speed_wpm = row["typing_speed_wpm"].As<std::optional<double>>();
        sample.mouse_velocity = row["mouse_velocity"].As<std::optional<double>>();
        sample.session_duration_seconds = row["session_duration_seconds"].As<std::optional<double>>();
        sample.copy_paste_count = row["copy_paste_count"].As<std::optional<double>>();
        sample.autofill_used = row["autofill_used"].As<std::optional<bool>>();
        samples.push_back(std::move(sample));
    }
    return samples;
}

std::vector<FraudFlag> PostgresLedger::GetFraudFlags(
    const std::string& entity_id, const TimeRange& range) const {
    auto result = Execute(
        "GetFraudFlags",
        "SELECT flag_id, entity_id, EXTRACT(EPOCH FROM flagged_at)::bigint AS flagged, severity, "
        "COALESCE(fraud_type, '') AS fraud_type, confirmed FROM fraud_flags WHERE entity_id = $1 "
        "AND flagged_at > to_timestamp($2) AND flagged_at <= to_timestamp($3) ORDER BY flagged_at",
        entity_id, Epoch(range.since), Epoch(range.until));
    std::vector<FraudFlag> flags;
    for (const auto& row : result) {
        flags.push_back(FraudFlag{
            row["flag_id"].As<std::string>(),
            row["entity_id"].As<std::string>(),
            FromEpoch(row["flagged"].As<int64_t>()),
            row["severity"].As<double>(),
            row["fraud_type"].As<std::string>(),
            row["confirmed"].As<bool>()});
    }
    return flags;
}

}  // namespace transaction_monitor
