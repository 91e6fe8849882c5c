#pragma once

#include <string>
#include <vector>

#include <userver/storages/postgres/cluster.hpp>
#include <userver/storages/postgres/result_set.hpp>

#include "ledger.hpp"

namespace transaction_monitor {

// Ledger backed by the monitoring PostgreSQL database. History reads go to
// replicas; schema lives in postgresql/schemas/monitor.sql.
class PostgresLedger final : public TransactionLedger {
public:
    explicit PostgresLedger(userver::storages::postgres::ClusterPtr pg_cluster);

    std::optional<AccountRecord> GetAccount(const std::string& account_id) const override;
    std::vector<transaction::Transaction> GetAccountTransactions(
        const std::string& account_id, const TimeRange& range) const override;
    std::vector<transaction::Transaction> GetCounterpartyTransactions(
        const std::string& account_id,
        const std::string& counterparty_id,
        const TimeRange& range) const override;
    std::optional<BeneficiaryRecord> GetBeneficiary(
        const std::string& beneficiary_id) const override;
    std::vector<BeneficiaryRecord> GetRegisteredBeneficiaries(
        const std::string& account_id, const TimeRange& range) const override;
    std::vector<BeneficiaryChange> GetBeneficiaryChanges(
        const std::string& beneficiary_id, const TimeRange& range) const override;
    std::vector<AccountChange> GetAccountChanges(
        const std::string& account_id, const TimeRange& range) const override;
    std::vector<DeviceSession> GetAccountSessions(
        const std::string& account_id, const TimeRange& range) const override;
    std::vector<DeviceSession> GetDeviceSessions(
        const std::string& device_id, const TimeRange& range) const override;
    std::vector<BlacklistEntry> FindBlacklistEntries(
        const std::string& entity_type, const std::string& entity_value) const override;
    std::vector<VpnProxyEntry> FindVpnProxyEntries(const std::string& ip_address) const override;
    std::vector<HighRiskLocation> FindHighRiskLocations(
        const std::string& country, const std::string& city) const override;
    std::vector<BehavioralSample> GetBehavioralSamples(
        const std::string& account_id, const TimeRange& range) const override;
    std::vector<FraudFlag> GetFraudFlags(
        const std::string& entity_id, const TimeRange& range) const override;

private:
    template <typename... Args>
    userver::storages::postgres::ResultSet Execute(
        const char* query_name, const std::string& sql, const Args&... args) const;

    std::vector<transaction::Transaction> ReadTransactions(
        const userver::storages::postgres::ResultSet& result) const;

    userver::storages::postgres::ClusterPtr pg_cluster_;
};

}  // namespace transaction_monitor
