#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include <userver/engine/shared_mutex.hpp>

#include "ledger.hpp"

namespace transaction_monitor {

// Ledger kept in process memory. Used by tests and by offline replays of
// exported ledger snapshots. Writes are expected to happen out-of-band of
// evaluations; readers take a shared lock.
class MemoryLedger final : public TransactionLedger {
public:
    MemoryLedger() = default;

    void AddAccount(AccountRecord account);
    void AddTransaction(transaction::Transaction tx);
    void AddBeneficiary(BeneficiaryRecord beneficiary);
    void AddBeneficiaryChange(BeneficiaryChange change);
    void AddAccountChange(AccountChange change);
    void AddDeviceSession(DeviceSession session);
    void AddBlacklistEntry(BlacklistEntry entry);
    void AddVpnProxyEntry(VpnProxyEntry entry);
    void AddHighRiskLocation(HighRiskLocation location);
    void AddBehavioralSample(BehavioralSample sample);
    void AddFraudFlag(FraudFlag flag);

    // Outage simulation: every query throws LedgerUnavailableError.
    void SetAvailable(bool available);
    // Latency simulation for a single query method, e.g. "GetBehavioralSamples".
    void SetQueryDelay(const std::string& query, std::chrono::milliseconds delay);

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
    void BeforeQuery(const std::string& query) const;

    mutable userver::engine::SharedMutex mutex_;
    bool available_ = true;
    std::unordered_map<std::string, std::chrono::milliseconds> delays_;

    std::unordered_map<std::string, AccountRecord> accounts_;
    std::vector<transaction::Transaction> transactions_;
    std::unordered_map<std::string, BeneficiaryRecord> beneficiaries_;
    std::vector<BeneficiaryChange> beneficiary_changes_;
    std::vector<AccountChange> account_changes_;
    std::vector<DeviceSession> sessions_;
    std::vector<BlacklistEntry> blacklist_;
    std::vector<VpnProxyEntry> vpn_proxy_;
    std::vector<HighRiskLocation> high_risk_locations_;
    std::vector<BehavioralSample> behavioral_samples_;
    std::vector<FraudFlag> fraud_flags_;
};

// True when the address equals the network or lies inside its IPv4 CIDR.
bool IpMatchesNetwork(const std::string& ip_address, const std::string& network);

}  // namespace transaction_monitor
