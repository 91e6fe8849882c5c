#pragma once

#include <optional>
#include <string>
#include <vector>

#include <transaction/transaction.pb.h>

#include "utils/time_utils.hpp"

namespace transaction_monitor {

using TimePoint = time_utils::TimePoint;

// Half-open interval (since, until].
struct TimeRange {
    TimePoint since;
    TimePoint until;

    bool Contains(TimePoint tp) const { return tp > since && tp <= until; }
};

struct AccountRecord {
    std::string account_id;
    TimePoint created_at;
    std::string risk_tier;
    std::string status;
};

struct BeneficiaryRecord {
    std::string beneficiary_id;
    std::string account_id;
    TimePoint registered_at;
    std::string source_ip;
    std::string registered_by;
    bool verified = false;
    std::optional<TimePoint> last_payment_at;
};

struct BeneficiaryChange {
    std::string change_id;
    std::string beneficiary_id;
    TimePoint changed_at;
    std::string change_type;    // account_number, routing_number, bank_name, ...
    std::string change_source;  // portal, erp, email_request, phone_request, fax
    bool verified = false;
};

struct AccountChange {
    std::string change_id;
    std::string account_id;
    TimePoint changed_at;
    std::string change_type;  // phone, device, sim, email, password
};

struct DeviceSession {
    std::string session_id;
    std::string account_id;
    std::string device_id;
    std::string fingerprint;
    std::string ip_address;
    TimePoint started_at;
};

struct BlacklistEntry {
    std::string entity_type;  // account, ip, device, email
    std::string entity_value;
    std::string reason;
    std::string severity;  // low, medium, high, critical
    bool active = true;
    std::optional<TimePoint> expires_at;
};

struct VpnProxyEntry {
    std::string network;  // single address or IPv4 CIDR
    std::string provider;
    std::string kind;  // vpn, proxy, tor, hosting
    double confidence = 0.0;
};

struct HighRiskLocation {
    std::string country;
    std::string city;  // empty for the whole country
    std::string severity;
    bool sanctioned = false;
    bool embargoed = false;
    bool high_fraud_rate = false;
    bool block_by_default = false;
};

struct BehavioralSample {
    std::string account_id;
    TimePoint captured_at;
    std::optional<double> typing_speed_wpm;
    std::optional<double> mouse_velocity;
    std::optional<double> session_duration_seconds;
    std::optional<double> copy_paste_count;
    std::optional<bool> autofill_used;
};

struct FraudFlag {
    std::string flag_id;
    std::string entity_id;
    TimePoint flagged_at;
    double severity = 0.0;  // 1..10
    std::string fraud_type;
    bool confirmed = false;
};

// Read side of the transaction store. Every list is ordered by its timestamp
// ascending. Implementations throw LedgerUnavailableError on any failure.
class TransactionLedger {
public:
    virtual ~TransactionLedger() = default;

    virtual std::optional<AccountRecord> GetAccount(const std::string& account_id) const = 0;

    virtual std::vector<transaction::Transaction> GetAccountTransactions(
        const std::string& account_id, const TimeRange& range) const = 0;

    virtual std::vector<transaction::Transaction> GetCounterpartyTransactions(
        const std::string& account_id,
        const std::string& counterparty_id,
        const TimeRange& range) const = 0;

    virtual std::optional<BeneficiaryRecord> GetBeneficiary(
        const std::string& beneficiary_id) const = 0;

    // Beneficiaries of the account registered within the range.
    virtual std::vector<BeneficiaryRecord> GetRegisteredBeneficiaries(
        const std::string& account_id, const TimeRange& range) const = 0;

    virtual std::vector<BeneficiaryChange> GetBeneficiaryChanges(
        const std::string& beneficiary_id, const TimeRange& range) const = 0;

    virtual std::vector<AccountChange> GetAccountChanges(
        const std::string& account_id, const TimeRange& range) const = 0;

    virtual std::vector<DeviceSession> GetAccountSessions(
        const std::string& account_id, const TimeRange& range) const = 0;

    virtual std::vector<DeviceSession> GetDeviceSessions(
        const std::string& device_id, const TimeRange& range) const = 0;

    virtual std::vector<BlacklistEntry> FindBlacklistEntries(
        const std::string& entity_type, const std::string& entity_value) const = 0;

    virtual std::vector<VpnProxyEntry> FindVpnProxyEntries(const std::string& ip_address) const = 0;

    // Country-wide entries plus the entries for the given city.
    virtual std::vector<HighRiskLocation> FindHighRiskLocations(
        const std::string& country, const std::string& city) const = 0;

    virtual std::vector<BehavioralSample> GetBehavioralSamples(
        const std::string& account_id, const TimeRange& range) const = 0;

    virtual std::vector<FraudFlag> GetFraudFlags(
        const std::string& entity_id, const TimeRange& range) const = 0;
};

}  // namespace transaction_monitor
