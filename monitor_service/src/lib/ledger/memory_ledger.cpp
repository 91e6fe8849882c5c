#include "memory_ledger.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <sstream>

#include <userver/engine/sleep.hpp>
#include <userver/engine/task/cancel.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

std::optional<uint32_t> ParseIpv4(const std::string& address) {
    std::istringstream ss(address);
    uint32_t result = 0;
    for (int i = 0; i < 4; ++i) {
        int octet = -1;
        if (!(ss >> octet) || octet < 0 || octet > 255) {
            return std::nullopt;
        }
        result = (result << 8) | static_cast<uint32_t>(octet);
        if (i < 3) {
            char dot = 0;
            if (!(ss >> dot) || dot != '.') {
                return std::nullopt;
            }
        }
    }
    if (ss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return result;
}

TimePoint TransactionTime(const transaction::Transaction& tx) {
    return time_utils::ParseTimestamp(tx.timestamp()).value_or(TimePoint{});
}

template <typename Record, typename Pred, typename TimeOf>
std::vector<Record> Select(const std::vector<Record>& records, Pred pred, TimeOf time_of) {
    std::vector<Record> selected;
    for (const auto& record : records) {
        if (pred(record)) {
            selected.push_back(record);
        }
    }
    std::stable_sort(selected.begin(), selected.end(), [&](const Record& a, const Record& b) {
        return time_of(a) < time_of(b);
    });
    return selected;
}

}  // namespace

bool IpMatchesNetwork(const std::string& ip_address, const std::string& network) {
    if (ip_address == network) {
        return true;
    }
    const auto slash = network.find('/');
    if (slash == std::string::npos) {
        return false;
    }
    const auto ip = ParseIpv4(ip_address);
    const auto base = ParseIpv4(network.substr(0, slash));
    if (!ip || !base) {
        return false;
    }
    int prefix = 0;
    try {
        prefix = std::stoi(network.substr(slash + 1));
    } catch (const std::exception&) {
        return false;
    }
    if (prefix < 0 || prefix > 32) {
        return false;
    }
    const uint32_t mask = prefix == 0 ? 0 : ~uint32_t{0} << (32 - prefix);
    return (*ip & mask) == (*base & mask);
}

void MemoryLedger::AddAccount(AccountRecord account) {
    std::unique_lock lock(mutex_);
    accounts_[account.account_id] = std::move(account);
}

void MemoryLedger::AddTransaction(transaction::Transaction tx) {
    std::unique_lock lock(mutex_);
    transactions_.push_back(std::move(tx));
}

void MemoryLedger::AddBeneficiary(BeneficiaryRecord beneficiary) {
    std::unique_lock lock(mutex_);
    beneficiaries_[beneficiary.beneficiary_id] = std::move(beneficiary);
}

void MemoryLedger::AddBeneficiaryChange(BeneficiaryChange change) {
    std::unique_lock lock(mutex_);
    beneficiary_changes_.push_back(std::move(change));
}

void MemoryLedger::AddAccountChange(AccountChange change) {
    std::unique_lock lock(mutex_);
    account_changes_.push_back(std::move(change));
}

void MemoryLedger::AddDeviceSession(DeviceSession session) {
    std::unique_lock lock(mutex_);
    sessions_.push_back(std::move(session));
}

void MemoryLedger::AddBlacklistEntry(BlacklistEntry entry) {
    std::unique_lock lock(mutex_);
    blacklist_.push_back(std::move(entry));
}

void MemoryLedger::AddVpnProxyEntry(VpnProxyEntry entry) {
    std::unique_lock lock(mutex_);
    vpn_proxy_.push_back(std::move(entry));
}

void MemoryLedger::AddHighRiskLocation(HighRiskLocation location) {
    std::unique_lock lock(mutex_);
    high_risk_locations_.push_back(std::move(location));
}

void MemoryLedger::AddBehavioralSample(BehavioralSample sample) {
    std::unique_lock lock(mutex_);
    behavioral_samples_.push_back(std::move(sample));
}

void MemoryLedger::AddFraudFlag(FraudFlag flag) {
    std::unique_lock lock(mutex_);
    fraud_flags_.push_back(std::move(flag));
}

void MemoryLedger::SetAvailable(bool available) {
    std::unique_lock lock(mutex_);
    available_ = available;
}

void MemoryLedger::SetQueryDelay(const std::string& query, std::chrono::milliseconds delay) {
    std::unique_lock lock(mutex_);
    delays_[query] = delay;
}

void MemoryLedger::BeforeQuery(const std::string& query) const {
    std::chrono::milliseconds delay{0};
    {
        std::shared_lock lock(mutex_);
        if (!available_) {
            throw LedgerUnavailableError("In-memory ledger is marked unavailable");
        }
        auto it = delays_.find(query);
        if (it != delays_.end()) {
            delay = it->second;
        }
    }
    if (delay.count() > 0) {
        userver::engine::InterruptibleSleepFor(delay);
        userver::engine::current_task::CancellationPoint();
    }
}

std::optional<AccountRecord> MemoryLedger::GetAccount(const std::string& account_id) const {
    BeforeQuery("GetAccount");
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(account_id);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<transaction::Transaction> MemoryLedger::GetAccountTransactions(
    const std::string& account_id, const TimeRange& range) const {
    BeforeQuery("GetAccountTransactions");
    std::shared_lock lock(mutex_);
    return Select(
        transactions_,
        [&](const transaction::Transaction& tx) {
            return tx.account_id() == account_id && range.Contains(TransactionTime(tx));
        },
        TransactionTime);
}

std::vector<transaction::Transaction> MemoryLedger::GetCounterpartyTransactions(
    const std::string& account_id,
    const std::string& counterparty_id,
    const TimeRange& range) const {
    BeforeQuery("GetCounterpartyTransactions");
    std::shared_lock lock(mutex_);
    return Select(
        transactions_,
        [&](const transaction::Transaction& tx) {
            return tx.account_id() == account_id && tx.counterparty_id() == counterparty_id &&
                   range.Contains(TransactionTime(tx));
        },
        TransactionTime);
}

std::optional<BeneficiaryRecord> MemoryLedger::GetBeneficiary(
    const std::string& beneficiary_id) const {
    BeforeQuery("GetBeneficiary");
    std::shared_lock lock(mutex_);
    auto it = beneficiaries_.find(beneficiary_id);
    if (it == beneficiaries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BeneficiaryRecord> MemoryLedger::GetRegisteredBeneficiaries(
    const std::string& account_id, const TimeRange& range) const {
    BeforeQuery("GetRegisteredBeneficiaries");
    std::shared_lock lock(mutex_);
    std::vector<BeneficiaryRecord> all;
    for (const auto& [id, beneficiary] : beneficiaries_) {
        all.push_back(beneficiary);
    }
    auto selected = Select(
        all,
        [&](const BeneficiaryRecord& b) {
            return b.account_id == account_id && range.Contains(b.registered_at);
        },
        [](const BeneficiaryRecord& b) { return b.registered_at; });
    return selected;
}

std::vector<BeneficiaryChange> MemoryLedger::GetBeneficiaryChanges(
    const std::string& beneficiary_id, const TimeRange& range) const {
    BeforeQuery("GetBeneficiaryChanges");
    std::shared_lock lock(mutex_);
    return Select(
        beneficiary_changes_,
        [&](const BeneficiaryChange& c) {
            return c.beneficiary_id == beneficiary_id && range.Contains(c.changed_at);
        },
        [](const BeneficiaryChange& c) { return c.changed_at; });
}

std::vector<AccountChange> MemoryLedger::GetAccountChanges(
    const std::string& account_id, const TimeRange& range) const {
    BeforeQuery("GetAccountChanges");
    std::shared_lock lock(mutex_);
    return Select(
        account_changes_,
        [&](const AccountChange& c) {
            return c.account_id == account_id && range.Contains(c.changed_at);
        },
        [](const AccountChange& c) { return c.changed_at; });
}

std::vector<DeviceSession> MemoryLedger::GetAccountSessions(
    const std::string& account_id, const TimeRange& range) const {
    BeforeQuery("GetAccountSessions");
    std::shared_lock lock(mutex_);
    return Select(
        sessions_,
        [&](const DeviceSession& s) {
            return s.account_id == account_id && range.Contains(s.started_at);
        },
        [](const DeviceSession& s) { return s.started_at; });
}

std::vector<DeviceSession> MemoryLedger::GetDeviceSessions(
    const std::string& device_id, const TimeRange& range) const {
    BeforeQuery("GetDeviceSessions");
    std::shared_lock lock(mutex_);
    return Select(
        sessions_,
        [&](const DeviceSession& s) {
            return s.device_id == device_id && range.Contains(s.started_at);
        },
        [](const DeviceSession& s) { return s.started_at; });
}

std::vector<BlacklistEntry> MemoryLedger::FindBlacklistEntries(
    const std::string& entity_type, const std::string& entity_value) const {
    BeforeQuery("FindBlacklistEntries");
    std::shared_lock lock(mutex_);
    std::vector<BlacklistEntry> matches;
    for (const auto& entry : blacklist_) {
        if (entry.entity_type == entity_type && entry.entity_value == entity_value) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::vector<VpnProxyEntry> MemoryLedger::FindVpnProxyEntries(const std::string& ip_address) const {
    BeforeQuery("FindVpnProxyEntries");
    std::shared_lock lock(mutex_);
    std::vector<VpnProxyEntry> matches;
    for (const auto& entry : vpn_proxy_) {
        if (IpMatchesNetwork(ip_address, entry.network)) {
            matches.push_back(entry);
        }
    }
    return matches;
}

std::vector<HighRiskLocation> MemoryLedger::FindHighRiskLocations(
    const std::string& country, const std::string& city) const {
    BeforeQuery("FindHighRiskLocations");
    std::shared_lock lock(mutex_);
    std::vector<HighRiskLocation> matches;
    for (const auto& location : high_risk_locations_) {
        if (location.country != country) continue;
        if (location.city.empty() || location.city == city) {
            matches.push_back(location);
        }
    }
    return matches;
}

std::vector<BehavioralSample> MemoryLedger::GetBehavioralSamples(
    const std::string& account_id, const TimeRange& range) const {
    BeforeQuery("GetBehavioralSamples");
    std::shared_lock lock(mutex_);
    return Select(
        behavioral_samples_,
        [&](const BehavioralSample& s) {
            return s.account_id == account_id && range.Contains(s.captured_at);
        },
        [](const BehavioralSample& s) { return s.captured_at; });
}

std::vector<FraudFlag> MemoryLedger::GetFraudFlags(
    const std::string& entity_id, const TimeRange& range) const {
    BeforeQuery("GetFraudFlags");
    std::shared_lock lock(mutex_);
    return Select(
        fraud_flags_,
        [&](const FraudFlag& f) {
            return f.entity_id == entity_id && range.Contains(f.flagged_at);
        },
        [](const FraudFlag& f) { return f.flagged_at; });
}

}  // namespace transaction_monitor
