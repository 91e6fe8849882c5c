#include "device_group.hpp"

#include <algorithm>
#include <set>

#include <userver/formats/json/value_builder.hpp>

namespace transaction_monitor {

DeviceGroup::DeviceGroup(LedgerPtr ledger, DeviceConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

ContextFragment DeviceGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto device = json_access::GetObject(input.metadata, "device");
    const auto device_id = device ? json_access::GetString(*device, "device_id") : std::nullopt;
    fragment.SetBool("has_device", device_id.has_value());
    if (!device_id) {
        return fragment;
    }
    const auto fingerprint = json_access::GetString(*device, "fingerprint");
    const bool is_emulator = json_access::GetBool(*device, "is_emulator").value_or(false);
    const bool is_rooted = json_access::GetBool(*device, "is_rooted").value_or(false);

    const auto sessions = ledger_->GetAccountSessions(
        tx.account_id(), signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0));
    std::set<std::string> known_devices;
    bool seen_device = false;
    bool fingerprint_seen = false;
    for (const auto& session : sessions) {
        known_devices.insert(session.device_id);
        if (session.device_id != *device_id) continue;
        seen_device = true;
        if (fingerprint && session.fingerprint == *fingerprint) fingerprint_seen = true;
    }
    // A first session ever has nothing to compare against.
    const std::optional<bool> is_new_device =
        sessions.empty() ? std::nullopt : std::optional<bool>{!seen_device};
    const bool fingerprint_mismatch = seen_device && fingerprint && !fingerprint_seen;

    const auto device_sessions = ledger_->GetDeviceSessions(
        *device_id, signal_utils::Lookback(input.as_of, config_.shared_window_days * 24.0));
    std::set<std::string> accounts{tx.account_id()};
    for (const auto& session : device_sessions) accounts.insert(session.account_id);
    const bool is_shared = static_cast<int>(accounts.size()) >= config_.shared_device_accounts;

    fragment.SetString("device_id", *device_id);
    fragment.SetNumber("known_device_count", static_cast<double>(known_devices.size()));
    if (is_new_device) {
        fragment.SetBool("is_new_device", *is_new_device);
    } else {
        fragment.SetNull("is_new_device");
    }
    fragment.SetBool("fingerprint_mismatch", fingerprint_mismatch);
    fragment.SetNumber("accounts_on_device", static_cast<double>(accounts.size()));
    fragment.SetBool("is_shared_device", is_shared);
    fragment.SetBool("is_emulator", is_emulator);
    fragment.SetBool("is_rooted", is_rooted);

    userver::formats::json::ValueBuilder indicators(userver::formats::common::Type::kArray);
    std::optional<double> max_confidence;
    auto add_indicator = [&](bool present, const char* name, double confidence) {
        if (!present) return;
        userver::formats::json::ValueBuilder indicator;
        indicator["indicator"] = std::string{name};
        indicator["confidence"] = confidence;
        indicators.PushBack(std::move(indicator));
        max_confidence = std::max(max_confidence.value_or(0.0), confidence);
    };
    add_indicator(is_emulator, "emulator", config_.emulator_confidence);
    add_indicator(is_rooted, "rooted", config_.rooted_confidence);
    add_indicator(is_shared, "shared_device", config_.shared_device_confidence);
    add_indicator(fingerprint_mismatch, "fingerprint_mismatch",
                  config_.fingerprint_mismatch_confidence);
    add_indicator(is_new_device.value_or(false), "new_device", config_.new_device_confidence);

    fragment.SetValue("risk_indicators", indicators.ExtractValue());
    fragment.SetNumber("max_risk_confidence", max_confidence);
    return fragment;
}

}  // namespace transaction_monitor
