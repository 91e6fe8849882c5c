#include "blacklist_group.hpp"

#include <userver/formats/json/value_builder.hpp>

namespace transaction_monitor {

namespace {

struct Lookup {
    std::string field;        // signal name of the checked identifier
    std::string entity_type;  // blacklist entity type
    std::optional<std::string> value;
};

bool IsActive(const BlacklistEntry& entry, TimePoint as_of) {
    return entry.active && (!entry.expires_at || *entry.expires_at > as_of);
}

}  // namespace

BlacklistGroup::BlacklistGroup(LedgerPtr ledger)
    : ledger_(std::move(ledger)) {}

ContextFragment BlacklistGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto device = json_access::GetObject(input.metadata, "device");
    std::vector<Lookup> lookups{
        {"account", "account", tx.account_id()},
        {"counterparty", "account",
         tx.counterparty_id().empty() ? std::nullopt
                                      : std::optional<std::string>{tx.counterparty_id()}},
        {"ip", "ip", json_access::GetString(input.metadata, "ip_address")},
        {"device", "device",
         device ? json_access::GetString(*device, "device_id") : std::nullopt},
        {"email", "email", json_access::GetString(input.metadata, "email")},
    };

    userver::formats::json::ValueBuilder matches(userver::formats::common::Type::kArray);
    std::optional<std::string> max_severity;
    int match_count = 0;
    for (const auto& lookup : lookups) {
        bool matched = false;
        if (lookup.value && !lookup.value->empty()) {
            for (const auto& entry : ledger_->FindBlacklistEntries(lookup.entity_type, *lookup.value)) {
                if (!IsActive(entry, input.as_of)) continue;
                matched = true;
                ++match_count;
                if (!max_severity || signal_utils::SeverityRank(entry.severity) >
                                         signal_utils::SeverityRank(*max_severity)) {
                    max_severity = entry.severity;
                }
                userver::formats::json::ValueBuilder match;
                match["matched_field"] = lookup.field;
                match["entity_type"] = entry.entity_type;
                match["entity_value"] = entry.entity_value;
                match["reason"] = entry.reason;
                match["severity"] = entry.severity;
                matches.PushBack(std::move(match));
            }
        }
        fragment.SetBool(lookup.field + "_blacklisted", matched);
    }

    fragment.SetBool("is_blacklisted", match_count > 0);
    fragment.SetNumber("match_count", match_count);
    fragment.SetString("max_severity", max_severity);
    fragment.SetValue("matches", matches.ExtractValue());
    return fragment;
}

}  // namespace transaction_monitor
