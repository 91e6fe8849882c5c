#include "vpn_group.hpp"

#include <fmt/format.h>

#include <userver/formats/json/value_builder.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/ip.hpp>

namespace transaction_monitor {

namespace {

// Only a parsable IPv4 or IPv6 address is matched against the ledger ranges.
bool IsIpAddress(const std::string& value) {
    try {
        userver::utils::ip::AddressV4FromString(value);
        return true;
    } catch (const userver::utils::ip::AddressConversionException&) {
    }
    try {
        userver::utils::ip::AddressV6FromString(value);
        return true;
    } catch (const userver::utils::ip::AddressConversionException&) {
    }
    return false;
}

}  // namespace

VpnGroup::VpnGroup(LedgerPtr ledger)
    : ledger_(std::move(ledger)) {}

ContextFragment VpnGroup::Collect(const EvaluationInput& input) const {
    ContextFragment fragment{std::string{GetName()}};

    const auto ip = json_access::GetString(input.metadata, "ip_address");
    fragment.SetBool("has_ip", ip.has_value());
    if (!ip) {
        return fragment;
    }
    const bool valid = IsIpAddress(*ip);
    fragment.SetBool("invalid_ip", !valid);
    if (!valid) {
        LOG_WARNING() << fmt::format("Transaction {}: ip_address '{}' is not an IP address",
                                     input.transaction.transaction_id(), *ip);
        return fragment;
    }

    bool is_vpn = false;
    bool is_proxy = false;
    bool is_tor = false;
    bool is_hosting = false;
    std::optional<double> max_confidence;
    std::optional<std::string> provider;
    userver::formats::json::ValueBuilder matches(userver::formats::common::Type::kArray);

    for (const auto& entry : ledger_->FindVpnProxyEntries(*ip)) {
        is_vpn = is_vpn || entry.kind == "vpn";
        is_proxy = is_proxy || entry.kind == "proxy";
        is_tor = is_tor || entry.kind == "tor";
        is_hosting = is_hosting || entry.kind == "hosting";
        if (!max_confidence || entry.confidence > *max_confidence) {
            max_confidence = entry.confidence;
            provider = entry.provider;
        }
        userver::formats::json::ValueBuilder match;
        match["network"] = entry.network;
        match["provider"] = entry.provider;
        match["kind"] = entry.kind;
        match["confidence"] = entry.confidence;
        matches.PushBack(std::move(match));
    }

    fragment.SetBool("is_vpn", is_vpn);
    fragment.SetBool("is_proxy", is_proxy);
    fragment.SetBool("is_tor", is_tor);
    fragment.SetBool("is_hosting", is_hosting);
    fragment.SetBool("is_anonymized", is_vpn || is_proxy || is_tor || is_hosting);
    fragment.SetNumber("max_confidence", max_confidence);
    fragment.SetString("provider", provider);
    fragment.SetValue("matches", matches.ExtractValue());
    return fragment;
}

}  // namespace transaction_monitor
