#include "geo_group.hpp"

#include <map>

#include <userver/formats/json/value_builder.hpp>

#include "utils/stats.hpp"

namespace transaction_monitor {

namespace {

struct Coordinates {
    double latitude;
    double longitude;
};

std::optional<Coordinates> ReadCoordinates(const JsonValue& geolocation) {
    auto latitude = json_access::GetNumber(geolocation, "latitude");
    auto longitude = json_access::GetNumber(geolocation, "longitude");
    if (!latitude || !longitude) return std::nullopt;
    return Coordinates{*latitude, *longitude};
}

}  // namespace

GeoGroup::GeoGroup(LedgerPtr ledger, GeoConfig config)
    : ledger_(std::move(ledger)), config_(config) {}

void GeoGroup::CollectRiskLocations(const std::string& country, const std::string& city,
                                    ContextFragment& fragment) const {
    const auto locations = ledger_->FindHighRiskLocations(country, city);

    userver::formats::json::ValueBuilder matches(userver::formats::common::Type::kArray);
    std::optional<std::string> max_severity;
    bool sanctioned = false;
    bool embargoed = false;
    bool high_fraud_rate = false;
    bool block_by_default = false;
    for (const auto& location : locations) {
        if (!max_severity || signal_utils::SeverityRank(location.severity) >
                                 signal_utils::SeverityRank(*max_severity)) {
            max_severity = location.severity;
        }
        sanctioned = sanctioned || location.sanctioned;
        embargoed = embargoed || location.embargoed;
        high_fraud_rate = high_fraud_rate || location.high_fraud_rate;
        block_by_default = block_by_default || location.block_by_default;

        userver::formats::json::ValueBuilder match;
        match["country"] = location.country;
        match["city"] = location.city;
        match["severity"] = location.severity;
        matches.PushBack(std::move(match));
    }

    fragment.SetBool("is_high_risk_location", !locations.empty());
    fragment.SetString("high_risk_severity", max_severity);
    fragment.SetBool("is_sanctioned", sanctioned);
    fragment.SetBool("is_embargoed", embargoed);
    fragment.SetBool("is_high_fraud_rate", high_fraud_rate);
    fragment.SetBool("block_by_default", block_by_default);
    fragment.SetValue("high_risk_matches", matches.ExtractValue());
}

ContextFragment GeoGroup::Collect(const EvaluationInput& input) const {
    const auto& tx = input.transaction;
    ContextFragment fragment{std::string{GetName()}};

    const auto geolocation = json_access::GetObject(input.metadata, "geolocation");
    const auto country = geolocation ? json_access::GetString(*geolocation, "country")
                                     : std::nullopt;
    fragment.SetBool("has_location", geolocation.has_value());
    if (!country) {
        return fragment;
    }
    const auto city = json_access::GetString(*geolocation, "city").value_or("");
    fragment.SetString("country", *country);

    CollectRiskLocations(*country, city, fragment);

    const auto history = signal_utils::PriorTransactions(
        ledger_->GetAccountTransactions(
            tx.account_id(), signal_utils::Lookback(input.as_of, config_.lookback_days * 24.0)),
        tx);

    std::map<std::string, int> country_counts;
    int located = 0;
    int skipped = 0;
    std::optional<std::pair<TimePoint, Coordinates>> last_position;
    for (const auto& prior : history) {
        const auto metadata = signal_utils::HistoricalMetadata(prior, GetName());
        if (!metadata) {
            ++skipped;
            continue;
        }
        const auto prior_geo = json_access::GetObject(*metadata, "geolocation");
        if (!prior_geo) continue;
        if (auto prior_country = json_access::GetString(*prior_geo, "country")) {
            ++country_counts[*prior_country];
            ++located;
        }
        if (auto coordinates = ReadCoordinates(*prior_geo)) {
            last_position.emplace(*signal_utils::TransactionTime(prior), *coordinates);
        }
    }
    fragment.SetNumber("skipped_records", skipped);
    fragment.SetNumber("known_country_count", static_cast<double>(country_counts.size()));

    if (located == 0) {
        fragment.SetNull("is_new_country");
        fragment.SetNull("primary_country");
        fragment.SetNull("primary_country_ratio");
        fragment.SetNull("deviates_from_primary_country");
    } else {
        std::string primary;
        int primary_count = 0;
        for (const auto& [name, count] : country_counts) {
            if (count > primary_count) {
                primary = name;
                primary_count = count;
            }
        }
        const double ratio = static_cast<double>(primary_count) / located;
        fragment.SetBool("is_new_country", country_counts.count(*country) == 0);
        fragment.SetString("primary_country", primary);
        fragment.SetNumber("primary_country_ratio", ratio);
        fragment.SetBool("deviates_from_primary_country",
                         ratio >= config_.primary_country_ratio && primary != *country);
    }

    const auto current = ReadCoordinates(*geolocation);
    if (!current || !last_position) {
        fragment.SetNull("distance_from_last_km");
        fragment.SetNull("hours_since_last_location");
        fragment.SetNull("required_speed_kmh");
        fragment.SetBool("is_impossible_travel", false);
        return fragment;
    }
    const auto& [last_at, last] = *last_position;
    const double distance = stats::HaversineKm(last.latitude, last.longitude, current->latitude,
                                               current->longitude);
    const double hours = time_utils::HoursBetween(last_at, input.as_of);
    const std::optional<double> speed =
        hours > 0.0 ? std::optional<double>{distance / hours} : std::nullopt;

    fragment.SetNumber("distance_from_last_km", distance);
    fragment.SetNumber("hours_since_last_location", hours);
    fragment.SetNumber("required_speed_kmh", speed);
    fragment.SetBool("is_impossible_travel",
                     distance > config_.min_travel_distance_km &&
                         (!speed || *speed > config_.max_travel_speed_kmh));
    return fragment;
}

}  // namespace transaction_monitor
