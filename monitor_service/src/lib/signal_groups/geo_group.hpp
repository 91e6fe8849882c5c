#pragma once

#include "signal_group.hpp"

namespace transaction_monitor {

struct GeoConfig {
    int lookback_days = 180;
    double primary_country_ratio = 0.8;
    double max_travel_speed_kmh = 900.0;
    double min_travel_distance_km = 100.0;
};

// High-risk locations, countries new to the account and impossible travel
// between the last known and the current coordinates.
class GeoGroup final : public SignalGroup {
public:
    GeoGroup(LedgerPtr ledger, GeoConfig config);

    std::string_view GetName() const override { return "geo"; }
    ContextFragment Collect(const EvaluationInput& input) const override;

private:
    void CollectRiskLocations(const std::string& country, const std::string& city,
                              ContextFragment& fragment) const;

    LedgerPtr ledger_;
    GeoConfig config_;
};

}  // namespace transaction_monitor
