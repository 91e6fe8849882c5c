#pragma once

#include <optional>
#include <vector>

namespace transaction_monitor::stats {

std::optional<double> Mean(const std::vector<double>& values);

// Population standard deviation.
std::optional<double> StdDev(const std::vector<double>& values);

// stddev / mean; empty when there are fewer than two values or the mean is 0.
std::optional<double> CoefficientOfVariation(const std::vector<double>& values);

// |value - mean| / stddev; empty when stddev is 0.
std::optional<double> ZScore(double value, double mean, double stddev);

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance between two WGS84 coordinates.
double HaversineKm(double lat1, double lon1, double lat2, double lon2);

}  // namespace transaction_monitor::stats
