#include "stats.hpp"

#include <cmath>
#include <numeric>

namespace transaction_monitor::stats {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

}  // namespace

std::optional<double> Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

std::optional<double> StdDev(const std::vector<double>& values) {
    const auto mean = Mean(values);
    if (!mean) {
        return std::nullopt;
    }
    double variance = 0.0;
    for (double v : values) {
        variance += (v - *mean) * (v - *mean);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance);
}

std::optional<double> CoefficientOfVariation(const std::vector<double>& values) {
    if (values.size() < 2) {
        return std::nullopt;
    }
    const double mean = *Mean(values);
    if (mean == 0.0) {
        return std::nullopt;
    }
    return *StdDev(values) / std::abs(mean);
}

std::optional<double> ZScore(double value, double mean, double stddev) {
    if (stddev <= 0.0) {
        return std::nullopt;
    }
    return std::abs(value - mean) / stddev;
}

double HaversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double dlat = ToRadians(lat2 - lat1);
    const double dlon = ToRadians(lon2 - lon1);
    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(ToRadians(lat1)) * std::cos(ToRadians(lat2)) *
                     std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return kEarthRadiusKm * c;
}

}  // namespace transaction_monitor::stats
