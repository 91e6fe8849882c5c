#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace transaction_monitor::time_utils {

using TimePoint = std::chrono::system_clock::time_point;

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fraction and "Z"/"+00:00"
// suffix, or a unix timestamp in seconds.
std::optional<TimePoint> ParseTimestamp(const std::string& timestamp);

std::string FormatIso(TimePoint tp);

int64_t ToEpochSeconds(TimePoint tp);
TimePoint FromEpochSeconds(int64_t seconds);

double HoursBetween(TimePoint from, TimePoint to);
double DaysBetween(TimePoint from, TimePoint to);

// UTC calendar fields.
int HourOfDay(TimePoint tp);
bool IsWeekend(TimePoint tp);

}  // namespace transaction_monitor::time_utils
