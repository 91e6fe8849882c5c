#include "time_utils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace transaction_monitor::time_utils {

namespace {

std::tm ToUtcTm(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

bool IsAllDigits(const std::string& s) {
    if (s.empty()) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
    }
    return true;
}

}  // namespace

std::optional<TimePoint> ParseTimestamp(const std::string& timestamp) {
    if (timestamp.empty()) {
        return std::nullopt;
    }

    if (IsAllDigits(timestamp)) {
        try {
            return FromEpochSeconds(std::stoll(timestamp));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    if (timestamp.find('T') == std::string::npos) {
        return std::nullopt;
    }

    // Seconds precision is enough for every window the pipeline computes.
    std::string core = timestamp.substr(0, 19);
    std::tm tm{};
    std::istringstream ss(core);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::string rest = timestamp.substr(core.size());
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') ++i;
        rest = rest.substr(i);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string FormatIso(TimePoint tp) {
    const std::tm tm = ToUtcTm(tp);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

int64_t ToEpochSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromEpochSeconds(int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

double HoursBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

double DaysBetween(TimePoint from, TimePoint to) {
    return HoursBetween(from, to) / 24.0;
}

int HourOfDay(TimePoint tp) {
    return ToUtcTm(tp).tm_hour;
}

bool IsWeekend(TimePoint tp) {
    const int wday = ToUtcTm(tp).tm_wday;
    return wday == 0 || wday == 6;
}

}  // namespace transaction_monitor::time_utils
