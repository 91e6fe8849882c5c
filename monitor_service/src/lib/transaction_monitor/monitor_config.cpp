#include "monitor_config.hpp"

#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <userver/formats/parse/common_containers.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

using userver::yaml_config::YamlConfig;

void ParseVelocity(const YamlConfig& config, VelocityConfig& velocity) {
    velocity.window_hours = config["window-hours"].As<std::vector<int>>(velocity.window_hours);
    velocity.small_deposit_threshold =
        config["small-deposit-threshold"].As<double>(velocity.small_deposit_threshold);
    velocity.small_deposit_types =
        config["small-deposit-types"].As<std::vector<std::string>>(velocity.small_deposit_types);
    velocity.lookback_days = config["lookback-days"].As<int>(velocity.lookback_days);
    velocity.cold_start_deviation =
        config["cold-start-deviation"].As<double>(velocity.cold_start_deviation);
}

void ParseMule(const YamlConfig& config, MuleConfig& mule) {
    mule.window_hours = config["window-hours"].As<std::vector<int>>(mule.window_hours);
    mule.transfer_window_hours =
        config["transfer-window-hours"].As<int>(mule.transfer_window_hours);
}

void ParseBeneficiary(const YamlConfig& config, BeneficiaryConfig& beneficiary) {
    beneficiary.window_hours =
        config["window-hours"].As<std::vector<int>>(beneficiary.window_hours);
    beneficiary.new_beneficiary_hours =
        config["new-beneficiary-hours"].As<double>(beneficiary.new_beneficiary_hours);
    beneficiary.change_lookback_days =
        config["change-lookback-days"].As<int>(beneficiary.change_lookback_days);
    beneficiary.off_hours_start = config["off-hours-start"].As<int>(beneficiary.off_hours_start);
    beneficiary.off_hours_end = config["off-hours-end"].As<int>(beneficiary.off_hours_end);
}

void ParseAto(const YamlConfig& config, AtoConfig& ato) {
    ato.window_hours = config["window-hours"].As<std::vector<int>>(ato.window_hours);
    ato.tracked_change_types =
        config["tracked-change-types"].As<std::vector<std::string>>(ato.tracked_change_types);
}

void ParseOddHours(const YamlConfig& config, OddHoursConfig& odd_hours) {
    odd_hours.start_hour = config["start-hour"].As<int>(odd_hours.start_hour);
    odd_hours.end_hour = config["end-hour"].As<int>(odd_hours.end_hour);
    odd_hours.lookback_days = config["lookback-days"].As<int>(odd_hours.lookback_days);
    odd_hours.min_history = config["min-history"].As<int>(odd_hours.min_history);
    odd_hours.rare_ratio = config["rare-ratio"].As<double>(odd_hours.rare_ratio);
}

void ParseGeo(const YamlConfig& config, GeoConfig& geo) {
    geo.lookback_days = config["lookback-days"].As<int>(geo.lookback_days);
    geo.primary_country_ratio =
        config["primary-country-ratio"].As<double>(geo.primary_country_ratio);
    geo.max_travel_speed_kmh = config["max-travel-speed-kmh"].As<double>(geo.max_travel_speed_kmh);
    geo.min_travel_distance_km =
        config["min-travel-distance-km"].As<double>(geo.min_travel_distance_km);
}

void ParseDevice(const YamlConfig& config, DeviceConfig& device) {
    device.lookback_days = config["lookback-days"].As<int>(device.lookback_days);
    device.shared_window_days = config["shared-window-days"].As<int>(device.shared_window_days);
    device.shared_device_accounts =
        config["shared-device-accounts"].As<int>(device.shared_device_accounts);
}

void ParseBiometrics(const YamlConfig& config, BiometricsConfig& biometrics) {
    biometrics.lookback_days = config["lookback-days"].As<int>(biometrics.lookback_days);
    biometrics.min_samples = config["min-samples"].As<int>(biometrics.min_samples);
    biometrics.zscore_threshold = config["zscore-threshold"].As<double>(biometrics.zscore_threshold);
    biometrics.habit_high_ratio = config["habit-high-ratio"].As<double>(biometrics.habit_high_ratio);
    biometrics.habit_low_ratio = config["habit-low-ratio"].As<double>(biometrics.habit_low_ratio);
}

void ParseRelationship(const YamlConfig& config, RelationshipConfig& relationship) {
    relationship.active_days = config["active-days"].As<int>(relationship.active_days);
    relationship.recent_days = config["recent-days"].As<int>(relationship.recent_days);
    relationship.dormant_days = config["dormant-days"].As<int>(relationship.dormant_days);
}

void ParseAccountAge(const YamlConfig& config, AccountAgeConfig& account_age) {
    account_age.brand_new_days = config["brand-new-days"].As<int>(account_age.brand_new_days);
    account_age.new_days = config["new-days"].As<int>(account_age.new_days);
    account_age.young_days = config["young-days"].As<int>(account_age.young_days);
    account_age.established_days =
        config["established-days"].As<int>(account_age.established_days);
    account_age.large_amount = config["large-amount"].As<double>(account_age.large_amount);
}

void ParseFraudHistory(const YamlConfig& config, FraudHistoryConfig& fraud_history) {
    fraud_history.window_days =
        config["window-days"].As<std::vector<int>>(fraud_history.window_days);
    fraud_history.recent_days = config["recent-days"].As<int>(fraud_history.recent_days);
    fraud_history.repeat_offender_flags =
        config["repeat-offender-flags"].As<int>(fraud_history.repeat_offender_flags);
}

void ParseCheck(const YamlConfig& config, CheckConfig& check) {
    check.lookback_days = config["lookback-days"].As<int>(check.lookback_days);
}

void RequireAtLeast(std::string_view key, int value, int minimum) {
    if (value < minimum) {
        throw RuleConfigError(fmt::format("{} must be at least {}, got {}", key, minimum, value));
    }
}

void RequirePositive(std::string_view key, int value) { RequireAtLeast(key, value, 1); }

// Non-empty, positive and strictly increasing.
void RequireWindows(std::string_view key, const std::vector<int>& windows) {
    if (windows.empty()) {
        throw RuleConfigError(fmt::format("{} must not be empty", key));
    }
    for (size_t i = 0; i < windows.size(); ++i) {
        if (windows[i] <= 0 || (i > 0 && windows[i] <= windows[i - 1])) {
            throw RuleConfigError(fmt::format(
                "{} must be positive and strictly increasing, got [{}]", key,
                fmt::join(windows, ", ")));
        }
    }
}

void RequireHour(std::string_view key, int hour) {
    if (hour < 0 || hour > 23) {
        throw RuleConfigError(fmt::format("{} must be an hour of day, got {}", key, hour));
    }
}

void ValidateSignalGroups(const SignalGroupsConfig& groups) {
    RequireWindows("velocity.window-hours", groups.velocity.window_hours);
    RequirePositive("velocity.lookback-days", groups.velocity.lookback_days);

    RequireWindows("mule.window-hours", groups.mule.window_hours);
    RequirePositive("mule.transfer-window-hours", groups.mule.transfer_window_hours);

    RequireWindows("beneficiary.window-hours", groups.beneficiary.window_hours);
    RequirePositive("beneficiary.change-lookback-days", groups.beneficiary.change_lookback_days);
    RequireHour("beneficiary.off-hours-start", groups.beneficiary.off_hours_start);
    RequireHour("beneficiary.off-hours-end", groups.beneficiary.off_hours_end);

    RequireWindows("ato.window-hours", groups.ato.window_hours);

    RequireHour("odd-hours.start-hour", groups.odd_hours.start_hour);
    RequireHour("odd-hours.end-hour", groups.odd_hours.end_hour);
    RequirePositive("odd-hours.lookback-days", groups.odd_hours.lookback_days);
    RequirePositive("odd-hours.min-history", groups.odd_hours.min_history);

    RequirePositive("geo.lookback-days", groups.geo.lookback_days);

    RequirePositive("device.lookback-days", groups.device.lookback_days);
    RequirePositive("device.shared-window-days", groups.device.shared_window_days);
    RequireAtLeast("device.shared-device-accounts", groups.device.shared_device_accounts, 2);

    RequirePositive("biometrics.lookback-days", groups.biometrics.lookback_days);
    RequirePositive("biometrics.min-samples", groups.biometrics.min_samples);

    const auto& relationship = groups.relationship;
    RequireWindows("relationship.active/recent/dormant-days",
                   {relationship.active_days, relationship.recent_days, relationship.dormant_days});

    const auto& account_age = groups.account_age;
    RequireAtLeast("account-age.brand-new-days", account_age.brand_new_days, 0);
    if (account_age.new_days <= account_age.brand_new_days ||
        account_age.young_days <= account_age.new_days ||
        account_age.established_days <= account_age.young_days) {
        throw RuleConfigError(fmt::format(
            "account-age buckets must be strictly increasing, got {}/{}/{}/{}",
            account_age.brand_new_days, account_age.new_days, account_age.young_days,
            account_age.established_days));
    }

    RequireWindows("fraud-history.window-days", groups.fraud_history.window_days);
    RequirePositive("fraud-history.recent-days", groups.fraud_history.recent_days);
    RequirePositive("fraud-history.repeat-offender-flags",
                    groups.fraud_history.repeat_offender_flags);

    RequirePositive("check.lookback-days", groups.check.lookback_days);
}

}  // namespace

MonitorConfig ParseMonitorConfig(const YamlConfig& config) {
    MonitorConfig result;
    result.rule_sets_dir = config["rule-sets-dir"].As<std::string>();
    result.rule_sets = config["rule-sets"].As<std::vector<std::string>>();
    result.evaluation_timeout = std::chrono::milliseconds{
        config["evaluation-timeout-ms"].As<int64_t>(result.evaluation_timeout.count())};

    result.scoring.normalization_divisor =
        config["normalization-divisor"].As<double>(result.scoring.normalization_divisor);
    result.scoring.version = config["scoring-version"].As<std::string>(result.scoring.version);
    result.decision.manual_review_threshold =
        config["manual-review-threshold"].As<double>(result.decision.manual_review_threshold);

    const auto groups = config["signal-groups"];
    auto& signal_groups = result.signal_groups;
    ParseVelocity(groups["velocity"], signal_groups.velocity);
    ParseMule(groups["mule"], signal_groups.mule);
    ParseBeneficiary(groups["beneficiary"], signal_groups.beneficiary);
    ParseAto(groups["ato"], signal_groups.ato);
    ParseOddHours(groups["odd-hours"], signal_groups.odd_hours);
    ParseGeo(groups["geo"], signal_groups.geo);
    ParseDevice(groups["device"], signal_groups.device);
    ParseBiometrics(groups["biometrics"], signal_groups.biometrics);
    ParseRelationship(groups["relationship"], signal_groups.relationship);
    ParseAccountAge(groups["account-age"], signal_groups.account_age);
    ParseFraudHistory(groups["fraud-history"], signal_groups.fraud_history);
    ParseCheck(groups["check"], signal_groups.check);
    ValidateSignalGroups(signal_groups);
    return result;
}

}  // namespace transaction_monitor
