#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <userver/yaml_config/yaml_config.hpp>

#include "context_assembler/context_assembler.hpp"
#include "decision_engine/decision_engine.hpp"
#include "risk_scorer/risk_scorer.hpp"

namespace transaction_monitor {

struct MonitorConfig {
    std::string rule_sets_dir;
    std::vector<std::string> rule_sets;
    std::chrono::milliseconds evaluation_timeout{2000};
    ScoringConfig scoring;
    DecisionConfig decision;
    SignalGroupsConfig signal_groups;
};

// Reads the static config of the monitor component. Missing keys keep their
// defaults. Throws RuleConfigError on out-of-range signal group settings.
MonitorConfig ParseMonitorConfig(const userver::yaml_config::YamlConfig& config);

}  // namespace transaction_monitor
