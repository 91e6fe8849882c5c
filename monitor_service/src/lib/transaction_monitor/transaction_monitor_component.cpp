#include "transaction_monitor_component.hpp"

#include <fmt/format.h>

#include <userver/logging/log.hpp>
#include <userver/storages/postgres/component.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "assessment_store/postgres_assessment_store.hpp"
#include "ledger/postgres_ledger.hpp"
#include "monitor_config.hpp"
#include "rule_windows.hpp"

namespace transaction_monitor {

TransactionMonitorComponent::TransactionMonitorComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : LoggableComponentBase(config, context) {
    const auto monitor_config = ParseMonitorConfig(config);

    auto pg_cluster =
        context.FindComponent<userver::components::Postgres>("postgres-db-1").GetCluster();
    auto ledger = std::make_shared<PostgresLedger>(pg_cluster);
    auto store = std::make_shared<PostgresAssessmentStore>(pg_cluster);

    std::vector<rules::RuleSet> rule_sets;
    for (const auto& name : monitor_config.rule_sets) {
        rule_sets.push_back(LoadRuleSet(monitor_config.rule_sets_dir, name));
    }
    auto catalog = std::make_shared<const RuleCatalog>(RuleCatalog::FromRuleSets(rule_sets));
    ValidateRuleWindows(*catalog, monitor_config.signal_groups);
    LOG_INFO() << fmt::format("Rule catalog ready: {} rules from {} rule sets", catalog->Size(),
                              rule_sets.size());

    monitor_ = std::make_unique<TransactionMonitor>(
        ContextAssembler{MakeSignalGroups(ledger, monitor_config.signal_groups),
                         monitor_config.evaluation_timeout},
        RuleEvaluator{catalog},
        RiskScorer{monitor_config.scoring},
        DecisionEngine{monitor_config.decision},
        store);

    LOG_INFO() << fmt::format(
        "TransactionMonitor initialized: scoring={} divisor={} review_threshold={} timeout={}ms",
        monitor_config.scoring.version, monitor_config.scoring.normalization_divisor,
        monitor_config.decision.manual_review_threshold,
        monitor_config.evaluation_timeout.count());
}

TransactionMonitorComponent::~TransactionMonitorComponent() {
    LOG_INFO() << "TransactionMonitor shutting down";
}

userver::yaml_config::Schema TransactionMonitorComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::LoggableComponentBase>(R"(
type: object
description: Transaction fraud-risk monitoring pipeline
additionalProperties: false
properties:
    rule-sets-dir:
        type: string
        description: Directory with <name>.json rule set files
    rule-sets:
        type: array
        description: Rule sets to load, in catalog order
        items:
            type: string
            description: rule set name
    evaluation-timeout-ms:
        type: integer
        description: Deadline of signal assembly per transaction
        defaultDescription: 2000
    normalization-divisor:
        type: number
        description: Sum of triggered weights that maps to score 1.0
        defaultDescription: 10.0
    scoring-version:
        type: string
        description: Version tag stored on every assessment
        defaultDescription: linear-v1
    manual-review-threshold:
        type: number
        description: Score at or above which a transaction goes to manual review
        defaultDescription: 0.6
    signal-groups:
        type: object
        description: Parameters of the signal groups
        additionalProperties: false
        properties:
            velocity:
                type: object
                description: transaction velocity and amount deviation
                additionalProperties: false
                properties:
                    window-hours:
                        type: array
                        description: count windows
                        items:
                            type: integer
                            description: hours
                    small-deposit-threshold:
                        type: number
                        description: maximum amount of a small deposit
                    small-deposit-types:
                        type: array
                        description: inbound types counted as small deposits, empty for any
                        items:
                            type: string
                            description: transaction type
                    lookback-days:
                        type: integer
                        description: same-type amount history
                    cold-start-deviation:
                        type: number
                        description: deviation reported without history
            mule:
                type: object
                description: money mule flow-through
                additionalProperties: false
                properties:
                    window-hours:
                        type: array
                        description: flow windows
                        items:
                            type: integer
                            description: hours
                    transfer-window-hours:
                        type: integer
                        description: inbound to outbound pairing window
            beneficiary:
                type: object
                description: beneficiary freshness and changes
                additionalProperties: false
                properties:
                    window-hours:
                        type: array
                        description: registration windows
                        items:
                            type: integer
                            description: hours
                    new-beneficiary-hours:
                        type: number
                        description: age under which a beneficiary is new
                    change-lookback-days:
                        type: integer
                        description: banking detail change history
                    off-hours-start:
                        type: integer
                        description: first off-hour
                    off-hours-end:
                        type: integer
                        description: first business hour
            ato:
                type: object
                description: account takeover
                additionalProperties: false
                properties:
                    window-hours:
                        type: array
                        description: change windows
                        items:
                            type: integer
                            description: hours
                    tracked-change-types:
                        type: array
                        description: account change types
                        items:
                            type: string
                            description: change type
            odd-hours:
                type: object
                description: time of day
                additionalProperties: false
                properties:
                    start-hour:
                        type: integer
                        description: first odd hour, UTC
                    end-hour:
                        type: integer
                        description: first regular hour, UTC
                    lookback-days:
                        type: integer
                        description: personal pattern history
                    min-history:
                        type: integer
                        description: minimum sample for the personal pattern
                    rare-ratio:
                        type: number
                        description: personal ratio considered unusual
            geo:
                type: object
                description: geolocation
                additionalProperties: false
                properties:
                    lookback-days:
                        type: integer
                        description: country history
                    primary-country-ratio:
                        type: number
                        description: share of history that makes a primary country
                    max-travel-speed-kmh:
                        type: number
                        description: fastest plausible travel
                    min-travel-distance-km:
                        type: number
                        description: shorter hops are never impossible travel
            device:
                type: object
                description: device fingerprint
                additionalProperties: false
                properties:
                    lookback-days:
                        type: integer
                        description: known device history
                    shared-window-days:
                        type: integer
                        description: window for accounts sharing a device
                    shared-device-accounts:
                        type: integer
                        description: accounts on one device that make it shared
            biometrics:
                type: object
                description: behavioral biometrics
                additionalProperties: false
                properties:
                    lookback-days:
                        type: integer
                        description: baseline history
                    min-samples:
                        type: integer
                        description: minimum baseline size
                    zscore-threshold:
                        type: number
                        description: deviation in sigma
                    habit-high-ratio:
                        type: number
                        description: established autofill usage
                    habit-low-ratio:
                        type: number
                        description: established autofill avoidance
            relationship:
                type: object
                description: counterparty relationship
                additionalProperties: false
                properties:
                    active-days:
                        type: integer
                        description: active relationship bound
                    recent-days:
                        type: integer
                        description: recent relationship bound
                    dormant-days:
                        type: integer
                        description: dormant relationship bound
            account-age:
                type: object
                description: account maturity
                additionalProperties: false
                properties:
                    brand-new-days:
                        type: integer
                        description: brand new bucket bound
                    new-days:
                        type: integer
                        description: new bucket bound
                    young-days:
                        type: integer
                        description: young bucket bound
                    established-days:
                        type: integer
                        description: established bucket bound
                    large-amount:
                        type: number
                        description: large transaction on a young account
            fraud-history:
                type: object
                description: prior fraud flags
                additionalProperties: false
                properties:
                    window-days:
                        type: array
                        description: flag count windows
                        items:
                            type: integer
                            description: days
                    recent-days:
                        type: integer
                        description: recent part of the escalation pattern
                    repeat-offender-flags:
                        type: integer
                        description: flags that make a repeat offender
            check:
                type: object
                description: check deposits
                additionalProperties: false
                properties:
                    lookback-days:
                        type: integer
                        description: duplicate search window
)");
}

}  // namespace transaction_monitor
