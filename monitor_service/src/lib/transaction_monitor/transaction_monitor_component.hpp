#pragma once

#include <memory>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/loggable_component_base.hpp>
#include <userver/yaml_config/schema.hpp>

#include "transaction_monitor.hpp"

namespace transaction_monitor {

// Wires the pipeline to the PostgreSQL ledger and assessment table and loads
// the configured rule sets at startup.
class TransactionMonitorComponent final : public userver::components::LoggableComponentBase {
public:
    static constexpr std::string_view kName = "transaction-monitor";

    TransactionMonitorComponent(const userver::components::ComponentConfig& config,
                                const userver::components::ComponentContext& context);

    ~TransactionMonitorComponent() override;

    TransactionMonitorComponent(const TransactionMonitorComponent&) = delete;
    TransactionMonitorComponent& operator=(const TransactionMonitorComponent&) = delete;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    const TransactionMonitor& GetMonitor() const { return *monitor_; }

private:
    std::unique_ptr<TransactionMonitor> monitor_;
};

}  // namespace transaction_monitor
