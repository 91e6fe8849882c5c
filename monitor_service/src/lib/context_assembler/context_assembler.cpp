#include "context_assembler.hpp"

#include <set>
#include <stdexcept>

#include <fmt/format.h>

#include <userver/engine/deadline.hpp>
#include <userver/engine/task/task_with_result.hpp>
#include <userver/formats/json/value_builder.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/async.hpp>

#include "signal_groups/blacklist_group.hpp"
#include "signal_groups/vpn_group.hpp"
#include "validation/transaction_validator.hpp"

namespace transaction_monitor {

namespace {

constexpr std::string_view kSkippedRecordsSuffix = ".skipped_records";

bool EndsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::vector<SignalGroupPtr> MakeSignalGroups(LedgerPtr ledger, const SignalGroupsConfig& config) {
    std::vector<SignalGroupPtr> groups;
    groups.push_back(std::make_unique<VelocityGroup>(ledger, config.velocity));
    groups.push_back(std::make_unique<MuleGroup>(ledger, config.mule));
    groups.push_back(std::make_unique<BeneficiaryGroup>(ledger, config.beneficiary));
    groups.push_back(std::make_unique<AtoGroup>(ledger, config.ato));
    groups.push_back(std::make_unique<OddHoursGroup>(ledger, config.odd_hours));
    groups.push_back(std::make_unique<GeoGroup>(ledger, config.geo));
    groups.push_back(std::make_unique<BlacklistGroup>(ledger));
    groups.push_back(std::make_unique<VpnGroup>(ledger));
    groups.push_back(std::make_unique<DeviceGroup>(ledger, config.device));
    groups.push_back(std::make_unique<BiometricsGroup>(ledger, config.biometrics));
    groups.push_back(std::make_unique<RelationshipGroup>(ledger, config.relationship));
    groups.push_back(std::make_unique<AccountAgeGroup>(ledger, config.account_age));
    groups.push_back(std::make_unique<FraudHistoryGroup>(ledger, config.fraud_history));
    groups.push_back(std::make_unique<CheckGroup>(ledger, config.check));
    return groups;
}

ContextAssembler::ContextAssembler(std::vector<SignalGroupPtr> groups,
                                   std::chrono::milliseconds timeout)
    : groups_(std::move(groups)), timeout_(timeout) {
    std::set<std::string_view> names;
    for (const auto& group : groups_) {
        if (!names.insert(group->GetName()).second || group->GetName() == "assembler") {
            throw std::invalid_argument(
                fmt::format("Signal group prefix '{}' is not unique", group->GetName()));
        }
    }
}

Context ContextAssembler::Build(const transaction::Transaction& tx) const {
    const auto validated = ValidateTransaction(tx);
    const EvaluationInput input{tx, validated.metadata, validated.as_of};

    const auto deadline = userver::engine::Deadline::FromDuration(timeout_);
    std::vector<userver::engine::TaskWithResult<ContextFragment>> tasks;
    tasks.reserve(groups_.size());
    for (const auto& group : groups_) {
        tasks.push_back(userver::utils::Async(
            fmt::format("signal_group/{}", group->GetName()),
            [&group, &input] { return group->Collect(input); }));
    }

    Context context;
    userver::formats::json::ValueBuilder degraded(userver::formats::common::Type::kArray);
    double skipped_records = 0.0;

    // Unfinished tasks are cancelled by their destructors when a group throws.
    for (size_t i = 0; i < tasks.size(); ++i) {
        auto& task = tasks[i];
        task.WaitUntil(deadline);
        if (!task.IsFinished()) {
            task.SyncCancel();
            LOG_WARNING() << fmt::format(
                "Signal group {} did not finish in {}ms for transaction {}, signals left absent",
                groups_[i]->GetName(), timeout_.count(), tx.transaction_id());
            degraded.PushBack(std::string{groups_[i]->GetName()});
            continue;
        }

        const auto fragment = task.Get();
        if (fragment.GetPrefix() != groups_[i]->GetName()) {
            throw std::logic_error(fmt::format("Signal group {} produced fragment with prefix {}",
                                               groups_[i]->GetName(), fragment.GetPrefix()));
        }
        for (const auto& [key, value] : fragment.GetSignals()) {
            if (EndsWith(key, kSkippedRecordsSuffix) && value.IsDouble()) {
                skipped_records += value.As<double>();
            }
        }
        context.Merge(fragment);
    }

    ContextFragment bookkeeping{"assembler"};
    bookkeeping.SetValue("degraded_groups", degraded.ExtractValue());
    bookkeeping.SetNumber("skipped_records", skipped_records);
    bookkeeping.SetString("as_of", time_utils::FormatIso(validated.as_of));
    context.Merge(bookkeeping);

    LOG_DEBUG() << fmt::format("Assembled {} signals for transaction {}", context.Size(),
                               tx.transaction_id());
    return context;
}

}  // namespace transaction_monitor
