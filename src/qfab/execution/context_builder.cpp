#include "qfab/execution/context_builder.h"

#include <algorithm>

#include "qfab/common/logger.h"
#include "qfab/core/config.h"
#include "qfab/core/types.h"
#include "qfab/governor/resource_governor.h"

namespace qfab {
namespace execution {

size_t ResolveTargetPartitions(size_t requested) {
    auto cfg = core::GetConfig();
    size_t partitions = requested == 0 ? cfg->limit.cpu_num : std::max(cfg->limit.min_partition_num, requested);
    return partitions == 0 ? core::kMinPartitions : partitions;
}

core::Result<std::unique_ptr<ExecutionContext>> PrepareContext(
    const std::optional<std::string>& work_group,
    const std::vector<plan::OptimizerRulePtr>& optimizer_rules,
    bool sorted_by_time,
    size_t target_partitions) {
    using ContextResult = core::Result<std::unique_ptr<ExecutionContext>>;
    auto cfg = core::GetConfig();

    size_t partitions = ResolveTargetPartitions(target_partitions);
    auto limits = governor::GetResourceGovernor()->Govern(work_group, partitions,
                                                          cfg->memory_cache.query_max_size);
    if (!limits.ok()) {
        QFAB_ERROR("[context] resource governor failed: {}", limits.error());
        return ContextResult::error(limits);
    }
    // a tiny workgroup share may scale partitions down to zero
    partitions = std::max<size_t>(limits.value().partitions, 1);
    size_t memory = limits.value().memory;

    auto runtime = CreateRuntimeEnv(memory);
    if (!runtime.ok()) return ContextResult::error(runtime);

    auto ctx = std::make_unique<ExecutionContext>(CreateSessionConfig(sorted_by_time, partitions),
                                                  runtime.take_value());
    if (!optimizer_rules.empty()) {
        for (const auto& rule : optimizer_rules) ctx->AddOptimizerRule(rule);
        ctx->AddPhysicalOptimizerRule(std::make_shared<plan::JoinReorderRule>());
    }
    if (cfg->common.feature_join_match_one_enabled) {
        ctx->SetQueryPlanner(std::make_shared<plan::JoinMatchOneQueryPlanner>());
    }
    auto registered = RegisterDefaultFunctions(*ctx);
    if (!registered.ok()) return ContextResult::error(registered);

    QFAB_DEBUG("[context] prepared: work_group={} partitions={} memory={} sorted_by_time={}",
               work_group.value_or("-"), partitions, memory, sorted_by_time);
    return ContextResult(std::move(ctx));
}

} // namespace execution
} // namespace qfab
