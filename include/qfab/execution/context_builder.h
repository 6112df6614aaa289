#ifndef QFAB_EXECUTION_CONTEXT_BUILDER_H_
#define QFAB_EXECUTION_CONTEXT_BUILDER_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qfab/core/result.h"
#include "qfab/execution/execution_context.h"
#include "qfab/plan/optimizer.h"

namespace qfab {
namespace execution {

/**
 * @brief Partition count for a request
 *
 * 0 means limit.cpu_num; anything else is raised to limit.min_partition_num.
 * A result of 0 becomes 2.
 */
size_t ResolveTargetPartitions(size_t requested);

/**
 * @brief Builds the execution context of one search or compaction request
 *
 * Partitions and memory go through the process-wide resource governor when a
 * workgroup is named. Extra optimizer rules run after the default ones and
 * also enable join reordering. The match-one join planner is installed when
 * common.feature_join_match_one_enabled is set.
 *
 * Fails with INVALID_CONFIGURATION for an unknown memory pool strategy and
 * RESOURCE_RESOLUTION_FAILURE when the workgroup share cannot be read.
 */
core::Result<std::unique_ptr<ExecutionContext>> PrepareContext(
    const std::optional<std::string>& work_group,
    const std::vector<plan::OptimizerRulePtr>& optimizer_rules,
    bool sorted_by_time,
    size_t target_partitions);

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_CONTEXT_BUILDER_H_
