#ifndef QFAB_PLAN_OPTIMIZER_H_
#define QFAB_PLAN_OPTIMIZER_H_

#include <memory>
#include <string>
#include <vector>

#include "qfab/core/result.h"
#include "qfab/execution/session_config.h"
#include "qfab/plan/logical_plan.h"
#include "qfab/plan/physical_plan.h"

namespace qfab {
namespace plan {

/**
 * @brief Rewrite of a logical plan
 *
 * Rules return a new tree and never mutate the nodes they are given; an
 * unchanged plan may be returned as is.
 */
class OptimizerRule {
public:
    virtual ~OptimizerRule() = default;
    virtual std::string name() const = 0;
    virtual core::Result<LogicalPlanPtr> Rewrite(const LogicalPlanPtr& plan) const = 0;
};

using OptimizerRulePtr = std::shared_ptr<OptimizerRule>;

// Copies conjuncts of a filter directly above a scan into the scan as hints.
// The filter stays in place.
class PushDownFilter : public OptimizerRule {
public:
    std::string name() const override { return "push_down_filter"; }
    core::Result<LogicalPlanPtr> Rewrite(const LogicalPlanPtr& plan) const override;
};

// Turns LIMIT over ORDER BY into a sort that only keeps skip + fetch rows
class PushDownLimit : public OptimizerRule {
public:
    std::string name() const override { return "push_down_limit"; }
    core::Result<LogicalPlanPtr> Rewrite(const LogicalPlanPtr& plan) const override;
};

std::vector<OptimizerRulePtr> DefaultOptimizerRules();

// Applies the rules in order
core::Result<LogicalPlanPtr> Optimize(const LogicalPlanPtr& plan, const std::vector<OptimizerRulePtr>& rules);

/**
 * @brief Rewrite of a physical plan
 */
class PhysicalOptimizerRule {
public:
    virtual ~PhysicalOptimizerRule() = default;
    virtual std::string name() const = 0;
    virtual core::Result<ExecNodePtr> Optimize(const ExecNodePtr& plan,
                                               const execution::SessionConfig& config) const = 0;
};

using PhysicalOptimizerRulePtr = std::shared_ptr<PhysicalOptimizerRule>;

/**
 * @brief Puts the smaller input of an inner join on the build (right) side
 *
 * Only applies when both inputs have a row estimate. A projection above the
 * swapped join restores the original column order.
 */
class JoinReorderRule : public PhysicalOptimizerRule {
public:
    std::string name() const override { return "join_reorder"; }
    core::Result<ExecNodePtr> Optimize(const ExecNodePtr& plan,
                                       const execution::SessionConfig& config) const override;
};

core::Result<ExecNodePtr> OptimizePhysical(const ExecNodePtr& plan,
                                           const std::vector<PhysicalOptimizerRulePtr>& rules,
                                           const execution::SessionConfig& config);

} // namespace plan
} // namespace qfab

#endif // QFAB_PLAN_OPTIMIZER_H_
