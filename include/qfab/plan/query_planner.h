#ifndef QFAB_PLAN_QUERY_PLANNER_H_
#define QFAB_PLAN_QUERY_PLANNER_H_

#include <memory>

#include "qfab/core/result.h"
#include "qfab/execution/session_config.h"
#include "qfab/plan/logical_plan.h"
#include "qfab/plan/physical_plan.h"

namespace qfab {
namespace plan {

/**
 * @brief Turns an optimized logical plan into physical operators
 */
class QueryPlanner {
public:
    virtual ~QueryPlanner() = default;

    virtual core::Result<ExecNodePtr> CreatePhysicalPlan(const LogicalPlanPtr& plan,
                                                         const execution::SessionConfig& config) const = 0;
};

/**
 * @brief One physical operator per logical node
 *
 * Unless the session skips it, the schema an aggregate realises on Acero
 * must equal the logically derived schema, nullability included; a mismatch
 * fails with PLANNING_FAILURE.
 */
class DefaultQueryPlanner : public QueryPlanner {
public:
    core::Result<ExecNodePtr> CreatePhysicalPlan(const LogicalPlanPtr& plan,
                                                 const execution::SessionConfig& config) const override;

protected:
    // Builds the operator for a join whose inputs are already planned
    virtual core::Result<ExecNodePtr> PlanJoin(const LogicalPlan& join, ExecNodePtr left, ExecNodePtr right,
                                               const execution::SessionConfig& config) const;

    core::Result<std::shared_ptr<AggregateExec>> PlanAggregate(ExecNodePtr input, std::vector<ExprPtr> group_exprs,
                                                               std::vector<AggregateCall> aggregates,
                                                               std::shared_ptr<arrow::Schema> schema,
                                                               const execution::SessionConfig& config) const;

private:
    core::Result<SubqueryPlans> PlanSubqueries(const std::vector<ExprPtr>& exprs,
                                               const execution::SessionConfig& config) const;
};

/**
 * @brief Join planner that matches each left row with at most one right row
 *
 * The right input is reduced to the first row seen for every join key
 * before the hash join.
 */
class JoinMatchOneQueryPlanner : public DefaultQueryPlanner {
protected:
    core::Result<ExecNodePtr> PlanJoin(const LogicalPlan& join, ExecNodePtr left, ExecNodePtr right,
                                       const execution::SessionConfig& config) const override;
};

} // namespace plan
} // namespace qfab

#endif // QFAB_PLAN_QUERY_PLANNER_H_
