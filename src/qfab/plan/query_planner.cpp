#include "qfab/plan/query_planner.h"

#include <arrow/compute/api.h>

#include "qfab/common/logger.h"

namespace qfab {
namespace plan {

namespace {

using ExecResult = core::Result<ExecNodePtr>;

} // namespace

ExecResult DefaultQueryPlanner::CreatePhysicalPlan(const LogicalPlanPtr& plan,
                                                   const execution::SessionConfig& config) const {
    std::vector<ExecNodePtr> inputs;
    for (const auto& input : plan->inputs) {
        auto planned = CreatePhysicalPlan(input, config);
        if (!planned.ok()) return planned;
        inputs.push_back(planned.take_value());
    }

    switch (plan->kind) {
        case LogicalPlan::Kind::TABLE_SCAN:
            return ExecResult(std::make_shared<ScanExec>(plan->table_name, plan->provider, plan->filters));

        case LogicalPlan::Kind::FILTER: {
            auto subqueries = PlanSubqueries({plan->predicate}, config);
            if (!subqueries.ok()) return ExecResult::error(subqueries);
            return ExecResult(std::make_shared<FilterExec>(inputs[0], plan->predicate, subqueries.take_value()));
        }

        case LogicalPlan::Kind::PROJECTION: {
            auto subqueries = PlanSubqueries(plan->exprs, config);
            if (!subqueries.ok()) return ExecResult::error(subqueries);
            return ExecResult(std::make_shared<ProjectionExec>(inputs[0], plan->exprs, plan->schema,
                                                               subqueries.take_value()));
        }

        case LogicalPlan::Kind::AGGREGATE: {
            auto aggregate = PlanAggregate(inputs[0], plan->group_exprs, plan->aggregates, plan->schema, config);
            if (!aggregate.ok()) return ExecResult::error(aggregate);
            return ExecResult(aggregate.take_value());
        }

        case LogicalPlan::Kind::SORT: {
            std::vector<SortKeySpec> keys;
            for (const auto& sort : plan->sort_exprs) {
                if (sort.expr->kind != Expr::Kind::COLUMN) {
                    return ExecResult::error("Sort expression must be a column: " + sort.expr->ToString(),
                                             core::Error::Code::PLANNING_FAILURE);
                }
                keys.push_back(SortKeySpec{sort.expr->index, sort.descending, sort.nulls_first});
            }
            return ExecResult(std::make_shared<SortExec>(inputs[0], std::move(keys), plan->fetch));
        }

        case LogicalPlan::Kind::LIMIT:
            return ExecResult(std::make_shared<LimitExec>(inputs[0], plan->skip, plan->fetch));

        case LogicalPlan::Kind::JOIN:
            return PlanJoin(*plan, inputs[0], inputs[1], config);
    }
    return ExecResult::error("Unknown logical plan node", core::Error::Code::INTERNAL);
}

ExecResult DefaultQueryPlanner::PlanJoin(const LogicalPlan& join, ExecNodePtr left, ExecNodePtr right,
                                         const execution::SessionConfig&) const {
    return ExecResult(std::make_shared<HashJoinExec>(std::move(left), std::move(right), join.join_type, join.join_on));
}

core::Result<std::shared_ptr<AggregateExec>> DefaultQueryPlanner::PlanAggregate(
    ExecNodePtr input, std::vector<ExprPtr> group_exprs, std::vector<AggregateCall> aggregates,
    std::shared_ptr<arrow::Schema> schema, const execution::SessionConfig& config) const {
    using AggResult = core::Result<std::shared_ptr<AggregateExec>>;
    auto logical_schema = schema;
    auto aggregate = AggregateExec::Make(std::move(input), std::move(group_exprs), std::move(aggregates),
                                         std::move(schema));
    if (!aggregate.ok()) return aggregate;
    if (!config.skip_physical_aggregate_schema_check &&
        !aggregate.value()->realised_schema()->Equals(*logical_schema, /*check_metadata=*/false)) {
        std::string message = "Physical aggregate schema " + aggregate.value()->realised_schema()->ToString() +
                              " does not match logical schema " + logical_schema->ToString();
        QFAB_ERROR("[planner] {}", message);
        return AggResult::error(message, core::Error::Code::PLANNING_FAILURE);
    }
    return aggregate;
}

core::Result<SubqueryPlans> DefaultQueryPlanner::PlanSubqueries(const std::vector<ExprPtr>& exprs,
                                                               const execution::SessionConfig& config) const {
    using PlansResult = core::Result<SubqueryPlans>;
    SubqueryPlans plans;
    for (const auto& expr : exprs) {
        std::vector<const Expr*> subqueries;
        CollectSubqueries(expr, &subqueries);
        for (const Expr* subquery : subqueries) {
            auto planned = CreatePhysicalPlan(subquery->subquery, config);
            if (!planned.ok()) return PlansResult::error(planned);
            plans.emplace_back(subquery, planned.take_value());
        }
    }
    return PlansResult(std::move(plans));
}

ExecResult JoinMatchOneQueryPlanner::PlanJoin(const LogicalPlan& join, ExecNodePtr left, ExecNodePtr right,
                                              const execution::SessionConfig& config) const {
    auto right_schema = right->schema();
    int num_fields = right_schema->num_fields();

    // Group by the join keys, keep the first value of every other column
    std::vector<int> key_columns;
    std::vector<bool> is_key(static_cast<size_t>(num_fields), false);
    for (const auto& pair : join.join_on) {
        if (is_key[static_cast<size_t>(pair.second)]) continue;
        is_key[static_cast<size_t>(pair.second)] = true;
        key_columns.push_back(pair.second);
    }
    std::vector<ExprPtr> group_exprs;
    arrow::FieldVector fields;
    std::vector<int> position(static_cast<size_t>(num_fields), -1);
    for (int column : key_columns) {
        position[static_cast<size_t>(column)] = static_cast<int>(fields.size());
        group_exprs.push_back(MakeColumn(column, *right_schema->field(column)));
        fields.push_back(right_schema->field(column));
    }
    std::vector<AggregateCall> aggregates;
    for (int i = 0; i < num_fields; ++i) {
        if (is_key[static_cast<size_t>(i)]) continue;
        const auto& field = right_schema->field(i);
        AggregateCall call;
        call.function = "first";
        call.arg = MakeColumn(i, *field);
        call.options = std::make_shared<arrow::compute::ScalarAggregateOptions>(/*skip_nulls=*/false);
        call.name = field->name();
        call.type = field->type();
        call.nullable = field->nullable();
        position[static_cast<size_t>(i)] = static_cast<int>(fields.size());
        fields.push_back(field);
        aggregates.push_back(std::move(call));
    }

    auto deduped = AggregateExec::Make(right, std::move(group_exprs), std::move(aggregates),
                                       arrow::schema(fields));
    if (!deduped.ok()) return ExecResult::error(deduped);
    auto deduped_schema = deduped.value()->schema();

    std::vector<ExprPtr> restore;
    for (int i = 0; i < num_fields; ++i) {
        int from = position[static_cast<size_t>(i)];
        restore.push_back(MakeColumn(from, *deduped_schema->field(from)));
    }
    ExecNodePtr reduced = std::make_shared<ProjectionExec>(deduped.take_value(), std::move(restore), right_schema);
    QFAB_DEBUG("[planner] join right side reduced to one row per key");
    return DefaultQueryPlanner::PlanJoin(join, std::move(left), std::move(reduced), config);
}

} // namespace plan
} // namespace qfab
