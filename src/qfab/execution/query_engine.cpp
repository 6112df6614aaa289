#include "qfab/execution/query_engine.h"

#include "qfab/common/logger.h"
#include "qfab/execution/execution_context.h"
#include "qfab/plan/optimizer.h"
#include "qfab/sql/parser.h"
#include "qfab/sql/sql_planner.h"

namespace qfab {
namespace execution {

core::Result<CompiledQuery> SqlQueryEngine::Compile(const std::string& query, const ExecutionContext& ctx) const {
    using CompileResult = core::Result<CompiledQuery>;
    auto planning_error = [&query](const std::string& stage, const std::string& message) {
        QFAB_ERROR("[sql] {} failed for '{}': {}", stage, query, message);
        return CompileResult::error(message, core::Error::Code::PLANNING_FAILURE);
    };

    auto stmt = sql::ParseSql(query, ctx.config().dialect == SqlDialect::POSTGRESQL);
    if (!stmt.ok()) return planning_error("parsing", stmt.error());

    sql::SqlPlanner planner([&ctx](const sql::TableRef& ref) { return ctx.ResolveTable(ref); }, ctx.functions());
    auto logical = planner.Plan(*stmt.value());
    if (!logical.ok()) return planning_error("binding", logical.error());

    auto optimized = plan::Optimize(logical.value(), ctx.optimizer_rules());
    if (!optimized.ok()) return planning_error("optimization", optimized.error());

    auto physical = ctx.query_planner().CreatePhysicalPlan(optimized.value(), ctx.config());
    if (!physical.ok()) return planning_error("physical planning", physical.error());

    auto final_plan = plan::OptimizePhysical(physical.value(), ctx.physical_optimizer_rules(), ctx.config());
    if (!final_plan.ok()) return planning_error("physical optimization", final_plan.error());

    QFAB_DEBUG("[sql] logical plan:\n{}", optimized.value()->ToString());
    QFAB_DEBUG("[sql] physical plan:\n{}", final_plan.value()->ToString());

    CompiledQuery query;
    query.logical = optimized.take_value();
    query.physical = final_plan.take_value();
    query.schema = query.physical->schema();
    return CompileResult(std::move(query));
}

core::Result<std::unique_ptr<RecordBatchStream>> SqlQueryEngine::Execute(const CompiledQuery& query,
                                                                         const ExecutionContext& ctx) const {
    auto stream = query.physical->Execute(ctx.task_context());
    if (!stream.ok()) {
        QFAB_ERROR("[sql] execution failed: {}", stream.error());
    }
    return stream;
}

} // namespace execution
} // namespace qfab
