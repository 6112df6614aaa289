#ifndef QFAB_EXECUTION_QUERY_ENGINE_H_
#define QFAB_EXECUTION_QUERY_ENGINE_H_

#include <memory>
#include <string>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/execution/record_batch_stream.h"
#include "qfab/plan/logical_plan.h"
#include "qfab/plan/physical_plan.h"

namespace qfab {
namespace execution {

class ExecutionContext;

/**
 * @brief A query ready to run against the context it was compiled in
 */
struct CompiledQuery {
    plan::LogicalPlanPtr logical;
    plan::ExecNodePtr physical;
    std::shared_ptr<arrow::Schema> schema;
};

/**
 * @brief Narrow interface between the fabric and the query engine
 */
class QueryEngine {
public:
    virtual ~QueryEngine() = default;

    virtual core::Result<CompiledQuery> Compile(const std::string& sql, const ExecutionContext& ctx) const = 0;

    virtual core::Result<std::unique_ptr<RecordBatchStream>> Execute(const CompiledQuery& query,
                                                                     const ExecutionContext& ctx) const = 0;
};

/**
 * @brief Parse, bind, optimize and plan SQL on Arrow compute and Acero
 *
 * Compile runs the context's logical rules, its query planner, then its
 * physical rules. Failures before execution are PLANNING_FAILURE.
 */
class SqlQueryEngine : public QueryEngine {
public:
    core::Result<CompiledQuery> Compile(const std::string& sql, const ExecutionContext& ctx) const override;

    core::Result<std::unique_ptr<RecordBatchStream>> Execute(const CompiledQuery& query,
                                                             const ExecutionContext& ctx) const override;
};

} // namespace execution
} // namespace qfab

#endif // QFAB_EXECUTION_QUERY_ENGINE_H_
