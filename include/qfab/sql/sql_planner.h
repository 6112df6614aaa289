#ifndef QFAB_SQL_SQL_PLANNER_H_
#define QFAB_SQL_SQL_PLANNER_H_

#include <functional>
#include <memory>
#include <string>

#include <arrow/api.h>

#include "qfab/core/result.h"
#include "qfab/execution/function_registry.h"
#include "qfab/plan/logical_plan.h"
#include "qfab/sql/ast.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace sql {

// Looks up the provider behind a FROM or JOIN table reference
using TableResolver = std::function<core::Result<std::shared_ptr<table::TableProvider>>(const TableRef&)>;

/**
 * @brief Binds a parsed SELECT to a logical plan
 *
 * Every failure (unknown table, column or function, type errors, unsupported
 * constructs) is reported as PLANNING_FAILURE.
 */
class SqlPlanner {
public:
    SqlPlanner(TableResolver resolver, const execution::FunctionRegistry& functions);

    core::Result<plan::LogicalPlanPtr> Plan(const SelectStmt& stmt) const;

private:
    TableResolver resolver_;
    const execution::FunctionRegistry& functions_;
};

// SQL type name of a CAST to its Arrow type
core::Result<std::shared_ptr<arrow::DataType>> ParseSqlType(const std::string& name);

} // namespace sql
} // namespace qfab

#endif // QFAB_SQL_SQL_PLANNER_H_
