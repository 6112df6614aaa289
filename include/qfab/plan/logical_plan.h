#ifndef QFAB_PLAN_LOGICAL_PLAN_H_
#define QFAB_PLAN_LOGICAL_PLAN_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <arrow/api.h>

#include "qfab/plan/expr.h"
#include "qfab/table/table_provider.h"

namespace qfab {
namespace plan {

enum class JoinType {
    INNER,
    LEFT
};

/**
 * @brief One aggregate call of an Aggregate node
 *
 * function is the ungrouped Arrow aggregate ("sum", "count_all", ...); the
 * grouped plan uses its "hash_" variant. arg is null for count_all.
 */
struct AggregateCall {
    std::string function;
    ExprPtr arg;
    std::shared_ptr<arrow::compute::FunctionOptions> options;
    std::string name;
    std::shared_ptr<arrow::DataType> type;
    bool nullable = true;
};

struct SortExpr {
    ExprPtr expr;
    bool descending = false;
    bool nulls_first = false;
};

/**
 * @brief Node of a bound logical plan
 *
 * Expressions of a node are bound to the schema of its input (for a join,
 * to the concatenation of the left and right schemas).
 */
class LogicalPlan {
public:
    enum class Kind {
        TABLE_SCAN,
        FILTER,
        PROJECTION,
        AGGREGATE,
        SORT,
        LIMIT,
        JOIN
    };

    Kind kind = Kind::TABLE_SCAN;
    std::shared_ptr<arrow::Schema> schema;
    std::vector<std::shared_ptr<LogicalPlan>> inputs;

    // TABLE_SCAN
    std::string table_name;
    std::shared_ptr<table::TableProvider> provider;
    std::vector<ExprPtr> filters;   // inexact hints bound to the provider schema

    // FILTER
    ExprPtr predicate;

    // PROJECTION
    std::vector<ExprPtr> exprs;

    // AGGREGATE
    std::vector<ExprPtr> group_exprs;
    std::vector<AggregateCall> aggregates;

    // SORT
    std::vector<SortExpr> sort_exprs;
    std::optional<size_t> fetch;   // also LIMIT

    // LIMIT
    size_t skip = 0;

    // JOIN: (left column, right column) pairs, right columns indexed within
    // the right input
    JoinType join_type = JoinType::INNER;
    std::vector<std::pair<int, int>> join_on;

    const std::shared_ptr<LogicalPlan>& input() const { return inputs.front(); }

    // Indented tree, one node per line
    std::string ToString(int indent = 0) const;
};

using LogicalPlanPtr = std::shared_ptr<LogicalPlan>;

LogicalPlanPtr MakeTableScan(std::string table_name, std::shared_ptr<table::TableProvider> provider);
LogicalPlanPtr MakeFilter(LogicalPlanPtr input, ExprPtr predicate);
LogicalPlanPtr MakeProjection(LogicalPlanPtr input, std::vector<ExprPtr> exprs, const std::vector<std::string>& names);
LogicalPlanPtr MakeAggregate(LogicalPlanPtr input, std::vector<ExprPtr> group_exprs,
                             const std::vector<std::string>& group_names, std::vector<AggregateCall> aggregates);
LogicalPlanPtr MakeSort(LogicalPlanPtr input, std::vector<SortExpr> sort_exprs, std::optional<size_t> fetch);
LogicalPlanPtr MakeLimit(LogicalPlanPtr input, size_t skip, std::optional<size_t> fetch);
LogicalPlanPtr MakeJoin(LogicalPlanPtr left, LogicalPlanPtr right, JoinType type,
                        std::vector<std::pair<int, int>> on);

// Schema of a join output: left fields, then right fields (nullable for LEFT)
std::shared_ptr<arrow::Schema> JoinSchema(const arrow::Schema& left, const arrow::Schema& right, JoinType type);

/**
 * @brief Output type and nullability of an aggregate over an input type
 *
 * Fails with PLANNING_FAILURE when the function does not accept the type.
 */
core::Result<std::pair<std::shared_ptr<arrow::DataType>, bool>> AggregateOutputType(
    const std::string& function, const std::shared_ptr<arrow::DataType>& input_type, bool input_nullable);

std::string JoinTypeToString(JoinType type);

} // namespace plan
} // namespace qfab

#endif // QFAB_PLAN_LOGICAL_PLAN_H_
