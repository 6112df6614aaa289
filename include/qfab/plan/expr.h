#ifndef QFAB_PLAN_EXPR_H_
#define QFAB_PLAN_EXPR_H_

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <arrow/compute/expression.h>

#include "qfab/core/result.h"

namespace qfab {
namespace plan {

class LogicalPlan;
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

/**
 * @brief Typed expression bound to the columns of one input schema
 *
 * Columns are referenced by position so inputs with repeated names (the two
 * sides of a join) stay unambiguous. Expressions lower to Arrow compute
 * expressions for evaluation.
 */
struct Expr {
    enum class Kind {
        COLUMN,
        LITERAL,
        CALL,
        IN_SUBQUERY
    };

    Kind kind = Kind::LITERAL;
    std::shared_ptr<arrow::DataType> type;
    bool nullable = true;

    // COLUMN
    int index = -1;
    std::string name;

    // LITERAL
    std::shared_ptr<arrow::Scalar> value;

    // CALL: Arrow function name, arguments and options.
    // IN_SUBQUERY: args[0] is the tested expression.
    std::string function;
    std::vector<ExprPtr> args;
    std::shared_ptr<arrow::compute::FunctionOptions> options;

    // IN_SUBQUERY
    std::shared_ptr<LogicalPlan> subquery;
    bool negated = false;

    std::string ToString() const;
};

/**
 * @brief Values produced by an uncorrelated IN subquery
 *
 * values holds the distinct non-null results cast to the tested type.
 */
struct SubqueryValues {
    std::shared_ptr<arrow::Array> values;
    bool has_null = false;
};
using SubqueryResults = std::map<const Expr*, SubqueryValues>;

ExprPtr MakeColumn(int index, const arrow::Field& field);
ExprPtr MakeLiteral(std::shared_ptr<arrow::Scalar> value);

// Builds a call and derives its type by binding against the input schema
core::Result<ExprPtr> MakeCall(const std::string& function, std::vector<ExprPtr> args,
                               const arrow::Schema& input,
                               std::shared_ptr<arrow::compute::FunctionOptions> options = nullptr);

ExprPtr MakeInSubquery(ExprPtr arg, std::shared_ptr<LogicalPlan> subquery, bool negated);

/**
 * @brief SQL three-valued [NOT] IN over a constant value set
 *
 * value_set must already have the tested expression's type and contain no
 * nulls; list_has_null records whether the original list had one.
 */
core::Result<ExprPtr> MakeInValues(ExprPtr arg, std::shared_ptr<arrow::Array> value_set,
                                   bool list_has_null, bool negated, const arrow::Schema& input);

/**
 * @brief Lowers to an unbound Arrow expression
 *
 * IN_SUBQUERY nodes without an entry in results lower to a null boolean.
 */
core::Result<arrow::compute::Expression> ToArrowExpression(const Expr& expr,
                                                           const SubqueryResults* results = nullptr);

core::Result<arrow::compute::Expression> BindExpression(const Expr& expr, const arrow::Schema& input,
                                                        const SubqueryResults* results = nullptr);

// Evaluates a bound expression, broadcasting constant results to the batch length
core::Result<std::shared_ptr<arrow::Array>> EvaluateExpression(const arrow::compute::Expression& bound,
                                                               const arrow::RecordBatch& batch);

void CollectSubqueries(const ExprPtr& expr, std::vector<const Expr*>* out);
bool ContainsSubquery(const ExprPtr& expr);

// Splits nested AND into conjuncts
void SplitConjunction(const ExprPtr& expr, std::vector<ExprPtr>* out);

// Column indices referenced outside of subqueries
void CollectColumns(const ExprPtr& expr, std::vector<int>* out);

// Rewrites column indices through mapping[old] = new; -1 in mapping fails
core::Result<ExprPtr> RemapColumns(const ExprPtr& expr, const std::vector<int>& mapping);

// Casts a scalar to the given type
core::Result<std::shared_ptr<arrow::Scalar>> CastScalar(const std::shared_ptr<arrow::Scalar>& value,
                                                        const std::shared_ptr<arrow::DataType>& type);

} // namespace plan
} // namespace qfab

#endif // QFAB_PLAN_EXPR_H_
