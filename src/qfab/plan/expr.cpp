#include "qfab/plan/expr.h"

#include <sstream>

#include "qfab/plan/logical_plan.h"

namespace qfab {
namespace plan {

namespace cp = arrow::compute;

namespace {

bool NeverNull(const std::string& function) {
    return function == "is_null" || function == "is_valid" || function == "is_nan" ||
           function == "true_unless_null";
}

bool DeriveNullable(const std::string& function, const std::vector<ExprPtr>& args) {
    if (NeverNull(function)) return false;
    if (function == "coalesce") {
        for (const auto& arg : args) {
            if (!arg->nullable) return false;
        }
        return true;
    }
    for (const auto& arg : args) {
        if (arg->nullable) return true;
    }
    return false;
}

} // namespace

std::string Expr::ToString() const {
    switch (kind) {
        case Kind::COLUMN:
            return name.empty() ? "#" + std::to_string(index) : name;
        case Kind::LITERAL:
            if (!value || !value->is_valid) return "NULL";
            if (value->type->id() == arrow::Type::STRING || value->type->id() == arrow::Type::LARGE_STRING) {
                return "'" + value->ToString() + "'";
            }
            return value->ToString();
        case Kind::CALL: {
            std::ostringstream oss;
            oss << function << "(";
            for (size_t i = 0; i < args.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << args[i]->ToString();
            }
            oss << ")";
            return oss.str();
        }
        case Kind::IN_SUBQUERY:
            return args[0]->ToString() + (negated ? " NOT IN (<subquery>)" : " IN (<subquery>)");
    }
    return "?";
}

ExprPtr MakeColumn(int index, const arrow::Field& field) {
    auto e = std::make_shared<Expr>();
    e->kind = Expr::Kind::COLUMN;
    e->index = index;
    e->name = field.name();
    e->type = field.type();
    e->nullable = field.nullable();
    return e;
}

ExprPtr MakeLiteral(std::shared_ptr<arrow::Scalar> value) {
    auto e = std::make_shared<Expr>();
    e->kind = Expr::Kind::LITERAL;
    e->type = value->type;
    e->nullable = !value->is_valid;
    e->value = std::move(value);
    return e;
}

core::Result<ExprPtr> MakeCall(const std::string& function, std::vector<ExprPtr> args,
                               const arrow::Schema& input,
                               std::shared_ptr<cp::FunctionOptions> options) {
    auto e = std::make_shared<Expr>();
    e->kind = Expr::Kind::CALL;
    e->function = function;
    e->args = std::move(args);
    e->options = std::move(options);

    auto bound = BindExpression(*e, input);
    if (!bound.ok()) {
        return core::Result<ExprPtr>::error(bound);
    }
    e->type = bound.value().type()->GetSharedPtr();
    e->nullable = DeriveNullable(function, e->args);
    return core::Result<ExprPtr>(ExprPtr(e));
}

ExprPtr MakeInSubquery(ExprPtr arg, std::shared_ptr<LogicalPlan> subquery, bool negated) {
    auto e = std::make_shared<Expr>();
    e->kind = Expr::Kind::IN_SUBQUERY;
    e->type = arrow::boolean();
    e->nullable = true;
    e->args.push_back(std::move(arg));
    e->subquery = std::move(subquery);
    e->negated = negated;
    return e;
}

core::Result<ExprPtr> MakeInValues(ExprPtr arg, std::shared_ptr<arrow::Array> value_set,
                                   bool list_has_null, bool negated, const arrow::Schema& input) {
    auto null_bool = MakeLiteral(arrow::MakeNullScalar(arrow::boolean()));
    auto is_in = MakeCall("is_in", {arg}, input, std::make_shared<cp::SetLookupOptions>(value_set));
    if (!is_in.ok()) return is_in;
    auto arg_null = MakeCall("is_null", {arg}, input);
    if (!arg_null.ok()) return arg_null;
    auto result = MakeCall("if_else", {arg_null.value(), null_bool, is_in.value()}, input);
    if (!result.ok()) return result;
    ExprPtr out = result.value();
    if (list_has_null) {
        auto with_null = MakeCall("or_kleene", {out, null_bool}, input);
        if (!with_null.ok()) return with_null;
        out = with_null.value();
    }
    if (negated) {
        auto inverted = MakeCall("invert", {out}, input);
        if (!inverted.ok()) return inverted;
        out = inverted.value();
    }
    // NULL appears only through the tested value or a NULL in the list
    auto mutable_out = std::make_shared<Expr>(*out);
    mutable_out->nullable = arg->nullable || list_has_null;
    return core::Result<ExprPtr>(ExprPtr(mutable_out));
}

core::Result<cp::Expression> ToArrowExpression(const Expr& expr, const SubqueryResults* results) {
    using ExprResult = core::Result<cp::Expression>;
    switch (expr.kind) {
        case Expr::Kind::COLUMN:
            return ExprResult(cp::field_ref(arrow::FieldRef(expr.index)));
        case Expr::Kind::LITERAL:
            return ExprResult(cp::literal(arrow::Datum(expr.value)));
        case Expr::Kind::CALL: {
            std::vector<cp::Expression> args;
            args.reserve(expr.args.size());
            for (const auto& arg : expr.args) {
                auto lowered = ToArrowExpression(*arg, results);
                if (!lowered.ok()) return lowered;
                args.push_back(lowered.take_value());
            }
            return ExprResult(cp::call(expr.function, std::move(args), expr.options));
        }
        case Expr::Kind::IN_SUBQUERY: {
            auto null_bool = cp::literal(arrow::Datum(arrow::MakeNullScalar(arrow::boolean())));
            const SubqueryValues* values = nullptr;
            if (results) {
                auto it = results->find(&expr);
                if (it != results->end()) values = &it->second;
            }
            if (!values) {
                return ExprResult(null_bool);
            }
            auto tested = ToArrowExpression(*expr.args[0], results);
            if (!tested.ok()) return tested;
            auto x = tested.take_value();
            auto out = cp::call("if_else", {cp::call("is_null", {x}), null_bool,
                                            cp::call("is_in", {x}, cp::SetLookupOptions(values->values))});
            if (values->has_null) {
                out = cp::call("or_kleene", {out, null_bool});
            }
            if (expr.negated) {
                out = cp::call("invert", {out});
            }
            return ExprResult(std::move(out));
        }
    }
    return ExprResult::error("Unknown expression kind", core::Error::Code::INTERNAL);
}

core::Result<cp::Expression> BindExpression(const Expr& expr, const arrow::Schema& input,
                                            const SubqueryResults* results) {
    auto lowered = ToArrowExpression(expr, results);
    if (!lowered.ok()) return lowered;
    auto bound = lowered.value().Bind(input);
    if (!bound.ok()) {
        return core::Result<cp::Expression>::error(
            "Cannot plan expression " + expr.ToString() + ": " + bound.status().ToString(),
            core::Error::Code::PLANNING_FAILURE);
    }
    return core::Result<cp::Expression>(*bound);
}

core::Result<std::shared_ptr<arrow::Array>> EvaluateExpression(const cp::Expression& bound,
                                                               const arrow::RecordBatch& batch) {
    using ArrayResult = core::Result<std::shared_ptr<arrow::Array>>;
    auto datum = cp::ExecuteScalarExpression(bound, cp::ExecBatch(batch));
    if (!datum.ok()) {
        return ArrayResult::error("Failed to evaluate " + bound.ToString() + ": " + datum.status().ToString(),
                                  core::Error::Code::EXECUTION_FAILURE);
    }
    if (datum->is_scalar()) {
        auto array = arrow::MakeArrayFromScalar(*datum->scalar(), batch.num_rows());
        if (!array.ok()) {
            return ArrayResult::error("Failed to broadcast scalar: " + array.status().ToString(),
                                      core::Error::Code::EXECUTION_FAILURE);
        }
        return ArrayResult(*array);
    }
    if (datum->is_chunked_array()) {
        auto combined = arrow::Concatenate(datum->chunked_array()->chunks());
        if (!combined.ok()) {
            return ArrayResult::error("Failed to combine result: " + combined.status().ToString(),
                                      core::Error::Code::EXECUTION_FAILURE);
        }
        return ArrayResult(*combined);
    }
    return ArrayResult(datum->make_array());
}

void CollectSubqueries(const ExprPtr& expr, std::vector<const Expr*>* out) {
    if (!expr) return;
    if (expr->kind == Expr::Kind::IN_SUBQUERY) {
        out->push_back(expr.get());
    }
    for (const auto& arg : expr->args) {
        CollectSubqueries(arg, out);
    }
}

bool ContainsSubquery(const ExprPtr& expr) {
    std::vector<const Expr*> found;
    CollectSubqueries(expr, &found);
    return !found.empty();
}

void SplitConjunction(const ExprPtr& expr, std::vector<ExprPtr>* out) {
    if (expr->kind == Expr::Kind::CALL && (expr->function == "and_kleene" || expr->function == "and")) {
        for (const auto& arg : expr->args) {
            SplitConjunction(arg, out);
        }
        return;
    }
    out->push_back(expr);
}

void CollectColumns(const ExprPtr& expr, std::vector<int>* out) {
    if (expr->kind == Expr::Kind::COLUMN) {
        out->push_back(expr->index);
        return;
    }
    for (const auto& arg : expr->args) {
        CollectColumns(arg, out);
    }
}

core::Result<ExprPtr> RemapColumns(const ExprPtr& expr, const std::vector<int>& mapping) {
    if (expr->kind == Expr::Kind::COLUMN) {
        if (expr->index < 0 || static_cast<size_t>(expr->index) >= mapping.size() || mapping[expr->index] < 0) {
            return core::Result<ExprPtr>::error("Column " + expr->name + " is not available after remapping",
                                                core::Error::Code::PLANNING_FAILURE);
        }
        auto copy = std::make_shared<Expr>(*expr);
        copy->index = mapping[expr->index];
        return core::Result<ExprPtr>(ExprPtr(copy));
    }
    if (expr->args.empty()) {
        return core::Result<ExprPtr>(ExprPtr(expr));
    }
    auto copy = std::make_shared<Expr>(*expr);
    for (auto& arg : copy->args) {
        auto remapped = RemapColumns(arg, mapping);
        if (!remapped.ok()) return remapped;
        arg = remapped.take_value();
    }
    return core::Result<ExprPtr>(ExprPtr(copy));
}

core::Result<std::shared_ptr<arrow::Scalar>> CastScalar(const std::shared_ptr<arrow::Scalar>& value,
                                                        const std::shared_ptr<arrow::DataType>& type) {
    using ScalarResult = core::Result<std::shared_ptr<arrow::Scalar>>;
    if (value->type->Equals(*type)) {
        return ScalarResult(value);
    }
    if (!value->is_valid) {
        return ScalarResult(arrow::MakeNullScalar(type));
    }
    auto cast = cp::Cast(arrow::Datum(value), type);
    if (!cast.ok()) {
        return ScalarResult::error("Cannot cast " + value->ToString() + " to " + type->ToString() + ": " +
                                       cast.status().ToString(),
                                   core::Error::Code::PLANNING_FAILURE);
    }
    return ScalarResult(cast->scalar());
}

} // namespace plan
} // namespace qfab
