#include "qfab/sql/sql_planner.h"

#include <cerrno>
#include <cstdlib>
#include <map>

#include <arrow/compute/api.h>
#include <arrow/type_traits.h>

#include "qfab/common/logger.h"

namespace qfab {
namespace sql {

namespace cp = arrow::compute;

namespace {

using plan::ExprPtr;
using plan::LogicalPlanPtr;
using ExprResult = core::Result<ExprPtr>;
using PlanResult = core::Result<LogicalPlanPtr>;
using IndexResult = core::Result<int>;

constexpr auto kPlanningFailure = core::Error::Code::PLANNING_FAILURE;

// Column of a scope: qualifier the table is bound to, column name
struct ScopeColumn {
    std::string qualifier;
    std::string name;
};

using Scope = std::vector<ScopeColumn>;

/**
 * @brief Output columns of an aggregate, for binding the select list above it
 *
 * by_text maps the text of group expressions and aggregate calls to output
 * columns; by_column maps plain input columns that are group keys.
 */
struct AggregateBinding {
    const Scope* input_scope = nullptr;
    std::map<std::string, int> by_text;
    std::map<int, int> by_column;
};

struct BindContext {
    const Scope* scope = nullptr;
    std::shared_ptr<arrow::Schema> schema;
    const AggregateBinding* aggregate = nullptr;
};

std::optional<int64_t> ParseInteger(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return static_cast<int64_t>(value);
}

// Integer position of a literal like the 2 of ORDER BY 2
std::optional<int64_t> PositionOf(const ExprNode& node) {
    if (node.type() != ExprNode::Type::LITERAL) return std::nullopt;
    const auto& literal = static_cast<const LiteralNode&>(node);
    if (literal.kind != LiteralNode::Kind::NUMBER) return std::nullopt;
    return ParseInteger(literal.text);
}

std::vector<const ExprNode*> Children(const ExprNode& node) {
    std::vector<const ExprNode*> out;
    switch (node.type()) {
        case ExprNode::Type::UNARY:
            out.push_back(static_cast<const UnaryExprNode&>(node).expr.get());
            break;
        case ExprNode::Type::BINARY: {
            const auto& binary = static_cast<const BinaryExprNode&>(node);
            out.push_back(binary.lhs.get());
            out.push_back(binary.rhs.get());
            break;
        }
        case ExprNode::Type::IS:
            out.push_back(static_cast<const IsExprNode&>(node).expr.get());
            break;
        case ExprNode::Type::IN_LIST: {
            const auto& in = static_cast<const InListNode&>(node);
            out.push_back(in.expr.get());
            for (const auto& item : in.list) out.push_back(item.get());
            break;
        }
        case ExprNode::Type::IN_SUBQUERY:
            out.push_back(static_cast<const InSubqueryNode&>(node).expr.get());
            break;
        case ExprNode::Type::LIKE: {
            const auto& like = static_cast<const LikeNode&>(node);
            out.push_back(like.expr.get());
            out.push_back(like.pattern.get());
            break;
        }
        case ExprNode::Type::CAST:
            out.push_back(static_cast<const CastNode&>(node).expr.get());
            break;
        case ExprNode::Type::CALL:
            for (const auto& arg : static_cast<const CallNode&>(node).args) out.push_back(arg.get());
            break;
        case ExprNode::Type::COLUMN_REF:
        case ExprNode::Type::LITERAL:
            break;
    }
    return out;
}

// Casts a literal operand to the type of the other operand when possible
ExprPtr CoerceLiteral(const ExprPtr& literal, const ExprPtr& other) {
    if (literal->kind != plan::Expr::Kind::LITERAL || other->kind == plan::Expr::Kind::LITERAL) return literal;
    if (literal->type->Equals(*other->type)) return literal;
    auto cast = plan::CastScalar(literal->value, other->type);
    if (!cast.ok()) return literal;
    return plan::MakeLiteral(cast.take_value());
}

core::Result<std::string> StringLiteral(const ExprPtr& expr, const std::string& what) {
    using StringResult = core::Result<std::string>;
    if (expr->kind != plan::Expr::Kind::LITERAL || expr->value->type->id() != arrow::Type::STRING ||
        !expr->value->is_valid) {
        return StringResult::error(what + " must be a string literal", kPlanningFailure);
    }
    return StringResult(std::static_pointer_cast<arrow::StringScalar>(expr->value)->value->ToString());
}

std::string BinaryFunction(TokenType op) {
    switch (op) {
        case TokenType::AND: return "and_kleene";
        case TokenType::OR: return "or_kleene";
        case TokenType::EQL: return "equal";
        case TokenType::NEQ: return "not_equal";
        case TokenType::LSS: return "less";
        case TokenType::LTE: return "less_equal";
        case TokenType::GTR: return "greater";
        case TokenType::GTE: return "greater_equal";
        case TokenType::ADD: return "add";
        case TokenType::SUB: return "subtract";
        case TokenType::MUL: return "multiply";
        case TokenType::DIV: return "divide";
        default: return "";
    }
}

class StatementBinder {
public:
    StatementBinder(const TableResolver& resolver, const execution::FunctionRegistry& functions)
        : resolver_(resolver), functions_(functions) {}

    PlanResult PlanSelect(const SelectStmt& stmt) const;

private:
    PlanResult PlanTable(const TableRef& ref, Scope* scope) const;
    core::Result<std::vector<std::pair<int, int>>> JoinKeys(const ExprNode& on, const Scope& left,
                                                            const Scope& right, const arrow::Schema& left_schema,
                                                            const arrow::Schema& right_schema) const;
    IndexResult ResolveColumn(const ColumnRefNode& ref, const Scope& scope) const;

    bool IsAggregateCall(const ExprNode& node) const;
    void CollectAggregates(const ExprNode& node, std::vector<const CallNode*>* out) const;
    core::Result<plan::AggregateCall> BuildAggregate(const CallNode& call, const BindContext& ctx) const;

    ExprResult Bind(const ExprNode& node, const BindContext& ctx) const;
    ExprResult BindLiteral(const LiteralNode& node) const;
    ExprResult BindUnary(const UnaryExprNode& node, const BindContext& ctx) const;
    ExprResult BindBinary(const BinaryExprNode& node, const BindContext& ctx) const;
    ExprResult BindIs(const IsExprNode& node, const BindContext& ctx) const;
    ExprResult BindInList(const InListNode& node, const BindContext& ctx) const;
    ExprResult BindInSubquery(const InSubqueryNode& node, const BindContext& ctx) const;
    ExprResult BindLike(const LikeNode& node, const BindContext& ctx) const;
    ExprResult BindCast(const CastNode& node, const BindContext& ctx) const;
    ExprResult BindCall(const CallNode& node, const BindContext& ctx) const;

    const TableResolver& resolver_;
    const execution::FunctionRegistry& functions_;
};

IndexResult StatementBinder::ResolveColumn(const ColumnRefNode& ref, const Scope& scope) const {
    int found = -1;
    for (size_t i = 0; i < scope.size(); ++i) {
        if (scope[i].name != ref.name) continue;
        if (!ref.qualifier.empty() && scope[i].qualifier != ref.qualifier) continue;
        if (found >= 0) {
            return IndexResult::error("Column reference " + ref.String() + " is ambiguous", kPlanningFailure);
        }
        found = static_cast<int>(i);
    }
    if (found < 0) {
        return IndexResult::error("Column " + ref.String() + " not found", kPlanningFailure);
    }
    return IndexResult(found);
}

bool StatementBinder::IsAggregateCall(const ExprNode& node) const {
    if (node.type() != ExprNode::Type::CALL) return false;
    const auto* def = functions_.Lookup(static_cast<const CallNode&>(node).funcName);
    return def != nullptr && def->kind == execution::FunctionKind::AGGREGATE;
}

void StatementBinder::CollectAggregates(const ExprNode& node, std::vector<const CallNode*>* out) const {
    if (IsAggregateCall(node)) {
        out->push_back(static_cast<const CallNode*>(&node));
        return;
    }
    for (const ExprNode* child : Children(node)) CollectAggregates(*child, out);
}

core::Result<plan::AggregateCall> StatementBinder::BuildAggregate(const CallNode& call,
                                                                  const BindContext& ctx) const {
    using AggResult = core::Result<plan::AggregateCall>;
    const auto* def = functions_.Lookup(call.funcName);
    plan::AggregateCall agg;
    agg.name = call.String();

    if (call.star) {
        if (def->name != "count") {
            return AggResult::error(call.funcName + "(*) is not supported", kPlanningFailure);
        }
        agg.function = "count_all";
    } else {
        if (call.args.size() < def->min_args || call.args.size() > def->max_args) {
            return AggResult::error("Wrong number of arguments to " + call.funcName, kPlanningFailure);
        }
        if (call.distinct && def->name != "count") {
            return AggResult::error("DISTINCT is not supported for " + call.funcName, kPlanningFailure);
        }
        auto arg = Bind(*call.args[0], ctx);
        if (!arg.ok()) return AggResult::error(arg);
        agg.arg = arg.take_value();

        if (def->name == "count") {
            agg.function = call.distinct ? "count_distinct" : "count";
            agg.options = std::make_shared<cp::CountOptions>(cp::CountOptions::ONLY_VALID);
        } else {
            agg.function = def->arrow_function;
        }
        if (def->arg_style == execution::ArgStyle::QUANTILE) {
            auto quantile = Bind(*call.args[1], ctx);
            if (!quantile.ok()) return AggResult::error(quantile);
            const auto& q = quantile.value();
            if (q->kind != plan::Expr::Kind::LITERAL || !q->value->is_valid) {
                return AggResult::error(call.funcName + " needs a literal quantile", kPlanningFailure);
            }
            auto as_double = plan::CastScalar(q->value, arrow::float64());
            if (!as_double.ok()) return AggResult::error(as_double);
            double value = std::static_pointer_cast<arrow::DoubleScalar>(as_double.value())->value;
            if (value < 0.0 || value > 1.0) {
                return AggResult::error("Quantile must be between 0 and 1", kPlanningFailure);
            }
            agg.options = std::make_shared<cp::TDigestOptions>(value);
        }
    }

    auto output = plan::AggregateOutputType(agg.function, agg.arg ? agg.arg->type : nullptr,
                                            agg.arg ? agg.arg->nullable : false);
    if (!output.ok()) return AggResult::error(output);
    agg.type = output.value().first;
    agg.nullable = output.value().second;
    return AggResult(std::move(agg));
}

ExprResult StatementBinder::Bind(const ExprNode& node, const BindContext& ctx) const {
    if (ctx.aggregate) {
        auto it = ctx.aggregate->by_text.find(node.String());
        if (it != ctx.aggregate->by_text.end()) {
            return ExprResult(plan::MakeColumn(it->second, *ctx.schema->field(it->second)));
        }
        if (IsAggregateCall(node)) {
            return ExprResult::error("Aggregate calls cannot be nested: " + node.String(), kPlanningFailure);
        }
        if (node.type() == ExprNode::Type::COLUMN_REF) {
            const auto& ref = static_cast<const ColumnRefNode&>(node);
            auto index = ResolveColumn(ref, *ctx.aggregate->input_scope);
            if (!index.ok()) return ExprResult::error(index);
            auto group = ctx.aggregate->by_column.find(index.value());
            if (group == ctx.aggregate->by_column.end()) {
                return ExprResult::error("Column " + ref.String() +
                                             " must appear in the GROUP BY clause or be used in an aggregate function",
                                         kPlanningFailure);
            }
            return ExprResult(plan::MakeColumn(group->second, *ctx.schema->field(group->second)));
        }
    } else if (IsAggregateCall(node)) {
        return ExprResult::error("Aggregate functions are not allowed here: " + node.String(), kPlanningFailure);
    }

    switch (node.type()) {
        case ExprNode::Type::COLUMN_REF: {
            const auto& ref = static_cast<const ColumnRefNode&>(node);
            if (ref.name == "*") {
                return ExprResult::error("Wildcard is only allowed in the select list", kPlanningFailure);
            }
            auto index = ResolveColumn(ref, *ctx.scope);
            if (!index.ok()) return ExprResult::error(index);
            return ExprResult(plan::MakeColumn(index.value(), *ctx.schema->field(index.value())));
        }
        case ExprNode::Type::LITERAL:
            return BindLiteral(static_cast<const LiteralNode&>(node));
        case ExprNode::Type::UNARY:
            return BindUnary(static_cast<const UnaryExprNode&>(node), ctx);
        case ExprNode::Type::BINARY:
            return BindBinary(static_cast<const BinaryExprNode&>(node), ctx);
        case ExprNode::Type::IS:
            return BindIs(static_cast<const IsExprNode&>(node), ctx);
        case ExprNode::Type::IN_LIST:
            return BindInList(static_cast<const InListNode&>(node), ctx);
        case ExprNode::Type::IN_SUBQUERY:
            return BindInSubquery(static_cast<const InSubqueryNode&>(node), ctx);
        case ExprNode::Type::LIKE:
            return BindLike(static_cast<const LikeNode&>(node), ctx);
        case ExprNode::Type::CAST:
            return BindCast(static_cast<const CastNode&>(node), ctx);
        case ExprNode::Type::CALL:
            return BindCall(static_cast<const CallNode&>(node), ctx);
    }
    return ExprResult::error("Unsupported expression " + node.String(), kPlanningFailure);
}

ExprResult StatementBinder::BindLiteral(const LiteralNode& node) const {
    switch (node.kind) {
        case LiteralNode::Kind::NUMBER: {
            if (node.text.find_first_of(".eE") == std::string::npos) {
                auto value = ParseInteger(node.text);
                if (value) return ExprResult(plan::MakeLiteral(arrow::MakeScalar(*value)));
            }
            errno = 0;
            char* end = nullptr;
            double value = std::strtod(node.text.c_str(), &end);
            if (errno != 0 || *end != '\0') {
                return ExprResult::error("Invalid number " + node.text, kPlanningFailure);
            }
            return ExprResult(plan::MakeLiteral(arrow::MakeScalar(value)));
        }
        case LiteralNode::Kind::STRING:
            return ExprResult(plan::MakeLiteral(std::make_shared<arrow::StringScalar>(node.text)));
        case LiteralNode::Kind::BOOLEAN:
            return ExprResult(plan::MakeLiteral(arrow::MakeScalar(node.text == "true")));
        case LiteralNode::Kind::NULL_VALUE:
            return ExprResult(plan::MakeLiteral(std::make_shared<arrow::NullScalar>()));
    }
    return ExprResult::error("Unsupported literal " + node.String(), kPlanningFailure);
}

ExprResult StatementBinder::BindUnary(const UnaryExprNode& node, const BindContext& ctx) const {
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    auto expr = operand.take_value();
    if (node.op == TokenType::NOT) {
        return plan::MakeCall("invert", {expr}, *ctx.schema);
    }
    if (node.op != TokenType::SUB) {
        return ExprResult::error("Unsupported unary operator in " + node.String(), kPlanningFailure);
    }
    if (expr->kind == plan::Expr::Kind::LITERAL) {
        auto negated = cp::CallFunction("negate", {arrow::Datum(expr->value)});
        if (!negated.ok()) {
            return ExprResult::error("Cannot negate " + expr->ToString() + ": " + negated.status().ToString(),
                                     kPlanningFailure);
        }
        return ExprResult(plan::MakeLiteral(negated->scalar()));
    }
    return plan::MakeCall("negate", {expr}, *ctx.schema);
}

ExprResult StatementBinder::BindBinary(const BinaryExprNode& node, const BindContext& ctx) const {
    auto lhs = Bind(*node.lhs, ctx);
    if (!lhs.ok()) return lhs;
    auto rhs = Bind(*node.rhs, ctx);
    if (!rhs.ok()) return rhs;
    auto left = CoerceLiteral(lhs.value(), rhs.value());
    auto right = CoerceLiteral(rhs.value(), lhs.value());

    if (node.op == TokenType::MOD) {
        // x % y == x - trunc(x / y) * y; integer division already truncates
        auto quotient = plan::MakeCall("divide", {left, right}, *ctx.schema);
        if (!quotient.ok()) return quotient;
        auto truncated = quotient.take_value();
        if (arrow::is_floating(truncated->type->id())) {
            auto call = plan::MakeCall("trunc", {truncated}, *ctx.schema);
            if (!call.ok()) return call;
            truncated = call.take_value();
        }
        auto product = plan::MakeCall("multiply", {truncated, right}, *ctx.schema);
        if (!product.ok()) return product;
        return plan::MakeCall("subtract", {left, product.value()}, *ctx.schema);
    }

    std::string function = BinaryFunction(node.op);
    if (function.empty()) {
        return ExprResult::error("Unsupported operator in " + node.String(), kPlanningFailure);
    }
    return plan::MakeCall(function, {left, right}, *ctx.schema);
}

ExprResult StatementBinder::BindIs(const IsExprNode& node, const BindContext& ctx) const {
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    auto expr = operand.take_value();
    const auto& schema = *ctx.schema;

    if (node.test == IsExprNode::Test::IS_NULL) {
        return plan::MakeCall(node.negated ? "is_valid" : "is_null", {expr}, schema);
    }
    // IS TRUE / IS FALSE never yield null
    if (node.test == IsExprNode::Test::IS_FALSE) {
        auto inverted = plan::MakeCall("invert", {expr}, schema);
        if (!inverted.ok()) return inverted;
        expr = inverted.take_value();
    }
    auto tested = plan::MakeCall("coalesce", {expr, plan::MakeLiteral(arrow::MakeScalar(false))}, schema);
    if (!tested.ok() || !node.negated) return tested;
    return plan::MakeCall("invert", {tested.value()}, schema);
}

ExprResult StatementBinder::BindInList(const InListNode& node, const BindContext& ctx) const {
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    auto arg = operand.take_value();

    auto builder = arrow::MakeBuilder(arg->type);
    if (!builder.ok()) {
        return ExprResult::error("IN list over " + arg->type->ToString() + " is not supported", kPlanningFailure);
    }
    bool has_null = false;
    for (const auto& item : node.list) {
        auto bound = Bind(*item, ctx);
        if (!bound.ok()) return bound;
        const auto& value = bound.value();
        if (value->kind != plan::Expr::Kind::LITERAL) {
            return ExprResult::error("IN list items must be literals: " + item->String(), kPlanningFailure);
        }
        if (!value->value->is_valid) {
            has_null = true;
            continue;
        }
        auto cast = plan::CastScalar(value->value, arg->type);
        if (!cast.ok()) return ExprResult::error(cast);
        auto status = (*builder)->AppendScalar(*cast.value());
        if (!status.ok()) return ExprResult::error("Failed to build IN list: " + status.ToString(), kPlanningFailure);
    }
    std::shared_ptr<arrow::Array> values;
    auto status = (*builder)->Finish(&values);
    if (!status.ok()) return ExprResult::error("Failed to build IN list: " + status.ToString(), kPlanningFailure);
    return plan::MakeInValues(arg, std::move(values), has_null, node.negated, *ctx.schema);
}

ExprResult StatementBinder::BindInSubquery(const InSubqueryNode& node, const BindContext& ctx) const {
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    auto subquery = PlanSelect(*node.subquery);
    if (!subquery.ok()) return ExprResult::error(subquery);
    if (subquery.value()->schema->num_fields() != 1) {
        return ExprResult::error("IN subquery must return exactly one column", kPlanningFailure);
    }
    return ExprResult(plan::MakeInSubquery(operand.take_value(), subquery.take_value(), node.negated));
}

ExprResult StatementBinder::BindLike(const LikeNode& node, const BindContext& ctx) const {
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    auto pattern_expr = Bind(*node.pattern, ctx);
    if (!pattern_expr.ok()) return pattern_expr;
    auto pattern = StringLiteral(pattern_expr.value(), "LIKE pattern");
    if (!pattern.ok()) return ExprResult::error(pattern);

    auto options = std::make_shared<cp::MatchSubstringOptions>(pattern.value(), node.case_insensitive);
    auto matched = plan::MakeCall("match_like", {operand.value()}, *ctx.schema, std::move(options));
    if (!matched.ok() || !node.negated) return matched;
    return plan::MakeCall("invert", {matched.value()}, *ctx.schema);
}

ExprResult StatementBinder::BindCast(const CastNode& node, const BindContext& ctx) const {
    auto type = ParseSqlType(node.type_name);
    if (!type.ok()) return ExprResult::error(type);
    auto operand = Bind(*node.expr, ctx);
    if (!operand.ok()) return operand;
    const auto& expr = operand.value();
    if (expr->kind == plan::Expr::Kind::LITERAL) {
        auto cast = plan::CastScalar(expr->value, type.value());
        if (!cast.ok()) return ExprResult::error(cast);
        return ExprResult(plan::MakeLiteral(cast.take_value()));
    }
    auto options = std::make_shared<cp::CastOptions>(cp::CastOptions::Safe(type.value()));
    return plan::MakeCall("cast", {expr}, *ctx.schema, std::move(options));
}

ExprResult StatementBinder::BindCall(const CallNode& node, const BindContext& ctx) const {
    const auto* def = functions_.Lookup(node.funcName);
    if (!def) {
        return ExprResult::error("Unknown function " + node.funcName, kPlanningFailure);
    }
    if (node.star || node.distinct) {
        return ExprResult::error("Invalid arguments to " + node.String(), kPlanningFailure);
    }
    if (node.args.size() < def->min_args || node.args.size() > def->max_args) {
        return ExprResult::error("Wrong number of arguments to " + node.funcName, kPlanningFailure);
    }

    std::vector<ExprPtr> args;
    for (const auto& arg : node.args) {
        auto bound = Bind(*arg, ctx);
        if (!bound.ok()) return bound;
        args.push_back(bound.take_value());
    }

    if (def->arg_style != execution::ArgStyle::PATTERN) {
        return plan::MakeCall(def->arrow_function, std::move(args), *ctx.schema);
    }
    auto pattern = StringLiteral(args[1], "Pattern of " + node.funcName);
    if (!pattern.ok()) return ExprResult::error(pattern);
    auto options = std::make_shared<cp::MatchSubstringOptions>(pattern.value(), def->ignore_case);
    auto matched = plan::MakeCall(def->arrow_function, {args[0]}, *ctx.schema, std::move(options));
    if (!matched.ok() || !def->invert) return matched;
    return plan::MakeCall("invert", {matched.value()}, *ctx.schema);
}

PlanResult StatementBinder::PlanTable(const TableRef& ref, Scope* scope) const {
    auto provider = resolver_(ref);
    if (!provider.ok()) {
        return PlanResult::error(provider.error(), kPlanningFailure);
    }
    auto scan = plan::MakeTableScan(ref.qualified_name(), provider.take_value());
    for (const auto& field : scan->schema->fields()) {
        scope->push_back(ScopeColumn{ref.binding_name(), field->name()});
    }
    return PlanResult(std::move(scan));
}

core::Result<std::vector<std::pair<int, int>>> StatementBinder::JoinKeys(const ExprNode& on, const Scope& left,
                                                                         const Scope& right,
                                                                         const arrow::Schema& left_schema,
                                                                         const arrow::Schema& right_schema) const {
    using KeysResult = core::Result<std::vector<std::pair<int, int>>>;
    std::vector<const ExprNode*> conjuncts;
    std::vector<const ExprNode*> pending = {&on};
    while (!pending.empty()) {
        const ExprNode* node = pending.back();
        pending.pop_back();
        if (node->type() == ExprNode::Type::BINARY && static_cast<const BinaryExprNode*>(node)->op == TokenType::AND) {
            const auto* binary = static_cast<const BinaryExprNode*>(node);
            pending.push_back(binary->rhs.get());
            pending.push_back(binary->lhs.get());
            continue;
        }
        conjuncts.push_back(node);
    }

    std::vector<std::pair<int, int>> keys;
    for (const ExprNode* conjunct : conjuncts) {
        const auto* binary = conjunct->type() == ExprNode::Type::BINARY
                                 ? static_cast<const BinaryExprNode*>(conjunct) : nullptr;
        if (!binary || binary->op != TokenType::EQL || binary->lhs->type() != ExprNode::Type::COLUMN_REF ||
            binary->rhs->type() != ExprNode::Type::COLUMN_REF) {
            return KeysResult::error("JOIN ON supports only equalities between columns: " + conjunct->String(),
                                     kPlanningFailure);
        }
        const auto& a = static_cast<const ColumnRefNode&>(*binary->lhs);
        const auto& b = static_cast<const ColumnRefNode&>(*binary->rhs);

        auto a_left = ResolveColumn(a, left);
        auto b_right = ResolveColumn(b, right);
        std::pair<int, int> key;
        if (a_left.ok() && b_right.ok()) {
            key = std::make_pair(a_left.value(), b_right.value());
        } else {
            auto b_left = ResolveColumn(b, left);
            auto a_right = ResolveColumn(a, right);
            if (!b_left.ok() || !a_right.ok()) {
                return KeysResult::error("JOIN ON must compare a column of each side: " + conjunct->String(),
                                         kPlanningFailure);
            }
            key = std::make_pair(b_left.value(), a_right.value());
        }
        const auto& left_type = left_schema.field(key.first)->type();
        const auto& right_type = right_schema.field(key.second)->type();
        if (!left_type->Equals(*right_type)) {
            return KeysResult::error("JOIN key types differ: " + left_type->ToString() + " and " +
                                         right_type->ToString(),
                                     kPlanningFailure);
        }
        keys.push_back(key);
    }
    return KeysResult(std::move(keys));
}

PlanResult StatementBinder::PlanSelect(const SelectStmt& stmt) const {
    Scope scope;
    auto from = PlanTable(stmt.from, &scope);
    if (!from.ok()) return from;
    LogicalPlanPtr current = from.take_value();

    for (const auto& join : stmt.joins) {
        Scope right_scope;
        auto right = PlanTable(join.table, &right_scope);
        if (!right.ok()) return right;
        auto keys = JoinKeys(*join.on, scope, right_scope, *current->schema, *right.value()->schema);
        if (!keys.ok()) return PlanResult::error(keys);
        auto type = join.kind == JoinKind::LEFT ? plan::JoinType::LEFT : plan::JoinType::INNER;
        current = plan::MakeJoin(current, right.take_value(), type, keys.take_value());
        scope.insert(scope.end(), right_scope.begin(), right_scope.end());
    }

    BindContext base{&scope, current->schema, nullptr};
    if (stmt.where) {
        auto predicate = Bind(*stmt.where, base);
        if (!predicate.ok()) return PlanResult::error(predicate);
        auto id = predicate.value()->type->id();
        if (id != arrow::Type::BOOL && id != arrow::Type::NA) {
            return PlanResult::error("WHERE clause must be a boolean expression", kPlanningFailure);
        }
        current = plan::MakeFilter(current, predicate.take_value());
    }

    std::vector<const CallNode*> aggregate_nodes;
    for (const auto& item : stmt.items) {
        if (item.expr) CollectAggregates(*item.expr, &aggregate_nodes);
    }
    for (const auto& order : stmt.order_by) CollectAggregates(*order.expr, &aggregate_nodes);
    bool aggregating = !stmt.group_by.empty() || !aggregate_nodes.empty();

    AggregateBinding binding;
    BindContext select_ctx = base;
    if (aggregating) {
        std::vector<ExprPtr> group_exprs;
        std::vector<std::string> group_names;
        for (const auto& group : stmt.group_by) {
            const ExprNode* node = group.get();
            if (auto position = PositionOf(*node)) {
                if (*position < 1 || static_cast<size_t>(*position) > stmt.items.size() ||
                    !stmt.items[static_cast<size_t>(*position - 1)].expr) {
                    return PlanResult::error("GROUP BY position " + std::to_string(*position) +
                                                 " is not in select list",
                                             kPlanningFailure);
                }
                node = stmt.items[static_cast<size_t>(*position - 1)].expr.get();
            }
            auto expr = Bind(*node, base);
            if (!expr.ok()) return PlanResult::error(expr);
            int output = static_cast<int>(group_exprs.size());
            binding.by_text.emplace(node->String(), output);
            if (expr.value()->kind == plan::Expr::Kind::COLUMN) binding.by_column.emplace(expr.value()->index, output);
            group_names.push_back(node->type() == ExprNode::Type::COLUMN_REF
                                      ? static_cast<const ColumnRefNode*>(node)->name : node->String());
            group_exprs.push_back(expr.take_value());
        }

        std::vector<plan::AggregateCall> aggregates;
        for (const CallNode* call : aggregate_nodes) {
            auto text = call->String();
            if (binding.by_text.count(text)) continue;
            auto agg = BuildAggregate(*call, base);
            if (!agg.ok()) return PlanResult::error(agg);
            binding.by_text.emplace(text, static_cast<int>(group_exprs.size() + aggregates.size()));
            aggregates.push_back(agg.take_value());
        }
        current = plan::MakeAggregate(current, std::move(group_exprs), group_names, std::move(aggregates));
        binding.input_scope = &scope;
        select_ctx = BindContext{nullptr, current->schema, &binding};
    }

    std::vector<ExprPtr> exprs;
    std::vector<std::string> names;
    std::vector<std::string> texts;
    for (const auto& item : stmt.items) {
        if (item.wildcard) {
            if (aggregating) {
                return PlanResult::error("Wildcard cannot be combined with aggregation", kPlanningFailure);
            }
            bool matched = false;
            for (size_t i = 0; i < scope.size(); ++i) {
                if (!item.wildcard_qualifier.empty() && scope[i].qualifier != item.wildcard_qualifier) continue;
                int index = static_cast<int>(i);
                exprs.push_back(plan::MakeColumn(index, *current->schema->field(index)));
                names.push_back(scope[i].name);
                texts.push_back(scope[i].name);
                matched = true;
            }
            if (!matched) {
                return PlanResult::error("Unknown table " + item.wildcard_qualifier, kPlanningFailure);
            }
            continue;
        }
        auto expr = Bind(*item.expr, select_ctx);
        if (!expr.ok()) return PlanResult::error(expr);
        std::string name = item.alias;
        if (name.empty()) {
            name = item.expr->type() == ExprNode::Type::COLUMN_REF
                       ? static_cast<const ColumnRefNode&>(*item.expr).name : item.expr->String();
        }
        exprs.push_back(expr.take_value());
        names.push_back(std::move(name));
        texts.push_back(item.expr->String());
    }
    size_t visible = exprs.size();

    // ORDER BY: output name, then select list position, then a hidden column
    std::vector<plan::SortExpr> sort_columns;
    std::vector<int> sort_indices;
    for (const auto& order : stmt.order_by) {
        int index = -1;
        const ExprNode& node = *order.expr;
        if (node.type() == ExprNode::Type::COLUMN_REF) {
            const auto& ref = static_cast<const ColumnRefNode&>(node);
            for (size_t i = 0; ref.qualifier.empty() && i < visible; ++i) {
                if (names[i] == ref.name) {
                    index = static_cast<int>(i);
                    break;
                }
            }
        }
        if (index < 0) {
            if (auto position = PositionOf(node)) {
                if (*position < 1 || static_cast<size_t>(*position) > visible) {
                    return PlanResult::error("ORDER BY position " + std::to_string(*position) +
                                                 " is not in select list",
                                             kPlanningFailure);
                }
                index = static_cast<int>(*position - 1);
            }
        }
        if (index < 0) {
            for (size_t i = 0; i < visible; ++i) {
                if (texts[i] == node.String()) {
                    index = static_cast<int>(i);
                    break;
                }
            }
        }
        if (index < 0) {
            if (stmt.distinct) {
                return PlanResult::error("For SELECT DISTINCT, ORDER BY expressions must appear in select list",
                                         kPlanningFailure);
            }
            auto expr = Bind(node, select_ctx);
            if (!expr.ok()) return PlanResult::error(expr);
            index = static_cast<int>(exprs.size());
            exprs.push_back(expr.take_value());
            names.push_back("__sort_" + std::to_string(index - static_cast<int>(visible)));
        }
        plan::SortExpr sort;
        sort.descending = !order.ascending;
        sort.nulls_first = order.nulls_first.value_or(sort.descending);
        sort_columns.push_back(std::move(sort));
        sort_indices.push_back(index);
    }

    current = plan::MakeProjection(current, std::move(exprs), names);

    if (stmt.distinct) {
        std::vector<ExprPtr> keys;
        for (int i = 0; i < current->schema->num_fields(); ++i) {
            keys.push_back(plan::MakeColumn(i, *current->schema->field(i)));
        }
        // Acero needs an aggregate to group by; the count is dropped again
        plan::AggregateCall count;
        count.function = "count_all";
        count.name = "__distinct_count";
        count.type = arrow::int64();
        std::vector<plan::AggregateCall> aggregates;
        aggregates.push_back(std::move(count));
        current = plan::MakeAggregate(current, keys, names, std::move(aggregates));
        current = plan::MakeProjection(current, std::move(keys), names);
    }

    if (!sort_columns.empty()) {
        for (size_t i = 0; i < sort_columns.size(); ++i) {
            sort_columns[i].expr = plan::MakeColumn(sort_indices[i], *current->schema->field(sort_indices[i]));
        }
        current = plan::MakeSort(current, std::move(sort_columns), std::nullopt);
    }

    if (names.size() > visible) {
        std::vector<ExprPtr> kept;
        for (size_t i = 0; i < visible; ++i) {
            kept.push_back(plan::MakeColumn(static_cast<int>(i), *current->schema->field(static_cast<int>(i))));
        }
        names.resize(visible);
        current = plan::MakeProjection(current, std::move(kept), names);
    }

    if (stmt.limit || stmt.offset) {
        if ((stmt.limit && *stmt.limit < 0) || (stmt.offset && *stmt.offset < 0)) {
            return PlanResult::error("LIMIT and OFFSET must not be negative", kPlanningFailure);
        }
        std::optional<size_t> fetch;
        if (stmt.limit) fetch = static_cast<size_t>(*stmt.limit);
        current = plan::MakeLimit(current, static_cast<size_t>(stmt.offset.value_or(0)), fetch);
    }
    return PlanResult(std::move(current));
}

} // namespace

SqlPlanner::SqlPlanner(TableResolver resolver, const execution::FunctionRegistry& functions)
    : resolver_(std::move(resolver)), functions_(functions) {}

core::Result<plan::LogicalPlanPtr> SqlPlanner::Plan(const SelectStmt& stmt) const {
    StatementBinder binder(resolver_, functions_);
    auto planned = binder.PlanSelect(stmt);
    if (!planned.ok()) {
        QFAB_DEBUG("[sql] planning failed: {}", planned.error());
        return PlanResult::error(planned.error(), kPlanningFailure);
    }
    return planned;
}

core::Result<std::shared_ptr<arrow::DataType>> ParseSqlType(const std::string& name) {
    using TypeResult = core::Result<std::shared_ptr<arrow::DataType>>;
    static const std::map<std::string, std::shared_ptr<arrow::DataType>> kTypes = {
        {"bigint", arrow::int64()},    {"int8", arrow::int64()},       {"int64", arrow::int64()},
        {"long", arrow::int64()},      {"int", arrow::int32()},        {"integer", arrow::int32()},
        {"int4", arrow::int32()},      {"int32", arrow::int32()},      {"smallint", arrow::int16()},
        {"int2", arrow::int16()},      {"tinyint", arrow::int8()},     {"double", arrow::float64()},
        {"double precision", arrow::float64()},                        {"float8", arrow::float64()},
        {"float", arrow::float64()},   {"float64", arrow::float64()},  {"real", arrow::float32()},
        {"float4", arrow::float32()},  {"varchar", arrow::utf8()},     {"text", arrow::utf8()},
        {"string", arrow::utf8()},     {"char", arrow::utf8()},        {"bool", arrow::boolean()},
        {"boolean", arrow::boolean()}, {"timestamp", arrow::timestamp(arrow::TimeUnit::MICRO)},
        {"date", arrow::date32()},
    };
    auto it = kTypes.find(name);
    if (it == kTypes.end()) {
        return TypeResult::error("Unsupported type " + name, kPlanningFailure);
    }
    return TypeResult(it->second);
}

} // namespace sql
} // namespace qfab
