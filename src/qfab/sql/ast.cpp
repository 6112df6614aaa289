#include "qfab/sql/ast.h"

#include <sstream>

namespace qfab {
namespace sql {

namespace {

std::string OpString(TokenType op) {
    switch (op) {
        case TokenType::EQL: return "=";
        case TokenType::NEQ: return "<>";
        case TokenType::LSS: return "<";
        case TokenType::LTE: return "<=";
        case TokenType::GTR: return ">";
        case TokenType::GTE: return ">=";
        case TokenType::ADD: return "+";
        case TokenType::SUB: return "-";
        case TokenType::MUL: return "*";
        case TokenType::DIV: return "/";
        case TokenType::MOD: return "%";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        default: return TokenTypeToString(op);
    }
}

} // namespace

std::string ColumnRefNode::String() const {
    return qualifier.empty() ? name : qualifier + "." + name;
}

std::string LiteralNode::String() const {
    switch (kind) {
        case Kind::STRING: return "'" + text + "'";
        case Kind::NULL_VALUE: return "NULL";
        default: return text;
    }
}

std::string UnaryExprNode::String() const {
    if (op == TokenType::NOT) {
        return "NOT " + expr->String();
    }
    return OpString(op) + expr->String();
}

std::string BinaryExprNode::String() const {
    return lhs->String() + " " + OpString(op) + " " + rhs->String();
}

std::string IsExprNode::String() const {
    std::string s = expr->String() + (negated ? " IS NOT " : " IS ");
    switch (test) {
        case Test::IS_NULL: return s + "NULL";
        case Test::IS_TRUE: return s + "TRUE";
        case Test::IS_FALSE: return s + "FALSE";
    }
    return s;
}

std::string InListNode::String() const {
    std::ostringstream oss;
    oss << expr->String() << (negated ? " NOT IN (" : " IN (");
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << list[i]->String();
    }
    oss << ")";
    return oss.str();
}

InSubqueryNode::InSubqueryNode(std::unique_ptr<ExprNode> e, std::unique_ptr<SelectStmt> s, bool n)
    : expr(std::move(e)), subquery(std::move(s)), negated(n) {}

InSubqueryNode::~InSubqueryNode() = default;

std::string InSubqueryNode::String() const {
    return expr->String() + (negated ? " NOT IN (" : " IN (") + subquery->String() + ")";
}

std::string LikeNode::String() const {
    std::string op = case_insensitive ? "ILIKE" : "LIKE";
    return expr->String() + (negated ? " NOT " : " ") + op + " " + pattern->String();
}

std::string CastNode::String() const {
    return "CAST(" + expr->String() + " AS " + type_name + ")";
}

std::string CallNode::String() const {
    std::ostringstream oss;
    oss << funcName << "(";
    if (distinct) oss << "DISTINCT ";
    if (star) oss << "*";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << args[i]->String();
    }
    oss << ")";
    return oss.str();
}

std::string SelectStmt::String() const {
    std::ostringstream oss;
    oss << "SELECT ";
    if (distinct) oss << "DISTINCT ";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ", ";
        const auto& item = items[i];
        if (item.wildcard) {
            oss << (item.wildcard_qualifier.empty() ? "*" : item.wildcard_qualifier + ".*");
        } else {
            oss << item.expr->String();
            if (!item.alias.empty()) oss << " AS " << item.alias;
        }
    }
    oss << " FROM " << from.qualified_name();
    if (!from.alias.empty()) oss << " " << from.alias;
    for (const auto& join : joins) {
        oss << (join.kind == JoinKind::LEFT ? " LEFT JOIN " : " JOIN ") << join.table.qualified_name();
        if (!join.table.alias.empty()) oss << " " << join.table.alias;
        oss << " ON " << join.on->String();
    }
    if (where) oss << " WHERE " << where->String();
    if (!group_by.empty()) {
        oss << " GROUP BY ";
        for (size_t i = 0; i < group_by.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << group_by[i]->String();
        }
    }
    if (!order_by.empty()) {
        oss << " ORDER BY ";
        for (size_t i = 0; i < order_by.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << order_by[i].expr->String() << (order_by[i].ascending ? " ASC" : " DESC");
            if (order_by[i].nulls_first) oss << (*order_by[i].nulls_first ? " NULLS FIRST" : " NULLS LAST");
        }
    }
    if (limit) oss << " LIMIT " << *limit;
    if (offset) oss << " OFFSET " << *offset;
    return oss.str();
}

} // namespace sql
} // namespace qfab
