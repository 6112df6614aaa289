#ifndef QFAB_SQL_AST_H_
#define QFAB_SQL_AST_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "qfab/sql/lexer.h"

namespace qfab {
namespace sql {

struct SelectStmt;

// Base interface for all AST expression nodes
struct ExprNode {
    enum class Type {
        BINARY,
        CALL,
        CAST,
        COLUMN_REF,
        IN_LIST,
        IN_SUBQUERY,
        IS,
        LIKE,
        LITERAL,
        UNARY
    };

    virtual ~ExprNode() = default;
    virtual std::string String() const = 0;
    virtual Type type() const = 0;
};

// column, or qualifier.column
struct ColumnRefNode : ExprNode {
    std::string qualifier;   // empty when unqualified
    std::string name;

    ColumnRefNode(std::string q, std::string n) : qualifier(std::move(q)), name(std::move(n)) {}
    std::string String() const override;
    Type type() const override { return Type::COLUMN_REF; }
};

struct LiteralNode : ExprNode {
    enum class Kind { NUMBER, STRING, BOOLEAN, NULL_VALUE };

    Kind kind;
    std::string text;   // NUMBER/STRING spelling; "true"/"false" for BOOLEAN

    LiteralNode(Kind k, std::string t) : kind(k), text(std::move(t)) {}
    std::string String() const override;
    Type type() const override { return Type::LITERAL; }
};

// NOT expr, -expr
struct UnaryExprNode : ExprNode {
    TokenType op;
    std::unique_ptr<ExprNode> expr;

    UnaryExprNode(TokenType o, std::unique_ptr<ExprNode> e) : op(o), expr(std::move(e)) {}
    std::string String() const override;
    Type type() const override { return Type::UNARY; }
};

// Arithmetic, comparison, AND and OR
struct BinaryExprNode : ExprNode {
    TokenType op;
    std::unique_ptr<ExprNode> lhs;
    std::unique_ptr<ExprNode> rhs;

    BinaryExprNode(TokenType o, std::unique_ptr<ExprNode> l, std::unique_ptr<ExprNode> r)
        : op(o), lhs(std::move(l)), rhs(std::move(r)) {}
    std::string String() const override;
    Type type() const override { return Type::BINARY; }
};

// expr IS [NOT] NULL|TRUE|FALSE
struct IsExprNode : ExprNode {
    enum class Test { IS_NULL, IS_TRUE, IS_FALSE };

    std::unique_ptr<ExprNode> expr;
    Test test;
    bool negated;

    IsExprNode(std::unique_ptr<ExprNode> e, Test t, bool n) : expr(std::move(e)), test(t), negated(n) {}
    std::string String() const override;
    Type type() const override { return Type::IS; }
};

// expr [NOT] IN (v1, v2, ...)
struct InListNode : ExprNode {
    std::unique_ptr<ExprNode> expr;
    std::vector<std::unique_ptr<ExprNode>> list;
    bool negated;

    InListNode(std::unique_ptr<ExprNode> e, std::vector<std::unique_ptr<ExprNode>> l, bool n)
        : expr(std::move(e)), list(std::move(l)), negated(n) {}
    std::string String() const override;
    Type type() const override { return Type::IN_LIST; }
};

// expr [NOT] IN (SELECT ...)
struct InSubqueryNode : ExprNode {
    std::unique_ptr<ExprNode> expr;
    std::unique_ptr<SelectStmt> subquery;
    bool negated;

    InSubqueryNode(std::unique_ptr<ExprNode> e, std::unique_ptr<SelectStmt> s, bool n);
    ~InSubqueryNode() override;
    std::string String() const override;
    Type type() const override { return Type::IN_SUBQUERY; }
};

// expr [NOT] LIKE|ILIKE pattern
struct LikeNode : ExprNode {
    std::unique_ptr<ExprNode> expr;
    std::unique_ptr<ExprNode> pattern;
    bool negated;
    bool case_insensitive;

    LikeNode(std::unique_ptr<ExprNode> e, std::unique_ptr<ExprNode> p, bool n, bool ci)
        : expr(std::move(e)), pattern(std::move(p)), negated(n), case_insensitive(ci) {}
    std::string String() const override;
    Type type() const override { return Type::LIKE; }
};

// CAST(expr AS type_name)
struct CastNode : ExprNode {
    std::unique_ptr<ExprNode> expr;
    std::string type_name;   // lower-cased, e.g. "bigint", "double precision"

    CastNode(std::unique_ptr<ExprNode> e, std::string t) : expr(std::move(e)), type_name(std::move(t)) {}
    std::string String() const override;
    Type type() const override { return Type::CAST; }
};

// name(args), name(*), name(DISTINCT args)
struct CallNode : ExprNode {
    std::string funcName;
    std::vector<std::unique_ptr<ExprNode>> args;
    bool star = false;
    bool distinct = false;

    CallNode(std::string name, std::vector<std::unique_ptr<ExprNode>> a)
        : funcName(std::move(name)), args(std::move(a)) {}
    std::string String() const override;
    Type type() const override { return Type::CALL; }
};

struct SelectItem {
    std::unique_ptr<ExprNode> expr;   // null for a wildcard
    std::string alias;
    bool wildcard = false;
    std::string wildcard_qualifier;   // t.* when set
};

struct TableRef {
    std::string schema;   // e.g. information_schema, empty otherwise
    std::string name;
    std::string alias;

    std::string qualified_name() const { return schema.empty() ? name : schema + "." + name; }
    // Name columns of this table are qualified with
    const std::string& binding_name() const { return alias.empty() ? name : alias; }
};

enum class JoinKind {
    INNER,
    LEFT
};

struct JoinClause {
    JoinKind kind = JoinKind::INNER;
    TableRef table;
    std::unique_ptr<ExprNode> on;
};

struct OrderItem {
    std::unique_ptr<ExprNode> expr;
    bool ascending = true;
    std::optional<bool> nulls_first;   // dialect default when unset
};

/**
 * @brief One SELECT statement
 */
struct SelectStmt {
    bool distinct = false;
    std::vector<SelectItem> items;
    TableRef from;
    std::vector<JoinClause> joins;
    std::unique_ptr<ExprNode> where;
    std::vector<std::unique_ptr<ExprNode>> group_by;
    std::vector<OrderItem> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;

    std::string String() const;
};

} // namespace sql
} // namespace qfab

#endif // QFAB_SQL_AST_H_
