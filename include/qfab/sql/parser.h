#ifndef QFAB_SQL_PARSER_H_
#define QFAB_SQL_PARSER_H_

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "qfab/core/result.h"
#include "qfab/sql/ast.h"
#include "qfab/sql/lexer.h"

namespace qfab {
namespace sql {

class ParserError : public std::runtime_error {
public:
    ParserError(const std::string& message, int line, int pos)
        : std::runtime_error(message + " at line " + std::to_string(line) + ":" + std::to_string(pos)),
          line_(line), pos_(pos) {}

    int line() const { return line_; }
    int pos() const { return pos_; }
private:
    int line_;
    int pos_;
};

class Parser {
public:
    explicit Parser(Lexer& lexer);

    enum class Precedence {
        LOWEST      = 0,
        OR          = 1, // OR
        AND         = 2, // AND
        NOT         = 3, // NOT (prefix)
        COMPARISON  = 4, // = <> < <= > >= IS IN LIKE ILIKE
        SUM_SUB     = 5, // + -
        MUL_DIV_MOD = 6, // * / %
        UNARY       = 7  // - (unary)
    };

    // Parses one SELECT statement followed by an optional ';'. Returns null
    // and records errors on a syntax error.
    std::unique_ptr<SelectStmt> ParseStatement();

    const std::vector<ParserError>& Errors() const { return errors_; }

private:
    Lexer& lexer_;
    Token currentToken_;
    Token peekToken_;

    std::vector<ParserError> errors_;

    void nextToken();
    bool expectCurrent(TokenType t);
    void currentError(const std::string& expected);

    Precedence getPrecedence(TokenType type);
    bool isIdentifierToken(const Token& tok) const;

    std::unique_ptr<SelectStmt> parseSelect();
    bool parseSelectItems(SelectStmt& stmt);
    bool parseTableRef(TableRef& ref);
    bool parseOrderBy(SelectStmt& stmt);
    bool parseCount(std::optional<int64_t>& out, const char* clause);

    std::unique_ptr<ExprNode> parseExpression(Precedence precedence);
    std::unique_ptr<ExprNode> parsePrefixExpression();
    std::unique_ptr<ExprNode> parseInfixExpression(std::unique_ptr<ExprNode> left);

    std::unique_ptr<ExprNode> parseIdentifierOrCall();
    std::unique_ptr<ExprNode> parseCallExpression(std::string funcName);
    std::unique_ptr<ExprNode> parseCastExpression();
    std::unique_ptr<ExprNode> parseInExpression(std::unique_ptr<ExprNode> left, bool negated);
    bool parseExpressionList(std::vector<std::unique_ptr<ExprNode>>& out);
};

/**
 * @brief Parses a statement, surfacing syntax errors as PLANNING_FAILURE
 *
 * With fold_identifiers unset, unquoted identifiers keep their spelling.
 */
core::Result<std::unique_ptr<SelectStmt>> ParseSql(const std::string& sql, bool fold_identifiers = true);

} // namespace sql
} // namespace qfab

#endif // QFAB_SQL_PARSER_H_
