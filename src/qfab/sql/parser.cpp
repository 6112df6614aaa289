#include "qfab/sql/parser.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace qfab {
namespace sql {

static const std::unordered_map<TokenType, Parser::Precedence> precedenceMap = {
    {TokenType::OR, Parser::Precedence::OR},
    {TokenType::AND, Parser::Precedence::AND},
    {TokenType::EQL, Parser::Precedence::COMPARISON},
    {TokenType::NEQ, Parser::Precedence::COMPARISON},
    {TokenType::LSS, Parser::Precedence::COMPARISON},
    {TokenType::LTE, Parser::Precedence::COMPARISON},
    {TokenType::GTR, Parser::Precedence::COMPARISON},
    {TokenType::GTE, Parser::Precedence::COMPARISON},
    {TokenType::IS, Parser::Precedence::COMPARISON},
    {TokenType::IN, Parser::Precedence::COMPARISON},
    {TokenType::LIKE, Parser::Precedence::COMPARISON},
    {TokenType::ILIKE, Parser::Precedence::COMPARISON},
    {TokenType::NOT, Parser::Precedence::COMPARISON}, // NOT IN / NOT LIKE
    {TokenType::ADD, Parser::Precedence::SUM_SUB},
    {TokenType::SUB, Parser::Precedence::SUM_SUB},
    {TokenType::MUL, Parser::Precedence::MUL_DIV_MOD},
    {TokenType::DIV, Parser::Precedence::MUL_DIV_MOD},
    {TokenType::MOD, Parser::Precedence::MUL_DIV_MOD},
};

Parser::Parser(Lexer& lexer)
    : lexer_(lexer),
      currentToken_(lexer_.NextToken()),
      peekToken_(lexer_.NextToken()) {}

void Parser::nextToken() {
    currentToken_ = peekToken_;
    peekToken_ = lexer_.NextToken();
}

bool Parser::expectCurrent(TokenType t) {
    if (currentToken_.type == t) {
        nextToken();
        return true;
    }
    currentError(TokenTypeToString(t));
    return false;
}

void Parser::currentError(const std::string& expected) {
    std::string got = currentToken_.type == TokenType::ILLEGAL
                          ? "illegal input '" + currentToken_.literal + "'"
                          : TokenTypeToString(currentToken_.type);
    errors_.emplace_back("Expected " + expected + ", got " + got, currentToken_.line, currentToken_.pos);
}

Parser::Precedence Parser::getPrecedence(TokenType type) {
    auto it = precedenceMap.find(type);
    return it == precedenceMap.end() ? Precedence::LOWEST : it->second;
}

// Non-reserved keywords double as identifiers
bool Parser::isIdentifierToken(const Token& tok) const {
    switch (tok.type) {
        case TokenType::IDENTIFIER:
        case TokenType::QUOTED_IDENTIFIER:
        case TokenType::FIRST:
        case TokenType::LAST:
        case TokenType::NULLS:
            return true;
        default:
            return false;
    }
}

std::unique_ptr<SelectStmt> Parser::ParseStatement() {
    auto stmt = parseSelect();
    if (!stmt) {
        return nullptr;
    }
    if (currentToken_.type == TokenType::SEMICOLON) {
        nextToken();
    }
    if (currentToken_.type != TokenType::EOF_TOKEN) {
        currentError("end of statement");
        return nullptr;
    }
    return stmt;
}

std::unique_ptr<SelectStmt> Parser::parseSelect() {
    if (!expectCurrent(TokenType::SELECT)) {
        return nullptr;
    }
    auto stmt = std::make_unique<SelectStmt>();
    if (currentToken_.type == TokenType::DISTINCT) {
        stmt->distinct = true;
        nextToken();
    }
    if (!parseSelectItems(*stmt)) {
        return nullptr;
    }
    if (!expectCurrent(TokenType::FROM) || !parseTableRef(stmt->from)) {
        return nullptr;
    }

    while (currentToken_.type == TokenType::JOIN || currentToken_.type == TokenType::INNER ||
           currentToken_.type == TokenType::LEFT) {
        JoinClause join;
        if (currentToken_.type == TokenType::LEFT) {
            join.kind = JoinKind::LEFT;
            nextToken();
            if (currentToken_.type == TokenType::OUTER) nextToken();
        } else if (currentToken_.type == TokenType::INNER) {
            nextToken();
        }
        if (!expectCurrent(TokenType::JOIN) || !parseTableRef(join.table) || !expectCurrent(TokenType::ON)) {
            return nullptr;
        }
        join.on = parseExpression(Precedence::LOWEST);
        if (!join.on) return nullptr;
        stmt->joins.push_back(std::move(join));
    }

    if (currentToken_.type == TokenType::WHERE) {
        nextToken();
        stmt->where = parseExpression(Precedence::LOWEST);
        if (!stmt->where) return nullptr;
    }
    if (currentToken_.type == TokenType::GROUP) {
        nextToken();
        if (!expectCurrent(TokenType::BY) || !parseExpressionList(stmt->group_by)) {
            return nullptr;
        }
    }
    if (currentToken_.type == TokenType::ORDER) {
        nextToken();
        if (!expectCurrent(TokenType::BY) || !parseOrderBy(*stmt)) {
            return nullptr;
        }
    }
    if (currentToken_.type == TokenType::LIMIT) {
        nextToken();
        if (!parseCount(stmt->limit, "LIMIT")) return nullptr;
    }
    if (currentToken_.type == TokenType::OFFSET) {
        nextToken();
        if (!parseCount(stmt->offset, "OFFSET")) return nullptr;
    }
    return stmt;
}

bool Parser::parseSelectItems(SelectStmt& stmt) {
    while (true) {
        SelectItem item;
        if (currentToken_.type == TokenType::MUL) {
            item.wildcard = true;
            nextToken();
        } else {
            item.expr = parseExpression(Precedence::LOWEST);
            if (!item.expr) return false;
            // t.* comes back from the prefix parser as a column named "*"
            if (item.expr->type() == ExprNode::Type::COLUMN_REF) {
                auto* ref = static_cast<ColumnRefNode*>(item.expr.get());
                if (ref->name == "*") {
                    item.wildcard = true;
                    item.wildcard_qualifier = ref->qualifier;
                    item.expr.reset();
                }
            }
            if (!item.wildcard) {
                if (currentToken_.type == TokenType::AS) {
                    nextToken();
                    if (!isIdentifierToken(currentToken_)) {
                        currentError("alias");
                        return false;
                    }
                    item.alias = currentToken_.literal;
                    nextToken();
                } else if (currentToken_.type == TokenType::IDENTIFIER ||
                           currentToken_.type == TokenType::QUOTED_IDENTIFIER) {
                    item.alias = currentToken_.literal;
                    nextToken();
                }
            }
        }
        stmt.items.push_back(std::move(item));
        if (currentToken_.type != TokenType::COMMA) {
            return true;
        }
        nextToken();
    }
}

bool Parser::parseTableRef(TableRef& ref) {
    if (!isIdentifierToken(currentToken_)) {
        currentError("table name");
        return false;
    }
    ref.name = currentToken_.literal;
    nextToken();
    if (currentToken_.type == TokenType::DOT) {
        nextToken();
        if (!isIdentifierToken(currentToken_)) {
            currentError("table name");
            return false;
        }
        ref.schema = ref.name;
        ref.name = currentToken_.literal;
        nextToken();
    }
    if (currentToken_.type == TokenType::AS) {
        nextToken();
        if (!isIdentifierToken(currentToken_)) {
            currentError("table alias");
            return false;
        }
        ref.alias = currentToken_.literal;
        nextToken();
    } else if (currentToken_.type == TokenType::IDENTIFIER ||
               currentToken_.type == TokenType::QUOTED_IDENTIFIER) {
        ref.alias = currentToken_.literal;
        nextToken();
    }
    return true;
}

bool Parser::parseOrderBy(SelectStmt& stmt) {
    while (true) {
        OrderItem item;
        item.expr = parseExpression(Precedence::LOWEST);
        if (!item.expr) return false;
        if (currentToken_.type == TokenType::ASC) {
            nextToken();
        } else if (currentToken_.type == TokenType::DESC) {
            item.ascending = false;
            nextToken();
        }
        if (currentToken_.type == TokenType::NULLS) {
            nextToken();
            if (currentToken_.type == TokenType::FIRST) {
                item.nulls_first = true;
            } else if (currentToken_.type == TokenType::LAST) {
                item.nulls_first = false;
            } else {
                currentError("FIRST or LAST");
                return false;
            }
            nextToken();
        }
        stmt.order_by.push_back(std::move(item));
        if (currentToken_.type != TokenType::COMMA) {
            return true;
        }
        nextToken();
    }
}

bool Parser::parseCount(std::optional<int64_t>& out, const char* clause) {
    if (currentToken_.type != TokenType::NUMBER) {
        currentError(std::string("row count after ") + clause);
        return false;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(currentToken_.literal, &consumed);
        if (consumed != currentToken_.literal.size() || value < 0) {
            throw std::invalid_argument(currentToken_.literal);
        }
        out = static_cast<int64_t>(value);
    } catch (const std::exception&) {
        errors_.emplace_back(std::string("Invalid ") + clause + " value " + currentToken_.literal,
                             currentToken_.line, currentToken_.pos);
        return false;
    }
    nextToken();
    return true;
}

std::unique_ptr<ExprNode> Parser::parseExpression(Precedence precedence) {
    std::unique_ptr<ExprNode> leftExpr = parsePrefixExpression();
    if (!leftExpr) {
        return nullptr;
    }
    while (currentToken_.type != TokenType::EOF_TOKEN && precedence < getPrecedence(currentToken_.type)) {
        leftExpr = parseInfixExpression(std::move(leftExpr));
        if (!leftExpr) {
            return nullptr;
        }
    }
    return leftExpr;
}

std::unique_ptr<ExprNode> Parser::parsePrefixExpression() {
    switch (currentToken_.type) {
        case TokenType::NUMBER: {
            auto node = std::make_unique<LiteralNode>(LiteralNode::Kind::NUMBER, currentToken_.literal);
            nextToken();
            return node;
        }
        case TokenType::STRING: {
            auto node = std::make_unique<LiteralNode>(LiteralNode::Kind::STRING, currentToken_.literal);
            nextToken();
            return node;
        }
        case TokenType::TRUE_LITERAL:
        case TokenType::FALSE_LITERAL: {
            auto node = std::make_unique<LiteralNode>(LiteralNode::Kind::BOOLEAN, currentToken_.literal);
            nextToken();
            return node;
        }
        case TokenType::NULL_LITERAL:
            nextToken();
            return std::make_unique<LiteralNode>(LiteralNode::Kind::NULL_VALUE, "NULL");
        case TokenType::LEFT_PAREN: {
            nextToken();
            if (currentToken_.type == TokenType::SELECT) {
                currentError("expression (scalar subqueries are not supported)");
                return nullptr;
            }
            auto inner = parseExpression(Precedence::LOWEST);
            if (!inner || !expectCurrent(TokenType::RIGHT_PAREN)) {
                return nullptr;
            }
            return inner;
        }
        case TokenType::SUB:
        case TokenType::ADD: {
            TokenType op = currentToken_.type;
            nextToken();
            auto operand = parseExpression(Precedence::UNARY);
            if (!operand) return nullptr;
            if (op == TokenType::ADD) return operand;
            return std::make_unique<UnaryExprNode>(TokenType::SUB, std::move(operand));
        }
        case TokenType::NOT: {
            nextToken();
            auto operand = parseExpression(Precedence::NOT);
            if (!operand) return nullptr;
            return std::make_unique<UnaryExprNode>(TokenType::NOT, std::move(operand));
        }
        case TokenType::CAST:
            return parseCastExpression();
        default:
            if (isIdentifierToken(currentToken_)) {
                return parseIdentifierOrCall();
            }
            currentError("expression");
            return nullptr;
    }
}

std::unique_ptr<ExprNode> Parser::parseIdentifierOrCall() {
    Token first = currentToken_;
    nextToken();
    if (currentToken_.type == TokenType::LEFT_PAREN && first.type != TokenType::QUOTED_IDENTIFIER) {
        // Function names resolve case-insensitively in every dialect
        std::string name = first.literal;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return parseCallExpression(std::move(name));
    }
    if (currentToken_.type == TokenType::DOT) {
        nextToken();
        if (currentToken_.type == TokenType::MUL) {
            nextToken();
            return std::make_unique<ColumnRefNode>(first.literal, "*");
        }
        if (!isIdentifierToken(currentToken_)) {
            currentError("column name");
            return nullptr;
        }
        auto node = std::make_unique<ColumnRefNode>(first.literal, currentToken_.literal);
        nextToken();
        return node;
    }
    return std::make_unique<ColumnRefNode>("", first.literal);
}

std::unique_ptr<ExprNode> Parser::parseCallExpression(std::string funcName) {
    nextToken(); // consume '('
    std::vector<std::unique_ptr<ExprNode>> args;
    bool star = false;
    bool distinct = false;
    if (currentToken_.type == TokenType::DISTINCT) {
        distinct = true;
        nextToken();
    }
    if (currentToken_.type == TokenType::MUL) {
        star = true;
        nextToken();
    } else if (currentToken_.type != TokenType::RIGHT_PAREN) {
        if (!parseExpressionList(args)) return nullptr;
    }
    if (!expectCurrent(TokenType::RIGHT_PAREN)) {
        return nullptr;
    }
    auto call = std::make_unique<CallNode>(std::move(funcName), std::move(args));
    call->star = star;
    call->distinct = distinct;
    return call;
}

std::unique_ptr<ExprNode> Parser::parseCastExpression() {
    nextToken(); // consume CAST
    if (!expectCurrent(TokenType::LEFT_PAREN)) return nullptr;
    auto operand = parseExpression(Precedence::LOWEST);
    if (!operand || !expectCurrent(TokenType::AS)) return nullptr;

    std::string type_name;
    while (isIdentifierToken(currentToken_)) {
        if (!type_name.empty()) type_name += " ";
        type_name += currentToken_.literal;
        nextToken();
    }
    if (type_name.empty()) {
        currentError("type name");
        return nullptr;
    }
    if (!expectCurrent(TokenType::RIGHT_PAREN)) return nullptr;
    return std::make_unique<CastNode>(std::move(operand), std::move(type_name));
}

std::unique_ptr<ExprNode> Parser::parseInfixExpression(std::unique_ptr<ExprNode> left) {
    Token op = currentToken_;
    Precedence precedence = getPrecedence(op.type);
    nextToken();

    switch (op.type) {
        case TokenType::IS: {
            bool negated = false;
            if (currentToken_.type == TokenType::NOT) {
                negated = true;
                nextToken();
            }
            IsExprNode::Test test;
            switch (currentToken_.type) {
                case TokenType::NULL_LITERAL: test = IsExprNode::Test::IS_NULL; break;
                case TokenType::TRUE_LITERAL: test = IsExprNode::Test::IS_TRUE; break;
                case TokenType::FALSE_LITERAL: test = IsExprNode::Test::IS_FALSE; break;
                default:
                    currentError("NULL, TRUE or FALSE");
                    return nullptr;
            }
            nextToken();
            return std::make_unique<IsExprNode>(std::move(left), test, negated);
        }
        case TokenType::IN:
            return parseInExpression(std::move(left), false);
        case TokenType::NOT: {
            if (currentToken_.type == TokenType::IN) {
                nextToken();
                return parseInExpression(std::move(left), true);
            }
            if (currentToken_.type == TokenType::LIKE || currentToken_.type == TokenType::ILIKE) {
                bool ci = currentToken_.type == TokenType::ILIKE;
                nextToken();
                auto pattern = parseExpression(Precedence::COMPARISON);
                if (!pattern) return nullptr;
                return std::make_unique<LikeNode>(std::move(left), std::move(pattern), true, ci);
            }
            currentError("IN, LIKE or ILIKE after NOT");
            return nullptr;
        }
        case TokenType::LIKE:
        case TokenType::ILIKE: {
            auto pattern = parseExpression(Precedence::COMPARISON);
            if (!pattern) return nullptr;
            return std::make_unique<LikeNode>(std::move(left), std::move(pattern), false,
                                              op.type == TokenType::ILIKE);
        }
        default: {
            auto right = parseExpression(precedence);
            if (!right) return nullptr;
            return std::make_unique<BinaryExprNode>(op.type, std::move(left), std::move(right));
        }
    }
}

std::unique_ptr<ExprNode> Parser::parseInExpression(std::unique_ptr<ExprNode> left, bool negated) {
    if (!expectCurrent(TokenType::LEFT_PAREN)) {
        return nullptr;
    }
    if (currentToken_.type == TokenType::SELECT) {
        auto subquery = parseSelect();
        if (!subquery || !expectCurrent(TokenType::RIGHT_PAREN)) {
            return nullptr;
        }
        return std::make_unique<InSubqueryNode>(std::move(left), std::move(subquery), negated);
    }
    std::vector<std::unique_ptr<ExprNode>> list;
    if (!parseExpressionList(list) || !expectCurrent(TokenType::RIGHT_PAREN)) {
        return nullptr;
    }
    return std::make_unique<InListNode>(std::move(left), std::move(list), negated);
}

bool Parser::parseExpressionList(std::vector<std::unique_ptr<ExprNode>>& out) {
    while (true) {
        auto expr = parseExpression(Precedence::LOWEST);
        if (!expr) return false;
        out.push_back(std::move(expr));
        if (currentToken_.type != TokenType::COMMA) {
            return true;
        }
        nextToken();
    }
}

core::Result<std::unique_ptr<SelectStmt>> ParseSql(const std::string& sql, bool fold_identifiers) {
    using StmtResult = core::Result<std::unique_ptr<SelectStmt>>;
    Lexer lexer(sql, fold_identifiers);
    Parser parser(lexer);
    auto stmt = parser.ParseStatement();
    if (!parser.Errors().empty()) {
        std::string message = "SQL syntax error: ";
        for (size_t i = 0; i < parser.Errors().size(); ++i) {
            if (i > 0) message += "; ";
            message += parser.Errors()[i].what();
        }
        return StmtResult::error(message, core::Error::Code::PLANNING_FAILURE);
    }
    if (!stmt) {
        return StmtResult::error("SQL syntax error: no statement found", core::Error::Code::PLANNING_FAILURE);
    }
    return StmtResult(std::move(stmt));
}

} // namespace sql
} // namespace qfab
