#include <gtest/gtest.h>

#include <string>

#include "qfab/sql/lexer.h"
#include "qfab/sql/parser.h"

using namespace qfab::sql;

// --- Lexer Tests ---

TEST(SqlLexerTest, EmptyInput) {
    Lexer l("");
    Token t = l.NextToken();
    EXPECT_EQ(t.type, TokenType::EOF_TOKEN);
}

TEST(SqlLexerTest, Operators) {
    Lexer l("= != <> < <= > >= + - * / % ( ) , . ;");
    std::vector<TokenType> expected = {
        TokenType::EQL, TokenType::NEQ, TokenType::NEQ, TokenType::LSS, TokenType::LTE, TokenType::GTR,
        TokenType::GTE, TokenType::ADD, TokenType::SUB, TokenType::MUL, TokenType::DIV, TokenType::MOD,
        TokenType::LEFT_PAREN, TokenType::RIGHT_PAREN, TokenType::COMMA, TokenType::DOT, TokenType::SEMICOLON,
        TokenType::EOF_TOKEN
    };
    for (TokenType expected_type : expected) {
        Token t = l.NextToken();
        EXPECT_EQ(t.type, expected_type) << TokenTypeToString(t.type);
    }
}

TEST(SqlLexerTest, KeywordsAreCaseInsensitive) {
    Lexer l("SeLeCt Level FROM \"Mixed Case\" where");
    auto tokens = l.GetAllTokens();
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].type, TokenType::SELECT);
    EXPECT_EQ(tokens[1].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[1].literal, "level");
    EXPECT_EQ(tokens[2].type, TokenType::FROM);
    EXPECT_EQ(tokens[3].type, TokenType::QUOTED_IDENTIFIER);
    EXPECT_EQ(tokens[3].literal, "Mixed Case");
    EXPECT_EQ(tokens[4].type, TokenType::WHERE);
    EXPECT_EQ(tokens[5].type, TokenType::EOF_TOKEN);
}

TEST(SqlLexerTest, IdentifierFoldingCanBeDisabled) {
    Lexer l("SELECT Level FROM Logs", /*fold_identifiers=*/false);
    auto tokens = l.GetAllTokens();
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, TokenType::SELECT);
    EXPECT_EQ(tokens[1].literal, "Level");
    EXPECT_EQ(tokens[2].type, TokenType::FROM);
    EXPECT_EQ(tokens[3].literal, "Logs");
}

TEST(SqlLexerTest, LiteralsAndComments) {
    Lexer l("42 3.5 1e3 'it''s' -- trailing comment\n7");
    std::vector<Token> expected = {
        {TokenType::NUMBER, "42", 1, 0},
        {TokenType::NUMBER, "3.5", 1, 0},
        {TokenType::NUMBER, "1e3", 1, 0},
        {TokenType::STRING, "it's", 1, 0},
        {TokenType::NUMBER, "7", 2, 0},
        {TokenType::EOF_TOKEN, "", 2, 0}
    };
    for (const auto& exp_tok : expected) {
        Token t = l.NextToken();
        EXPECT_EQ(t.type, exp_tok.type);
        EXPECT_EQ(t.literal, exp_tok.literal);
    }
}

TEST(SqlLexerTest, UnterminatedStringIsIllegal) {
    Lexer l("'open");
    EXPECT_EQ(l.NextToken().type, TokenType::ILLEGAL);
}

// --- Parser Tests ---

TEST(SqlParserTest, FullSelect) {
    auto stmt = ParseSql(
        "SELECT DISTINCT l.level AS lvl, count(*) n FROM logs l LEFT JOIN hosts h ON l.host = h.name "
        "WHERE l.code >= 500 GROUP BY l.level ORDER BY n DESC NULLS LAST, 1 LIMIT 10 OFFSET 5;");
    ASSERT_TRUE(stmt.ok()) << stmt.error();
    const auto& s = *stmt.value();
    EXPECT_TRUE(s.distinct);
    ASSERT_EQ(s.items.size(), 2u);
    EXPECT_EQ(s.items[0].alias, "lvl");
    EXPECT_EQ(s.items[1].alias, "n");
    EXPECT_EQ(s.from.binding_name(), "l");
    ASSERT_EQ(s.joins.size(), 1u);
    EXPECT_EQ(s.joins[0].kind, JoinKind::LEFT);
    ASSERT_EQ(s.order_by.size(), 2u);
    EXPECT_FALSE(s.order_by[0].ascending);
    EXPECT_EQ(s.order_by[0].nulls_first, false);
    EXPECT_FALSE(s.order_by[1].nulls_first.has_value());
    EXPECT_EQ(s.limit, 10);
    EXPECT_EQ(s.offset, 5);
    EXPECT_EQ(s.String(),
              "SELECT DISTINCT l.level AS lvl, count(*) AS n FROM logs l LEFT JOIN hosts h ON l.host = h.name "
              "WHERE l.code >= 500 GROUP BY l.level ORDER BY n DESC NULLS LAST, 1 ASC LIMIT 10 OFFSET 5");
}

TEST(SqlParserTest, Precedence) {
    auto stmt = ParseSql("SELECT a FROM t WHERE a = 1 OR b = 2 AND c + 2 * 3 > 4");
    ASSERT_TRUE(stmt.ok()) << stmt.error();
    const auto* where = stmt.value()->where.get();
    ASSERT_EQ(where->type(), ExprNode::Type::BINARY);
    const auto* top = static_cast<const BinaryExprNode*>(where);
    EXPECT_EQ(top->op, TokenType::OR);
    ASSERT_EQ(top->rhs->type(), ExprNode::Type::BINARY);
    EXPECT_EQ(static_cast<const BinaryExprNode*>(top->rhs.get())->op, TokenType::AND);
}

TEST(SqlParserTest, PredicateForms) {
    auto stmt = ParseSql(
        "SELECT * FROM information_schema.columns WHERE a IS NOT NULL AND b NOT IN (1, 2) "
        "AND c ILIKE '%x%' AND d IN (SELECT e FROM u) AND CAST(f AS double precision) > 1");
    ASSERT_TRUE(stmt.ok()) << stmt.error();
    const auto& s = *stmt.value();
    EXPECT_TRUE(s.items[0].wildcard);
    EXPECT_EQ(s.from.qualified_name(), "information_schema.columns");
    EXPECT_EQ(s.where->String(),
              "a IS NOT NULL AND b NOT IN (1, 2) AND c ILIKE '%x%' AND d IN (SELECT e FROM u) "
              "AND CAST(f AS double precision) > 1");
}

TEST(SqlParserTest, QualifiedWildcard) {
    auto stmt = ParseSql("SELECT t.*, \"Upper\" FROM t");
    ASSERT_TRUE(stmt.ok()) << stmt.error();
    EXPECT_TRUE(stmt.value()->items[0].wildcard);
    EXPECT_EQ(stmt.value()->items[0].wildcard_qualifier, "t");
    ASSERT_EQ(stmt.value()->items[1].expr->type(), ExprNode::Type::COLUMN_REF);
    EXPECT_EQ(static_cast<const ColumnRefNode*>(stmt.value()->items[1].expr.get())->name, "Upper");
}

TEST(SqlParserTest, SyntaxErrorsArePlanningFailures) {
    for (const char* sql : {"", "SELECT", "SELECT a", "SELECT a FROM", "SELECT a FROM t LIMIT -1",
                            "SELECT a FROM t WHERE", "SELECT a FROM t extra junk", "SELECT (SELECT 1) FROM t",
                            "SELECT 'open FROM t"}) {
        auto stmt = ParseSql(sql);
        ASSERT_FALSE(stmt.ok()) << sql;
        EXPECT_EQ(stmt.error_code(), qfab::core::Error::Code::PLANNING_FAILURE) << sql;
    }
}
