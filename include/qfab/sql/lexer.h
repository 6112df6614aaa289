#ifndef QFAB_SQL_LEXER_H_
#define QFAB_SQL_LEXER_H_

#include <stdexcept>
#include <string>
#include <vector>

namespace qfab {
namespace sql {

enum class TokenType {
    // Special tokens
    ILLEGAL,
    EOF_TOKEN,

    // Identifiers and literals
    IDENTIFIER,         // unquoted, lower-cased when folding
    QUOTED_IDENTIFIER,  // "Name", kept verbatim
    NUMBER,
    STRING,             // 'text'

    // Punctuation
    LEFT_PAREN,
    RIGHT_PAREN,
    COMMA,
    DOT,
    SEMICOLON,

    // Comparison operators
    EQL,  // =
    NEQ,  // != or <>
    LSS,  // <
    LTE,  // <=
    GTR,  // >
    GTE,  // >=

    // Arithmetic operators
    ADD,
    SUB,
    MUL,  // also the * of SELECT * and COUNT(*)
    DIV,
    MOD,

    // Keywords
    SELECT,
    DISTINCT,
    FROM,
    AS,
    JOIN,
    INNER,
    LEFT,
    OUTER,
    ON,
    WHERE,
    GROUP,
    BY,
    ORDER,
    ASC,
    DESC,
    NULLS,
    FIRST,
    LAST,
    LIMIT,
    OFFSET,
    AND,
    OR,
    NOT,
    IS,
    NULL_LITERAL,
    TRUE_LITERAL,
    FALSE_LITERAL,
    IN,
    LIKE,
    ILIKE,
    CAST,
};

struct Token {
    TokenType type;
    std::string literal;
    int line;
    int pos;

    Token(TokenType t, std::string lit, int l, int p)
        : type(t), literal(std::move(lit)), line(l), pos(p) {}

    std::string TypeString() const;
};

class LexerError : public std::runtime_error {
public:
    LexerError(const std::string& message, int line, int pos)
        : std::runtime_error(message + " at line " + std::to_string(line) + ":" + std::to_string(pos)),
          line_(line), pos_(pos) {}

    int line() const { return line_; }
    int pos() const { return pos_; }
private:
    int line_;
    int pos_;
};

/**
 * @brief Tokenizer for the SQL subset understood by the planner
 *
 * Keywords are case-insensitive. Unquoted identifiers are lower-cased unless
 * fold_identifiers is false, double-quoted identifiers keep their spelling.
 * "--" starts a comment that runs to the end of the line.
 */
class Lexer {
public:
    explicit Lexer(std::string input, bool fold_identifiers = true);

    /**
     * @brief Get the next token from the input
     */
    Token NextToken();

    /**
     * @brief Get all tokens from the input, ending with EOF_TOKEN
     */
    std::vector<Token> GetAllTokens();

    size_t GetPosition() const { return position_; }

private:
    void readChar();
    char peekChar() const;
    void skipWhitespaceAndComments();

    Token readIdentifier();
    Token readQuotedIdentifier();
    Token readNumber();
    Token readString();

    std::string input_;
    size_t position_;     // current position in input (points to current char)
    size_t readPosition_; // current reading position in input (after current char)
    char ch_;             // current char under examination
    bool fold_identifiers_;

    int currentLine_;
    int currentPosInLine_;
};

std::string TokenTypeToString(TokenType type);

} // namespace sql
} // namespace qfab

#endif // QFAB_SQL_LEXER_H_
