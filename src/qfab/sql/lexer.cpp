#include "qfab/sql/lexer.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace qfab {
namespace sql {

// Keyword mapping, matched after lower-casing
static const std::unordered_map<std::string, TokenType> keywords = {
    {"select", TokenType::SELECT},
    {"distinct", TokenType::DISTINCT},
    {"from", TokenType::FROM},
    {"as", TokenType::AS},
    {"join", TokenType::JOIN},
    {"inner", TokenType::INNER},
    {"left", TokenType::LEFT},
    {"outer", TokenType::OUTER},
    {"on", TokenType::ON},
    {"where", TokenType::WHERE},
    {"group", TokenType::GROUP},
    {"by", TokenType::BY},
    {"order", TokenType::ORDER},
    {"asc", TokenType::ASC},
    {"desc", TokenType::DESC},
    {"nulls", TokenType::NULLS},
    {"first", TokenType::FIRST},
    {"last", TokenType::LAST},
    {"limit", TokenType::LIMIT},
    {"offset", TokenType::OFFSET},
    {"and", TokenType::AND},
    {"or", TokenType::OR},
    {"not", TokenType::NOT},
    {"is", TokenType::IS},
    {"null", TokenType::NULL_LITERAL},
    {"true", TokenType::TRUE_LITERAL},
    {"false", TokenType::FALSE_LITERAL},
    {"in", TokenType::IN},
    {"like", TokenType::LIKE},
    {"ilike", TokenType::ILIKE},
    {"cast", TokenType::CAST},
};

std::string Token::TypeString() const {
    return TokenTypeToString(type);
}

Lexer::Lexer(std::string input, bool fold_identifiers)
    : input_(std::move(input)), position_(0), readPosition_(0), ch_(0), fold_identifiers_(fold_identifiers),
      currentLine_(1), currentPosInLine_(0) {
    readChar();
}

void Lexer::readChar() {
    if (readPosition_ >= input_.length()) {
        ch_ = 0; // EOF
    } else {
        ch_ = input_[readPosition_];
    }
    position_ = readPosition_;
    readPosition_++;
    currentPosInLine_++;
}

char Lexer::peekChar() const {
    if (readPosition_ >= input_.length()) {
        return 0;
    }
    return input_[readPosition_];
}

void Lexer::skipWhitespaceAndComments() {
    while (true) {
        while (ch_ == ' ' || ch_ == '\t' || ch_ == '\n' || ch_ == '\r') {
            if (ch_ == '\n') {
                currentLine_++;
                currentPosInLine_ = 0;
            }
            readChar();
        }
        if (ch_ == '-' && peekChar() == '-') {
            while (ch_ != '\n' && ch_ != 0) {
                readChar();
            }
            continue;
        }
        return;
    }
}

Token Lexer::readIdentifier() {
    size_t startPos = position_;
    int tokenStartLine = currentLine_;
    int tokenStartPosInLine = currentPosInLine_;
    while (std::isalnum(static_cast<unsigned char>(ch_)) || ch_ == '_' || ch_ == '$') {
        readChar();
    }
    std::string literal = input_.substr(startPos, position_ - startPos);
    std::string folded = literal;
    std::transform(folded.begin(), folded.end(), folded.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = keywords.find(folded);
    if (it != keywords.end()) {
        return Token(it->second, folded, tokenStartLine, tokenStartPosInLine);
    }
    return Token(TokenType::IDENTIFIER, fold_identifiers_ ? folded : literal, tokenStartLine, tokenStartPosInLine);
}

Token Lexer::readQuotedIdentifier() {
    int tokenStartLine = currentLine_;
    int tokenStartPosInLine = currentPosInLine_;
    readChar(); // opening quote

    std::string literal;
    while (ch_ != 0) {
        if (ch_ == '"') {
            if (peekChar() == '"') { // "" is an escaped quote
                literal += '"';
                readChar();
                readChar();
                continue;
            }
            break;
        }
        literal += ch_;
        readChar();
    }
    if (ch_ == 0) {
        throw LexerError("Unterminated quoted identifier", tokenStartLine, tokenStartPosInLine);
    }
    readChar(); // closing quote
    return Token(TokenType::QUOTED_IDENTIFIER, literal, tokenStartLine, tokenStartPosInLine);
}

Token Lexer::readNumber() {
    size_t startPos = position_;
    int tokenStartLine = currentLine_;
    int tokenStartPosInLine = currentPosInLine_;

    while (std::isdigit(static_cast<unsigned char>(ch_))) {
        readChar();
    }
    if (ch_ == '.' && std::isdigit(static_cast<unsigned char>(peekChar()))) {
        readChar();
        while (std::isdigit(static_cast<unsigned char>(ch_))) {
            readChar();
        }
    }
    if (ch_ == 'e' || ch_ == 'E') {
        char next = peekChar();
        if (std::isdigit(static_cast<unsigned char>(next)) || next == '-' || next == '+') {
            readChar();
            if (ch_ == '-' || ch_ == '+') readChar();
            while (std::isdigit(static_cast<unsigned char>(ch_))) {
                readChar();
            }
        }
    }
    return Token(TokenType::NUMBER, input_.substr(startPos, position_ - startPos), tokenStartLine,
                 tokenStartPosInLine);
}

Token Lexer::readString() {
    int tokenStartLine = currentLine_;
    int tokenStartPosInLine = currentPosInLine_;
    readChar(); // opening quote

    std::string literal;
    while (ch_ != 0) {
        if (ch_ == '\'') {
            if (peekChar() == '\'') { // '' is an escaped quote
                literal += '\'';
                readChar();
                readChar();
                continue;
            }
            break;
        }
        if (ch_ == '\n') {
            currentLine_++;
            currentPosInLine_ = 0;
        }
        literal += ch_;
        readChar();
    }
    if (ch_ == 0) {
        throw LexerError("Unterminated string literal", tokenStartLine, tokenStartPosInLine);
    }
    readChar(); // closing quote
    return Token(TokenType::STRING, literal, tokenStartLine, tokenStartPosInLine);
}

Token Lexer::NextToken() {
    skipWhitespaceAndComments();

    int tokenStartLine = currentLine_;
    int tokenStartPosInLine = currentPosInLine_;
    auto single = [&](TokenType type, const char* lit) {
        readChar();
        return Token(type, lit, tokenStartLine, tokenStartPosInLine);
    };
    auto pair = [&](TokenType type, const char* lit) {
        readChar();
        readChar();
        return Token(type, lit, tokenStartLine, tokenStartPosInLine);
    };

    switch (ch_) {
        case '=': return single(TokenType::EQL, "=");
        case '!':
            if (peekChar() == '=') return pair(TokenType::NEQ, "!=");
            return single(TokenType::ILLEGAL, "!");
        case '<':
            if (peekChar() == '=') return pair(TokenType::LTE, "<=");
            if (peekChar() == '>') return pair(TokenType::NEQ, "<>");
            return single(TokenType::LSS, "<");
        case '>':
            if (peekChar() == '=') return pair(TokenType::GTE, ">=");
            return single(TokenType::GTR, ">");
        case '+': return single(TokenType::ADD, "+");
        case '-': return single(TokenType::SUB, "-");
        case '*': return single(TokenType::MUL, "*");
        case '/': return single(TokenType::DIV, "/");
        case '%': return single(TokenType::MOD, "%");
        case '(': return single(TokenType::LEFT_PAREN, "(");
        case ')': return single(TokenType::RIGHT_PAREN, ")");
        case ',': return single(TokenType::COMMA, ",");
        case '.': return single(TokenType::DOT, ".");
        case ';': return single(TokenType::SEMICOLON, ";");
        case '\'':
            try {
                return readString();
            } catch (const LexerError& e) {
                return Token(TokenType::ILLEGAL, e.what(), e.line(), e.pos());
            }
        case '"':
            try {
                return readQuotedIdentifier();
            } catch (const LexerError& e) {
                return Token(TokenType::ILLEGAL, e.what(), e.line(), e.pos());
            }
        case 0:
            return Token(TokenType::EOF_TOKEN, "", tokenStartLine, tokenStartPosInLine);
        default:
            if (std::isalpha(static_cast<unsigned char>(ch_)) || ch_ == '_') {
                return readIdentifier();
            }
            if (std::isdigit(static_cast<unsigned char>(ch_))) {
                return readNumber();
            }
            return single(TokenType::ILLEGAL, "");
    }
}

std::vector<Token> Lexer::GetAllTokens() {
    std::vector<Token> tokens;
    Token tok = NextToken();
    while (tok.type != TokenType::EOF_TOKEN) {
        tokens.push_back(tok);
        tok = NextToken();
    }
    tokens.push_back(tok);
    return tokens;
}

std::string TokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::ILLEGAL: return "ILLEGAL";
        case TokenType::EOF_TOKEN: return "EOF";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::QUOTED_IDENTIFIER: return "QUOTED_IDENTIFIER";
        case TokenType::NUMBER: return "NUMBER";
        case TokenType::STRING: return "STRING";
        case TokenType::LEFT_PAREN: return "LEFT_PAREN";
        case TokenType::RIGHT_PAREN: return "RIGHT_PAREN";
        case TokenType::COMMA: return "COMMA";
        case TokenType::DOT: return "DOT";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::EQL: return "EQL";
        case TokenType::NEQ: return "NEQ";
        case TokenType::LSS: return "LSS";
        case TokenType::LTE: return "LTE";
        case TokenType::GTR: return "GTR";
        case TokenType::GTE: return "GTE";
        case TokenType::ADD: return "ADD";
        case TokenType::SUB: return "SUB";
        case TokenType::MUL: return "MUL";
        case TokenType::DIV: return "DIV";
        case TokenType::MOD: return "MOD";
        case TokenType::SELECT: return "SELECT";
        case TokenType::DISTINCT: return "DISTINCT";
        case TokenType::FROM: return "FROM";
        case TokenType::AS: return "AS";
        case TokenType::JOIN: return "JOIN";
        case TokenType::INNER: return "INNER";
        case TokenType::LEFT: return "LEFT";
        case TokenType::OUTER: return "OUTER";
        case TokenType::ON: return "ON";
        case TokenType::WHERE: return "WHERE";
        case TokenType::GROUP: return "GROUP";
        case TokenType::BY: return "BY";
        case TokenType::ORDER: return "ORDER";
        case TokenType::ASC: return "ASC";
        case TokenType::DESC: return "DESC";
        case TokenType::NULLS: return "NULLS";
        case TokenType::FIRST: return "FIRST";
        case TokenType::LAST: return "LAST";
        case TokenType::LIMIT: return "LIMIT";
        case TokenType::OFFSET: return "OFFSET";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::IS: return "IS";
        case TokenType::NULL_LITERAL: return "NULL";
        case TokenType::TRUE_LITERAL: return "TRUE";
        case TokenType::FALSE_LITERAL: return "FALSE";
        case TokenType::IN: return "IN";
        case TokenType::LIKE: return "LIKE";
        case TokenType::ILIKE: return "ILIKE";
        case TokenType::CAST: return "CAST";
    }
    return "UNKNOWN";
}

} // namespace sql
} // namespace qfab
