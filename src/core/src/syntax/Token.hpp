#pragma once

/**
 * @file Token.hpp
 * @brief Token tree definitions for application description blocks
 *
 * Leaves are identifiers, punctuation and literals. Delimited groups
 * ( ), { }, [ ] carry their inner tokens, already matched by the Lexer.
 */

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace rtos_config {
namespace syntax {

enum class TokenType {
    // Words
    IDENTIFIER,     // foo, _bar, u8
    LIFETIME,       // 'static

    // Literals
    INTEGER,        // 42, 0xFF, 1_000, 5u8
    FLOAT,          // 1.5, 2e10, 3f32
    STRING,         // "hello"
    CHAR,           // 'a'
    BOOL,           // true, false

    // Punctuation
    COLON,          // :
    PATH_SEP,       // ::
    COMMA,          // ,
    SEMICOLON,      // ;
    EQ,             // =
    EQ_EQ,          // ==
    NE,             // !=
    LT, LE,         // < <=
    GT, GE,         // > >=
    DOT, DOT_DOT,   // . ..
    ARROW,          // ->
    FAT_ARROW,      // =>
    PLUS, MINUS, STAR, SLASH, PERCENT, CARET,
    NOT,            // !
    AND, AND_AND,   // & &&
    OR, OR_OR,      // | ||
    AT,             // @
    POUND,          // #
    DOLLAR,         // $
    QUESTION,       // ?

    // Delimited group
    GROUP
};

enum class Delimiter {
    PAREN,      // ( )
    BRACE,      // { }
    BRACKET     // [ ]
};

using LiteralValue = std::variant<std::monostate, std::uint64_t, double, bool, std::string>;

struct Token {
    TokenType type;
    std::string lexeme;             // Source text (leaves only)
    LiteralValue literal;           // Decoded value for literals
    std::string suffix;             // u8, i32, f64 ... empty when unsuffixed
    Delimiter delimiter = Delimiter::PAREN;  // GROUP only
    std::vector<Token> children;             // GROUP only
    int line = 0;
    int column = 0;

    bool isGroup() const { return type == TokenType::GROUP; }
    bool is(TokenType t) const { return type == t; }
};

using TokenStream = std::vector<Token>;

/**
 * Structural equality. Source positions are ignored so that a fragment
 * compares equal to the same tokens re-lexed from printed text.
 */
inline bool operator==(const Token& a, const Token& b) {
    if (a.type != b.type) return false;
    if (a.type == TokenType::GROUP) {
        return a.delimiter == b.delimiter && a.children == b.children;
    }
    return a.lexeme == b.lexeme;
}

inline bool operator!=(const Token& a, const Token& b) {
    return !(a == b);
}

inline std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::IDENTIFIER: return "Ident";
        case TokenType::LIFETIME: return "Lifetime";
        case TokenType::INTEGER: return "Integer";
        case TokenType::FLOAT: return "Float";
        case TokenType::STRING: return "String";
        case TokenType::CHAR: return "Char";
        case TokenType::BOOL: return "Bool";
        case TokenType::COLON: return "Colon";
        case TokenType::PATH_SEP: return "PathSep";
        case TokenType::COMMA: return "Comma";
        case TokenType::SEMICOLON: return "Semicolon";
        case TokenType::EQ: return "Equal";
        case TokenType::EQ_EQ: return "EqEq";
        case TokenType::NE: return "Ne";
        case TokenType::LT: return "Lt";
        case TokenType::LE: return "Le";
        case TokenType::GT: return "Gt";
        case TokenType::GE: return "Ge";
        case TokenType::DOT: return "Dot";
        case TokenType::DOT_DOT: return "DotDot";
        case TokenType::ARROW: return "Arrow";
        case TokenType::FAT_ARROW: return "FatArrow";
        case TokenType::PLUS: return "Plus";
        case TokenType::MINUS: return "Minus";
        case TokenType::STAR: return "Star";
        case TokenType::SLASH: return "Slash";
        case TokenType::PERCENT: return "Percent";
        case TokenType::CARET: return "Caret";
        case TokenType::NOT: return "Not";
        case TokenType::AND: return "And";
        case TokenType::AND_AND: return "AndAnd";
        case TokenType::OR: return "Or";
        case TokenType::OR_OR: return "OrOr";
        case TokenType::AT: return "At";
        case TokenType::POUND: return "Pound";
        case TokenType::DOLLAR: return "Dollar";
        case TokenType::QUESTION: return "Question";
        case TokenType::GROUP: return "Group";
        default: return "Unknown";
    }
}

inline std::string delimiterToString(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::PAREN: return "Paren";
        case Delimiter::BRACE: return "Brace";
        case Delimiter::BRACKET: return "Bracket";
        default: return "Unknown";
    }
}

inline char openingChar(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::BRACE: return '{';
        case Delimiter::BRACKET: return '[';
        default: return '(';
    }
}

inline char closingChar(Delimiter delimiter) {
    switch (delimiter) {
        case Delimiter::BRACE: return '}';
        case Delimiter::BRACKET: return ']';
        default: return ')';
    }
}

} // namespace syntax
} // namespace rtos_config
