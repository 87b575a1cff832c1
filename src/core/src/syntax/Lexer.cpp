/**
 * @file Lexer.cpp
 * @brief Tokenizer implementation
 */

#include "Lexer.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace rtos_config {
namespace syntax {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isDigitInRadix(char c, int radix) {
    switch (radix) {
        case 2: return c == '0' || c == '1';
        case 8: return c >= '0' && c <= '7';
        case 16: return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        default: return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
}

int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

} // namespace

Lexer::Lexer(const std::string& source, LexerOptions options)
    : m_source(source), m_options(options) {}

TokenStream Lexer::tokenize() {
    m_stack.clear();
    m_stack.push_back({Delimiter::PAREN, 0, 0, {}});
    m_depthExceeded = false;

    // Scanning stops at the first group beyond the nesting limit
    while (!isAtEnd() && !m_depthExceeded) {
        m_start = m_current;
        m_startLine = m_line;
        m_startColumn = m_column;
        scanToken();
    }

    closeUnterminatedGroups();

    TokenStream tokens = std::move(m_stack.front().tokens);
    m_stack.clear();
    return tokens;
}

bool Lexer::isAtEnd() const {
    return m_current >= m_source.length();
}

char Lexer::advance() {
    char c = m_source[m_current++];
    if (c == '\n') {
        m_line++;
        m_column = 1;
    } else {
        m_column++;
    }
    return c;
}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return m_source[m_current];
}

char Lexer::peekNext() const {
    if (m_current + 1 >= m_source.length()) return '\0';
    return m_source[m_current + 1];
}

bool Lexer::match(char expected) {
    if (isAtEnd()) return false;
    if (m_source[m_current] != expected) return false;
    advance();
    return true;
}

void Lexer::addToken(TokenType type) {
    addToken(type, std::monostate{});
}

void Lexer::addToken(TokenType type, LiteralValue literal, std::string suffix) {
    Token token;
    token.type = type;
    token.lexeme = m_source.substr(m_start, m_current - m_start);
    token.literal = std::move(literal);
    token.suffix = std::move(suffix);
    token.line = m_startLine;
    token.column = m_startColumn;
    m_stack.back().tokens.push_back(std::move(token));
}

void Lexer::scanToken() {
    char c = advance();

    switch (c) {
        // Delimiters
        case '(': openGroup(Delimiter::PAREN); break;
        case '{': openGroup(Delimiter::BRACE); break;
        case '[': openGroup(Delimiter::BRACKET); break;
        case ')': closeGroup(Delimiter::PAREN); break;
        case '}': closeGroup(Delimiter::BRACE); break;
        case ']': closeGroup(Delimiter::BRACKET); break;

        // Single-character tokens
        case ',': addToken(TokenType::COMMA); break;
        case ';': addToken(TokenType::SEMICOLON); break;
        case '+': addToken(TokenType::PLUS); break;
        case '*': addToken(TokenType::STAR); break;
        case '%': addToken(TokenType::PERCENT); break;
        case '^': addToken(TokenType::CARET); break;
        case '@': addToken(TokenType::AT); break;
        case '#': addToken(TokenType::POUND); break;
        case '$': addToken(TokenType::DOLLAR); break;
        case '?': addToken(TokenType::QUESTION); break;

        // One or two character tokens
        case ':':
            addToken(match(':') ? TokenType::PATH_SEP : TokenType::COLON);
            break;
        case '=':
            if (match('=')) addToken(TokenType::EQ_EQ);
            else if (match('>')) addToken(TokenType::FAT_ARROW);
            else addToken(TokenType::EQ);
            break;
        case '!':
            addToken(match('=') ? TokenType::NE : TokenType::NOT);
            break;
        case '<':
            addToken(match('=') ? TokenType::LE : TokenType::LT);
            break;
        case '>':
            addToken(match('=') ? TokenType::GE : TokenType::GT);
            break;
        case '.':
            addToken(match('.') ? TokenType::DOT_DOT : TokenType::DOT);
            break;
        case '-':
            addToken(match('>') ? TokenType::ARROW : TokenType::MINUS);
            break;
        case '&':
            addToken(match('&') ? TokenType::AND_AND : TokenType::AND);
            break;
        case '|':
            addToken(match('|') ? TokenType::OR_OR : TokenType::OR);
            break;

        case '/':
            if (match('/')) {
                skipLineComment();
            } else if (match('*')) {
                skipBlockComment();
            } else {
                addToken(TokenType::SLASH);
            }
            break;

        case '"':
            scanString();
            break;

        case '\'':
            scanQuote();
            break;

        case ' ':
        case '\r':
        case '\t':
        case '\n':
            // Ignore whitespace
            break;

        default:
            if (std::isdigit(static_cast<unsigned char>(c))) {
                scanNumber(c);
            } else if (isIdentStart(c)) {
                scanIdentifier();
            } else {
                error("Unexpected character: " + std::string(1, c));
            }
            break;
    }
}

// ============================================================================
// Delimiter matching
// ============================================================================

void Lexer::openGroup(Delimiter delimiter) {
    int depth = static_cast<int>(m_stack.size());
    if (depth > m_options.max_nesting_depth) {
        error("Nesting depth exceeds limit of " + std::to_string(m_options.max_nesting_depth));
        m_depthExceeded = true;
        return;
    }
    m_stack.push_back({delimiter, m_startLine, m_startColumn, {}});
}

void Lexer::closeGroup(Delimiter delimiter) {
    if (m_stack.size() == 1) {
        error(std::string("Unexpected closing delimiter '") + closingChar(delimiter) + "'");
        return;
    }

    Frame& open = m_stack.back();
    if (open.delimiter != delimiter) {
        error(std::string("Mismatched closing delimiter '") + closingChar(delimiter) +
              "', expected '" + closingChar(open.delimiter) + "' to close '" +
              openingChar(open.delimiter) + "' opened at line " + std::to_string(open.line));
        return;
    }

    Token group;
    group.type = TokenType::GROUP;
    group.delimiter = open.delimiter;
    group.children = std::move(open.tokens);
    group.line = open.line;
    group.column = open.column;
    m_stack.pop_back();
    m_stack.back().tokens.push_back(std::move(group));
}

void Lexer::closeUnterminatedGroups() {
    while (m_stack.size() > 1) {
        Frame& open = m_stack.back();
        if (!m_depthExceeded) {
            errorAt(open.line, std::string("Unclosed delimiter '") + openingChar(open.delimiter) + "'");
        }

        Token group;
        group.type = TokenType::GROUP;
        group.delimiter = open.delimiter;
        group.children = std::move(open.tokens);
        group.line = open.line;
        group.column = open.column;
        m_stack.pop_back();
        m_stack.back().tokens.push_back(std::move(group));
    }
}

// ============================================================================
// Literals and words
// ============================================================================

void Lexer::scanNumber(char first) {
    int radix = 10;
    if (first == '0') {
        char p = peek();
        if (p == 'x' || p == 'X') radix = 16;
        else if (p == 'o' || p == 'O') radix = 8;
        else if (p == 'b' || p == 'B') radix = 2;
        if (radix != 10) advance();
    }

    std::string digits;
    if (radix == 10) digits += first;
    while (isDigitInRadix(peek(), radix) || peek() == '_') {
        char c = advance();
        if (c != '_') digits += c;
    }

    if (digits.empty()) {
        error("Missing digits after integer base prefix");
        return;
    }

    bool isFloat = false;
    if (radix == 10) {
        // Fraction: "1.5" but not "1..2" or "1.foo"
        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext()))) {
            isFloat = true;
            digits += advance();
            while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                char c = advance();
                if (c != '_') digits += c;
            }
        }

        // Exponent: 1e10, 2.5E-3
        if (peek() == 'e' || peek() == 'E') {
            char sign = peekNext();
            bool hasDigit = std::isdigit(static_cast<unsigned char>(sign)) != 0;
            if ((sign == '+' || sign == '-') && m_current + 2 < m_source.length()) {
                hasDigit = std::isdigit(static_cast<unsigned char>(m_source[m_current + 2])) != 0;
            }
            if (hasDigit) {
                isFloat = true;
                digits += advance();
                if (peek() == '+' || peek() == '-') digits += advance();
                while (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_') {
                    char c = advance();
                    if (c != '_') digits += c;
                }
            }
        }
    }

    std::string suffix;
    while (isIdentChar(peek())) suffix += advance();

    if (suffix == "f32" || suffix == "f64") {
        if (radix != 10) {
            error("Float suffix on non-decimal literal");
            return;
        }
        isFloat = true;
    }

    if (isFloat) {
        try {
            addToken(TokenType::FLOAT, std::stod(digits), suffix);
        } catch (const std::out_of_range&) {
            error("Float literal is out of range");
        }
        return;
    }

    std::uint64_t value = 0;
    const std::uint64_t max = std::numeric_limits<std::uint64_t>::max();
    for (char c : digits) {
        std::uint64_t d = static_cast<std::uint64_t>(digitValue(c));
        if (value > (max - d) / static_cast<std::uint64_t>(radix)) {
            error("Integer literal is too large");
            return;
        }
        value = value * static_cast<std::uint64_t>(radix) + d;
    }

    addToken(TokenType::INTEGER, value, suffix);
}

bool Lexer::scanEscape(std::string& out) {
    if (isAtEnd()) return false;
    char c = advance();
    switch (c) {
        case 'n': out += '\n'; return true;
        case 't': out += '\t'; return true;
        case 'r': out += '\r'; return true;
        case '0': out += '\0'; return true;
        case '\\': out += '\\'; return true;
        case '\'': out += '\''; return true;
        case '"': out += '"'; return true;
        default:
            error(std::string("Unknown escape sequence: \\") + c);
            return false;
    }
}

void Lexer::scanString() {
    std::string value;
    while (peek() != '"' && !isAtEnd()) {
        char c = advance();
        if (c == '\\') {
            scanEscape(value);
        } else {
            value += c;
        }
    }

    if (isAtEnd()) {
        errorAt(m_startLine, "Unterminated string");
        return;
    }

    advance();  // closing "
    addToken(TokenType::STRING, value);
}

void Lexer::scanQuote() {
    // 'x' and '\n' are chars, 'name is a lifetime
    if (peek() == '\\') {
        advance();
        std::string value;
        scanEscape(value);
        if (!match('\'')) {
            error("Unterminated character literal");
            return;
        }
        addToken(TokenType::CHAR, value);
        return;
    }

    if (!isAtEnd() && peekNext() == '\'') {
        std::string value(1, advance());
        advance();  // closing '
        addToken(TokenType::CHAR, value);
        return;
    }

    if (isIdentStart(peek())) {
        while (isIdentChar(peek())) advance();
        addToken(TokenType::LIFETIME);
        return;
    }

    error("Invalid character literal");
}

void Lexer::scanIdentifier() {
    while (isIdentChar(peek())) advance();

    std::string text = m_source.substr(m_start, m_current - m_start);
    if (text == "true") {
        addToken(TokenType::BOOL, true);
    } else if (text == "false") {
        addToken(TokenType::BOOL, false);
    } else {
        addToken(TokenType::IDENTIFIER, text);
    }
}

void Lexer::skipLineComment() {
    while (peek() != '\n' && !isAtEnd()) {
        advance();
    }
}

void Lexer::skipBlockComment() {
    int depth = 1;
    while (!isAtEnd()) {
        if (peek() == '/' && peekNext() == '*') {
            advance();
            advance();
            depth++;
        } else if (peek() == '*' && peekNext() == '/') {
            advance();
            advance();
            if (--depth == 0) return;
        } else {
            advance();
        }
    }
    errorAt(m_startLine, "Unterminated block comment");
}

void Lexer::error(const std::string& message) {
    errorAt(m_startLine, message);
}

void Lexer::errorAt(int line, const std::string& message) {
    m_errors.push_back("Line " + std::to_string(line) + ": " + message);
}

} // namespace syntax
} // namespace rtos_config
