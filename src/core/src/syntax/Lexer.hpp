#pragma once

/**
 * @file Lexer.hpp
 * @brief Tokenizer for application description blocks
 *
 * Produces a token tree: delimiters are matched here so that the parser
 * only ever sees balanced groups.
 */

#include "Token.hpp"
#include <vector>
#include <string>

namespace rtos_config {
namespace syntax {

struct LexerOptions {
    int max_nesting_depth = 64;
};

class Lexer {
public:
    explicit Lexer(const std::string& source, LexerOptions options = {});

    TokenStream tokenize();

    const std::vector<std::string>& getErrors() const { return m_errors; }
    bool hasErrors() const { return !m_errors.empty(); }

private:
    // Open delimiter awaiting its closer
    struct Frame {
        Delimiter delimiter;
        int line;
        int column;
        TokenStream tokens;
    };

    std::string m_source;
    LexerOptions m_options;
    std::vector<Frame> m_stack;
    std::vector<std::string> m_errors;
    bool m_depthExceeded = false;

    size_t m_start = 0;
    size_t m_current = 0;
    int m_line = 1;
    int m_column = 1;
    int m_startLine = 1;
    int m_startColumn = 1;

    bool isAtEnd() const;
    char advance();
    char peek() const;
    char peekNext() const;
    bool match(char expected);

    void scanToken();
    void addToken(TokenType type);
    void addToken(TokenType type, LiteralValue literal, std::string suffix = {});

    void openGroup(Delimiter delimiter);
    void closeGroup(Delimiter delimiter);
    void closeUnterminatedGroups();

    void scanNumber(char first);
    void scanString();
    void scanQuote();
    void scanIdentifier();
    void skipLineComment();
    void skipBlockComment();
    bool scanEscape(std::string& out);

    void error(const std::string& message);
    void errorAt(int line, const std::string& message);
};

} // namespace syntax
} // namespace rtos_config
