#pragma once

/**
 * @file Parser.hpp
 * @brief Entry point turning an application description into an App
 *
 * Failures never escape as exceptions: parse() returns std::nullopt and
 * getErrors() holds the context chain, outermost note first.
 */

#include "AST.hpp"
#include "syntax/Lexer.hpp"
#include "syntax/Token.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rtos_config {
namespace parser {

class Parser {
public:
    explicit Parser(syntax::TokenStream tokens);

    /**
     * Tokenize raw text first; tokenizer errors are reported by parse()
     */
    static Parser fromSource(const std::string& source, syntax::LexerOptions options = {});

    std::optional<App> parse();

    const std::vector<std::string>& getErrors() const { return m_errors; }
    bool hasErrors() const { return !m_errors.empty(); }

private:
    syntax::TokenStream m_tokens;
    std::vector<std::string> m_lexerErrors;
    std::vector<std::string> m_errors;
};

} // namespace parser
} // namespace rtos_config
