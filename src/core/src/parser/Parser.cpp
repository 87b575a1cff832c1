/**
 * @file Parser.cpp
 * @brief Parser entry point implementation
 */

#include "Parser.hpp"
#include "Grammar.hpp"
#include "ParseError.hpp"
#include <utility>

namespace rtos_config {
namespace parser {

Parser::Parser(syntax::TokenStream tokens)
    : m_tokens(std::move(tokens)) {}

Parser Parser::fromSource(const std::string& source, syntax::LexerOptions options) {
    syntax::Lexer lexer(source, options);
    Parser parser(lexer.tokenize());

    parser.m_lexerErrors = lexer.getErrors();
    return parser;
}

std::optional<App> Parser::parse() {
    m_errors.clear();

    if (!m_lexerErrors.empty()) {
        m_errors.push_back("tokenizing application block");
        m_errors.insert(m_errors.end(), m_lexerErrors.begin(), m_lexerErrors.end());
        return std::nullopt;
    }

    try {
        return grammar::parseApp(m_tokens);
    } catch (const ParseError& e) {
        m_errors = e.chain();
        return std::nullopt;
    }
}

} // namespace parser
} // namespace rtos_config
