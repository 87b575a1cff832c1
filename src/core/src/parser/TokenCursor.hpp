#pragma once

/**
 * @file TokenCursor.hpp
 * @brief Token-stream primitives shared by every grammar rule
 *
 * delimited() enters exactly one group, fields() walks a
 * `key: value, key: value[,]` list inside it.
 */

#include "ParseError.hpp"
#include "syntax/Token.hpp"
#include "syntax/TokenPrinter.hpp"
#include <string>
#include <utility>

namespace rtos_config {
namespace parser {

/**
 * Forward-only position in one token sequence.
 * The sequence must outlive the cursor.
 */
class TokenCursor {
public:
    explicit TokenCursor(const syntax::TokenStream& tokens)
        : m_tokens(tokens) {}

    bool isAtEnd() const { return m_current >= m_tokens.size(); }

    // nullptr at end of sequence
    const syntax::Token* peek() const {
        return isAtEnd() ? nullptr : &m_tokens[m_current];
    }

    const syntax::Token* advance() {
        if (isAtEnd()) return nullptr;
        return &m_tokens[m_current++];
    }

    bool check(syntax::TokenType type) const {
        const syntax::Token* token = peek();
        return token != nullptr && token->type == type;
    }

private:
    const syntax::TokenStream& m_tokens;
    size_t m_current = 0;
};

/**
 * Consume one group of the expected kind and hand its inner tokens to
 * `body`. Nothing outside the group is visible to `body`.
 */
template<typename F>
auto delimited(TokenCursor& cursor, syntax::Delimiter delimiter, F&& body)
    -> decltype(body(std::declval<const syntax::TokenStream&>())) {
    const syntax::Token* token = cursor.advance();
    if (token == nullptr || !token->isGroup()) {
        throw ParseError("expected a " + syntax::delimiterToString(delimiter) +
                         " group, found " + syntax::describe(token));
    }
    if (token->delimiter != delimiter) {
        throw ParseError("expected " + syntax::delimiterToString(delimiter) + ", found " +
                         syntax::describe(token));
    }
    return body(token->children);
}

/**
 * Walk `$($key:ident: $($value:tt)*),*[,]`.
 * `handler(key, cursor)` consumes the value; a comma or the end of the
 * sequence must follow it.
 */
template<typename F>
void fields(const syntax::TokenStream& tokens, F&& handler) {
    TokenCursor cursor(tokens);

    while (!cursor.isAtEnd()) {
        const syntax::Token* key = cursor.advance();
        if (!key->is(syntax::TokenType::IDENTIFIER)) {
            throw ParseError("expected Ident, found " + syntax::describe(key));
        }

        const syntax::Token* colon = cursor.advance();
        if (colon == nullptr || !colon->is(syntax::TokenType::COLON)) {
            throw ParseError("expected Colon, found " + syntax::describe(colon));
        }

        handler(*key, cursor);

        const syntax::Token* separator = cursor.advance();
        if (separator != nullptr && !separator->is(syntax::TokenType::COMMA)) {
            throw ParseError("expected Comma, found " + syntax::describe(separator));
        }
    }
}

} // namespace parser
} // namespace rtos_config
