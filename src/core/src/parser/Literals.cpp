/**
 * @file Literals.cpp
 * @brief Literal coercion implementation
 */

#include "Literals.hpp"
#include <variant>

namespace rtos_config {
namespace parser {

using syntax::Token;
using syntax::TokenType;

bool parseBool(const Token* token) {
    if (token != nullptr && token->is(TokenType::BOOL)) {
        if (const bool* value = std::get_if<bool>(&token->literal)) {
            return *value;
        }
    }
    throw ParseError("expected boolean, found " + syntax::describe(token));
}

std::uint8_t parseU8(const Token* token) {
    const std::uint64_t* value = nullptr;
    if (token != nullptr && token->is(TokenType::INTEGER) && token->suffix.empty()) {
        value = std::get_if<std::uint64_t>(&token->literal);
    }
    if (value == nullptr) {
        throw ParseError("expected integer, found " + syntax::describe(token));
    }

    if (*value >= 256) {
        throw ParseError(std::to_string(*value) + " is out of the `u8` range");
    }
    return static_cast<std::uint8_t>(*value);
}

Fragment collectUntil(TokenCursor& cursor, TokenType stop) {
    Fragment fragment;
    while (const Token* token = cursor.advance()) {
        if (token->is(stop)) {
            return fragment;
        }
        fragment.push_back(*token);
    }
    throw ParseError("expected " + syntax::tokenTypeToString(stop) + ", found end of input");
}

Static parseStatic(TokenCursor& cursor) {
    Static result;

    result.ty = collectUntil(cursor, TokenType::EQ);
    if (result.ty.empty()) {
        throw ParseError("type is missing");
    }

    result.expr = collectUntil(cursor, TokenType::SEMICOLON);
    if (result.expr.empty()) {
        throw ParseError("initial value is missing");
    }

    return result;
}

} // namespace parser
} // namespace rtos_config
