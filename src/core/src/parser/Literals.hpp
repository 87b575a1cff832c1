#pragma once

/**
 * @file Literals.hpp
 * @brief Literal coercion and opaque fragment capture
 */

#include "AST.hpp"
#include "TokenCursor.hpp"
#include <cstdint>

namespace rtos_config {
namespace parser {

/**
 * `true` / `false`
 * @throw ParseError "expected boolean, found ..." for any other token
 */
bool parseBool(const syntax::Token* token);

/**
 * Unsuffixed, unsigned integer literal below 256
 * @throw ParseError on a wrong token kind or an out-of-range value
 */
std::uint8_t parseU8(const syntax::Token* token);

/**
 * Collect tokens until a top-level `stop` token. Groups are single
 * tokens, so separators nested inside them are never seen here.
 * The stop token is consumed.
 * @throw ParseError when the sequence ends before `stop`
 */
Fragment collectUntil(TokenCursor& cursor, syntax::TokenType stop);

/**
 * `$ty:ty = $expr:expr ;`
 */
Static parseStatic(TokenCursor& cursor);

} // namespace parser
} // namespace rtos_config
