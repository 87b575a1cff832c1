#pragma once

/**
 * @file TokenPrinter.hpp
 * @brief Source re-emission and diagnostics text for tokens
 */

#include "Token.hpp"
#include <string>

namespace rtos_config {
namespace syntax {

/**
 * Print a token sequence as source text.
 * Leaves are separated by a single space so that re-lexing the output
 * yields an equal sequence.
 */
std::string toString(const TokenStream& tokens);

std::string toString(const Token& token);

/**
 * Describe a token for an error message, e.g. "`foo` (Ident) at 3:7".
 * A null token is described as "end of input".
 */
std::string describe(const Token* token);

} // namespace syntax
} // namespace rtos_config
