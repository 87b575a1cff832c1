#pragma once

/**
 * @file Grammar.hpp
 * @brief Recursive-descent rules for the application description block
 *
 * Every rule throws ParseError on the first structural or validation
 * failure. Named sub-constructs add a context note on the way out.
 *
 * @code
 * {
 *     device: stm32f103xx,
 *     idle: { path: idle, locals: { COUNT: u32 = 0; }, resources: [LED] },
 *     init: { path: init },
 *     resources: { LED: bool = false; },
 *     tasks: { exti0: { enabled: true, priority: 1, resources: [LED] } },
 * }
 * @endcode
 */

#include "AST.hpp"
#include "TokenCursor.hpp"

namespace rtos_config {
namespace parser {
namespace grammar {

// Whole block: exactly one brace group
App parseApp(const syntax::TokenStream& tokens);

Idle parseIdle(TokenCursor& cursor);
Init parseInit(TokenCursor& cursor);
Task parseTask(TokenCursor& cursor);
Tasks parseTasks(TokenCursor& cursor);

// `{ $($name:ident: $ty:ty = $expr:expr;)* }`
Statics parseStatics(TokenCursor& cursor);

// `[a, b, c]`
Idents parseIdents(TokenCursor& cursor);

// Tokens up to the next top-level comma
Fragment parsePath(TokenCursor& cursor);

} // namespace grammar
} // namespace parser
} // namespace rtos_config
