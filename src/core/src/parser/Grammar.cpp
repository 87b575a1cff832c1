/**
 * @file Grammar.cpp
 * @brief Recursive-descent rules implementation
 */

#include "Grammar.hpp"
#include "Literals.hpp"
#include <optional>
#include <utility>

namespace rtos_config {
namespace parser {
namespace grammar {

using syntax::Delimiter;
using syntax::Token;
using syntax::TokenStream;
using syntax::TokenType;

namespace {

void ensureUnique(bool alreadySet, const std::string& field) {
    if (alreadySet) {
        throw ParseError("duplicated `" + field + "` field");
    }
}

[[noreturn]] void unknownField(const std::string& field) {
    throw ParseError("unknown field: `" + field + "`");
}

template<typename T>
T require(std::optional<T>& slot, const std::string& field) {
    if (!slot) {
        throw ParseError("`" + field + "` field is missing");
    }
    return std::move(*slot);
}

} // namespace

// ============================================================================
// Application Block
// ============================================================================

App parseApp(const TokenStream& tokens) {
    TokenCursor cursor(tokens);

    App app = delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        std::optional<Fragment> device;
        std::optional<Idle> idle;
        std::optional<Init> init;
        std::optional<Statics> resources;
        std::optional<Tasks> tasks;

        fields(body, [&](const Token& key, TokenCursor& value) {
            const std::string& name = key.lexeme;

            if (name == "device") {
                ensureUnique(device.has_value(), name);
                device = withContext("parsing `device`", [&] { return parsePath(value); });
            } else if (name == "idle") {
                ensureUnique(idle.has_value(), name);
                idle = withContext("parsing `idle`", [&] { return parseIdle(value); });
            } else if (name == "init") {
                ensureUnique(init.has_value(), name);
                init = withContext("parsing `init`", [&] { return parseInit(value); });
            } else if (name == "resources") {
                ensureUnique(resources.has_value(), name);
                resources = withContext("parsing `resources`", [&] { return parseStatics(value); });
            } else if (name == "tasks") {
                ensureUnique(tasks.has_value(), name);
                tasks = withContext("parsing `tasks`", [&] { return parseTasks(value); });
            } else {
                unknownField(name);
            }
        });

        App result;
        result.device = require(device, "device");
        result.idle = require(idle, "idle");
        result.init = require(init, "init");
        result.resources = resources.value_or(Statics{});
        result.tasks = tasks.value_or(Tasks{});
        return result;
    });

    if (const Token* extra = cursor.peek()) {
        throw ParseError("unexpected token after application block: " + syntax::describe(extra));
    }

    return app;
}

// ============================================================================
// Routines
// ============================================================================

Idle parseIdle(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        std::optional<Statics> locals;
        std::optional<Fragment> path;
        std::optional<Idents> resources;

        fields(body, [&](const Token& key, TokenCursor& value) {
            const std::string& name = key.lexeme;

            if (name == "path") {
                ensureUnique(path.has_value(), name);
                path = withContext("parsing `path`", [&] { return parsePath(value); });
            } else if (name == "locals") {
                ensureUnique(locals.has_value(), name);
                locals = withContext("parsing `locals`", [&] { return parseStatics(value); });
            } else if (name == "resources") {
                ensureUnique(resources.has_value(), name);
                resources = withContext("parsing `resources`", [&] { return parseIdents(value); });
            } else {
                unknownField(name);
            }
        });

        Idle idle;
        idle.path = require(path, "path");
        idle.locals = locals.value_or(Statics{});
        idle.resources = resources.value_or(Idents{});
        return idle;
    });
}

Init parseInit(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        std::optional<Fragment> path;

        fields(body, [&](const Token& key, TokenCursor& value) {
            if (key.lexeme == "path") {
                ensureUnique(path.has_value(), key.lexeme);
                path = withContext("parsing `path`", [&] { return parsePath(value); });
            } else {
                unknownField(key.lexeme);
            }
        });

        Init init;
        init.path = require(path, "path");
        return init;
    });
}

// ============================================================================
// Tasks
// ============================================================================

Task parseTask(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        Task task;
        std::optional<Idents> resources;

        fields(body, [&](const Token& key, TokenCursor& value) {
            const std::string& name = key.lexeme;

            if (name == "enabled") {
                ensureUnique(task.enabled.has_value(), name);
                task.enabled = withContext("parsing `enabled`",
                                           [&] { return parseBool(value.advance()); });
            } else if (name == "priority") {
                ensureUnique(task.priority.has_value(), name);
                task.priority = withContext("parsing `priority`",
                                            [&] { return parseU8(value.advance()); });
            } else if (name == "resources") {
                ensureUnique(resources.has_value(), name);
                resources = withContext("parsing `resources`", [&] { return parseIdents(value); });
            } else {
                unknownField(name);
            }
        });

        task.resources = resources.value_or(Idents{});
        return task;
    });
}

Tasks parseTasks(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        Tasks tasks;

        // Every key is a task name
        fields(body, [&](const Token& key, TokenCursor& value) {
            const std::string& name = key.lexeme;
            if (tasks.count(name) != 0) {
                throw ParseError("task `" + name + "` listed more than once");
            }

            tasks.emplace(name, withContext("parsing task `" + name + "`",
                                            [&] { return parseTask(value); }));
        });

        return tasks;
    });
}

// ============================================================================
// Statics, identifier sets and paths
// ============================================================================

Statics parseStatics(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACE, [](const TokenStream& body) {
        Statics statics;
        TokenCursor entries(body);

        while (const Token* ident = entries.advance()) {
            if (!ident->is(TokenType::IDENTIFIER)) {
                throw ParseError("expected Ident, found " + syntax::describe(ident));
            }

            const std::string& name = ident->lexeme;
            if (statics.count(name) != 0) {
                throw ParseError("resource `" + name + "` listed more than once");
            }

            const Token* colon = entries.advance();
            if (colon == nullptr || !colon->is(TokenType::COLON)) {
                throw ParseError("expected Colon, found " + syntax::describe(colon));
            }

            statics.emplace(name, withContext("parsing `" + name + "`",
                                              [&] { return parseStatic(entries); }));
        }

        return statics;
    });
}

Idents parseIdents(TokenCursor& cursor) {
    return delimited(cursor, Delimiter::BRACKET, [](const TokenStream& body) {
        Idents idents;
        TokenCursor items(body);

        while (const Token* ident = items.advance()) {
            if (!ident->is(TokenType::IDENTIFIER)) {
                throw ParseError("expected Ident, found " + syntax::describe(ident));
            }

            if (!idents.insert(ident->lexeme).second) {
                throw ParseError("ident `" + ident->lexeme + "` listed more than once");
            }

            // A trailing comma is allowed
            const Token* separator = items.advance();
            if (separator == nullptr) {
                break;
            }
            if (!separator->is(TokenType::COMMA)) {
                throw ParseError("expected Comma, found " + syntax::describe(separator));
            }
        }

        return idents;
    });
}

Fragment parsePath(TokenCursor& cursor) {
    Fragment path;
    while (!cursor.isAtEnd() && !cursor.check(TokenType::COMMA)) {
        path.push_back(*cursor.advance());
    }

    if (path.empty()) {
        throw ParseError("expected path, found " + syntax::describe(cursor.peek()));
    }
    return path;
}

} // namespace grammar
} // namespace parser
} // namespace rtos_config
