#pragma once

/**
 * @file AST.hpp
 * @brief Application description tree
 *
 * The parser produces one App per call. Type, expression and path
 * fragments are kept as raw token runs for the code generator.
 */

#include "syntax/Token.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace rtos_config {
namespace parser {

// Opaque token run (type, initializer, routine path, device path)
using Fragment = syntax::TokenStream;

// Resource names a routine may access
using Idents = std::set<std::string>;

// Statically allocated storage: `name: ty = expr;`
struct Static {
    Fragment ty;
    Fragment expr;
};

using Statics = std::map<std::string, Static>;

struct Init {
    Fragment path;
};

struct Idle {
    Statics locals;
    Fragment path;
    Idents resources;
};

struct Task {
    std::optional<bool> enabled;            // No default: left to the code generator
    std::optional<std::uint8_t> priority;   // 0..255, no default either
    Idents resources;
};

using Tasks = std::map<std::string, Task>;

struct App {
    Fragment device;
    Idle idle;
    Init init;
    Statics resources;
    Tasks tasks;
};

} // namespace parser
} // namespace rtos_config
