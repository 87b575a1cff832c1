/**
 * @file TokenPrinter.cpp
 * @brief Token printing implementation
 */

#include "TokenPrinter.hpp"
#include <sstream>

namespace rtos_config {
namespace syntax {

namespace {

void print(std::ostringstream& out, const Token& token);

void printSequence(std::ostringstream& out, const TokenStream& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) out << ' ';
        print(out, tokens[i]);
    }
}

void print(std::ostringstream& out, const Token& token) {
    if (!token.isGroup()) {
        out << token.lexeme;
        return;
    }

    out << openingChar(token.delimiter);
    printSequence(out, token.children);
    out << closingChar(token.delimiter);
}

} // namespace

std::string toString(const TokenStream& tokens) {
    std::ostringstream out;
    printSequence(out, tokens);
    return out.str();
}

std::string toString(const Token& token) {
    std::ostringstream out;
    print(out, token);
    return out.str();
}

std::string describe(const Token* token) {
    if (token == nullptr) {
        return "end of input";
    }

    std::ostringstream out;
    if (token->isGroup()) {
        out << delimiterToString(token->delimiter) << " group";
    } else {
        out << '`' << token->lexeme << "` (" << tokenTypeToString(token->type) << ')';
    }
    if (token->line > 0) {
        out << " at " << token->line << ':' << token->column;
    }
    return out.str();
}

} // namespace syntax
} // namespace rtos_config
