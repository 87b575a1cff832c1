#pragma once

/**
 * @file ParseError.hpp
 * @brief Parse failure carrying a chain of context notes
 *
 * The chain reads outermost first: "parsing `tasks`", "parsing task `t1`",
 * "parsing `priority`", "256 is out of the `u8` range".
 */

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rtos_config {
namespace parser {

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message), m_chain{message}, m_formatted(message) {}

    /**
     * Prepend a note naming the construct that was being parsed
     */
    void addContext(const std::string& note) {
        m_chain.insert(m_chain.begin(), note);
        m_formatted = note + ": " + m_formatted;
    }

    /**
     * Context notes followed by the innermost message
     */
    const std::vector<std::string>& chain() const { return m_chain; }

    const std::string& message() const { return m_chain.back(); }

    const char* what() const noexcept override { return m_formatted.c_str(); }

private:
    std::vector<std::string> m_chain;
    std::string m_formatted;
};

/**
 * Run a sub-parse; on failure, note what was being parsed and rethrow
 */
template<typename F>
auto withContext(const std::string& note, F&& parse) -> decltype(parse()) {
    try {
        return parse();
    } catch (ParseError& e) {
        e.addContext(note);
        throw;
    }
}

} // namespace parser
} // namespace rtos_config
