/**
 * @file message_parser.hpp
 * @brief Parser for the user-error message format
 *
 * A user-error message (with the prefix already removed) looks like:
 *
 *   "translation.key"|param1:value|param2:"value with | pipe"
 *
 * - The key comes first. It may be quoted, and must be quoted if it
 *   contains a '|'.
 * - Parameters are optional '|'-separated name:value pairs. Names follow
 *   the [A-Za-z_][A-Za-z0-9_]* identifier rule.
 * - Values may be quoted, and must be quoted if they contain a '|'.
 * - Inside quotes, a literal " is written as "" (SQL-style).
 *
 * Parsing never fails: input that cannot be decomposed is returned whole
 * as the key, with no parameters.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace usererror {

/**
 * @brief Ordered string-to-string map keyed by placeholder ("%name%")
 *
 * Keeps insertion order. Setting an existing name overwrites the value in
 * place, so the first appearance decides the position and the last one
 * decides the value.
 */
class Parameters {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    Parameters() = default;
    Parameters(std::initializer_list<value_type> entries);

    void set(const std::string& name, std::string value);

    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const Parameters& other) const { return entries_ == other.entries_; }
    bool operator!=(const Parameters& other) const { return !(*this == other); }

private:
    std::vector<value_type> entries_;
};

/**
 * @brief Result of parsing one user-error message
 */
struct ParsedMessage {
    std::string key;
    Parameters parameters;
};

/**
 * @brief Parses user-error messages into a key and its parameters
 *
 * Stateless; one instance can be shared between threads.
 *
 * Usage:
 *   MessageParser parser;
 *   auto parsed = parser.parse(R"("stock.low"|product:"Widget ""XL""")");
 *   // parsed.key == "stock.low"
 *   // parsed.parameters.get("%product%") == "Widget \"XL\""
 */
class MessageParser {
public:
    /**
     * @brief Parse a message
     * @param input Message text without the user-error prefix
     * @return Key and parameters; never throws for malformed input
     */
    ParsedMessage parse(std::string_view input) const;
};

} // namespace usererror
