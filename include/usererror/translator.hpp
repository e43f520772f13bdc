/**
 * @file translator.hpp
 * @brief Translation of user-error keys
 *
 * A Translator turns a message key and its %placeholder% parameters into
 * display text. MessageCatalog is the in-memory implementation; its
 * messages can be loaded from a SQLite table:
 *
 *   CREATE TABLE translations (key TEXT PRIMARY KEY, message TEXT NOT NULL);
 *   INSERT INTO translations VALUES ('stock.negative', 'Not enough %product% in stock');
 *
 *   MessageCatalog catalog;
 *   catalog.loadFromTable(conn);
 *   catalog.trans("stock.negative", {{"%product%", "widgets"}});
 *   // "Not enough widgets in stock"
 */

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include "message_parser.hpp"

namespace usererror {

class Connection;

/**
 * @brief Interface for looking up and formatting translated messages
 */
class Translator {
public:
    virtual ~Translator() = default;

    /**
     * @param id Message key
     * @param parameters Placeholder ("%name%") to value mapping
     * @return Translated message with placeholders replaced
     */
    virtual std::string trans(const std::string& id, const Parameters& parameters) const = 0;
};

/**
 * @brief Translator backed by an in-memory key to message table
 *
 * Unknown keys translate to themselves, so an untranslated user-error
 * still shows its key (with placeholders substituted).
 */
class MessageCatalog : public Translator {
public:
    MessageCatalog() = default;

    /**
     * @brief Add or replace a message
     */
    MessageCatalog& add(const std::string& id, const std::string& message);

    bool has(const std::string& id) const;

    std::size_t size() const { return messages_.size(); }

    std::string trans(const std::string& id, const Parameters& parameters) const override;

    /**
     * @brief Load every (key, message) row of a table
     * @param conn Open connection
     * @param table Table with `key` and `message` text columns
     * @return Number of messages loaded
     * @throws SchemaException if the table name is not a plain identifier
     * @throws QueryException if the table cannot be read
     */
    std::size_t loadFromTable(Connection& conn, const std::string& table = "translations");

private:
    std::unordered_map<std::string, std::string> messages_;
};

/**
 * @brief Replace placeholders in a message
 *
 * At each position the longest matching placeholder is replaced;
 * substituted text is not scanned again.
 */
std::string replacePlaceholders(const std::string& message, const Parameters& parameters);

} // namespace usererror
