/**
 * @file translator.cpp
 * @brief Implementation of MessageCatalog
 */

#include "usererror/translator.hpp"
#include "usererror/connection.hpp"
#include "usererror/logger.hpp"
#include "usererror/statement.hpp"

namespace usererror {

namespace {

bool isIdentifier(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string replacePlaceholders(const std::string& message, const Parameters& parameters) {
    if (parameters.empty()) {
        return message;
    }

    std::string result;
    result.reserve(message.size());

    std::size_t pos = 0;
    while (pos < message.size()) {
        const Parameters::value_type* best = nullptr;
        for (const auto& entry : parameters) {
            const std::string& placeholder = entry.first;
            if (placeholder.empty() || message.compare(pos, placeholder.size(), placeholder) != 0) {
                continue;
            }
            if (best == nullptr || placeholder.size() > best->first.size()) {
                best = &entry;
            }
        }

        if (best != nullptr) {
            result += best->second;
            pos += best->first.size();
        } else {
            result += message[pos];
            ++pos;
        }
    }
    return result;
}

MessageCatalog& MessageCatalog::add(const std::string& id, const std::string& message) {
    messages_[id] = message;
    return *this;
}

bool MessageCatalog::has(const std::string& id) const {
    return messages_.find(id) != messages_.end();
}

std::string MessageCatalog::trans(const std::string& id, const Parameters& parameters) const {
    auto it = messages_.find(id);
    if (it == messages_.end()) {
        return replacePlaceholders(id, parameters);
    }
    return replacePlaceholders(it->second, parameters);
}

std::size_t MessageCatalog::loadFromTable(Connection& conn, const std::string& table) {
    if (!isIdentifier(table)) {
        throw SchemaException("Invalid translation table name: '" + table + "'");
    }

    auto stmt = conn.prepare("SELECT key, message FROM " + table);

    std::size_t loaded = 0;
    while (stmt.step()) {
        auto message = stmt.columnOptionalString(1);
        if (stmt.isNull(0) || !message) {
            Logger::warn("Skipping translation row with NULL key or message in '" + table + "'");
            continue;
        }
        add(stmt.columnString(0), *message);
        ++loaded;
    }

    Logger::info("Loaded " + std::to_string(loaded) + " translations from '" + table + "'");
    return loaded;
}

} // namespace usererror
