/**
 * @file main.cpp
 * @brief Example: translating user-errors raised by SQLite triggers
 *
 * This example shows:
 * 1. Raising a user-error from a trigger with RAISE(ABORT, ...)
 * 2. Loading translations from a table
 * 3. Replacing the driver exception with a translated UserErrorException
 * 4. Parsing messages directly with MessageParser
 */

#include <iostream>
#include "usererror/usererror.hpp"

using namespace usererror;

namespace {

void createSchema(Connection& conn) {
    conn.execute(R"(
        CREATE TABLE accounts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            owner TEXT NOT NULL,
            balance INTEGER NOT NULL
        );

        CREATE TRIGGER accounts_no_overdraft BEFORE UPDATE ON accounts
        WHEN NEW.balance < 0
        BEGIN
            SELECT RAISE(ABORT, 'app-exception: "account.overdraft"|limit:0|currency:EUR');
        END;

        CREATE TABLE translations (key TEXT PRIMARY KEY, message TEXT NOT NULL);
        INSERT INTO translations VALUES
            ('account.overdraft', 'Balance may not drop below %limit% %currency%');
    )");
}

void withdraw(Connection& conn, int64_t accountId, int amount) {
    auto stmt = conn.prepare("UPDATE accounts SET balance = balance - ? WHERE id = ?");
    stmt.bind(1, amount).bind(2, accountId).execute();
}

void printParsed(const MessageParser& parser, const std::string& message) {
    ParsedMessage parsed = parser.parse(message);
    std::cout << "  " << message << "\n";
    std::cout << "    key: " << parsed.key << "\n";
    for (const auto& entry : parsed.parameters) {
        std::cout << "    " << entry.first << " = " << entry.second << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== usererror example (SQLite " << sqliteVersion() << ") ===\n\n";

    try {
        auto conn = Connection::inMemory();
        createSchema(*conn);

        MessageCatalog catalog;
        catalog.loadFromTable(*conn);

        Logger::minLevel = LogLevel::Debug;
        UserErrorListener listener(catalog);

        conn->execute("INSERT INTO accounts (owner, balance) VALUES ('alice', 100)");
        int64_t accountId = conn->lastInsertRowId();

        listener.guard([&] { withdraw(*conn, accountId, 30); });
        std::cout << "Withdrew 30\n";

        try {
            listener.guard([&] { withdraw(*conn, accountId, 500); });
        } catch (const UserErrorException& e) {
            std::cout << "Rejected: " << e.what() << "\n";
            try {
                std::rethrow_exception(e.previous());
            } catch (const DatabaseException& cause) {
                std::cout << "  caused by: " << cause.what() << "\n";
            }
        }

        std::cout << "\nParsing messages:\n";
        MessageParser parser;
        printParsed(parser, R"(some.key|name:value|other:"has a | pipe")");
        printParsed(parser, R"("quoted ""key"""|p:"a""b")");
        printParsed(parser, "k|1bad:val");

    } catch (const DatabaseException& e) {
        Logger::error(e.what());
        return 1;
    }

    return 0;
}
