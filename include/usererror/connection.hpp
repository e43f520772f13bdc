/**
 * @file connection.hpp
 * @brief SQLite connection with RAII ownership
 *
 * The connection is the source of the driver errors the listener
 * inspects: a failing statement throws a DatabaseException subclass whose
 * message() is SQLite's own error text. A trigger such as
 *
 *   CREATE TRIGGER check_stock BEFORE UPDATE ON stock
 *   WHEN NEW.quantity < 0
 *   BEGIN
 *       SELECT RAISE(ABORT, 'app-exception: stock.negative|product:widget');
 *   END;
 *
 * therefore surfaces as a ConstraintException carrying the user-error.
 *
 * Connections are non-copyable and moveable.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace usererror {

/**
 * @brief Configuration options for a database connection
 *
 *   ConnectionOptions opts;
 *   opts.busyTimeoutMs = 1000;
 *   auto conn = Connection::open("app.sqlite", opts);
 */
struct ConnectionOptions {
    // Write-Ahead Logging (ignored by SQLite for in-memory databases)
    bool enableWAL = true;

    // Timeout when the database is locked by another connection
    int busyTimeoutMs = 5000;

    // Foreign key enforcement is off by default in SQLite
    bool enableForeignKeys = true;

    bool readOnly = false;

    bool createIfNotExists = true;

    // Report SQLITE_CONSTRAINT_TRIGGER etc. instead of the bare primary code
    bool extendedResultCodes = true;
};

class Statement;

/**
 * @brief RAII wrapper for a SQLite database connection
 *
 * Usage:
 *   {
 *       Connection conn("app.sqlite");
 *       conn.execute("CREATE TABLE stock (name TEXT, quantity INTEGER)");
 *   } // closed here
 */
class Connection {
public:
    /**
     * @brief Open a database connection
     * @param dbPath Path to database file, or ":memory:" for in-memory DB
     * @param options Connection configuration
     * @throws ConnectionException if opening fails
     */
    explicit Connection(const std::string& dbPath,
                        const ConnectionOptions& options = ConnectionOptions{});

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    static std::unique_ptr<Connection> open(
        const std::string& dbPath,
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Create an in-memory database (tests, examples)
     */
    static std::unique_ptr<Connection> inMemory(
        const ConnectionOptions& options = ConnectionOptions{});

    /**
     * @brief Execute one or more SQL statements without results
     * @throws ConstraintException on constraint violations and RAISE(ABORT, ...)
     * @throws QueryException for any other failure
     */
    void execute(const std::string& sql);

    /**
     * @brief Create a prepared statement
     * @throws QueryException if the SQL does not compile
     */
    Statement prepare(const std::string& sql);

    int64_t lastInsertRowId() const;

    /**
     * @brief Number of rows changed by the last statement
     */
    int changes() const;

    bool tableExists(const std::string& tableName);

    sqlite3* handle() const { return db_; }

    const std::string& path() const { return dbPath_; }

    bool isOpen() const { return db_ != nullptr; }

private:
    void applyOptions(const ConnectionOptions& options);
    void close();

    sqlite3* db_ = nullptr;
    std::string dbPath_;
};

/**
 * @brief Throw the DatabaseException subclass matching a SQLite result code
 *
 * Primary code SQLITE_CONSTRAINT (including extended codes such as
 * SQLITE_CONSTRAINT_TRIGGER) maps to ConstraintException, everything else
 * to QueryException.
 */
[[noreturn]] void throwSqliteError(int result, const std::string& message, const std::string& sql);

} // namespace usererror
