/**
 * @file statement.hpp
 * @brief Prepared statement with parameter binding
 *
 * Binding calls return *this so they can be chained:
 *   stmt.bind(1, "widget").bind(2, 5).execute();
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>
#include "exceptions.hpp"

namespace usererror {

class Connection;

/**
 * @brief Sentinel for binding SQL NULL
 */
struct NullValue {};
static constexpr NullValue null{};

/**
 * @brief RAII wrapper for a prepared statement
 *
 * Lifecycle:
 * 1. Create from SQL text (compilation happens here)
 * 2. Bind parameters
 * 3. Execute or step through results
 * 4. Reset for reuse, or let destructor clean up
 */
class Statement {
public:
    /**
     * @param conn Parent connection (must outlive this statement)
     * @param sql SQL text with ? or :name placeholders
     * @throws QueryException if SQL is invalid
     */
    Statement(Connection& conn, const std::string& sql);

    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // ========== Parameter Binding ==========
    // Parameters are 1-indexed (SQLite convention)

    Statement& bind(int index, int value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, NullValue);

    /**
     * @brief Bind a parameter by name, e.g. ":product"
     * @throws QueryException if the statement has no such parameter
     */
    template<typename T>
    Statement& bind(const std::string& name, const T& value) {
        int index = sqlite3_bind_parameter_index(stmt_, name.c_str());
        if (index == 0) {
            throw QueryException("Unknown parameter name: " + name, sql_);
        }
        return bind(index, value);
    }

    Statement& clearBindings();

    // ========== Execution ==========

    /**
     * @brief Run a statement that returns no rows
     * @throws ConstraintException on constraint violations and RAISE(ABORT, ...)
     * @throws QueryException for any other failure
     */
    void execute();

    /**
     * @brief Step to the next result row
     * @return true if a row is available, false when done
     */
    bool step();

    Statement& reset();

    // ========== Column Access ==========
    // Columns are 0-indexed (SQLite convention)

    int columnCount() const;
    bool isNull(int index) const;
    int64_t columnInt64(int index) const;
    std::string columnString(int index) const;
    std::optional<std::string> columnOptionalString(int index) const;

    const std::string& sql() const { return sql_; }

private:
    void checkResult(int result, const std::string& operation);
    void finalize();

    sqlite3_stmt* stmt_ = nullptr;
    Connection* conn_;
    std::string sql_;
};

} // namespace usererror
