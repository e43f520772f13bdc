/**
 * @file exceptions.hpp
 * @brief Exception hierarchy for driver errors and translated user-errors
 *
 * Driver failures are reported as DatabaseException (or one of its
 * subclasses). Besides the human-readable what() text, every driver
 * exception keeps the raw driver message, the numeric result code, the
 * SQLSTATE when the driver reports one, and the name of the driver that
 * raised it. UserErrorListener inspects exactly those fields.
 *
 * UserErrorException is the replacement thrown once a user-error has been
 * recognized and translated. It chains the original driver exception.
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "message_parser.hpp"

namespace usererror {

/**
 * @brief Base exception for all driver errors
 */
class DatabaseException : public std::exception {
public:
    /**
     * @param message Raw driver message
     * @param errorCode Driver result code (0 when unknown)
     * @param sqlState Five-character SQLSTATE, empty if the driver has none
     * @param driver Name of the driver that raised the error
     */
    explicit DatabaseException(std::string message,
                               int errorCode = 0,
                               std::string sqlState = {},
                               std::string driver = "sqlite")
        : message_(std::move(message))
        , errorCode_(errorCode)
        , sqlState_(std::move(sqlState))
        , driver_(std::move(driver))
    {
        fullMessage_ = message_;
        if (!sqlState_.empty()) {
            fullMessage_ += " (SQLSTATE " + sqlState_ + ")";
        }
        if (errorCode_ != 0) {
            fullMessage_ += " (" + driver_ + " error code: " + std::to_string(errorCode_) + ")";
        }
    }

    const char* what() const noexcept override {
        return fullMessage_.c_str();
    }

    int errorCode() const noexcept {
        return errorCode_;
    }

    /**
     * @brief The driver message, without category or error code decoration
     */
    const std::string& message() const noexcept {
        return message_;
    }

    const std::string& sqlState() const noexcept {
        return sqlState_;
    }

    const std::string& driver() const noexcept {
        return driver_;
    }

protected:
    std::string message_;
    std::string fullMessage_;
    int errorCode_;
    std::string sqlState_;
    std::string driver_;
};

/**
 * @brief Thrown when a database connection cannot be opened
 */
class ConnectionException : public DatabaseException {
public:
    explicit ConnectionException(const std::string& message, int errorCode = 0)
        : DatabaseException(message, errorCode)
    {
        fullMessage_ = "Connection error: " + fullMessage_;
    }
};

/**
 * @brief Thrown when a statement fails to prepare or execute
 */
class QueryException : public DatabaseException {
public:
    QueryException(const std::string& message, const std::string& sql, int errorCode = 0)
        : DatabaseException(message, errorCode)
        , sql_(sql)
    {
        fullMessage_ = "Query error: " + fullMessage_ + "\nSQL: " + sql_;
    }

    const std::string& sql() const noexcept {
        return sql_;
    }

private:
    std::string sql_;
};

/**
 * @brief Thrown on constraint violations, including RAISE(ABORT, ...) in triggers
 */
class ConstraintException : public DatabaseException {
public:
    explicit ConstraintException(const std::string& message, int errorCode = 0)
        : DatabaseException(message, errorCode)
    {
        fullMessage_ = "Constraint violation: " + fullMessage_;
    }
};

/**
 * @brief Thrown when a table or identifier does not have the expected shape
 */
class SchemaException : public DatabaseException {
public:
    explicit SchemaException(const std::string& message)
        : DatabaseException(message)
    {
        fullMessage_ = "Schema error: " + fullMessage_;
    }
};

/**
 * @brief A recognized and translated user-error
 *
 * what() returns the translated text. previous() holds the driver
 * exception the user-error was extracted from.
 */
class UserErrorException : public std::runtime_error {
public:
    UserErrorException(const std::string& translated,
                       ParsedMessage parsed,
                       std::exception_ptr previous)
        : std::runtime_error(translated)
        , parsed_(std::move(parsed))
        , previous_(std::move(previous)) {}

    const std::string& key() const noexcept {
        return parsed_.key;
    }

    const Parameters& parameters() const noexcept {
        return parsed_.parameters;
    }

    std::exception_ptr previous() const noexcept {
        return previous_;
    }

private:
    ParsedMessage parsed_;
    std::exception_ptr previous_;
};

} // namespace usererror
