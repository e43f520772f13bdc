/**
 * @file listener.hpp
 * @brief Interception of driver exceptions that carry user-errors
 *
 * A user-error is raised by a database-side routine (a trigger, a stored
 * function) as a driver error whose message starts with a known prefix:
 *
 *   app-exception: "order.limit_exceeded"|limit:10|customer:"O""Brien"
 *
 * UserErrorListener recognizes such exceptions, parses the message with
 * MessageParser, translates it and replaces the driver exception with a
 * UserErrorException. Everything else passes through untouched.
 *
 * Usage:
 *   MessageCatalog catalog;
 *   catalog.add("order.limit_exceeded", "At most %limit% orders allowed");
 *   UserErrorListener listener(catalog);
 *
 *   listener.guard([&] { conn->execute("INSERT INTO orders ..."); });
 *   // throws UserErrorException("At most 10 orders allowed")
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "exceptions.hpp"
#include "message_parser.hpp"
#include "translator.hpp"

namespace usererror {

/**
 * @brief Configuration for UserErrorListener
 */
struct ListenerOptions {
    // Literal prefix a driver message must start with
    std::string errorPrefix = "app-exception: ";

    // DatabaseException::driver() values the listener inspects
    std::vector<std::string> drivers = {"sqlite", "pgsql", "oci8"};
};

/**
 * @brief Holds the exception being handled; listeners may replace it
 */
class ExceptionEvent {
public:
    explicit ExceptionEvent(std::exception_ptr exception)
        : exception_(std::move(exception)) {}

    std::exception_ptr exception() const { return exception_; }

    void setException(std::exception_ptr exception) {
        exception_ = std::move(exception);
        replaced_ = true;
    }

    bool isReplaced() const { return replaced_; }

private:
    std::exception_ptr exception_;
    bool replaced_ = false;
};

/**
 * @brief Replaces user-error driver exceptions with translated ones
 *
 * The listener only keeps a reference to the translator, which must
 * outlive it. All operations are const and may run concurrently.
 */
class UserErrorListener {
public:
    explicit UserErrorListener(const Translator& translator,
                               ListenerOptions options = ListenerOptions{});

    /**
     * @brief Inspect the event's exception and replace it if it is a user-error
     *
     * Exceptions that are not DatabaseExceptions, come from an unlisted
     * driver, or do not carry the prefix are left in place.
     */
    void onException(ExceptionEvent& event) const;

    /**
     * @brief Return the user-error message (prefix removed), if any
     *
     * Applies the driver filter, the PostgreSQL P0001 unwrapping and the
     * prefix check.
     */
    std::optional<std::string> extractUserMessage(const DatabaseException& exception) const;

    /**
     * @brief Run fn, translating user-errors it throws
     *
     * A DatabaseException thrown by fn is passed through onException() and
     * rethrown, either replaced by a UserErrorException or unchanged. Other
     * exceptions propagate as they are.
     */
    template<typename Fn>
    decltype(auto) guard(Fn&& fn) const {
        try {
            return std::forward<Fn>(fn)();
        } catch (const DatabaseException&) {
            ExceptionEvent event(std::current_exception());
            onException(event);
            std::rethrow_exception(event.exception());
        }
    }

    const ListenerOptions& options() const { return options_; }

private:
    bool watchesDriver(const std::string& driver) const;

    const Translator& translator_;
    ListenerOptions options_;
    MessageParser parser_;
};

/**
 * @brief Extract the raised text from a PostgreSQL RAISE EXCEPTION message
 *
 * PDO reports a PL/pgSQL RAISE EXCEPTION as
 *   SQLSTATE[P0001]: Raise exception: 7 ERROR:  <text>
 *
 * @return <text>, or nothing when the message does not have that form
 */
std::optional<std::string> unwrapRaiseException(const std::string& message);

} // namespace usererror
