/**
 * @file usererror.hpp
 * @brief Main include file for the usererror library
 *
 * Include everything:
 *   #include <usererror/usererror.hpp>
 * Or only the parts in use:
 *   #include <usererror/message_parser.hpp>
 *
 * Components:
 * - MessageParser: splits a user-error message into key and parameters
 * - Translator / MessageCatalog: key and %placeholder% translation
 * - UserErrorListener: replaces user-error driver exceptions with
 *   translated UserErrorExceptions
 * - Connection / Statement: SQLite driver the user-errors are raised from
 * - Logger: console logging
 */

#pragma once

#include "exceptions.hpp"
#include "logger.hpp"
#include "message_parser.hpp"
#include "connection.hpp"
#include "statement.hpp"
#include "translator.hpp"
#include "listener.hpp"

namespace usererror {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

inline const char* sqliteVersion() {
    return sqlite3_libversion();
}

} // namespace usererror
