/**
 * @file listener.cpp
 * @brief Implementation of UserErrorListener
 */

#include "usererror/listener.hpp"
#include "usererror/logger.hpp"

#include <algorithm>

namespace usererror {

namespace {

// SQLSTATE of PL/pgSQL RAISE EXCEPTION without an explicit ERRCODE
const std::string kRaiseExceptionState = "P0001";

} // namespace

std::optional<std::string> unwrapRaiseException(const std::string& message) {
    static const std::string head = "SQLSTATE[P0001]: Raise exception: ";
    static const std::string marker = " ERROR:  ";

    if (message.compare(0, head.size(), head) != 0) {
        return std::nullopt;
    }

    std::size_t pos = head.size();
    std::size_t digits = pos;
    while (pos < message.size() && message[pos] >= '0' && message[pos] <= '9') {
        ++pos;
    }
    if (pos == digits || message.compare(pos, marker.size(), marker) != 0) {
        return std::nullopt;
    }

    // The raised text ends at the first line break (CONTEXT lines follow it)
    std::size_t begin = pos + marker.size();
    std::size_t end = message.find('\n', begin);
    std::string text = message.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

UserErrorListener::UserErrorListener(const Translator& translator, ListenerOptions options)
    : translator_(translator)
    , options_(std::move(options))
{
}

bool UserErrorListener::watchesDriver(const std::string& driver) const {
    return std::find(options_.drivers.begin(), options_.drivers.end(), driver) != options_.drivers.end();
}

std::optional<std::string> UserErrorListener::extractUserMessage(const DatabaseException& exception) const {
    if (!watchesDriver(exception.driver())) {
        return std::nullopt;
    }

    std::string message = exception.message();

    // Drivers that report an SQLSTATE wrap the raised text in their own format
    if (!exception.sqlState().empty()) {
        if (exception.sqlState() != kRaiseExceptionState) {
            return std::nullopt;
        }
        auto unwrapped = unwrapRaiseException(message);
        if (!unwrapped) {
            return std::nullopt;
        }
        message = *unwrapped;
    }

    const std::string& prefix = options_.errorPrefix;
    if (message.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return message.substr(prefix.size());
}

void UserErrorListener::onException(ExceptionEvent& event) const {
    std::exception_ptr original = event.exception();
    if (!original) {
        return;
    }

    std::optional<std::string> userMessage;
    try {
        std::rethrow_exception(original);
    } catch (const DatabaseException& e) {
        userMessage = extractUserMessage(e);
    } catch (...) {
        // Not a driver error; the event keeps it
        return;
    }

    if (!userMessage) {
        return;
    }

    ParsedMessage parsed = parser_.parse(*userMessage);
    std::string translated = translator_.trans(parsed.key, parsed.parameters);

    Logger::debug("Translated user-error '" + parsed.key + "' with "
                  + std::to_string(parsed.parameters.size()) + " parameter(s)");

    event.setException(std::make_exception_ptr(
        UserErrorException(translated, std::move(parsed), original)));
}

} // namespace usererror
