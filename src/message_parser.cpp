/**
 * @file message_parser.cpp
 * @brief Implementation of MessageParser and Parameters
 *
 * Parsing runs in two passes:
 *
 * 1. Locate the end of the key. A quoted key may close at several quotes
 *    (any '"' reached at a token boundary); the longest close whose
 *    remainder is a valid parameter list wins. Validity of every suffix is
 *    computed once, back to front, so the search never backtracks.
 *
 * 2. Scan the validated remainder left to right, taking one
 *    `| name : value` segment at a time.
 */

#include "usererror/message_parser.hpp"

#include <algorithm>

namespace usererror {

// ========== Parameters ==========

Parameters::Parameters(std::initializer_list<value_type> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void Parameters::set(const std::string& name, std::string value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const value_type& entry) { return entry.first == name; });
    if (it != entries_.end()) {
        it->second = std::move(value);
        return;
    }
    entries_.emplace_back(name, std::move(value));
}

std::optional<std::string> Parameters::get(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool Parameters::contains(const std::string& name) const {
    return get(name).has_value();
}

// ========== Scanning helpers ==========

namespace {

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool isNameStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isNameChar(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

std::size_t skipSpaces(std::string_view text, std::size_t pos) {
    while (pos < text.size() && isSpace(text[pos])) {
        ++pos;
    }
    return pos;
}

// End of an unquoted token: the next '|' or the end of the text.
std::size_t runEnd(std::string_view text, std::size_t pos) {
    std::size_t pipe = text.find('|', pos);
    return pipe == std::string_view::npos ? text.size() : pipe;
}

/*
 * Every '"' that can close the quoted token opened at `open`, in increasing
 * order. The content must be non-empty and built from non-quote characters
 * and "" pairs, so the scan stops at the first lone quote.
 */
std::vector<std::size_t> closingQuotes(std::string_view text, std::size_t open) {
    std::vector<std::size_t> closes;
    std::size_t pos = open + 1;

    while (pos < text.size()) {
        if (text[pos] != '"') {
            ++pos;
            continue;
        }
        if (pos > open + 1) {
            closes.push_back(pos);
        }
        if (pos + 1 < text.size() && text[pos + 1] == '"') {
            pos += 2;
            continue;
        }
        break;
    }
    return closes;
}

struct SegmentHead {
    std::size_t nameBegin;
    std::size_t nameEnd;
    std::size_t valueBegin;
};

// Matches `ws* '|' ws* name ':'` starting at pos.
std::optional<SegmentHead> matchSegmentHead(std::string_view text, std::size_t pos) {
    pos = skipSpaces(text, pos);
    if (pos >= text.size() || text[pos] != '|') {
        return std::nullopt;
    }

    pos = skipSpaces(text, pos + 1);
    if (pos >= text.size() || !isNameStart(text[pos])) {
        return std::nullopt;
    }

    std::size_t nameBegin = pos;
    while (pos < text.size() && isNameChar(text[pos])) {
        ++pos;
    }
    if (pos >= text.size() || text[pos] != ':') {
        return std::nullopt;
    }
    return SegmentHead{nameBegin, pos, pos + 1};
}

bool startsUnquotedValue(std::string_view text, std::size_t pos) {
    return pos < text.size() && text[pos] != '|';
}

/*
 * valid[pos] is true when text[pos..] is a (possibly empty) sequence of
 * parameter segments running to the end of the text.
 */
std::vector<bool> validParameterTails(std::string_view text) {
    std::vector<bool> valid(text.size() + 1, false);
    valid[text.size()] = true;

    for (std::size_t pos = text.size(); pos-- > 0;) {
        // Leading whitespace is skipped by the head, so a position inside a
        // run shares the result of the position after it.
        if (isSpace(text[pos])) {
            valid[pos] = pos + 1 < text.size() && valid[pos + 1];
            continue;
        }

        auto head = matchSegmentHead(text, pos);
        if (!head) {
            continue;
        }

        std::size_t value = head->valueBegin;
        if (value < text.size() && text[value] == '"') {
            for (std::size_t close : closingQuotes(text, value)) {
                if (valid[close + 1]) {
                    valid[pos] = true;
                    break;
                }
            }
        }
        if (!valid[pos] && startsUnquotedValue(text, value) && valid[runEnd(text, value)]) {
            valid[pos] = true;
        }
    }
    return valid;
}

// Trims, then unwraps and unescapes a quoted token.
std::string normalizeToken(std::string_view raw) {
    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && isSpace(raw[begin])) {
        ++begin;
    }
    while (end > begin && isSpace(raw[end - 1])) {
        --end;
    }

    std::string_view token = raw.substr(begin, end - begin);
    if (token.empty() || token.front() != '"') {
        return std::string(token);
    }

    token.remove_prefix(1);
    if (!token.empty() && token.back() == '"') {
        token.remove_suffix(1);
    }

    std::string unescaped;
    unescaped.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        unescaped += token[i];
        if (token[i] == '"' && i + 1 < token.size() && token[i + 1] == '"') {
            ++i;
        }
    }
    return unescaped;
}

void collectParameters(std::string_view tail, Parameters& parameters) {
    std::size_t pos = 0;

    while (pos < tail.size()) {
        // Every start inside a whitespace run fails the same way, so a
        // failed match resumes after the run.
        auto head = matchSegmentHead(tail, pos);
        if (!head) {
            pos = std::max(pos + 1, skipSpaces(tail, pos));
            continue;
        }

        std::size_t value = head->valueBegin;
        std::size_t valueEnd = 0;
        std::vector<std::size_t> closes;
        if (value < tail.size() && tail[value] == '"') {
            closes = closingQuotes(tail, value);
        }

        if (!closes.empty()) {
            valueEnd = closes.back() + 1;
        } else if (startsUnquotedValue(tail, value)) {
            valueEnd = runEnd(tail, value);
        } else {
            pos = std::max(pos + 1, skipSpaces(tail, pos));
            continue;
        }

        std::string name(tail.substr(head->nameBegin, head->nameEnd - head->nameBegin));
        parameters.set("%" + name + "%", normalizeToken(tail.substr(value, valueEnd - value)));
        pos = skipSpaces(tail, valueEnd);
    }
}

} // namespace

// ========== MessageParser ==========

ParsedMessage MessageParser::parse(std::string_view input) const {
    ParsedMessage fallback{std::string(input), {}};

    std::size_t begin = skipSpaces(input, 0);
    if (begin == input.size() || input[begin] == '|') {
        return fallback;
    }

    std::vector<bool> validTail = validParameterTails(input);
    std::vector<std::size_t> closes;
    if (input[begin] == '"') {
        closes = closingQuotes(input, begin);
    }

    std::size_t keyEnd = std::string_view::npos;
    bool hasTail = false;

    for (auto it = closes.rbegin(); it != closes.rend(); ++it) {
        if (validTail[*it + 1]) {
            keyEnd = *it + 1;
            hasTail = true;
            break;
        }
    }
    if (!hasTail && validTail[runEnd(input, begin)]) {
        keyEnd = runEnd(input, begin);
        hasTail = true;
    }

    if (!hasTail) {
        // The remainder is not a parameter list; keep the key and ignore the rest.
        for (auto it = closes.rbegin(); it != closes.rend(); ++it) {
            std::size_t next = skipSpaces(input, *it + 1);
            if (next < input.size() && input[next] == '|') {
                keyEnd = *it + 1;
                break;
            }
        }
        if (keyEnd == std::string_view::npos) {
            keyEnd = runEnd(input, begin);
        }
    }

    ParsedMessage result;
    result.key = normalizeToken(input.substr(begin, keyEnd - begin));
    if (result.key.empty()) {
        return fallback;
    }

    if (hasTail) {
        std::string_view tail = input.substr(keyEnd);
        if (!tail.empty() && tail.find('|') != std::string_view::npos) {
            collectParameters(tail, result.parameters);
        }
    }
    return result;
}

} // namespace usererror
