#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "json_path.hpp"
#include "logging.hpp"

#ifndef JSONMEND_PARTIAL_MAX_DEPTH
#define JSONMEND_PARTIAL_MAX_DEPTH 512
#endif

namespace JsonMend {

namespace partial {

enum class TruncationSite {
    complete,
    string,
    array,
    object,
    key,
    value
};

constexpr std::string_view truncation_site_to_string(TruncationSite s) {
    switch (s) {
    case TruncationSite::complete: return "complete"; break;
    case TruncationSite::string: return "string"; break;
    case TruncationSite::array: return "array"; break;
    case TruncationSite::object: return "object"; break;
    case TruncationSite::key: return "key"; break;
    case TruncationSite::value: return "value"; break;
    }
    return "N/A";
}

struct ParserOptions {
    // Treat a raw newline inside a string as the end of the stream.
    bool strict = false;
    // Containers nested deeper than this are replaced by a truncated null.
    std::size_t maxDepth = JSONMEND_PARTIAL_MAX_DEPTH;
};

struct ParseResult {
    std::string repaired;
    std::vector<Path> incomplete;
    TruncationSite truncatedAt = TruncationSite::complete;

    bool complete() const {
        return incomplete.empty() && truncatedAt == TruncationSite::complete;
    }
};

namespace detail {

constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

constexpr bool is_hex(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

constexpr bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

constexpr unsigned hex_value(char c) {
    if (is_digit(c)) return unsigned(c - '0');
    if (c >= 'a' && c <= 'f') return unsigned(c - 'a' + 10);
    return unsigned(c - 'A' + 10);
}

// Cuts an incomplete multi-byte UTF-8 sequence off the end of `s`.
inline std::string_view drop_partial_utf8(std::string_view s) {
    const std::size_t n = s.size();
    std::size_t i = n;
    std::size_t back = 0;
    while (i > 0 && back < 4) {
        --i;
        ++back;
        const unsigned char b = static_cast<unsigned char>(s[i]);
        if ((b & 0xC0) == 0x80) {
            continue;
        }
        std::size_t need = 1;
        if ((b & 0xE0) == 0xC0) need = 2;
        else if ((b & 0xF0) == 0xE0) need = 3;
        else if ((b & 0xF8) == 0xF0) need = 4;
        return n - i < need ? s.substr(0, i) : s;
    }
    return s;
}

// State of one repair pass. Output is appended to a caller-supplied buffer;
// keys are only written once a value is known to follow them.
class RepairState {
public:
    RepairState(std::string_view data, const ParserOptions& options)
        : m_data(data), m_options(options) {}

    ParseResult run() {
        ParseResult result;
        result.repaired.reserve(m_data.size() + 16);
        result.truncatedAt = parse_value(result.repaired, 0);
        result.incomplete = std::move(m_incomplete);
        return result;
    }

private:
    static constexpr std::size_t npos = std::string_view::npos;

    bool at_end() const { return m_pos >= m_data.size(); }
    char peek() const { return m_data[m_pos]; }

    void skip_whitespace() {
        while (!at_end() && is_space(peek())) {
            ++m_pos;
        }
    }

    void mark_incomplete() {
        if (!m_path.empty()) {
            m_incomplete.push_back(m_path);
        }
    }

    TruncationSite parse_value(std::string& out, std::size_t depth) {
        skip_whitespace();
        if (at_end()) {
            out += "null";
            return TruncationSite::value;
        }
        const char c = peek();
        if ((c == '{' || c == '[') && depth >= m_options.maxDepth) {
            mark_incomplete();
            out += "null";
            return TruncationSite::value;
        }
        switch (c) {
        case '{':
            return parse_object(out, depth + 1);
        case '[':
            return parse_array(out, depth + 1);
        case '"': {
            const TruncationSite site = parse_string(out);
            if (site != TruncationSite::complete) {
                mark_incomplete();
            }
            return site;
        }
        case 't':
            return parse_literal(out, "true");
        case 'f':
            return parse_literal(out, "false");
        case 'n':
            return parse_literal(out, "null");
        default:
            if (c == '-' || is_digit(c)) {
                return parse_number(out);
            }
            out += "null";
            return TruncationSite::value;
        }
    }

    TruncationSite parse_object(std::string& out, std::size_t depth) {
        ++m_pos;
        out += '{';
        TruncationSite site = TruncationSite::complete;
        bool first = true;
        std::size_t pairs = 0;
        for (;;) {
            skip_whitespace();
            if (at_end()) {
                site = TruncationSite::object;
                break;
            }
            if (peek() == '}') {
                ++m_pos;
                out += '}';
                return site;
            }
            if (!first) {
                if (peek() != ',') {
                    site = TruncationSite::object;
                    break;
                }
                ++m_pos;
                skip_whitespace();
            }
            first = false;

            if (at_end() || peek() != '"') {
                site = TruncationSite::key;
                break;
            }
            std::string key;
            const TruncationSite keySite = parse_string(key);
            // an odd backslash run at the cut is a dangling escape, closed as an escaped backslash
            std::size_t backslashes = 0;
            while (backslashes < m_pos && m_data[m_pos - 1 - backslashes] == '\\') {
                ++backslashes;
            }
            const std::size_t closing = (keySite != TruncationSite::complete && backslashes % 2 == 1) ? 3 : 1;
            std::string name = key.substr(1, key.size() - 1 - closing);
            if (keySite != TruncationSite::complete) {
                // nothing of the name arrived yet: there is no field to point at
                if (!name.empty()) {
                    m_path.push_back(std::move(name));
                    mark_incomplete();
                    m_path.pop_back();
                }
                site = keySite;
                break;
            }
            m_path.push_back(std::move(name));

            skip_whitespace();
            if (at_end() || peek() != ':') {
                mark_incomplete();
                m_path.pop_back();
                site = TruncationSite::key;
                break;
            }
            ++m_pos;
            skip_whitespace();
            if (at_end()) {
                mark_incomplete();
                m_path.pop_back();
                site = TruncationSite::value;
                break;
            }

            if (pairs > 0) {
                out += ',';
            }
            out += key;
            out += ':';
            const TruncationSite valueSite = parse_value(out, depth);
            m_path.pop_back();
            ++pairs;
            if (valueSite != TruncationSite::complete) {
                site = valueSite;
                break;
            }
        }
        out += '}';
        return site;
    }

    TruncationSite parse_array(std::string& out, std::size_t depth) {
        ++m_pos;
        out += '[';
        TruncationSite site = TruncationSite::complete;
        bool first = true;
        std::size_t index = 0;
        for (;;) {
            skip_whitespace();
            if (at_end()) {
                site = TruncationSite::array;
                break;
            }
            if (peek() == ']') {
                ++m_pos;
                out += ']';
                return site;
            }
            if (!first) {
                if (peek() != ',') {
                    site = TruncationSite::array;
                    break;
                }
                ++m_pos;
                skip_whitespace();
            }
            first = false;
            if (at_end()) {
                site = TruncationSite::array;
                break;
            }

            m_path.push_back(index_segment(index));
            if (index > 0) {
                out += ',';
            }
            const TruncationSite valueSite = parse_value(out, depth);
            m_path.pop_back();
            ++index;
            if (valueSite != TruncationSite::complete) {
                site = valueSite;
                break;
            }
        }
        out += ']';
        return site;
    }

    // Copies the string text [start, end) and closes it. A trailing high surrogate
    // escape and, when the input ran out, a partial UTF-8 sequence are dropped.
    void close_string(std::string& out, std::size_t start, std::size_t end, std::size_t pendingHigh,
                      bool inputExhausted, std::string_view closing) {
        std::size_t stop = end;
        if (pendingHigh != npos && pendingHigh + 6 == stop) {
            stop = pendingHigh;
        }
        std::string_view text = m_data.substr(start, stop - start);
        if (inputExhausted) {
            text = drop_partial_utf8(text);
        }
        out += text;
        out += closing;
    }

    TruncationSite parse_string(std::string& out) {
        const std::size_t start = m_pos;
        ++m_pos;
        // start of a complete \uD800-\uDBFF escape that nothing has followed yet
        std::size_t pendingHigh = npos;
        while (!at_end()) {
            const char c = peek();
            if (c == '\\') {
                const std::size_t escapeStart = m_pos;
                ++m_pos;
                if (at_end()) {
                    close_string(out, start, escapeStart, pendingHigh, false, "\\\\\"");
                    return TruncationSite::string;
                }
                if (peek() != 'u') {
                    ++m_pos;
                    pendingHigh = npos;
                    continue;
                }
                ++m_pos;
                std::size_t digits = 0;
                while (digits < 4 && !at_end() && is_hex(peek())) {
                    ++m_pos;
                    ++digits;
                }
                if (digits < 4) {
                    close_string(out, start, escapeStart, pendingHigh, false, "\"");
                    return TruncationSite::string;
                }
                unsigned code = 0;
                for (std::size_t i = m_pos - 4; i < m_pos; i ++) {
                    code = code * 16 + hex_value(m_data[i]);
                }
                pendingHigh = (code >= 0xD800 && code <= 0xDBFF) ? escapeStart : npos;
                continue;
            }
            if (c == '"') {
                ++m_pos;
                out += m_data.substr(start, m_pos - start);
                return TruncationSite::complete;
            }
            if (c == '\n' && m_options.strict) {
                close_string(out, start, m_pos, pendingHigh, false, "\"");
                return TruncationSite::string;
            }
            ++m_pos;
            pendingHigh = npos;
        }
        close_string(out, start, m_pos, pendingHigh, true, "\"");
        return TruncationSite::string;
    }

    TruncationSite parse_number(std::string& out) {
        const std::size_t start = m_pos;
        if (peek() == '-') {
            ++m_pos;
        }
        if (at_end()) {
            mark_incomplete();
            out += '0';
            return TruncationSite::value;
        }
        if (peek() == '0') {
            ++m_pos;
        } else if (is_digit(peek())) {
            while (!at_end() && is_digit(peek())) {
                ++m_pos;
            }
        } else {
            out += '0';
            return TruncationSite::value;
        }

        if (!at_end() && peek() == '.') {
            ++m_pos;
            bool digits = false;
            while (!at_end() && is_digit(peek())) {
                ++m_pos;
                digits = true;
            }
            if (!digits) {
                mark_incomplete();
                out += m_data.substr(start, m_pos - 1 - start);
                return TruncationSite::value;
            }
        }

        if (!at_end() && (peek() == 'e' || peek() == 'E')) {
            const std::size_t exponentStart = m_pos;
            ++m_pos;
            if (!at_end() && (peek() == '+' || peek() == '-')) {
                ++m_pos;
            }
            bool digits = false;
            while (!at_end() && is_digit(peek())) {
                ++m_pos;
                digits = true;
            }
            if (!digits) {
                mark_incomplete();
                out += m_data.substr(start, exponentStart - start);
                return TruncationSite::value;
            }
        }

        out += m_data.substr(start, m_pos - start);
        return TruncationSite::complete;
    }

    TruncationSite parse_literal(std::string& out, std::string_view literal) {
        for (char expected : literal) {
            if (at_end() || peek() != expected) {
                mark_incomplete();
                out += literal;
                return TruncationSite::value;
            }
            ++m_pos;
        }
        out += literal;
        return TruncationSite::complete;
    }

    std::string_view m_data;
    const ParserOptions& m_options;
    std::size_t m_pos = 0;
    Path m_path;
    std::vector<Path> m_incomplete;
};

inline std::string_view trim(std::string_view s) {
    while (!s.empty() && (is_space(s.front()) || s.front() == '\f' || s.front() == '\v')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (is_space(s.back()) || s.back() == '\f' || s.back() == '\v')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace detail

// Turns a truncated JSON text into a valid one and reports what was cut off.
// Holds only its options, so one instance can be shared between threads.
class Parser {
public:
    Parser() = default;
    explicit Parser(ParserOptions options) : m_options(options) {}

    bool strict() const {
        return m_options.strict;
    }

    ParseResult parse(std::string_view data) const {
        const std::string_view text = detail::trim(data);
        if (text.empty()) {
            return ParseResult{"{}", {}, TruncationSite::complete};
        }
        detail::RepairState state(text, m_options);
        ParseResult result = state.run();
        JSONMEND_LOG_TRACE("repaired {} bytes into {} bytes, truncated at {}, {} incomplete paths",
                           text.size(), result.repaired.size(), truncation_site_to_string(result.truncatedAt),
                           result.incomplete.size());
        return result;
    }

private:
    ParserOptions m_options;
};

} // namespace partial

} // namespace JsonMend
