#pragma once

#include <gql/value.h>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace gql {

// Quote and escape `s` as a JSON string literal. Bytes that are not part of
// a well-formed UTF-8 sequence are written as \ufffd, so the output is
// always valid JSON.
std::string escape_json_string(const std::string& s);

// Length of the well-formed UTF-8 sequence starting at s[pos], or 0 if the
// bytes there are not one (overlong forms and surrogates included).
std::size_t utf8_sequence_length(const std::string& s, std::size_t pos) noexcept;

// Serialize to JSON. Object fields are written in insertion order, enums as
// strings. indent == 0 gives a single line with no spaces; a positive indent
// pretty-prints objects and long lists.
std::string dump(const Value& v, int indent = 0);
std::string dump(const Object& o, int indent = 0);

struct JsonParseError : public std::runtime_error {
    std::size_t line, col;
    JsonParseError(const std::string& msg, std::size_t l, std::size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// Read JSON text into a canonical Value. Throws JsonParseError on malformed
// input, invalid UTF-8 inside strings, duplicate object keys, keys that are not GraphQL names, or nesting
// deeper than `max_depth`.
//
// Integers that fit in 32 bits become Int, all other numbers Float. Strings
// always become String.
Value parse_json(const std::string& text, std::size_t max_depth = kDefaultMaxDepth);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace gql
