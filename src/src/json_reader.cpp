#include <gql/json.h>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <set>
#include <sstream>
#include <vector>

namespace gql {

namespace {
    struct Parser {
        const std::string& s;
        std::size_t max_depth;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str, std::size_t depth) : s(str), max_depth(depth) {}

        bool at_end() const { return i >= s.size(); }

        // '\0' at end of input; a NUL byte inside the input is returned as is.
        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")" << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base, line, col), line, col);
        }

        void skip_ws() {
            while (i < s.size() and std::isspace(static_cast<unsigned char>(s[i]))) get();
        }

        void open(char ch) {
            if (opener_stack.size() >= max_depth) fail("maximum nesting depth exceeded");
            opener_stack.push_back(Opener{ch, line, col});
            get();
        }

        void close() {
            get();
            opener_stack.pop_back();
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == 'n') return parse_literal("null", Value());
            if (c == 't') return parse_literal("true", Value(true));
            if (c == 'f') return parse_literal("false", Value(false));
            if (c == '"') return Value(String(parse_string()));
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            if (at_end()) fail("unexpected end of input while parsing value");
            fail("unexpected character while parsing value");
        }

        Value parse_literal(const char* word, Value result) {
            std::string w(word);
            if (s.compare(i, w.size(), w) != 0) fail("invalid literal");
            for (size_t k = 0; k < w.size(); ++k) get();
            return result;
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                if (at_end()) fail("unterminated unicode escape");
                char h = get();
                int hv = hex_val(h);
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            if (get() != '"') fail("expected '\"'");
            std::string out;
            while (true) {
                if (at_end()) fail("unexpected end in string");
                if (static_cast<unsigned char>(peek()) >= 0x80) {
                    std::size_t n = utf8_sequence_length(s, i);
                    if (n == 0) fail("invalid UTF-8 in string");
                    for (std::size_t k = 0; k < n; ++k) out.push_back(get());
                    continue;
                }
                char c = get();
                if (c == '"') break;
                if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in string");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (at_end()) fail("unexpected end in string escape");
                char e = get();
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // a high surrogate must be followed by an escaped low surrogate
                        if (cp >= 0xD800 and cp <= 0xDBFF) {
                            if (get() != '\\' or get() != 'u') fail("unpaired surrogate in unicode escape");
                            uint32_t lo = parse_hex4();
                            if (lo < 0xDC00 or lo > 0xDFFF) fail("unpaired surrogate in unicode escape");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else if (cp >= 0xDC00 and cp <= 0xDFFF) {
                            fail("unpaired surrogate in unicode escape");
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    default:
                        fail("unsupported escape sequence");
                }
            }
            return out;
        }

        Value parse_number() {
            size_t start = i;
            size_t start_col = col;
            if (peek() == '-') get();
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            if (peek() == '0') {
                get();
                if (std::isdigit(static_cast<unsigned char>(peek()))) fail("leading zeros are not allowed");
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (not is_float) {
                errno = 0;
                long long v = std::strtoll(token.c_str(), nullptr, 10);
                if (errno == 0 and v >= INT32_MIN and v <= INT32_MAX) return Value(static_cast<int32_t>(v));
            }
            double d = std::strtod(token.c_str(), nullptr);
            if (not std::isfinite(d)) {
                throw JsonParseError(format_error("number out of range", line, start_col), line, start_col);
            }
            return Value(d);
        }

        Value parse_array() {
            open('[');
            std::vector<Value> out_values;
            skip_ws();
            if (peek() == ']') {
                close();
                return Value(List(std::move(out_values)));
            }
            while (true) {
                out_values.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') { close(); break; }
                if (c == ',') { get(); continue; }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            return Value(List(std::move(out_values)));
        }

        Value parse_object() {
            open('{');
            std::vector<std::pair<Name, Value>> fields;
            std::set<std::string> seen;
            skip_ws();
            if (peek() == '}') {
                close();
                return Value(Object());
            }
            while (true) {
                skip_ws();
                if (peek() != '"') fail("expected string key");
                size_t key_line = line, key_col = col;
                std::string key = parse_string();
                auto name = Name::makeName(key);
                if (not name) {
                    throw JsonParseError(format_error("object key '" + key + "' is not a valid GraphQL name", key_line, key_col),
                                         key_line, key_col);
                }
                if (not seen.insert(key).second) {
                    throw JsonParseError(format_error("duplicate object key '" + key + "'", key_line, key_col),
                                         key_line, key_col);
                }
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                fields.emplace_back(std::move(*name), parse_value());
                skip_ws();
                char c = peek();
                if (c == '}') { close(); break; }
                if (c == ',') { get(); continue; }
                fail("expected ',' or '}'");
            }
            auto object = objectFromList(std::move(fields));
            if (not object) fail("duplicate object key");
            return Value(std::move(*object));
        }
    };
}

Value parse_json(const std::string& text, std::size_t max_depth) {
    Parser p(text, max_depth);
    Value val = p.parse_value();
    p.skip_ws();
    if (not p.at_end()) p.fail("extra data after JSON value");
    return val;
}

}  // namespace gql
