#include <gql/json.h>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>

namespace gql {

std::size_t utf8_sequence_length(const std::string& s, std::size_t pos) noexcept {
    auto byte = [&](std::size_t k) -> unsigned {
        return pos + k < s.size() ? static_cast<unsigned char>(s[pos + k]) : 0u;
    };
    auto cont = [&](std::size_t k, unsigned lo = 0x80, unsigned hi = 0xBF) {
        unsigned b = byte(k);
        return lo <= b and b <= hi;
    };
    unsigned lead = byte(0);
    if (pos >= s.size()) return 0;
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 and lead <= 0xDF) return cont(1) ? 2 : 0;
    if (lead == 0xE0) return cont(1, 0xA0) and cont(2) ? 3 : 0;
    if (lead == 0xED) return cont(1, 0x80, 0x9F) and cont(2) ? 3 : 0;
    if (lead >= 0xE1 and lead <= 0xEF) return cont(1) and cont(2) ? 3 : 0;
    if (lead == 0xF0) return cont(1, 0x90) and cont(2) and cont(3) ? 4 : 0;
    if (lead >= 0xF1 and lead <= 0xF3) return cont(1) and cont(2) and cont(3) ? 4 : 0;
    if (lead == 0xF4) return cont(1, 0x80, 0x8F) and cont(2) and cont(3) ? 4 : 0;
    return 0;
}

std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (static_cast<unsigned char>(c) >= 0x80) {
            std::size_t n = utf8_sequence_length(s, i);
            if (n == 0) {
                result += "\\ufffd";
            } else {
                result.append(s, i, n);
                i += n - 1;
            }
            continue;
        }
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

namespace {
    // Shortest decimal form that reads back as the same double. Always has a
    // fraction or exponent so that a reader does not take it for an Int.
    std::string format_float(double x) {
        if (not std::isfinite(x)) return "null";
        std::string s;
        for (int precision = 15; precision <= 17; ++precision) {
            std::ostringstream ss;
            ss.imbue(std::locale::classic());
            ss << std::setprecision(precision) << x;
            s = ss.str();
            if (std::strtod(s.c_str(), nullptr) == x) break;
        }
        if (s.find_first_of(".eE") == std::string::npos) s += ".0";
        return s;
    }

    bool is_scalar(const Value& v) { return not v.isList() and not v.isObject(); }

    class Writer {
      public:
        Writer(std::ostringstream& out, int indent) : out_(out), indent_(indent) {}

        void value(const Value& v, int level) {
            switch (v.type()) {
                case Value::Type::Int:
                    out_ << v.asInt();
                    return;
                case Value::Type::Float:
                    out_ << format_float(v.asFloat());
                    return;
                case Value::Type::Boolean:
                    out_ << (v.asBoolean() ? "true" : "false");
                    return;
                case Value::Type::String:
                    out_ << escape_json_string(v.asString().str());
                    return;
                case Value::Type::Enum:
                    out_ << escape_json_string(v.asEnum().str());
                    return;
                case Value::Type::List:
                    list(v.asList(), level);
                    return;
                case Value::Type::Object:
                    object(v.asObject(), level);
                    return;
                case Value::Type::Null:
                    out_ << "null";
                    return;
            }
        }

        void object(const Object& o, int level) {
            if (o.empty()) {
                out_ << "{}";
                return;
            }
            if (indent_ == 0) {
                out_ << '{';
                bool first = true;
                for (auto const& e : o.fields()) {
                    if (not first) out_ << ",";
                    first = false;
                    out_ << escape_json_string(e.first.str()) << ':';
                    value(e.second, level);
                }
                out_ << '}';
                return;
            }
            out_ << "{\n";
            std::size_t i = 0;
            for (auto const& e : o.fields()) {
                out_ << pad(level + indent_) << escape_json_string(e.first.str()) << ": ";
                value(e.second, level + indent_);
                out_ << (++i < o.size() ? ",\n" : "\n");
            }
            out_ << pad(level) << "}";
        }

        void list(const List& l, int level) {
            if (l.empty()) {
                out_ << "[]";
                return;
            }
            // Short lists of scalars stay on one line even when pretty-printing.
            bool inline_list = indent_ == 0;
            if (not inline_list and l.size() <= 3) {
                inline_list = true;
                for (auto const& el : l) inline_list = inline_list and is_scalar(el);
            }
            if (inline_list) {
                out_ << '[';
                for (std::size_t i = 0; i < l.size(); ++i) {
                    if (i) out_ << ",";
                    value(l.values()[i], level);
                }
                out_ << ']';
                return;
            }
            out_ << "[\n";
            for (std::size_t i = 0; i < l.size(); ++i) {
                out_ << pad(level + indent_);
                value(l.values()[i], level + indent_);
                out_ << (i + 1 < l.size() ? ",\n" : "\n");
            }
            out_ << pad(level) << "]";
        }

      private:
        static std::string pad(int n) { return std::string(static_cast<size_t>(n), ' '); }

        std::ostringstream& out_;
        int indent_;
    };
}

std::string dump(const Value& v, int indent) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    Writer(out, indent < 0 ? 0 : indent).value(v, 0);
    return out.str();
}

std::string dump(const Object& o, int indent) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    Writer(out, indent < 0 ? 0 : indent).object(o, 0);
    return out.str();
}

}  // namespace gql
