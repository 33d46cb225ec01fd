#include <gql/ast.h>
#include <gql/json.h>
#include <sstream>

namespace gql {
namespace ast {

namespace {
    void write_source(std::ostream& out, const Value& v) {
        struct Visitor {
            std::ostream& out;
            void operator()(int32_t x) const { out << x; }
            void operator()(double x) const { out << dump(gql::Value(x)); }
            void operator()(bool b) const { out << (b ? "true" : "false"); }
            void operator()(const StringValue& s) const { out << escape_json_string(s.text); }
            void operator()(const Name& n) const { out << n.str(); }
            void operator()(const ListValue& l) const {
                out << '[';
                for (size_t i = 0; i < l.values.size(); ++i) {
                    if (i) out << ", ";
                    write_source(out, l.values[i]);
                }
                out << ']';
            }
            void operator()(const ObjectValue& o) const {
                out << '{';
                for (size_t i = 0; i < o.fields.size(); ++i) {
                    if (i) out << ", ";
                    out << o.fields[i].name.str() << ": ";
                    write_source(out, o.fields[i].value);
                }
                out << '}';
            }
            void operator()(const NullValue&) const { out << "null"; }
            void operator()(const Variable& var) const { out << '$' << var.name.str(); }
        };
        std::visit(Visitor{out}, v.v);
    }
}

std::string to_string(const Value& v) {
    std::ostringstream ss;
    write_source(ss, v);
    return ss.str();
}

}  // namespace ast
}  // namespace gql
