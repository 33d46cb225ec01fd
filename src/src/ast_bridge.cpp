#include <gql/ast_bridge.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <variant>

namespace gql {

namespace {
    void debug_absent(const std::string& reason, const ast::Value& node) {
        if (std::getenv("GQL_VALUE_DEBUG")) {
            std::cerr << "astToValue: " << reason << " in " << ast::to_string(node) << "\n";
        }
    }

    std::optional<Value> convert(const ast::Value& node, std::size_t depth, std::size_t max_depth);

    struct AstToValue {
        const ast::Value& node;
        std::size_t depth;
        std::size_t max_depth;

        // `depth` counts the lists and objects enclosing `node`.
        bool too_deep() const {
            if (depth < max_depth) return false;
            debug_absent("nesting deeper than " + std::to_string(max_depth), node);
            return true;
        }

        std::optional<Value> operator()(int32_t x) const { return Value(x); }
        std::optional<Value> operator()(double x) const { return Value(x); }
        std::optional<Value> operator()(bool b) const { return Value(b); }
        std::optional<Value> operator()(const ast::StringValue& s) const { return Value(String(s.text)); }
        std::optional<Value> operator()(const Name& n) const { return Value(n); }
        std::optional<Value> operator()(const ast::NullValue&) const { return Value::null(); }

        std::optional<Value> operator()(const ast::Variable&) const {
            debug_absent("variable is not a literal", node);
            return std::nullopt;
        }

        std::optional<Value> operator()(const ast::ListValue& l) const {
            if (too_deep()) return std::nullopt;
            std::vector<Value> out;
            out.reserve(l.values.size());
            for (auto const& el : l.values) {
                auto v = convert(el, depth + 1, max_depth);
                if (not v) return std::nullopt;
                out.push_back(std::move(*v));
            }
            return Value(List(std::move(out)));
        }

        std::optional<Value> operator()(const ast::ObjectValue& o) const {
            if (too_deep()) return std::nullopt;
            std::vector<ObjectField> fields;
            fields.reserve(o.fields.size());
            for (auto const& f : o.fields) {
                auto v = convert(f.value, depth + 1, max_depth);
                if (not v) return std::nullopt;
                fields.emplace_back(f.name, std::move(*v));
            }
            auto object = makeObject(fields);
            if (not object) {
                debug_absent("duplicate field name", node);
                return std::nullopt;
            }
            return Value(std::move(*object));
        }
    };

    std::optional<Value> convert(const ast::Value& node, std::size_t depth, std::size_t max_depth) {
        return std::visit(AstToValue{node, depth, max_depth}, node.v);
    }

    struct ValueToAst {
        ast::Value operator()(int32_t x) const { return ast::Value(x); }
        ast::Value operator()(double x) const { return ast::Value(x); }
        ast::Value operator()(bool b) const { return ast::Value(b); }
        ast::Value operator()(const String& s) const { return ast::Value(ast::StringValue{s.str()}); }
        ast::Value operator()(const Name& n) const { return ast::Value(n); }
        ast::Value operator()(const Null&) const { return ast::Value(ast::NullValue{}); }

        ast::Value operator()(const List& l) const {
            ast::ListValue out;
            out.values.reserve(l.size());
            for (auto const& el : l) out.values.push_back(valueToAST(el));
            return ast::Value(std::move(out));
        }

        ast::Value operator()(const Object& o) const {
            ast::ObjectValue out;
            out.fields.reserve(o.size());
            for (auto const& e : o.fields()) out.fields.emplace_back(e.first, valueToAST(e.second));
            return ast::Value(std::move(out));
        }
    };
}

std::optional<Value> astToValue(const ast::Value& node, std::size_t max_depth) {
    return convert(node, 0, max_depth);
}

ast::Value valueToAST(const Value& v) { return std::visit(ValueToAst{}, v.variant()); }

}  // namespace gql
