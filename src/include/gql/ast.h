#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <gql/name.h>

namespace gql {
namespace ast {

// Value nodes as a query parser produces them. Unlike gql::Value these may
// contain variable references, and object fields are kept exactly as written
// (duplicates included) so that validation can report them later.

struct Value;

struct StringValue {
    std::string text;

    bool operator==(const StringValue& rhs) const { return text == rhs.text; }
    bool operator!=(const StringValue& rhs) const { return text != rhs.text; }
};

struct Variable {
    Name name;

    bool operator==(const Variable& rhs) const { return name == rhs.name; }
    bool operator!=(const Variable& rhs) const { return name != rhs.name; }
};

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
    bool operator!=(const NullValue&) const { return false; }
};

struct ListValue {
    std::vector<Value> values;

    bool operator==(const ListValue& rhs) const;
    bool operator!=(const ListValue& rhs) const;
};

struct ObjectField;

struct ObjectValue {
    std::vector<ObjectField> fields;

    bool operator==(const ObjectValue& rhs) const;
    bool operator!=(const ObjectValue& rhs) const;
};

struct Value {
    using variant_type = std::variant<int32_t, double, bool, StringValue, Name, ListValue,
                                      ObjectValue, NullValue, Variable>;

    variant_type v;

    Value() : v(NullValue{}) {}
    Value(int32_t x) : v(x) {}
    Value(double x) : v(x) {}
    Value(bool b) : v(b) {}
    Value(StringValue s) : v(std::move(s)) {}
    Value(Name enum_value) : v(std::move(enum_value)) {}
    Value(ListValue l) : v(std::move(l)) {}
    Value(ObjectValue o) : v(std::move(o)) {}
    Value(NullValue n) : v(n) {}
    Value(Variable var) : v(std::move(var)) {}
    Value(const char*) = delete;

    bool isVariable() const noexcept { return std::holds_alternative<Variable>(v); }

    bool operator==(const Value& rhs) const { return v == rhs.v; }
    bool operator!=(const Value& rhs) const { return v != rhs.v; }
};

struct ObjectField {
    Name name;
    Value value;

    ObjectField(Name n, Value val) : name(std::move(n)), value(std::move(val)) {}

    bool operator==(const ObjectField& rhs) const {
        return name == rhs.name and value == rhs.value;
    }
    bool operator!=(const ObjectField& rhs) const { return not(*this == rhs); }
};

inline bool ListValue::operator==(const ListValue& rhs) const { return values == rhs.values; }
inline bool ListValue::operator!=(const ListValue& rhs) const { return values != rhs.values; }
inline bool ObjectValue::operator==(const ObjectValue& rhs) const { return fields == rhs.fields; }
inline bool ObjectValue::operator!=(const ObjectValue& rhs) const { return fields != rhs.fields; }

// GraphQL source form, e.g. {x: 1, tags: ["a", $tag], mode: FAST}.
std::string to_string(const Value& v);
inline std::ostream& operator<<(std::ostream& os, const Value& v) { return os << to_string(v); }

}  // namespace ast
}  // namespace gql
