#include <gql/value.h>
#include <gql/json.h>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace gql {

// List

List::List() = default;

List::List(std::vector<Value> values) : values_(std::move(values)) {}

std::size_t List::size() const noexcept { return values_.size(); }
bool List::empty() const noexcept { return values_.empty(); }
List::const_iterator List::begin() const noexcept { return values_.begin(); }
List::const_iterator List::end() const noexcept { return values_.end(); }

bool List::operator==(const List& rhs) const { return values_ == rhs.values_; }
bool List::operator!=(const List& rhs) const { return values_ != rhs.values_; }
bool List::operator<(const List& rhs) const { return values_ < rhs.values_; }

// Object

Object::Object(map_type fields) : fields_(std::move(fields)) {}

const Value* Object::lookup(const Name& name) const { return fields_.lookup(name); }
std::size_t Object::size() const noexcept { return fields_.size(); }
bool Object::empty() const noexcept { return fields_.empty(); }

bool Object::operator==(const Object& rhs) const { return fields_ == rhs.fields_; }
bool Object::operator!=(const Object& rhs) const { return fields_ != rhs.fields_; }
bool Object::operator<(const Object& rhs) const { return fields_ < rhs.fields_; }

std::optional<Object> toObject(const Value& v) {
    if (not v.isObject()) return std::nullopt;
    return v.asObject();
}

std::optional<Object> makeObject(const std::vector<ObjectField>& fields) {
    std::vector<std::pair<Name, Value>> pairs;
    pairs.reserve(fields.size());
    for (auto const& f : fields) pairs.emplace_back(f.name, f.value);
    return objectFromList(std::move(pairs));
}

std::optional<Object> objectFromList(std::vector<std::pair<Name, Value>> pairs) {
    auto fields = Object::map_type::fromList(std::move(pairs));
    if (not fields) return std::nullopt;
    return Object(std::move(*fields));
}

std::optional<Object> unionObjects(const std::vector<Object>& objects) {
    std::vector<Object::map_type> maps;
    maps.reserve(objects.size());
    for (auto const& o : objects) maps.push_back(o.fields_);
    auto merged = Object::map_type::unions(maps);
    if (not merged) return std::nullopt;
    return Object(std::move(*merged));
}

std::vector<ObjectField> objectFields(const Object& o) {
    std::vector<ObjectField> out;
    out.reserve(o.size());
    for (auto const& e : o.fields()) out.emplace_back(e.first, e.second);
    return out;
}

// Value

std::string Value::typeName(Type t) {
    switch (t) {
        case Type::Int:
            return "Int";
        case Type::Float:
            return "Float";
        case Type::Boolean:
            return "Boolean";
        case Type::String:
            return "String";
        case Type::Enum:
            return "Enum";
        case Type::List:
            return "List";
        case Type::Object:
            return "Object";
        case Type::Null:
            return "Null";
    }
    throw std::logic_error("Not a valid type");
}

namespace {
    // -1, 0 or 1. NaN is greater than any number and equal to itself.
    int compare_floats(double a, double b) {
        bool a_nan = std::isnan(a), b_nan = std::isnan(b);
        if (a_nan or b_nan) return int(a_nan) - int(b_nan);
        return a < b ? -1 : (b < a ? 1 : 0);
    }
}

bool Value::operator==(const Value& rhs) const {
    if (v_.index() != rhs.v_.index()) return false;
    if (isFloat()) return compare_floats(std::get<double>(v_), std::get<double>(rhs.v_)) == 0;
    return v_ == rhs.v_;
}

bool Value::operator<(const Value& rhs) const {
    if (v_.index() != rhs.v_.index()) return v_.index() < rhs.v_.index();
    if (isFloat()) return compare_floats(std::get<double>(v_), std::get<double>(rhs.v_)) < 0;
    return v_ < rhs.v_;
}

namespace {
    [[noreturn]] void wrong_variant(const char* wanted, const Value& v) {
        throw std::logic_error(std::string("not ") + wanted + ": " + v.to_string());
    }
}

int32_t Value::asInt() const {
    if (not isInt()) wrong_variant("an Int", *this);
    return std::get<int32_t>(v_);
}

double Value::asFloat() const {
    if (not isFloat()) wrong_variant("a Float", *this);
    return std::get<double>(v_);
}

bool Value::asBoolean() const {
    if (not isBoolean()) wrong_variant("a Boolean", *this);
    return std::get<bool>(v_);
}

const gql::String& Value::asString() const {
    if (not isString()) wrong_variant("a String", *this);
    return std::get<gql::String>(v_);
}

const Name& Value::asEnum() const {
    if (not isEnum()) wrong_variant("an Enum", *this);
    return std::get<Name>(v_);
}

const gql::List& Value::asList() const {
    if (not isList()) wrong_variant("a List", *this);
    return std::get<gql::List>(v_);
}

const gql::Object& Value::asObject() const {
    if (not isObject()) wrong_variant("an Object", *this);
    return std::get<gql::Object>(v_);
}

namespace {
    void write_debug(std::ostream& out, const Value& v);

    void write_debug_fields(std::ostream& out, const Object& o) {
        out << '{';
        bool first = true;
        for (auto const& e : o.fields()) {
            if (not first) out << ", ";
            first = false;
            out << e.first.str() << ": ";
            write_debug(out, e.second);
        }
        out << '}';
    }

    void write_debug(std::ostream& out, const Value& v) {
        switch (v.type()) {
            case Value::Type::Int:
                out << "Int(" << v.asInt() << ")";
                return;
            case Value::Type::Float:
                out << "Float(" << dump(v) << ")";
                return;
            case Value::Type::Boolean:
                out << "Boolean(" << (v.asBoolean() ? "true" : "false") << ")";
                return;
            case Value::Type::String:
                out << "String(" << escape_json_string(v.asString().str()) << ")";
                return;
            case Value::Type::Enum:
                out << "Enum(" << v.asEnum().str() << ")";
                return;
            case Value::Type::List: {
                out << "List([";
                bool first = true;
                for (auto const& el : v.asList()) {
                    if (not first) out << ", ";
                    first = false;
                    write_debug(out, el);
                }
                out << "])";
                return;
            }
            case Value::Type::Object:
                out << "Object(";
                write_debug_fields(out, v.asObject());
                out << ")";
                return;
            case Value::Type::Null:
                out << "Null";
                return;
        }
    }
}

std::string Value::to_string() const {
    std::ostringstream ss;
    write_debug(ss, *this);
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Object& o) {
    write_debug_fields(os, o);
    return os;
}

std::ostream& operator<<(std::ostream& os, const ObjectField& f) {
    return os << f.name.str() << ": " << f.value.to_string();
}

}  // namespace gql
