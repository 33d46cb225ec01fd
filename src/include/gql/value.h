#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <gql/name.h>
#include <gql/ordered_map.h>

namespace gql {

// Nesting limit applied wherever a value tree is built from untrusted input.
constexpr std::size_t kDefaultMaxDepth = 512;

class Value;

// A GraphQL String scalar. Wrapped so that text values can never be mistaken
// for enum names.
class String {
  public:
    String() = default;
    explicit String(std::string text) : text_(std::move(text)) {}

    const std::string& str() const noexcept { return text_; }

    bool operator==(const String& rhs) const noexcept { return text_ == rhs.text_; }
    bool operator!=(const String& rhs) const noexcept { return text_ != rhs.text_; }
    bool operator<(const String& rhs) const noexcept { return text_ < rhs.text_; }

  private:
    std::string text_;
};

// An ordered sequence of values. Elements may be of mixed types; GraphQL
// forbids that but nothing here enforces it.
class List {
  public:
    using const_iterator = std::vector<Value>::const_iterator;

    List();
    explicit List(std::vector<Value> values);

    const std::vector<Value>& values() const noexcept { return values_; }

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    bool operator==(const List& rhs) const;
    bool operator!=(const List& rhs) const;
    bool operator<(const List& rhs) const;

  private:
    std::vector<Value> values_;
};

// A literal GraphQL object: unique field names in insertion order.
//
// An Object is immutable. The only ways to get a non-empty one are
// makeObject, objectFromList and unionObjects, all of which refuse duplicate
// names rather than picking a winner.
class Object {
  public:
    using map_type = OrderedMap<Name, Value>;

    Object() = default;

    const map_type& fields() const noexcept { return fields_; }
    const Value* lookup(const Name& name) const;
    std::size_t size() const noexcept;
    bool empty() const noexcept;

    bool operator==(const Object& rhs) const;
    bool operator!=(const Object& rhs) const;
    bool operator<(const Object& rhs) const;

  private:
    explicit Object(map_type fields);

    friend std::optional<Object> objectFromList(std::vector<std::pair<Name, Value>> pairs);
    friend std::optional<Object> unionObjects(const std::vector<Object>& objects);

    map_type fields_;
};

struct Null {
    bool operator==(const Null&) const noexcept { return true; }
    bool operator!=(const Null&) const noexcept { return false; }
    bool operator<(const Null&) const noexcept { return false; }
};

class Value {
  public:
    // Variant order is also the ordering between values of different types.
    enum class Type { Int, Float, Boolean, String, Enum, List, Object, Null };

    using variant_type = std::variant<int32_t, double, bool, gql::String, Name, gql::List,
                                      gql::Object, gql::Null>;

    Value() : v_(gql::Null{}) {}
    Value(int32_t x) : v_(x) {}
    Value(double x) : v_(x) {}
    Value(bool b) : v_(b) {}
    Value(gql::String s) : v_(std::move(s)) {}
    Value(Name enum_value) : v_(std::move(enum_value)) {}
    Value(gql::List l) : v_(std::move(l)) {}
    Value(gql::Object o) : v_(std::move(o)) {}
    Value(gql::Null n) : v_(n) {}

    // Text must be wrapped in gql::String (or Name for enums). Without this,
    // a string literal would silently become a Boolean.
    Value(const char*) = delete;

    static Value null() { return Value(); }

    Type type() const noexcept { return static_cast<Type>(v_.index()); }
    std::string typeName() const { return typeName(type()); }
    static std::string typeName(Type t);

    bool isInt() const noexcept { return std::holds_alternative<int32_t>(v_); }
    bool isFloat() const noexcept { return std::holds_alternative<double>(v_); }
    bool isBoolean() const noexcept { return std::holds_alternative<bool>(v_); }
    bool isString() const noexcept { return std::holds_alternative<gql::String>(v_); }
    bool isEnum() const noexcept { return std::holds_alternative<Name>(v_); }
    bool isList() const noexcept { return std::holds_alternative<gql::List>(v_); }
    bool isObject() const noexcept { return std::holds_alternative<gql::Object>(v_); }
    bool isNull() const noexcept { return std::holds_alternative<gql::Null>(v_); }

    // Checked accessors; throw std::logic_error on the wrong variant.
    int32_t asInt() const;
    double asFloat() const;
    bool asBoolean() const;
    const gql::String& asString() const;
    const Name& asEnum() const;
    const gql::List& asList() const;
    const gql::Object& asObject() const;

    const variant_type& variant() const noexcept { return v_; }

    // Debug rendering, e.g. Object({x: Int(1), y: Null}).
    std::string to_string() const;

    // Structural. Among Floats every NaN equals every other NaN and sorts
    // after all numbers, so equality is reflexive and ordering total.
    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return not(*this == rhs); }
    bool operator<(const Value& rhs) const;
    bool operator>(const Value& rhs) const { return rhs < *this; }
    bool operator<=(const Value& rhs) const { return not(rhs < *this); }
    bool operator>=(const Value& rhs) const { return not(*this < rhs); }

  private:
    variant_type v_;
};

// One (name, value) pair; the unit from which Objects are built.
struct ObjectField {
    Name name;
    Value value;

    ObjectField(Name n, Value v) : name(std::move(n)), value(std::move(v)) {}

    bool operator==(const ObjectField& rhs) const {
        return name == rhs.name and value == rhs.value;
    }
    bool operator!=(const ObjectField& rhs) const { return not(*this == rhs); }
};

inline std::ostream& operator<<(std::ostream& os, const Value& v) { return os << v.to_string(); }
std::ostream& operator<<(std::ostream& os, const Object& o);
std::ostream& operator<<(std::ostream& os, const ObjectField& f);

// The Object payload of `v`, or std::nullopt for every other variant.
std::optional<Object> toObject(const Value& v);

// Both return std::nullopt if two fields share a name.
std::optional<Object> makeObject(const std::vector<ObjectField>& fields);
std::optional<Object> objectFromList(std::vector<std::pair<Name, Value>> pairs);

// Concatenate the fields of `objects`. Fails if any name appears in more than
// one input.
std::optional<Object> unionObjects(const std::vector<Object>& objects);

std::vector<ObjectField> objectFields(const Object& o);

}  // namespace gql
