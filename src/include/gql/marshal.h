#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <gql/non_empty.h>
#include <gql/result.h>
#include <gql/value.h>

namespace gql {

// Conversions between native C++ types and gql::Value.
//
// A type opts in by specializing one or both of:
//
//     template <> struct ToValue<Point> {
//         static Value convert(const Point& p);
//     };
//
//     template <> struct FromValue<Point> {
//         static Result<Point> convert(const Value& v);
//     };
//
// ToValue cannot fail. FromValue is where untrusted data becomes typed data,
// so every failure comes back as a ConversionError, never an exception.
// There is no primary definition: using a type with no specialization is a
// compile error.

template <typename T>
struct ToValue;

template <typename T>
struct FromValue;

template <typename T>
Value toValue(const T& x) {
    return ToValue<T>::convert(x);
}

template <typename T>
Result<T> fromValue(const Value& v) {
    return FromValue<T>::convert(v);
}

// ToValue

template <>
struct ToValue<Value> {
    static Value convert(const Value& v) { return v; }
};

template <>
struct ToValue<bool> {
    static Value convert(bool b) { return Value(b); }
};

template <>
struct ToValue<int32_t> {
    static Value convert(int32_t x) { return Value(x); }
};

template <>
struct ToValue<double> {
    static Value convert(double x) { return Value(x); }
};

template <>
struct ToValue<String> {
    static Value convert(const String& s) { return Value(s); }
};

template <>
struct ToValue<std::string> {
    static Value convert(const std::string& s) { return Value(String(s)); }
};

template <>
struct ToValue<const char*> {
    static Value convert(const char* s) { return Value(String(s)); }
};

template <std::size_t N>
struct ToValue<char[N]> {
    static Value convert(const char (&s)[N]) { return Value(String(s)); }
};

// Names convert to Enum values.
template <>
struct ToValue<Name> {
    static Value convert(const Name& n) { return Value(n); }
};

template <>
struct ToValue<List> {
    static Value convert(const List& l) { return Value(l); }
};

template <>
struct ToValue<Object> {
    static Value convert(const Object& o) { return Value(o); }
};

template <typename T>
struct ToValue<std::vector<T>> {
    static Value convert(const std::vector<T>& xs) {
        std::vector<Value> out;
        out.reserve(xs.size());
        for (auto const& x : xs) out.push_back(ToValue<T>::convert(x));
        return Value(List(std::move(out)));
    }
};

template <typename T>
struct ToValue<NonEmptyList<T>> {
    static Value convert(const NonEmptyList<T>& xs) { return ToValue<std::vector<T>>::convert(xs.toVector()); }
};

template <typename T>
struct ToValue<std::optional<T>> {
    static Value convert(const std::optional<T>& x) {
        if (not x) return Value::null();
        return ToValue<T>::convert(*x);
    }
};

// FromValue

template <>
struct FromValue<Value> {
    static Result<Value> convert(const Value& v) { return v; }
};

template <>
struct FromValue<bool> {
    static Result<bool> convert(const Value& v);
};

template <>
struct FromValue<int32_t> {
    static Result<int32_t> convert(const Value& v);
};

template <>
struct FromValue<double> {
    static Result<double> convert(const Value& v);
};

template <>
struct FromValue<String> {
    static Result<String> convert(const Value& v);
};

template <>
struct FromValue<std::string> {
    static Result<std::string> convert(const Value& v);
};

template <>
struct FromValue<Name> {
    static Result<Name> convert(const Value& v);
};

template <>
struct FromValue<List> {
    static Result<List> convert(const Value& v);
};

template <>
struct FromValue<Object> {
    static Result<Object> convert(const Value& v);
};

// Expects a List; fails on the first element that does not convert.
template <typename T>
struct FromValue<std::vector<T>> {
    static Result<std::vector<T>> convert(const Value& v) {
        if (not v.isList()) return ConversionError::wrongType("List", v);
        std::vector<T> out;
        out.reserve(v.asList().size());
        for (auto const& el : v.asList()) {
            Result<T> x = FromValue<T>::convert(el);
            if (not x) return x.error();
            out.push_back(std::move(x).value());
        }
        return Result<std::vector<T>>(std::move(out));
    }
};

// An empty list is reported as EmptyList, not as WrongType.
template <typename T>
struct FromValue<NonEmptyList<T>> {
    static Result<NonEmptyList<T>> convert(const Value& v) {
        if (not v.isList()) return ConversionError::wrongType("List", v);
        if (v.asList().empty()) return ConversionError::emptyList(v);
        Result<std::vector<T>> xs = FromValue<std::vector<T>>::convert(v);
        if (not xs) return xs.error();
        return *NonEmptyList<T>::fromVector(std::move(xs).value());
    }
};

// Null is "absent"; anything else must convert to T.
template <typename T>
struct FromValue<std::optional<T>> {
    static Result<std::optional<T>> convert(const Value& v) {
        if (v.isNull()) return std::optional<T>();
        Result<T> x = FromValue<T>::convert(v);
        if (not x) return x.error();
        return std::optional<T>(std::move(x).value());
    }
};

// Read field `name` of `o` as a T, for FromValue specializations of
// Object-shaped types. A missing field reads as Null, so optional fields may
// be left out; for any other T it is an Invalid error.
template <typename T>
Result<T> fieldFromValue(const Object& o, const Name& name) {
    const Value* field = o.lookup(name);
    if (field) return FromValue<T>::convert(*field);
    Result<T> absent = FromValue<T>::convert(Value::null());
    if (absent) return absent;
    return ConversionError::invalid("missing field '" + name.str() + "'", Value(o));
}

}  // namespace gql
