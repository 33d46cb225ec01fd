#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include <gql/value.h>

namespace gql {

// Why a Value could not be converted to a native type. Always carries the
// offending value for diagnostics.
class ConversionError {
  public:
    enum class Kind {
        WrongType,  // the value is not of the expected variant
        EmptyList,  // a list was required to have at least one element
        Invalid     // right variant, wrong shape (reported by user conversions)
    };

    static ConversionError wrongType(std::string expected, Value actual);
    static ConversionError emptyList(Value actual);
    static ConversionError invalid(std::string message, Value actual);

    Kind kind() const noexcept { return kind_; }
    // Expected type name for WrongType, the free-form text for Invalid.
    const std::string& detail() const noexcept { return detail_; }
    const Value& actual() const noexcept { return actual_; }

    std::string message() const;

    bool operator==(const ConversionError& rhs) const {
        return kind_ == rhs.kind_ and detail_ == rhs.detail_ and actual_ == rhs.actual_;
    }
    bool operator!=(const ConversionError& rhs) const { return not(*this == rhs); }

  private:
    ConversionError(Kind kind, std::string detail, Value actual)
        : kind_(kind), detail_(std::move(detail)), actual_(std::move(actual)) {}

    Kind kind_;
    std::string detail_;
    Value actual_;
};

std::ostream& operator<<(std::ostream& os, const ConversionError& e);

// Either a converted T or the ConversionError that prevented it.
template <typename T>
class Result {
  public:
    Result(T value) : v_(std::in_place_index<0>, std::move(value)) {}
    Result(ConversionError error) : v_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const noexcept { return v_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    // Throws std::logic_error carrying the error message if !ok().
    const T& value() const& {
        if (not ok()) throw std::logic_error(std::get<1>(v_).message());
        return std::get<0>(v_);
    }

    T&& value() && {
        if (not ok()) throw std::logic_error(std::get<1>(v_).message());
        return std::get<0>(std::move(v_));
    }

    // Throws std::logic_error if ok().
    const ConversionError& error() const {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(v_);
    }

    bool operator==(const Result& rhs) const { return v_ == rhs.v_; }
    bool operator!=(const Result& rhs) const { return v_ != rhs.v_; }

  private:
    std::variant<T, ConversionError> v_;
};

}  // namespace gql
