#include <gql/result.h>
#include <ostream>

namespace gql {

ConversionError ConversionError::wrongType(std::string expected, Value actual) {
    return ConversionError(Kind::WrongType, std::move(expected), std::move(actual));
}

ConversionError ConversionError::emptyList(Value actual) {
    return ConversionError(Kind::EmptyList, "", std::move(actual));
}

ConversionError ConversionError::invalid(std::string message, Value actual) {
    return ConversionError(Kind::Invalid, std::move(message), std::move(actual));
}

std::string ConversionError::message() const {
    switch (kind_) {
        case Kind::WrongType:
            return "Wrong type, should be " + detail_ + ": " + actual_.to_string();
        case Kind::EmptyList:
            return "Cannot construct NonEmptyList from empty list";
        case Kind::Invalid:
            return detail_ + ": " + actual_.to_string();
    }
    return detail_;
}

std::ostream& operator<<(std::ostream& os, const ConversionError& e) { return os << e.message(); }

}  // namespace gql
