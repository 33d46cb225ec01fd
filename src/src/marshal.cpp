#include <gql/marshal.h>

namespace gql {

Result<bool> FromValue<bool>::convert(const Value& v) {
    if (not v.isBoolean()) return ConversionError::wrongType("Boolean", v);
    return v.asBoolean();
}

Result<int32_t> FromValue<int32_t>::convert(const Value& v) {
    if (not v.isInt()) return ConversionError::wrongType("Int", v);
    return v.asInt();
}

Result<double> FromValue<double>::convert(const Value& v) {
    if (not v.isFloat()) return ConversionError::wrongType("Float", v);
    return v.asFloat();
}

Result<String> FromValue<String>::convert(const Value& v) {
    if (not v.isString()) return ConversionError::wrongType("String", v);
    return v.asString();
}

Result<std::string> FromValue<std::string>::convert(const Value& v) {
    if (not v.isString()) return ConversionError::wrongType("String", v);
    return v.asString().str();
}

Result<Name> FromValue<Name>::convert(const Value& v) {
    if (not v.isEnum()) return ConversionError::wrongType("Enum", v);
    return v.asEnum();
}

Result<List> FromValue<List>::convert(const Value& v) {
    if (not v.isList()) return ConversionError::wrongType("List", v);
    return v.asList();
}

Result<Object> FromValue<Object>::convert(const Value& v) {
    if (not v.isObject()) return ConversionError::wrongType("Object", v);
    return v.asObject();
}

}  // namespace gql
