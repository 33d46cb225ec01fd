#pragma once

#include <cstddef>
#include <optional>

#include <gql/ast.h>
#include <gql/value.h>

namespace gql {

// Convert a parsed literal into a canonical value.
//
// Returns std::nullopt when the node is not a literal: it is, or contains, a
// variable reference, an object with a repeated field name, or nesting deeper
// than `max_depth`. Variables are expected here and are resolved elsewhere;
// absence is not an error.
//
// Set GQL_VALUE_DEBUG in the environment to have the reason for each absent
// result written to stderr.
std::optional<Value> astToValue(const ast::Value& node, std::size_t max_depth = kDefaultMaxDepth);

// The inverse of astToValue. Never fails. astToValue(valueToAST(v), d) == v,
// with object field order kept, for every v nested no deeper than d; deeper
// values need a larger d to come back.
ast::Value valueToAST(const Value& v);

}  // namespace gql
