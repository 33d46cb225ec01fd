// gqlvalue: canonical GraphQL literal values and their conversions
#pragma once

#include <gql/name.h>
#include <gql/ordered_map.h>
#include <gql/value.h>
#include <gql/ast.h>
#include <gql/ast_bridge.h>
#include <gql/result.h>
#include <gql/non_empty.h>
#include <gql/marshal.h>
#include <gql/json.h>
