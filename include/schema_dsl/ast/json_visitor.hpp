// schema_dsl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Used by `sdc dump` and `sdc introspect`, and by tests comparing parsed
// and introspected schemas structurally.
//
#pragma once

#include <nlohmann/json.hpp>

#include "schema_dsl/ast/ast.hpp"

namespace schema_dsl
{

/**
 * Serialize any AST node to JSON.
 *
 * Every object carries a "type" member naming the node kind. Source
 * positions are included only when `with_ranges` is set, so that parsed and
 * introspected schemas can be compared directly.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node, bool with_ranges = true);

/// Serialize a whole schema.
[[nodiscard]] nlohmann::json to_json(const Schema & schema, bool with_ranges = true);

}  // namespace schema_dsl
