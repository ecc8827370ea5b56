// schema_dsl/migrate/introspector.hpp - Reconstruct a Schema from a live database
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/db/connection.hpp"
#include "schema_dsl/migrate/catalog.hpp"

namespace schema_dsl
{

/// Maps a declared column type of any supported engine to a scalar type.
/// Unknown types map to ScalarType::String.
[[nodiscard]] ScalarType map_native_type(std::string_view native_type);

/// Parses a catalog default expression back into a default value.
///
/// Sequence defaults become autoincrement(), current-timestamp expressions
/// now(), random-UUID expressions uuid(). Quoted strings lose their quotes
/// and Postgres `::type` casts. Anything unrecognized is kept verbatim as a
/// string literal.
[[nodiscard]] std::optional<DefaultValue> parse_default_expression(
  std::string_view expr, ScalarType type, AstContext & ast);

/// `category` -> `categories`, `tags` -> `tags`, `user` -> `users`.
[[nodiscard]] std::string pluralize(std::string_view word);

/**
 * Builds a Schema from a catalog snapshot.
 *
 * Models are ordered by table name and fields by physical column order.
 * Every single-column foreign key marks its column as a many_to_one
 * relation; a relation field named after the referenced table is added
 * when the model has no field of that name. Tables holding exactly two
 * foreign keys and no other data columns are folded into many_to_many
 * fields on both participants.
 */
[[nodiscard]] Schema * build_schema(const CatalogSnapshot & snapshot, AstContext & ast);

class Introspector
{
public:
  explicit Introspector(db::Connection & conn) : conn_(conn) {}

  /// Reads the live schema into `ast`. Throws db::DatabaseError.
  [[nodiscard]] Schema * introspect(AstContext & ast);

private:
  db::Connection & conn_;
};

}  // namespace schema_dsl
