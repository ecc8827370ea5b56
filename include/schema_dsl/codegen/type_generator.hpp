// schema_dsl/codegen/type_generator.hpp - Generate C++ record types from a schema
#pragma once

#include <string>

#include "schema_dsl/ast/ast.hpp"

namespace schema_dsl
{

struct TypeGeneratorOptions
{
  /// Namespace wrapping the generated declarations.
  std::string namespace_name = "models";
  /// Shown in the header banner; empty omits it.
  std::string source_name;
};

/**
 * Emits a self-contained C++ header with one struct per model.
 *
 * Scalar columns map to fixed C++ types; fields that are neither required
 * nor primary keys become std::optional. Relation fields hold
 * std::shared_ptr to the target (std::vector for collections). JSON shapes
 * become nested structs named `<model>_<field>`.
 *
 * The header also provides a ModelName enum, a `model_names` table and a
 * ModelType<ModelName> trait mapping each name to its struct.
 */
class TypeGenerator
{
public:
  TypeGenerator() = default;

  [[nodiscard]] static std::string generate(
    const Schema & schema, const TypeGeneratorOptions & options = {});
};

}  // namespace schema_dsl
