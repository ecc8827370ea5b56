// schema_dsl/ast/ast.hpp - Schema AST node classes
//
// Nodes are allocated in an AstContext arena and must stay trivially
// destructible: strings are interned string_views, child lists are
// gsl::span over arena memory.
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string_view>
#include <variant>

#include "schema_dsl/ast/ast_enums.hpp"
#include "schema_dsl/basic/casting.hpp"
#include "schema_dsl/basic/source_file.hpp"

namespace schema_dsl
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * `loc` is the 1-based position of the node's defining token (the name
 * identifier for declarations). Introspected nodes carry invalid positions.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range;
  LineColumn loc;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

protected:
  AstNode(NodeKind k, SourceRange r, LineColumn lc) : kind(k), range(r), loc(lc) {}
  ~AstNode() = default;
};

/// CRTP helper providing classof() for a concrete node kind.
template <typename Derived, NodeKind K>
class NodeBase : public AstNode
{
public:
  static constexpr NodeKind node_kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}, LineColumn lc = {}) : AstNode(K, r, lc) {}
};

// ============================================================================
// Field attributes
// ============================================================================

/// Literal default: number, string or boolean.
struct LiteralValue
{
  std::variant<double, std::string_view, bool> value;
};

/// Function-call default such as `now()`.
struct FunctionCall
{
  DefaultFunction function = DefaultFunction::Now;
};

using DefaultValue = std::variant<LiteralValue, FunctionCall>;

[[nodiscard]] inline bool is_function(const DefaultValue & v, DefaultFunction f) noexcept
{
  const auto * call = std::get_if<FunctionCall>(&v);
  return call != nullptr && call->function == f;
}

struct Relation
{
  RelationKind kind = RelationKind::ManyToOne;
  /// Column (or join table, for many_to_many) named in the decorator.
  std::optional<std::string_view> foreign_key;
};

// ============================================================================
// JSON shape nodes
// ============================================================================

class JsonShapeDecl;

/// One member of a json field shape: `name?: type[]`, `name: type | null` or `name: { ... }`.
class JsonMemberDecl : public NodeBase<JsonMemberDecl, NodeKind::JsonMember>
{
public:
  std::string_view name;
  /// Empty when the member is a nested object (`nested` is set).
  std::string_view type_name;
  bool is_optional = false;
  bool is_array = false;
  const JsonShapeDecl * nested = nullptr;

  JsonMemberDecl(std::string_view n, SourceRange r = {}, LineColumn lc = {})
  : NodeBase(r, lc), name(n)
  {
  }
};

/// The `{ ... }` block following a `json` field type. `members` stays empty
/// when the block is not a member list; `raw` always holds the block text.
class JsonShapeDecl : public NodeBase<JsonShapeDecl, NodeKind::JsonShape>
{
public:
  std::string_view raw;
  bool is_array = false;
  gsl::span<JsonMemberDecl *> members;

  explicit JsonShapeDecl(std::string_view raw_text, SourceRange r = {}, LineColumn lc = {})
  : NodeBase(r, lc), raw(raw_text)
  {
  }
};

// ============================================================================
// Declarations
// ============================================================================

class FieldDecl : public NodeBase<FieldDecl, NodeKind::Field>
{
public:
  std::string_view name;
  /// Primitive name, model name or custom type name as written.
  std::string_view type_name;
  /// Set when type_name is a primitive.
  std::optional<ScalarType> scalar;
  bool is_array = false;
  bool is_primary_key = false;
  bool is_required = false;
  bool is_unique = false;
  std::optional<DefaultValue> default_value;
  std::optional<Relation> relation;
  const JsonShapeDecl * json_shape = nullptr;

  FieldDecl(std::string_view n, SourceRange r = {}, LineColumn lc = {}) : NodeBase(r, lc), name(n)
  {
  }

  /// True for fields stored as a table column.
  [[nodiscard]] bool is_column() const noexcept { return scalar.has_value(); }

  /// Column nullability: primary keys are implicitly NOT NULL.
  [[nodiscard]] bool is_not_null() const noexcept { return is_required || is_primary_key; }

  [[nodiscard]] bool has_relation(RelationKind k) const noexcept
  {
    return relation.has_value() && relation->kind == k;
  }
};

/// `@@unique([a, b])`
class CompositeUniqueDecl : public NodeBase<CompositeUniqueDecl, NodeKind::CompositeUnique>
{
public:
  gsl::span<std::string_view> fields;
  gsl::span<SourceRange> field_ranges;

  explicit CompositeUniqueDecl(SourceRange r = {}, LineColumn lc = {}) : NodeBase(r, lc) {}
};

class ModelDecl : public NodeBase<ModelDecl, NodeKind::Model>
{
public:
  std::string_view name;
  SourceRange name_range;
  gsl::span<FieldDecl *> fields;
  gsl::span<CompositeUniqueDecl *> combined_uniques;

  ModelDecl(std::string_view n, SourceRange r = {}, LineColumn lc = {}) : NodeBase(r, lc), name(n)
  {
  }

  [[nodiscard]] const FieldDecl * find_field(std::string_view field_name) const noexcept;

  /// First primary-key column, or nullptr.
  [[nodiscard]] const FieldDecl * primary_key() const noexcept;
};

// ============================================================================
// Schema (Root Node)
// ============================================================================

class Schema : public NodeBase<Schema, NodeKind::Schema>
{
public:
  gsl::span<ModelDecl *> models;

  explicit Schema(SourceRange r = {}) : NodeBase(r) {}

  [[nodiscard]] const ModelDecl * find_model(std::string_view model_name) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return models.empty(); }
};

}  // namespace schema_dsl
