// schema_dsl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "schema_dsl/ast/json_visitor.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>

#include "schema_dsl/basic/casting.hpp"

namespace schema_dsl
{
namespace
{

using nlohmann::json;

class JsonWriter
{
public:
  explicit JsonWriter(bool with_ranges) : with_ranges_(with_ranges) {}

  json node(const AstNode * n) const
  {
    if (!n) return nullptr;

    if (const auto * s = dyn_cast<Schema>(n)) return schema(*s);
    if (const auto * m = dyn_cast<ModelDecl>(n)) return model(*m);
    if (const auto * f = dyn_cast<FieldDecl>(n)) return field(*f);
    if (const auto * u = dyn_cast<CompositeUniqueDecl>(n)) return composite_unique(*u);
    if (const auto * j = dyn_cast<JsonShapeDecl>(n)) return json_shape(*j);
    if (const auto * m = dyn_cast<JsonMemberDecl>(n)) return json_member(*m);

    return json{{"type", "Unknown"}};
  }

  json schema(const Schema & s) const
  {
    json models = json::array();
    for (const ModelDecl * m : s.models) {
      models.push_back(model(*m));
    }
    json j{{"type", "Schema"}, {"models", std::move(models)}};
    add_range(j, s);
    return j;
  }

private:
  template <typename Node>
  void add_range(json & j, const Node & n) const
  {
    if (!with_ranges_) return;
    if (!n.range.is_valid()) {
      j["range"] = json{{"start", nullptr}, {"end", nullptr}};
      return;
    }
    j["range"] = json{{"start", n.range.begin()}, {"end", n.range.end()}};
    if (n.loc.is_valid()) {
      j["line"] = n.loc.line;
      j["column"] = n.loc.column;
    }
  }

  json model(const ModelDecl & m) const
  {
    json fields = json::array();
    for (const FieldDecl * f : m.fields) {
      fields.push_back(field(*f));
    }
    json uniques = json::array();
    for (const CompositeUniqueDecl * u : m.combined_uniques) {
      uniques.push_back(composite_unique(*u));
    }

    json j{
      {"type", "Model"},
      {"name", std::string(m.name)},
      {"fields", std::move(fields)},
      {"combinedUniques", std::move(uniques)}};
    add_range(j, m);
    return j;
  }

  static json default_value(const DefaultValue & v)
  {
    return std::visit(
      [](const auto & d) -> json {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, FunctionCall>) {
          return json{{"function", std::string(to_string(d.function))}};
        } else {
          return std::visit(
            [](const auto & lit) -> json {
              using L = std::decay_t<decltype(lit)>;
              if constexpr (std::is_same_v<L, std::string_view>) {
                return json{{"value", std::string(lit)}};
              } else {
                return json{{"value", lit}};
              }
            },
            d.value);
        }
      },
      v);
  }

  json field(const FieldDecl & f) const
  {
    json j{
      {"type", "Field"},
      {"name", std::string(f.name)},
      {"fieldType", std::string(f.type_name)},
      {"isArray", f.is_array},
      {"primaryKey", f.is_primary_key},
      {"required", f.is_required},
      {"unique", f.is_unique}};

    if (f.default_value) {
      j["default"] = default_value(*f.default_value);
    }
    if (f.relation) {
      json rel{{"kind", std::string(to_string(f.relation->kind))}};
      if (f.relation->foreign_key) {
        rel["foreignKey"] = std::string(*f.relation->foreign_key);
      }
      j["relation"] = std::move(rel);
    }
    if (f.json_shape) {
      j["jsonShape"] = json_shape(*f.json_shape);
    }
    add_range(j, f);
    return j;
  }

  json composite_unique(const CompositeUniqueDecl & u) const
  {
    json fields = json::array();
    for (const std::string_view name : u.fields) {
      fields.push_back(std::string(name));
    }
    json j{{"type", "CompositeUnique"}, {"fields", std::move(fields)}};
    add_range(j, u);
    return j;
  }

  json json_shape(const JsonShapeDecl & s) const
  {
    json members = json::array();
    for (const JsonMemberDecl * m : s.members) {
      members.push_back(json_member(*m));
    }
    json j{{"type", "JsonShape"}, {"isArray", s.is_array}, {"members", std::move(members)}};
    if (s.members.empty()) {
      j["raw"] = std::string(s.raw);
    }
    add_range(j, s);
    return j;
  }

  json json_member(const JsonMemberDecl & m) const
  {
    json j{
      {"type", "JsonMember"},
      {"name", std::string(m.name)},
      {"optional", m.is_optional},
      {"isArray", m.is_array}};
    if (m.nested) {
      j["shape"] = json_shape(*m.nested);
    } else {
      j["memberType"] = std::string(m.type_name);
    }
    add_range(j, m);
    return j;
  }

  bool with_ranges_;
};

}  // namespace

nlohmann::json to_json(const AstNode * node, bool with_ranges)
{
  return JsonWriter(with_ranges).node(node);
}

nlohmann::json to_json(const Schema & schema, bool with_ranges)
{
  return JsonWriter(with_ranges).schema(schema);
}

}  // namespace schema_dsl
