// schema_dsl/codegen/type_generator.cpp
#include "schema_dsl/codegen/type_generator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <utility>

namespace schema_dsl
{

namespace
{

constexpr std::array<std::string_view, 38> k_cpp_keywords = {
  "auto",     "bool",      "break",    "case",     "catch",    "char",      "class",
  "const",    "continue",  "default",  "delete",   "do",       "double",    "else",
  "enum",     "explicit",  "export",   "extern",   "false",    "float",     "for",
  "friend",   "goto",      "if",       "int",      "long",     "namespace", "new",
  "operator", "private",   "public",   "return",   "short",    "struct",    "template",
  "this",     "true",      "union",
};

std::string identifier(std::string_view name)
{
  std::string out(name);
  if (std::find(k_cpp_keywords.begin(), k_cpp_keywords.end(), name) != k_cpp_keywords.end()) {
    out += '_';
  }
  return out;
}

std::string_view scalar_cpp_type(ScalarType type)
{
  switch (type) {
    case ScalarType::Int:
      return "std::int64_t";
    case ScalarType::Float:
      return "double";
    case ScalarType::Boolean:
      return "bool";
    case ScalarType::String:
    case ScalarType::Json:
    case ScalarType::DateTime:
    case ScalarType::Date:
      return "std::string";
  }
  return "std::string";
}

class HeaderEmitter
{
public:
  HeaderEmitter(const Schema & schema, const TypeGeneratorOptions & options)
  : schema_(schema), options_(options)
  {
  }

  std::string run()
  {
    emit_prologue();

    for (const ModelDecl * model : schema_.models) {
      line("struct {};", identifier(model->name));
    }
    if (!schema_.models.empty()) {
      line("");
    }

    for (const ModelDecl * model : schema_.models) {
      emit_json_shapes(*model);
      emit_model(*model);
    }

    emit_name_map();
    line("}}  // namespace {}", options_.namespace_name);
    return std::move(out_);
  }

private:
  template <typename... Args>
  void line(fmt::format_string<Args...> format, Args &&... args)
  {
    fmt::format_to(std::back_inserter(out_), format, std::forward<Args>(args)...);
    out_ += '\n';
  }

  void emit_prologue()
  {
    if (options_.source_name.empty()) {
      line("// Generated by sdc. Do not edit.");
    } else {
      line("// Generated by sdc from {}. Do not edit.", options_.source_name);
    }
    line("#pragma once");
    line("");
    for (const std::string_view header :
         {"<array>", "<cstdint>", "<memory>", "<optional>", "<string>", "<string_view>",
          "<vector>"}) {
      line("#include {}", header);
    }
    line("");
    line("namespace {}", options_.namespace_name);
    line("{{");
    line("");
  }

  /// Emits nested structs children-first so every member type is complete.
  void emit_shape(const JsonShapeDecl & shape, const std::string & struct_name)
  {
    for (const JsonMemberDecl * member : shape.members) {
      if (member->nested != nullptr) {
        emit_shape(*member->nested, fmt::format("{}_{}", struct_name, member->name));
      }
    }

    line("struct {}", struct_name);
    line("{{");
    for (const JsonMemberDecl * member : shape.members) {
      std::string type = member->nested != nullptr
                           ? fmt::format("{}_{}", struct_name, member->name)
                           : member_cpp_type(member->type_name);
      const bool array = member->is_array || (member->nested && member->nested->is_array);
      if (array) {
        type = fmt::format("std::vector<{}>", type);
      } else if (member->is_optional) {
        type = fmt::format("std::optional<{}>", type);
      }
      line("  {} {};", type, identifier(member->name));
    }
    line("}};");
    line("");
  }

  void emit_json_shapes(const ModelDecl & model)
  {
    for (const FieldDecl * field : model.fields) {
      if (field->json_shape != nullptr && !field->json_shape->members.empty()) {
        emit_shape(*field->json_shape, shape_struct_name(model, *field));
      }
    }
  }

  void emit_model(const ModelDecl & model)
  {
    line("struct {}", identifier(model.name));
    line("{{");
    for (const FieldDecl * field : model.fields) {
      line("  {} {};", field_cpp_type(model, *field), identifier(field->name));
    }
    line("}};");
    line("");
  }

  void emit_name_map()
  {
    line("enum class ModelName");
    line("{{");
    for (const ModelDecl * model : schema_.models) {
      line("  {},", identifier(model->name));
    }
    line("}};");
    line("");

    std::string names;
    for (const ModelDecl * model : schema_.models) {
      if (!names.empty()) names += ", ";
      names += fmt::format("\"{}\"", model->name);
    }
    line(
      "inline constexpr std::array<std::string_view, {}> model_names = {{{}}};",
      schema_.models.size(), names);
    line("");

    line("template <ModelName>");
    line("struct ModelType;");
    line("");
    for (const ModelDecl * model : schema_.models) {
      const std::string name = identifier(model->name);
      line("template <>");
      line("struct ModelType<ModelName::{}>", name);
      line("{{");
      line("  using type = {};", name);
      line("}};");
      line("");
    }
  }

  [[nodiscard]] static std::string shape_struct_name(const ModelDecl & model, const FieldDecl & field)
  {
    return fmt::format("{}_{}", model.name, field.name);
  }

  [[nodiscard]] std::string member_cpp_type(std::string_view type_name) const
  {
    if (auto scalar = parse_scalar_type(type_name)) {
      return std::string(scalar_cpp_type(*scalar));
    }
    if (type_name == "number") return "double";
    if (type_name == "bool") return "bool";
    if (type_name == "any" || type_name == "object") return "std::string";
    return identifier(type_name);
  }

  [[nodiscard]] std::string field_cpp_type(const ModelDecl & model, const FieldDecl & field) const
  {
    if (field.scalar) {
      const bool shaped = field.json_shape != nullptr && !field.json_shape->members.empty();
      const std::string type =
        shaped ? shape_struct_name(model, field) : std::string(scalar_cpp_type(*field.scalar));
      if (field.is_array || (field.json_shape != nullptr && field.json_shape->is_array)) {
        return fmt::format("std::vector<{}>", type);
      }
      if (field.is_not_null()) {
        return type;
      }
      return fmt::format("std::optional<{}>", type);
    }

    const std::string target = identifier(field.type_name);
    if (schema_.find_model(field.type_name) != nullptr) {
      // Qualified so a member named after its model does not hide the type.
      const std::string qualified = fmt::format("::{}::{}", options_.namespace_name, target);
      const bool collection = field.is_array || field.has_relation(RelationKind::OneToMany) ||
                              field.has_relation(RelationKind::ManyToMany);
      if (collection) {
        return fmt::format("std::vector<{}>", qualified);
      }
      return fmt::format("std::shared_ptr<{}>", qualified);
    }

    // Custom type declared outside the schema.
    if (field.is_array) {
      return fmt::format("std::vector<{}>", target);
    }
    return field.is_not_null() ? target : fmt::format("std::optional<{}>", target);
  }

  const Schema & schema_;
  const TypeGeneratorOptions & options_;
  std::string out_;
};

}  // namespace

std::string TypeGenerator::generate(const Schema & schema, const TypeGeneratorOptions & options)
{
  return HeaderEmitter(schema, options).run();
}

}  // namespace schema_dsl
