// schema_dsl/driver/compiler.cpp - Compiler driver implementation
//
#include "schema_dsl/driver/compiler.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

#include "schema_dsl/codegen/type_generator.hpp"
#include "schema_dsl/sema/schema_analyzer.hpp"

namespace schema_dsl
{

namespace
{

CompileResult failed_before_parse(const std::filesystem::path & file, std::string message)
{
  CompileResult result;
  result.unit = std::make_unique<ParsedUnit>();
  result.unit->source = SourceFile(file, "");
  result.unit->diags.report_error(SourceRange{}, std::move(message));
  return result;
}

std::filesystem::path default_types_output(const std::filesystem::path & schema_file)
{
  return schema_file.parent_path() / (schema_file.stem().string() + "_types.hpp");
}

}  // namespace

CompileResult Compiler::compile_source(
  std::string text, const std::filesystem::path & path, const CompileOptions & options)
{
  CompileResult result;
  result.unit = parse_source(std::move(text), path);
  ParsedUnit & unit = *result.unit;

  if (unit.token_count == 0) {
    unit.diags.report_error(SourceRange{}, "No tokens found in schema").with_code("P000");
    return result;
  }

  // Parse errors stop the pipeline before analysis.
  if (unit.diags.has_errors()) {
    return result;
  }

  if (!run_semantic_analysis(unit)) {
    return result;
  }

  if (options.mode == CompileMode::Build) {
    const std::filesystem::path output_path =
      options.types_output ? *options.types_output : default_types_output(path);
    if (!generate_types(unit, output_path, options.types_namespace.value_or("models"))) {
      return result;
    }
    result.generated_files.push_back(output_path);
  }

  result.success = !unit.diags.has_errors();
  return result;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    return failed_before_parse(file, "file not found: " + file.string());
  }

  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return failed_before_parse(file, "cannot read file: " + file.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  spdlog::debug("compiling {}", file.string());
  return compile_source(buffer.str(), file, options);
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileOptions effective = options;
  if (!effective.types_output) {
    effective.types_output = config.types_output_path();
  }
  if (!effective.types_namespace) {
    effective.types_namespace = config.compiler.types_namespace;
  }
  return compile_file(config.schema_path(), effective);
}

bool Compiler::run_semantic_analysis(ParsedUnit & unit)
{
  SchemaAnalyzer analyzer(unit.diags);
  return analyzer.analyze(*unit.schema);
}

bool Compiler::generate_types(
  ParsedUnit & unit, const std::filesystem::path & output_path, const std::string & ns)
{
  namespace fs = std::filesystem;

  TypeGeneratorOptions gen_options;
  gen_options.namespace_name = ns;
  gen_options.source_name = unit.source.display_name();
  const std::string header = TypeGenerator::generate(*unit.schema, gen_options);

  if (output_path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(output_path.parent_path(), ec);
    if (ec) {
      unit.diags.report_error(
        SourceRange{}, "cannot create directory " + output_path.parent_path().string() + ": " +
                         ec.message());
      return false;
    }
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    unit.diags.report_error(SourceRange{}, "cannot write " + output_path.string());
    return false;
  }
  out << header;
  spdlog::info("wrote {}", output_path.string());
  return true;
}

}  // namespace schema_dsl
