// schema_dsl/syntax/frontend.hpp - Source text to AST in one call
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/basic/source_file.hpp"

namespace schema_dsl
{

/// Everything produced by lexing and parsing one schema source.
struct ParsedUnit
{
  SourceFile source;
  AstContext ast;
  DiagnosticBag diags;
  Schema * schema = nullptr;
  /// Tokens handed to the parser, excluding Eof and dropped Unknown tokens.
  size_t token_count = 0;
};

// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, std::filesystem::path path = {});

}  // namespace schema_dsl
