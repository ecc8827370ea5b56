// schema_dsl/test_support/parse_helpers.hpp - helpers for unit tests
//
// These helpers run the front half of the pipeline on in-memory sources.
// The returned ParsedUnit owns the AST and every diagnostic reported so far.
//
#pragma once

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/sema/schema_analyzer.hpp"
#include "schema_dsl/syntax/frontend.hpp"

namespace schema_dsl::test_support
{

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(std::string src)
{
  return parse_source(std::move(src), "<test>.sdl");
}

/// Parse, then run semantic analysis when parsing reported no error.
[[nodiscard]] inline std::unique_ptr<ParsedUnit> analyze(std::string src)
{
  auto unit = parse(std::move(src));
  if (!unit->diags.has_errors()) {
    SchemaAnalyzer analyzer(unit->diags);
    (void)analyzer.analyze(*unit->schema);
  }
  return unit;
}

[[nodiscard]] inline size_t count_code(const DiagnosticBag & diags, std::string_view code)
{
  return static_cast<size_t>(std::count_if(
    diags.begin(), diags.end(), [&](const Diagnostic & d) { return d.code == code; }));
}

}  // namespace schema_dsl::test_support
