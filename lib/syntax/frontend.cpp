// schema_dsl/syntax/frontend.cpp
#include "schema_dsl/syntax/frontend.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "schema_dsl/syntax/lexer.hpp"
#include "schema_dsl/syntax/parser.hpp"

namespace schema_dsl
{

std::unique_ptr<ParsedUnit> parse_source(std::string source_text, std::filesystem::path path)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceFile(std::move(path), std::move(source_text));

  syntax::Lexer lexer(unit->source.content(), unit->diags);
  std::vector<syntax::Token> tokens = lexer.lex_all();
  unit->token_count = tokens.size() - 1;

  spdlog::debug("lexed {} tokens from {}", unit->token_count, unit->source.display_name());

  syntax::Parser parser(unit->ast, unit->diags, std::move(tokens));
  unit->schema = parser.parse();

  spdlog::debug(
    "parsed {} model(s), {} diagnostic(s)", unit->schema->models.size(), unit->diags.size());
  return unit;
}

}  // namespace schema_dsl
