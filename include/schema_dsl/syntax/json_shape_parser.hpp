#pragma once

#include <string>
#include <string_view>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/syntax/parser.hpp"
#include "schema_dsl/syntax/token.hpp"

namespace schema_dsl::syntax
{

/**
 * Parses the raw `{ ... }` block captured after a `json` field type.
 *
 *   shape  := "{" member* "}"
 *   member := NAME "?"? ":" (NAME | shape) ("[" "]")? ("|" "null")? ("," | ";")?
 *
 * A block outside this grammar (e.g. `{ scores: Record<string, number> }`)
 * is kept as an unchecked shape: `raw` holds the text, `members` is empty,
 * and a P101 warning is reported. Parsing never fails the field.
 *
 * Positions reported in diagnostics and stored on nodes are absolute
 * offsets into the enclosing schema source.
 */
class JsonShapeParser
{
public:
  JsonShapeParser(AstContext & ast, DiagnosticBag & diags, const Token & block)
  : ast_(ast), diags_(diags), text_(block.text), base_(block.begin()), block_loc_(block.loc),
    line_(block.loc.line), column_(block.loc.column)
  {
  }

  [[nodiscard]] JsonShapeDecl * parse(bool is_array);

private:
  [[nodiscard]] ParseResult<JsonShapeDecl *> parse_shape();
  [[nodiscard]] ParseResult<JsonMemberDecl *> parse_member();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const noexcept { return eof() ? '\0' : text_[pos_]; }
  void advance() noexcept;
  void skip_trivia() noexcept;
  [[nodiscard]] std::string_view scan_name() noexcept;

  [[nodiscard]] SourceRange range_from(size_t start) const noexcept;
  [[nodiscard]] LineColumn here() const noexcept { return {line_, column_}; }
  /// Records why the block does not fit the member grammar.
  template <typename T>
  ParseResult<T> reject(std::string message);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::string_view text_;
  uint32_t base_;
  LineColumn block_loc_;
  size_t pos_ = 0;
  uint32_t line_;
  uint32_t column_;

  SourceRange problem_range_;
  std::string problem_;
};

}  // namespace schema_dsl::syntax
