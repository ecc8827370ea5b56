#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "schema_dsl/ast/ast.hpp"
#include "schema_dsl/ast/ast_context.hpp"
#include "schema_dsl/basic/diagnostic.hpp"
#include "schema_dsl/syntax/token.hpp"

namespace schema_dsl::syntax
{

// ============================================================================
// ParseResult
// ============================================================================

/// How far a syntax error propagates.
enum class ParseFailure : uint8_t {
  Model,   // abandon the current model, resynchronize at the next `model`
  Schema,  // abandon the whole parse (input ended inside a declaration)
};

/**
 * Outcome of one grammar rule.
 *
 * The error itself is already in the DiagnosticBag when a failure is
 * returned; the failure only tells the caller where to resume.
 */
template <typename T>
struct [[nodiscard]] ParseResult
{
  T value{};
  std::optional<ParseFailure> failure;

  static ParseResult ok(T v)
  {
    ParseResult r;
    r.value = std::move(v);
    return r;
  }

  static ParseResult fail(ParseFailure f)
  {
    ParseResult r;
    r.failure = f;
    return r;
  }

  [[nodiscard]] bool success() const noexcept { return !failure.has_value(); }
  explicit operator bool() const noexcept { return success(); }
};

// ============================================================================
// Parser
// ============================================================================

class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens);

  /// Parses every model; never returns nullptr.
  [[nodiscard]] Schema * parse();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] const Token & previous() const;

  const Token & advance();
  bool match(TokenKind k);

  /// Consumes `k` or reports "Expected <what>" and returns the failure kind.
  [[nodiscard]] std::optional<ParseFailure> expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string message, std::string_view code);
  void synchronize_to_model();

  [[nodiscard]] static bool is_ident(std::string_view text, const Token & t);
  [[nodiscard]] static bool is_name_token(const Token & t);

  // Rules
  [[nodiscard]] ParseResult<ModelDecl *> parse_model_definition();
  [[nodiscard]] ParseResult<FieldDecl *> parse_field_definition();
  [[nodiscard]] ParseResult<CompositeUniqueDecl *> parse_composite_attribute();
  [[nodiscard]] ParseResult<bool> parse_field_type(FieldDecl & field);
  [[nodiscard]] ParseResult<bool> parse_decorator(FieldDecl & field);
  [[nodiscard]] ParseResult<DefaultValue> parse_default_value();

  void skip_parenthesized();

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace schema_dsl::syntax
