// bff/syntax/parser.hpp - Recursive-descent parser for BFF files
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bff/ast/ast.hpp"
#include "bff/ast/ast_context.hpp"
#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"
#include "bff/syntax/token.hpp"

namespace bff::syntax
{

/// Token that closes a statement list.
enum class BlockEnd : uint8_t {
  File,         // end of input
  Brace,        // }
  Bracket,      // ]
  IfDirective,  // #else / #endif
};

/**
 * Builds the AST of one file from its token stream.
 *
 * Syntax errors are reported into the DiagnosticBag; after an error the
 * parser skips to the next line and continues, so one pass reports several
 * independent mistakes. Strings are unescaped and interned into the
 * AstContext, so the tree does not refer back into the source text.
 */
class Parser
{
public:
  Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), diags_(diags), tokens_(std::move(tokens))
  {
    if (!tokens_.empty()) {
      file_id_ = tokens_.front().range.file_id();
    }
  }

  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_identifier(std::string_view text) const;
  [[nodiscard]] bool at_directive(std::string_view name) const;
  /// True when the current token starts a new line (or there is none).
  [[nodiscard]] bool at_line_end() const;
  [[nodiscard]] bool at_block_end(BlockEnd end) const;

  const Token & advance();
  bool match(TokenKind k);
  /// Consumes a token of kind `k`, or reports "expected <what>" and returns nullptr.
  const Token * expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string msg);
  void error_at(SourceRange range, std::string msg);
  void report_unexpected(std::string_view expected);
  void synchronize_to_next_line();

  template <typename T>
  [[nodiscard]] gsl::span<T> to_span(const std::vector<T> & v)
  {
    return ast_.copy_to_arena(v);
  }

  // Statements
  [[nodiscard]] std::vector<Stmt *> parse_statement_list(BlockEnd end);
  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] Stmt * parse_variable_stmt();
  [[nodiscard]] Stmt * parse_unnamed_operator_stmt();
  [[nodiscard]] Stmt * parse_scoped_block();
  [[nodiscard]] Stmt * parse_using();
  [[nodiscard]] Stmt * parse_for_each();
  [[nodiscard]] Stmt * parse_if();
  [[nodiscard]] Stmt * parse_print_or_error();
  [[nodiscard]] Stmt * parse_generic_function();
  [[nodiscard]] Stmt * parse_user_function_decl();
  [[nodiscard]] Stmt * parse_user_function_call();

  /// `{ statements }`. Returns the closing brace, or nullptr on error.
  const Token * parse_braced_body(gsl::span<Stmt *> & body, SourceRange * body_range = nullptr);

  // Directives
  [[nodiscard]] Stmt * parse_directive();
  [[nodiscard]] Stmt * parse_if_directive();
  [[nodiscard]] Cond * parse_directive_or();
  [[nodiscard]] Cond * parse_directive_and();
  [[nodiscard]] Cond * parse_directive_unary();

  // If() conditions
  [[nodiscard]] Cond * parse_condition_or();
  [[nodiscard]] Cond * parse_condition_and();
  [[nodiscard]] Cond * parse_condition_unary();
  [[nodiscard]] Cond * parse_comparison();

  // Values
  [[nodiscard]] Expr * parse_sum();
  [[nodiscard]] Expr * parse_operand();
  [[nodiscard]] EvaluatedVar * parse_evaluated_var();
  [[nodiscard]] Expr * parse_array();
  [[nodiscard]] Expr * parse_conditional_items();
  bool parse_array_items(std::vector<Expr *> & out, bool in_directive);
  [[nodiscard]] Expr * parse_struct();
  [[nodiscard]] Expr * parse_int(const Token & digits, SourceRange range, bool negative);

  /**
   * Turns the raw contents of a quoted string into a StringLiteral, or a
   * StringTemplate when it interpolates variables.
   *
   * @param raw        text between the quotes, escapes intact
   * @param quote_pos  offset of the opening quote
   */
  [[nodiscard]] Expr * parse_string(std::string_view raw, uint32_t quote_pos);

  AstContext & ast_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  FileId file_id_;
  size_t idx_ = 0;
};

}  // namespace bff::syntax
