// bff/syntax/parser.cpp - Recursive-descent parser for BFF files
#include "bff/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string>

#include "bff/syntax/keywords.hpp"

namespace bff::syntax
{
namespace
{

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::StringLiteral:
      return "a string";
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::Variable:
    case TokenKind::DynamicVariable:
      return "'" + std::string(t.text) + "'";
    case TokenKind::Directive:
      return "'#" + std::string(t.text) + "'";
    default:
      return "'" + std::string(to_string(t.kind)) + "'";
  }
}

std::string describe_unknown(const Token & t)
{
  const std::string_view text = t.text;
  if (text.empty()) {
    return "unexpected character";
  }
  const char first = text.front();
  const bool sigil = first == '.' || first == '^';
  const bool quoted =
    first == '\'' || first == '"' || (sigil && text.size() > 1 && (text[1] == '\'' || text[1] == '"'));
  if (quoted) {
    return "unterminated string literal";
  }
  if (sigil) {
    return std::string("expected a variable name after '") + first + "'";
  }
  if (first == '#') {
    return "expected a directive name after '#'";
  }
  if (std::isdigit(static_cast<unsigned char>(first)) != 0) {
    return "invalid number '" + std::string(text) + "'";
  }
  return "unexpected character '" + std::string(text) + "'";
}

bool is_compare_token(TokenKind k)
{
  return k == TokenKind::EqEq || k == TokenKind::Ne || k == TokenKind::Lt || k == TokenKind::Le ||
         k == TokenKind::Gt || k == TokenKind::Ge;
}

CompareOp to_compare_op(TokenKind k)
{
  switch (k) {
    case TokenKind::Ne:
      return CompareOp::Ne;
    case TokenKind::Lt:
      return CompareOp::Lt;
    case TokenKind::Le:
      return CompareOp::Le;
    case TokenKind::Gt:
      return CompareOp::Gt;
    case TokenKind::Ge:
      return CompareOp::Ge;
    default:
      return CompareOp::Eq;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_identifier(std::string_view text) const
{
  return at(TokenKind::Identifier) && cur().text == text;
}

bool Parser::at_directive(std::string_view name) const
{
  return at(TokenKind::Directive) && cur().text == name;
}

bool Parser::at_line_end() const { return at_eof() || cur().newline_before; }

bool Parser::at_block_end(BlockEnd end) const
{
  if (at_eof()) {
    return true;
  }
  switch (end) {
    case BlockEnd::File:
      return false;
    case BlockEnd::Brace:
      return at(TokenKind::RBrace);
    case BlockEnd::Bracket:
      return at(TokenKind::RBracket);
    case BlockEnd::IfDirective:
      return at_directive("else") || at_directive("endif");
  }
  return false;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

const Token * Parser::expect(TokenKind k, std::string_view what)
{
  if (at(k)) {
    return &advance();
  }
  report_unexpected(what);
  return nullptr;
}

void Parser::error_at(const Token & t, std::string msg) { error_at(t.range, std::move(msg)); }

void Parser::error_at(SourceRange range, std::string msg)
{
  diags_.report_error(range, std::move(msg)).with_code("syntax");
}

void Parser::report_unexpected(std::string_view expected)
{
  const Token & t = cur();
  if (t.kind == TokenKind::Unknown) {
    error_at(t, describe_unknown(t));
    return;
  }
  error_at(t, "expected " + std::string(expected) + ", found " + describe(t));
}

void Parser::synchronize_to_next_line()
{
  while (!at_line_end()) {
    advance();
  }
}

// ============================================================================
// Program / statement lists
// ============================================================================

Program * Parser::parse_program()
{
  const uint32_t end = tokens_.empty() ? 0 : tokens_.back().end();
  auto * program = ast_.create<Program>(SourceRange(file_id_, 0, end));
  program->statements = to_span(parse_statement_list(BlockEnd::File));
  return program;
}

std::vector<Stmt *> Parser::parse_statement_list(BlockEnd end)
{
  std::vector<Stmt *> out;
  while (!at_block_end(end)) {
    const size_t start_idx = idx_;
    if (Stmt * s = parse_stmt()) {
      out.push_back(s);
      continue;
    }
    if (idx_ == start_idx) {
      advance();
    }
    synchronize_to_next_line();
  }
  return out;
}

Stmt * Parser::parse_stmt()
{
  switch (cur().kind) {
    case TokenKind::Variable:
    case TokenKind::DynamicVariable:
      return parse_variable_stmt();
    case TokenKind::Plus:
    case TokenKind::Minus:
      return parse_unnamed_operator_stmt();
    case TokenKind::LBrace:
      return parse_scoped_block();
    case TokenKind::Directive:
      return parse_directive();
    case TokenKind::Identifier:
      break;
    default:
      report_unexpected("a statement");
      return nullptr;
  }

  const std::string_view name = cur().text;
  if (name == "function") {
    return parse_user_function_decl();
  }
  if (name == "Using") {
    return parse_using();
  }
  if (name == "ForEach") {
    return parse_for_each();
  }
  if (name == "If") {
    return parse_if();
  }
  if (name == "Print" || name == "Error") {
    return parse_print_or_error();
  }
  if (name == "Settings" || is_generic_function_name(name)) {
    return parse_generic_function();
  }
  return parse_user_function_call();
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_variable_stmt()
{
  EvaluatedVar * lhs = parse_evaluated_var();
  if (lhs == nullptr) {
    return nullptr;
  }

  if (match(TokenKind::Eq)) {
    Expr * rhs = parse_sum();
    if (rhs == nullptr) {
      return nullptr;
    }
    return ast_.create<AssignmentStmt>(lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }

  if (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const SumOp op = at(TokenKind::Plus) ? SumOp::Add : SumOp::Sub;
    advance();
    Expr * rhs = parse_sum();
    if (rhs == nullptr) {
      return nullptr;
    }
    return ast_.create<OperatorStmt>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }

  report_unexpected("'=', '+' or '-' after the variable");
  return nullptr;
}

Stmt * Parser::parse_unnamed_operator_stmt()
{
  const Token & op_tok = advance();
  const SumOp op = op_tok.kind == TokenKind::Plus ? SumOp::Add : SumOp::Sub;
  Expr * rhs = parse_sum();
  if (rhs == nullptr) {
    return nullptr;
  }
  return ast_.create<UnnamedOperatorStmt>(op, rhs, join_ranges(op_tok.range, rhs->get_range()));
}

Stmt * Parser::parse_scoped_block()
{
  const Token & open = advance();
  auto statements = parse_statement_list(BlockEnd::Brace);
  const Token * close = expect(TokenKind::RBrace, "'}' to close the scope");
  if (close == nullptr) {
    return nullptr;
  }
  return ast_.create<ScopedBlockStmt>(to_span(statements), join_ranges(open.range, close->range));
}

const Token * Parser::parse_braced_body(gsl::span<Stmt *> & body, SourceRange * body_range)
{
  const Token * open = expect(TokenKind::LBrace, "'{'");
  if (open == nullptr) {
    return nullptr;
  }
  auto statements = parse_statement_list(BlockEnd::Brace);
  const Token * close = expect(TokenKind::RBrace, "'}'");
  if (close == nullptr) {
    return nullptr;
  }
  body = to_span(statements);
  if (body_range != nullptr) {
    *body_range = SourceRange(file_id_, open->end(), close->begin());
  }
  return close;
}

Stmt * Parser::parse_using()
{
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'(' after 'Using'") == nullptr) {
    return nullptr;
  }
  Expr * operand = parse_operand();
  if (operand == nullptr) {
    return nullptr;
  }
  const Token * close = expect(TokenKind::RParen, "')'");
  if (close == nullptr) {
    return nullptr;
  }
  return ast_.create<UsingStmt>(operand, join_ranges(name.range, close->range));
}

Stmt * Parser::parse_for_each()
{
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'(' after 'ForEach'") == nullptr) {
    return nullptr;
  }

  std::vector<ForEachIterator> iterators;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (!iterators.empty() && match(TokenKind::Comma)) {
      continue;
    }
    if (!at(TokenKind::Variable) && !at(TokenKind::DynamicVariable)) {
      report_unexpected("a loop variable");
      return nullptr;
    }
    EvaluatedVar * loop_var = parse_evaluated_var();
    if (loop_var == nullptr) {
      return nullptr;
    }
    if (!at_identifier("in")) {
      report_unexpected("'in'");
      return nullptr;
    }
    advance();
    Expr * array = parse_operand();
    if (array == nullptr) {
      return nullptr;
    }
    iterators.push_back(ForEachIterator{loop_var, array});
  }

  if (iterators.empty()) {
    report_unexpected("'.Item in .Array'");
    return nullptr;
  }
  if (expect(TokenKind::RParen, "')'") == nullptr) {
    return nullptr;
  }

  gsl::span<Stmt *> body;
  const Token * close = parse_braced_body(body);
  if (close == nullptr) {
    return nullptr;
  }
  auto * stmt = ast_.create<ForEachStmt>(join_ranges(name.range, close->range));
  stmt->iterators = to_span(iterators);
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_if()
{
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'(' after 'If'") == nullptr) {
    return nullptr;
  }
  Cond * condition = parse_condition_or();
  if (condition == nullptr) {
    return nullptr;
  }
  if (expect(TokenKind::RParen, "')'") == nullptr) {
    return nullptr;
  }

  gsl::span<Stmt *> body;
  const Token * close = parse_braced_body(body);
  if (close == nullptr) {
    return nullptr;
  }
  auto * stmt = ast_.create<IfStmt>(condition, join_ranges(name.range, close->range));
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_print_or_error()
{
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'('") == nullptr) {
    return nullptr;
  }
  Expr * value = parse_operand();
  if (value == nullptr) {
    return nullptr;
  }
  const Token * close = expect(TokenKind::RParen, "')'");
  if (close == nullptr) {
    return nullptr;
  }

  const SourceRange range = join_ranges(name.range, close->range);
  if (name.text == "Print") {
    return ast_.create<PrintStmt>(value, range);
  }
  return ast_.create<ErrorStmt>(value, range);
}

Stmt * Parser::parse_generic_function()
{
  const Token & name = advance();
  const bool is_settings = name.text == "Settings";

  Expr * target_name = nullptr;
  SourceRange header_range = name.range;
  if (!is_settings) {
    if (expect(TokenKind::LParen, "'(' after the function name") == nullptr) {
      return nullptr;
    }
    if (!at(TokenKind::RParen)) {
      target_name = parse_sum();
      if (target_name == nullptr) {
        return nullptr;
      }
    }
    const Token * close = expect(TokenKind::RParen, "')'");
    if (close == nullptr) {
      return nullptr;
    }
    header_range = join_ranges(name.range, close->range);
  }

  gsl::span<Stmt *> body;
  SourceRange body_range;
  const Token * close = parse_braced_body(body, &body_range);
  if (close == nullptr) {
    return nullptr;
  }

  auto * stmt = ast_.create<GenericFunctionStmt>(
    ast_.intern(name.text), name.range, join_ranges(name.range, close->range));
  stmt->headerRange = header_range;
  stmt->targetName = target_name;
  stmt->body = body;
  stmt->bodyRange = body_range;
  return stmt;
}

Stmt * Parser::parse_user_function_decl()
{
  const Token & keyword = advance();
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "Function name is required.");
    return nullptr;
  }
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'(' after the function name") == nullptr) {
    return nullptr;
  }

  std::vector<FunctionParam> params;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (match(TokenKind::Comma)) {
      continue;
    }
    if (!at(TokenKind::Variable) || cur().text.front() != '.') {
      report_unexpected("a parameter name starting with '.'");
      return nullptr;
    }
    const Token & param = advance();
    params.push_back(FunctionParam{ast_.intern(param.text.substr(1)), param.range});
  }
  if (expect(TokenKind::RParen, "')'") == nullptr) {
    return nullptr;
  }

  gsl::span<Stmt *> body;
  const Token * close = parse_braced_body(body);
  if (close == nullptr) {
    return nullptr;
  }

  auto * stmt = ast_.create<UserFunctionDeclStmt>(
    ast_.intern(name.text), name.range, join_ranges(keyword.range, close->range));
  stmt->params = to_span(params);
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_user_function_call()
{
  const Token & name = advance();
  if (expect(TokenKind::LParen, "'(' after the function name") == nullptr) {
    return nullptr;
  }

  std::vector<Expr *> args;
  while (!at(TokenKind::RParen) && !at_eof()) {
    if (match(TokenKind::Comma)) {
      continue;
    }
    Expr * arg = parse_operand();
    if (arg == nullptr) {
      return nullptr;
    }
    args.push_back(arg);
  }
  const Token * close = expect(TokenKind::RParen, "')'");
  if (close == nullptr) {
    return nullptr;
  }

  auto * stmt = ast_.create<UserFunctionCallStmt>(
    ast_.intern(name.text), name.range, join_ranges(name.range, close->range));
  stmt->args = to_span(args);
  return stmt;
}

// ============================================================================
// Directives
// ============================================================================

Stmt * Parser::parse_directive()
{
  const Token & hash = cur();
  const std::string_view name = hash.text;

  if (name == "include") {
    advance();
    if (!at(TokenKind::StringLiteral) || at_line_end()) {
      report_unexpected("a quoted path after '#include'");
      return nullptr;
    }
    const Token & path_tok = advance();
    Expr * path = parse_string(path_tok.text, path_tok.begin());
    if (path == nullptr) {
      return nullptr;
    }
    auto * literal = dyn_cast<StringLiteral>(path);
    if (literal == nullptr) {
      error_at(path_tok, "#include path cannot contain variables");
      return nullptr;
    }
    return ast_.create<IncludeDirective>(literal, join_ranges(hash.range, path_tok.range));
  }

  if (name == "once") {
    advance();
    return ast_.create<OnceDirective>(hash.range);
  }

  if (name == "if") {
    return parse_if_directive();
  }

  if (name == "define" || name == "undef" || name == "import") {
    advance();
    if (!at(TokenKind::Identifier) || at_line_end()) {
      report_unexpected("a symbol name after '#" + std::string(name) + "'");
      return nullptr;
    }
    const Token & symbol = advance();
    const SourceRange range = join_ranges(hash.range, symbol.range);
    const std::string_view text = ast_.intern(symbol.text);
    if (name == "define") {
      return ast_.create<DefineDirective>(text, range);
    }
    if (name == "undef") {
      return ast_.create<UndefDirective>(text, range);
    }
    return ast_.create<ImportDirective>(text, range);
  }

  if (name == "else" || name == "endif") {
    error_at(hash, "'#" + std::string(name) + "' without a matching '#if'");
    advance();
    return nullptr;
  }

  error_at(hash, "unknown directive '#" + std::string(name) + "'");
  advance();
  return nullptr;
}

Stmt * Parser::parse_if_directive()
{
  const Token & hash = advance();
  Cond * condition = parse_directive_or();
  if (condition == nullptr) {
    return nullptr;
  }
  if (!at_line_end()) {
    report_unexpected("the end of the '#if' line");
    return nullptr;
  }

  auto then_body = parse_statement_list(BlockEnd::IfDirective);
  std::vector<Stmt *> else_body;
  if (at_directive("else")) {
    advance();
    else_body = parse_statement_list(BlockEnd::IfDirective);
  }
  if (!at_directive("endif")) {
    report_unexpected("'#endif'");
    return nullptr;
  }
  const Token & endif = advance();

  auto * stmt = ast_.create<IfDirective>(condition, join_ranges(hash.range, endif.range));
  stmt->thenBody = to_span(then_body);
  stmt->elseBody = to_span(else_body);
  return stmt;
}

// Directive conditions end with their line.

Cond * Parser::parse_directive_or()
{
  Cond * lhs = parse_directive_and();
  while (lhs != nullptr && at(TokenKind::OrOr) && !at_line_end()) {
    advance();
    Cond * rhs = parse_directive_and();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<LogicalCond>(
      LogicalOp::Or, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Cond * Parser::parse_directive_and()
{
  Cond * lhs = parse_directive_unary();
  while (lhs != nullptr && at(TokenKind::AndAnd) && !at_line_end()) {
    advance();
    Cond * rhs = parse_directive_unary();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<LogicalCond>(
      LogicalOp::And, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Cond * Parser::parse_directive_unary()
{
  if (at_line_end()) {
    report_unexpected("a condition");
    return nullptr;
  }

  if (at(TokenKind::Bang)) {
    const Token & bang = advance();
    Cond * operand = parse_directive_unary();
    if (operand == nullptr) {
      return nullptr;
    }
    return ast_.create<NotCond>(operand, join_ranges(bang.range, operand->get_range()));
  }

  if (at(TokenKind::LParen)) {
    advance();
    Cond * inner = parse_directive_or();
    if (inner == nullptr || expect(TokenKind::RParen, "')'") == nullptr) {
      return nullptr;
    }
    return inner;
  }

  if (!at(TokenKind::Identifier)) {
    report_unexpected("a symbol, 'exists(...)' or 'file_exists(...)'");
    return nullptr;
  }

  const Token & ident = advance();
  if (ident.text == "exists" && at(TokenKind::LParen)) {
    advance();
    const Token * var = expect(TokenKind::Identifier, "an environment variable name");
    if (var == nullptr) {
      return nullptr;
    }
    const Token * close = expect(TokenKind::RParen, "')'");
    if (close == nullptr) {
      return nullptr;
    }
    return ast_.create<EnvExistsCond>(ast_.intern(var->text), join_ranges(ident.range, close->range));
  }

  if (ident.text == "file_exists" && at(TokenKind::LParen)) {
    advance();
    if (!at(TokenKind::StringLiteral)) {
      report_unexpected("a quoted path");
      return nullptr;
    }
    const Token & path_tok = advance();
    auto * path = dyn_cast<StringLiteral>(parse_string(path_tok.text, path_tok.begin()));
    if (path == nullptr) {
      error_at(path_tok, "file_exists path cannot contain variables");
      return nullptr;
    }
    const Token * close = expect(TokenKind::RParen, "')'");
    if (close == nullptr) {
      return nullptr;
    }
    return ast_.create<FileExistsCond>(path, join_ranges(ident.range, close->range));
  }

  return ast_.create<SymbolCond>(ast_.intern(ident.text), ident.range);
}

// ============================================================================
// If() conditions
// ============================================================================

Cond * Parser::parse_condition_or()
{
  Cond * lhs = parse_condition_and();
  while (lhs != nullptr && at(TokenKind::OrOr)) {
    advance();
    Cond * rhs = parse_condition_and();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<LogicalCond>(
      LogicalOp::Or, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Cond * Parser::parse_condition_and()
{
  Cond * lhs = parse_condition_unary();
  while (lhs != nullptr && at(TokenKind::AndAnd)) {
    advance();
    Cond * rhs = parse_condition_unary();
    if (rhs == nullptr) {
      return nullptr;
    }
    lhs = ast_.create<LogicalCond>(
      LogicalOp::And, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Cond * Parser::parse_condition_unary()
{
  if (at(TokenKind::Bang)) {
    const Token & bang = advance();
    Cond * operand = parse_condition_unary();
    if (operand == nullptr) {
      return nullptr;
    }
    return ast_.create<NotCond>(operand, join_ranges(bang.range, operand->get_range()));
  }

  if (at(TokenKind::LParen)) {
    advance();
    Cond * inner = parse_condition_or();
    if (inner == nullptr || expect(TokenKind::RParen, "')'") == nullptr) {
      return nullptr;
    }
    return inner;
  }

  return parse_comparison();
}

Cond * Parser::parse_comparison()
{
  Expr * lhs = parse_operand();
  if (lhs == nullptr) {
    return nullptr;
  }

  if (is_compare_token(cur().kind)) {
    const Token & op = advance();
    Expr * rhs = parse_operand();
    if (rhs == nullptr) {
      return nullptr;
    }
    return ast_.create<CompareCond>(
      to_compare_op(op.kind), op.range, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }

  bool negated = false;
  if (at_identifier("not") && cur(1).kind == TokenKind::Identifier && cur(1).text == "in") {
    negated = true;
    advance();
  }
  if (at_identifier("in")) {
    advance();
    Expr * rhs = parse_operand();
    if (rhs == nullptr) {
      return nullptr;
    }
    return ast_.create<InCond>(negated, lhs, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }

  return ast_.create<BoolCond>(lhs, lhs->get_range());
}

// ============================================================================
// Values
// ============================================================================

Expr * Parser::parse_sum()
{
  Expr * first = parse_operand();
  if (first == nullptr) {
    return nullptr;
  }

  // A `+` or `-` starting a new line is an unnamed operator statement, not a
  // continuation. An operator ending a line continues onto the next one.
  std::vector<Summand> summands;
  SourceRange last = first->get_range();
  while ((at(TokenKind::Plus) || at(TokenKind::Minus)) && !cur().newline_before) {
    const Token & op = advance();
    Expr * value = parse_operand();
    if (value == nullptr) {
      return nullptr;
    }
    summands.push_back(
      Summand{op.kind == TokenKind::Plus ? SumOp::Add : SumOp::Sub, op.range, value});
    last = value->get_range();
  }

  if (summands.empty()) {
    return first;
  }
  return ast_.create<SumExpr>(first, to_span(summands), join_ranges(first->get_range(), last));
}

Expr * Parser::parse_operand()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::StringLiteral:
      advance();
      return parse_string(t.text, t.begin());

    case TokenKind::IntLiteral:
      advance();
      return parse_int(t, t.range, false);

    case TokenKind::Minus: {
      const Token & digits = cur(1);
      if (digits.kind == TokenKind::IntLiteral && digits.begin() == t.end()) {
        advance();
        advance();
        return parse_int(digits, join_ranges(t.range, digits.range), true);
      }
      break;
    }

    case TokenKind::Identifier:
      if (t.text == "true" || t.text == "false") {
        advance();
        return ast_.create<BoolLiteral>(t.text == "true", t.range);
      }
      break;

    case TokenKind::Variable:
    case TokenKind::DynamicVariable:
      return parse_evaluated_var();

    case TokenKind::LBrace:
      return parse_array();

    case TokenKind::LBracket:
      return parse_struct();

    default:
      break;
  }

  report_unexpected("a value");
  return nullptr;
}

EvaluatedVar * Parser::parse_evaluated_var()
{
  const Token & t = advance();
  const VarScope scope = t.text.front() == '^' ? VarScope::Parent : VarScope::Current;

  if (t.kind == TokenKind::DynamicVariable) {
    // `."..."`: the name is the quoted string after the sigil
    Expr * name = parse_string(t.text.substr(2, t.text.size() - 3), t.begin() + 1);
    if (name == nullptr) {
      return nullptr;
    }
    return ast_.create<EvaluatedVar>(scope, name, t.range);
  }

  auto * name = ast_.create<StringLiteral>(
    ast_.intern(t.text.substr(1)), SourceRange(file_id_, t.begin() + 1, t.end()));
  return ast_.create<EvaluatedVar>(scope, name, t.range);
}

Expr * Parser::parse_array()
{
  const Token & open = advance();
  std::vector<Expr *> items;
  if (!parse_array_items(items, false)) {
    return nullptr;
  }
  const Token * close = expect(TokenKind::RBrace, "'}' to close the array");
  if (close == nullptr) {
    return nullptr;
  }
  return ast_.create<ArrayLiteral>(to_span(items), join_ranges(open.range, close->range));
}

bool Parser::parse_array_items(std::vector<Expr *> & out, bool in_directive)
{
  while (!at(TokenKind::RBrace) && !at_eof()) {
    if (in_directive && (at_directive("else") || at_directive("endif"))) {
      break;
    }
    if (match(TokenKind::Comma)) {
      continue;
    }
    Expr * item = at_directive("if") ? parse_conditional_items() : parse_operand();
    if (item == nullptr) {
      return false;
    }
    out.push_back(item);
  }
  return true;
}

Expr * Parser::parse_conditional_items()
{
  const Token & hash = advance();
  Cond * condition = parse_directive_or();
  if (condition == nullptr) {
    return nullptr;
  }
  if (!at_line_end()) {
    report_unexpected("the end of the '#if' line");
    return nullptr;
  }

  std::vector<Expr *> then_items;
  std::vector<Expr *> else_items;
  if (!parse_array_items(then_items, true)) {
    return nullptr;
  }
  if (at_directive("else")) {
    advance();
    if (!parse_array_items(else_items, true)) {
      return nullptr;
    }
  }
  if (!at_directive("endif")) {
    report_unexpected("'#endif'");
    return nullptr;
  }
  const Token & endif = advance();

  auto * items = ast_.create<ConditionalItems>(condition, join_ranges(hash.range, endif.range));
  items->thenItems = to_span(then_items);
  items->elseItems = to_span(else_items);
  return items;
}

Expr * Parser::parse_struct()
{
  const Token & open = advance();
  auto statements = parse_statement_list(BlockEnd::Bracket);
  const Token * close = expect(TokenKind::RBracket, "']' to close the struct");
  if (close == nullptr) {
    return nullptr;
  }
  return ast_.create<StructLiteral>(to_span(statements), join_ranges(open.range, close->range));
}

Expr * Parser::parse_int(const Token & digits, SourceRange range, bool negative)
{
  int64_t value = 0;
  const char * first = digits.text.data();
  const char * last = first + digits.text.size();
  const auto result = std::from_chars(first, last, value);

  if (negative) {
    value = -value;
  }
  if (
    result.ec != std::errc() || value < std::numeric_limits<int32_t>::min() ||
    value > std::numeric_limits<int32_t>::max()) {
    error_at(range, "integer literal is out of range");
    return nullptr;
  }
  return ast_.create<IntLiteral>(static_cast<int32_t>(value), range);
}

Expr * Parser::parse_string(std::string_view raw, uint32_t quote_pos)
{
  const uint32_t base = quote_pos + 1;
  const SourceRange range(file_id_, quote_pos, base + static_cast<uint32_t>(raw.size()) + 1);

  std::vector<TemplatePart> parts;
  std::string text;
  uint32_t text_start = 0;
  bool has_variable = false;

  auto flush_text = [&](uint32_t end) {
    if (!text.empty()) {
      parts.push_back(
        TemplatePart{false, ast_.intern(text), SourceRange(file_id_, base + text_start, base + end)});
      text.clear();
    }
  };

  size_t i = 0;
  while (i < raw.size()) {
    const char c = raw[i];
    if (c == '^' && i + 1 < raw.size()) {
      text.push_back(raw[i + 1]);
      i += 2;
      continue;
    }
    if (c != '$') {
      text.push_back(c);
      ++i;
      continue;
    }

    const size_t close = raw.find('$', i + 1);
    if (close == std::string_view::npos) {
      error_at(
        SourceRange(file_id_, base + static_cast<uint32_t>(i), base + static_cast<uint32_t>(i) + 1),
        "unterminated variable interpolation, expected a closing '$'");
      return nullptr;
    }
    const std::string_view name = raw.substr(i + 1, close - i - 1);
    const SourceRange var_range(
      file_id_, base + static_cast<uint32_t>(i), base + static_cast<uint32_t>(close) + 1);
    if (name.empty()) {
      error_at(var_range, "empty variable name in interpolation '$$'");
      return nullptr;
    }

    flush_text(static_cast<uint32_t>(i));
    parts.push_back(TemplatePart{true, ast_.intern(name), var_range});
    has_variable = true;
    i = close + 1;
    text_start = static_cast<uint32_t>(i);
  }

  if (!has_variable) {
    return ast_.create<StringLiteral>(ast_.intern(text), range);
  }
  flush_text(static_cast<uint32_t>(raw.size()));
  return ast_.create<StringTemplate>(to_span(parts), range);
}

}  // namespace bff::syntax
