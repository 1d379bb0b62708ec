// bff/syntax/lexer.cpp - BFF tokenizer
#include "bff/syntax/lexer.hpp"

#include <cctype>

namespace bff::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

// Variable names may start with a digit (`.1stPass` is legal in BFF).
bool is_var_name_char(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }

bool is_quote(char c) { return c == '\'' || c == '"'; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_whitespace_and_comments()
{
  bool crossed_newline = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      crossed_newline = true;
      advance(1);
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r') {
      advance(1);
      continue;
    }
    // `;` and `//` comments run to the end of the line
    if (c == ';' || starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
  return crossed_newline;
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && std::isdigit(static_cast<unsigned char>(peek())) != 0) {
    advance(1);
  }
  // `123abc` is not a number followed by an identifier
  if (!eof() && is_ident_start(static_cast<unsigned char>(peek()))) {
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return make_token(TokenKind::Unknown, start);
  }
  return make_token(TokenKind::IntLiteral, start);
}

bool Lexer::scan_quoted()
{
  const char quote = peek();
  advance(1);
  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      advance(1);
      return true;
    }
    // Raw newlines are not allowed inside string literals.
    if (c == '\n' || c == '\r') {
      return false;
    }
    if (c == '^') {
      // `^` escapes the next character, quotes included
      advance(1);
      if (eof() || peek() == '\n' || peek() == '\r') {
        return false;
      }
    }
    advance(1);
  }
  return false;
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  if (!scan_quoted()) {
    return make_token(TokenKind::Unknown, start);
  }

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(start + 1, pos_ - start - 2);
  return t;
}

Token Lexer::lex_variable()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // sigil

  if (is_quote(peek())) {
    if (!scan_quoted()) {
      return make_token(TokenKind::Unknown, start);
    }
    return make_token(TokenKind::DynamicVariable, start);
  }

  if (eof() || !is_var_name_char(static_cast<unsigned char>(peek()))) {
    return make_token(TokenKind::Unknown, start);
  }
  while (!eof() && is_var_name_char(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Variable, start);
}

Token Lexer::lex_directive()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // #

  // `# if` is accepted like `#if`
  while (peek() == ' ' || peek() == '\t') {
    advance(1);
  }
  const auto name_start = pos_;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  if (pos_ == name_start) {
    return make_token(TokenKind::Unknown, start);
  }

  Token t = make_token(TokenKind::Directive, start);
  t.text = src_.substr(name_start, pos_ - name_start);
  return t;
}

Token Lexer::next_token()
{
  const auto c = static_cast<unsigned char>(peek());

  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (std::isdigit(c) != 0) {
    return lex_number();
  }
  if (is_quote(peek())) {
    return lex_string();
  }
  if (c == '.' || c == '^') {
    return lex_variable();
  }
  if (c == '#') {
    return lex_directive();
  }

  const auto start = static_cast<uint32_t>(pos_);

  // Multi-char operators
  if (starts_with("&&")) {
    advance(2);
    return make_token(TokenKind::AndAnd, start);
  }
  if (starts_with("||")) {
    advance(2);
    return make_token(TokenKind::OrOr, start);
  }
  if (starts_with("==")) {
    advance(2);
    return make_token(TokenKind::EqEq, start);
  }
  if (starts_with("!=")) {
    advance(2);
    return make_token(TokenKind::Ne, start);
  }
  if (starts_with("<=")) {
    advance(2);
    return make_token(TokenKind::Le, start);
  }
  if (starts_with(">=")) {
    advance(2);
    return make_token(TokenKind::Ge, start);
  }

  // Single-char tokens
  const char ch = peek();
  advance(1);

  switch (ch) {
    case '(':
      return make_token(TokenKind::LParen, start);
    case ')':
      return make_token(TokenKind::RParen, start);
    case '{':
      return make_token(TokenKind::LBrace, start);
    case '}':
      return make_token(TokenKind::RBrace, start);
    case '[':
      return make_token(TokenKind::LBracket, start);
    case ']':
      return make_token(TokenKind::RBracket, start);
    case ',':
      return make_token(TokenKind::Comma, start);
    case '!':
      return make_token(TokenKind::Bang, start);
    case '+':
      return make_token(TokenKind::Plus, start);
    case '-':
      return make_token(TokenKind::Minus, start);
    case '=':
      return make_token(TokenKind::Eq, start);
    case '<':
      return make_token(TokenKind::Lt, start);
    case '>':
      return make_token(TokenKind::Gt, start);
    default:
      break;
  }

  return make_token(TokenKind::Unknown, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  bool at_line_start = true;
  while (true) {
    if (skip_whitespace_and_comments()) {
      at_line_start = true;
    }

    if (eof()) {
      const auto at = static_cast<uint32_t>(src_.size());
      Token t{TokenKind::Eof, make_range(at, at), {}};
      t.newline_before = true;
      out.push_back(t);
      break;
    }

    Token t = next_token();
    t.newline_before = at_line_start;
    at_line_start = false;
    out.push_back(t);
  }
  return out;
}

}  // namespace bff::syntax
