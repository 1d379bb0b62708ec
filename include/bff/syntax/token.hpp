// bff/syntax/token.hpp - Token kinds produced by the BFF lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "bff/basic/source_manager.hpp"

namespace bff::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,
  IntLiteral,
  StringLiteral,  // token.text is the raw string *contents* (without quotes, escapes intact)

  // `.Name` / `^Name`: token.text includes the sigil
  Variable,
  // `."..."` / `^'...'`: token.text is the whole slice, sigil and quotes included
  DynamicVariable,

  // `#name`: token.text is the name without the hash
  Directive,

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Comma,

  Bang,
  Plus,
  Minus,
  Eq,

  AndAnd,
  OrOr,

  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (see TokenKind for what each kind stores)
  bool newline_before = false;  // first token on its line

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::Variable:
      return "variable";
    case TokenKind::DynamicVariable:
      return "dynamic variable";
    case TokenKind::Directive:
      return "directive";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Eq:
      return "=";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "";
}

}  // namespace bff::syntax
