// bff/syntax/lexer.hpp - BFF tokenizer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "bff/syntax/token.hpp"

namespace bff::syntax
{

/**
 * Splits BFF source into tokens.
 *
 * Comments (`//` and `;` to end of line) and whitespace are dropped; the only
 * layout information kept is Token::newline_before. Malformed input (an
 * unterminated string, a stray character) becomes a TokenKind::Unknown token
 * for the parser to report.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skips whitespace and comments. Returns true if a newline was crossed.
  bool skip_whitespace_and_comments();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_variable();
  [[nodiscard]] Token lex_directive();

  /// Scans a quoted string starting at pos_. Returns false when unterminated.
  bool scan_quoted();

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept
  {
    const auto end = static_cast<uint32_t>(pos_);
    return {kind, make_range(start, end), src_.substr(start, end - start)};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace bff::syntax
