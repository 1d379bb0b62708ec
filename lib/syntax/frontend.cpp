// bff/syntax/frontend.cpp - High-level parse pipeline
#include "bff/syntax/frontend.hpp"

#include <utility>

#include "bff/syntax/lexer.hpp"
#include "bff/syntax/parser.hpp"

namespace bff
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::string & uri, std::string source_text, AstContext & ast,
  DiagnosticBag & diags)
{
  FileId file_id;
  if (const auto existing = sources.find_by_uri(uri)) {
    file_id = *existing;
    sources.update_content(file_id, std::move(source_text));
  } else {
    file_id = sources.register_file(uri, std::move(source_text));
  }

  ParseOutput out;
  out.file_id = file_id;

  const SourceFile * file = sources.get_file(file_id);
  if (file == nullptr) {
    diags.report_error({}, "too many source files registered").with_code("syntax");
    out.program = ast.create<Program>();
    return out;
  }

  syntax::Lexer lexer(file_id, file->content());
  syntax::Parser parser(ast, diags, lexer.lex_all());
  out.program = parser.parse_program();
  return out;
}

}  // namespace bff
