// bff/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <string>

#include "bff/ast/ast.hpp"
#include "bff/ast/ast_context.hpp"
#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"

namespace bff
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The text is registered (or updated) in `sources` under `uri`. Nodes are
// allocated in `ast`; syntax errors go to `diags`. A Program is returned even
// when there are errors.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::string & uri, std::string source_text, AstContext & ast,
  DiagnosticBag & diags);

}  // namespace bff
