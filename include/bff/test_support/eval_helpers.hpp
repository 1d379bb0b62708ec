// bff/test_support/eval_helpers.hpp - helpers for unit tests
//
// A single-file parse pipeline and an in-memory evaluation pipeline. Files
// live in an InMemoryFileSystem under `file:///project/`, so tests never
// touch the disk.
//
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "bff/ast/ast_context.hpp"
#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"
#include "bff/eval/evaluator.hpp"
#include "bff/eval/file_system.hpp"
#include "bff/eval/parse_data_provider.hpp"
#include "bff/syntax/frontend.hpp"

namespace bff::test_support
{

inline constexpr const char * k_root_uri = "file:///project/fbuild.bff";

// ============================================================================
// Parsing
// ============================================================================

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FileRange file_range(SourceRange r) const { return sources.to_file_range(r); }
};

[[nodiscard]] inline TestParseUnit parse(std::string src, const std::string & uri = k_root_uri)
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();
  const ParseOutput parsed = parse_source(out.sources, uri, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  return out;
}

// ============================================================================
// Evaluation
// ============================================================================

/// Owns the file system and parse cache that an EvaluationResult refers to.
struct TestEvaluation
{
  InMemoryFileSystem fs;
  ParseDataProvider provider{fs};
  EvaluationResult result;

  [[nodiscard]] const EvaluatedData & data() const noexcept { return result.data; }

  [[nodiscard]] bool ok() const noexcept { return !result.error.has_value(); }

  [[nodiscard]] std::string error_message() const
  {
    return result.error ? result.error->message : std::string();
  }

  /// Error range as an editor range.
  [[nodiscard]] FileRange error_range() const
  {
    return result.error ? provider.sources().to_file_range(result.error->range) : FileRange{};
  }

  [[nodiscard]] std::vector<Value> values() const
  {
    std::vector<Value> out;
    for (const auto & v : result.data.evaluatedVariables) {
      out.push_back(v.value);
    }
    return out;
  }

  [[nodiscard]] std::vector<std::string> warning_messages() const
  {
    std::vector<std::string> out;
    for (const auto & d : result.warnings) {
      out.push_back(d.message);
    }
    return out;
  }
};

/**
 * Evaluates `root_text` as `file:///project/fbuild.bff`.
 *
 * `files` adds more files by URI. The platform defaults to Linux so that
 * `__LINUX__` is the built-in symbol regardless of the host.
 */
[[nodiscard]] inline std::unique_ptr<TestEvaluation> evaluate(
  const std::string & root_text, const std::map<std::string, std::string> & files = {},
  EvaluationOptions options = {Platform::Linux, {}})
{
  auto out = std::make_unique<TestEvaluation>();
  out->fs.set_file(k_root_uri, root_text);
  for (const auto & [uri, text] : files) {
    out->fs.set_file(uri, text);
  }
  Evaluator evaluator(out->provider, std::move(options));
  out->result = evaluator.evaluate(k_root_uri);
  return out;
}

/// Zero-based editor range in `uri`.
[[nodiscard]] inline FileRange make_range(
  uint32_t start_line, uint32_t start_char, uint32_t end_line, uint32_t end_char,
  const std::string & uri = k_root_uri)
{
  return FileRange{uri, Position{start_line, start_char}, Position{end_line, end_char}};
}

}  // namespace bff::test_support
