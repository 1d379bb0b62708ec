// bff/lsp/workspace.hpp - Editor features over evaluated BFF files
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bff/eval/evaluator.hpp"

namespace bff::lsp
{

/**
 * Language service for FASTBuild files.
 *
 * Open documents shadow the files on disk. Every request evaluates the root
 * file the document belongs to (or reuses the cached evaluation of that
 * root) and answers from the recorded EvaluatedData, so hover shows the
 * values a variable really takes and references follow definitions across
 * `#include`d files.
 *
 * Positions are zero-based line and character (bytes within the line).
 * Results are JSON strings; ranges are written as
 * {"start": {"line", "character"}, "end": {...}}.
 *
 * The root file of a document is, in order: the configured root file, the
 * nearest `fbuild.bff` in the document's directory or one of its parents,
 * or the document itself.
 */
class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  /// The "Root File" setting. An empty string clears it.
  void set_root_file(std::string path);

  void set_evaluation_options(EvaluationOptions options);

  /// URI of the root file evaluated for `uri`. Empty when the root setting is invalid.
  [[nodiscard]] std::string root_uri(std::string_view uri);

  /**
   * Diagnostics of the evaluation that `uri` belongs to, grouped by file:
   * {"rootUri", "files": [{"uri", "items": [{source, message, severity,
   * range, relatedInformation}]}]}.
   */
  std::string diagnostics_json(std::string_view uri);

  std::string hover_json(std::string_view uri, uint32_t line, uint32_t character);

  std::string definition_json(std::string_view uri, uint32_t line, uint32_t character);

  std::string references_json(std::string_view uri, uint32_t line, uint32_t character);

  std::string document_symbols_json(std::string_view uri);

  /// Symbols of every open document's evaluation whose name fuzzily matches `query`.
  std::string workspace_symbols_json(std::string_view query);

  std::string completion_json(std::string_view uri, uint32_t line, uint32_t character);

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace bff::lsp
