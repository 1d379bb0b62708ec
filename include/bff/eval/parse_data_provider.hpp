// bff/eval/parse_data_provider.hpp - Cache of parsed BFF files
#pragma once

#include <memory>
#include <string>
#include <unordered_map>

#include "bff/ast/ast.hpp"
#include "bff/ast/ast_context.hpp"
#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"
#include "bff/eval/file_system.hpp"

namespace bff
{

/// One successfully parsed file. The AST lives as long as the entry.
struct ParsedFile
{
  std::string uri;
  FileId fileId;
  std::string content;
  std::unique_ptr<AstContext> ast;
  Program * program = nullptr;
};

/**
 * Parses files on demand and caches the result per URI.
 *
 * Each request re-reads the file and only re-parses when the text changed,
 * so entries stay valid across evaluations until their file is edited.
 * All files share one SourceRegistry, which turns AST byte ranges into
 * editor ranges.
 */
class ParseDataProvider
{
public:
  explicit ParseDataProvider(const IFileSystem & fs) : fs_(fs) {}

  ParseDataProvider(const ParseDataProvider &) = delete;
  ParseDataProvider & operator=(const ParseDataProvider &) = delete;

  /**
   * Parsed form of `uri`.
   *
   * @throws FileReadError when the file cannot be read
   * @throws ParseError    when it has syntax errors (first error reported)
   */
  const ParsedFile & get_parse_data(const std::string & uri);

  /// Syntax diagnostics of the last parse of `uri`, or nullptr.
  [[nodiscard]] const DiagnosticBag * syntax_diagnostics(const std::string & uri) const;

  void invalidate(const std::string & uri);

  [[nodiscard]] const IFileSystem & file_system() const noexcept { return fs_; }
  [[nodiscard]] SourceRegistry & sources() noexcept { return sources_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }

private:
  struct Entry
  {
    std::string content;
    std::unique_ptr<ParsedFile> parsed;  ///< null when the text has syntax errors
    DiagnosticBag diagnostics;
  };

  const IFileSystem & fs_;
  SourceRegistry sources_;
  std::unordered_map<std::string, Entry> cache_;
};

}  // namespace bff
