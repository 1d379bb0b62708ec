// bff/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"

namespace bff
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[eval]: Referencing variable "Foo" that is not defined in the current scope ...
 *     --> fbuild.bff:5:12
 *      |
 *    5 | .Bar = .Foo
 *      |        ^^^^
 *      |
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// "N error(s), M warning(s)" trailer line.
  void print_summary(size_t error_count, size_t warning_count);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_note(std::string_view message);

  [[nodiscard]] std::string display_path(const SourceRegistry & sources, FileId id) const;

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace bff
