// bff/basic/diagnostic.hpp - Syntax errors and evaluation warnings
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "bff/basic/source_manager.hpp"

namespace bff
{

// ============================================================================
// Diagnostic
// ============================================================================

/// A BFF file either fails (one error) or produces warnings; nothing finer.
enum class Severity : uint8_t {
  Error,
  Warning,
};

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  return s == Severity::Error ? "error" : "warning";
}

enum class LabelStyle {
  Primary,    // the offending range
  Secondary,  // a related range, e.g. the earlier #define or function declaration
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Source name reported to editors for every diagnostic.
inline constexpr const char * k_diagnostic_source = "FASTBuild";

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // "syntax", or an EvaluationError kind
  std::string message;
  std::vector<Label> labels;

  /// Range of the first primary label, or of the first label when all are secondary.
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Returned by DiagnosticBag::report_*; lets the caller attach a code or
 * related ranges, then files the diagnostic into the bag when it goes out of
 * scope.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Diagnostics in report order. The parser files syntax errors here and the
/// evaluator files its warnings.
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const { return first_error() != nullptr; }

  /// First error in report order, if any.
  [[nodiscard]] const Diagnostic * first_error() const noexcept;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace bff
