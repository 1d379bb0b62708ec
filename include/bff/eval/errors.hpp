// bff/eval/errors.hpp - Errors that stop an evaluation
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bff/basic/diagnostic.hpp"
#include "bff/basic/source_manager.hpp"

namespace bff
{

/// A semantic violation in the evaluated files.
class EvaluationError : public std::runtime_error
{
public:
  EvaluationError(SourceRange range, const std::string & message)
  : std::runtime_error(message), range_(range)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  SourceRange range_;
};

/// A file that does not parse. Carries its first syntax error.
class ParseError : public std::runtime_error
{
public:
  ParseError(SourceRange range, const std::string & message)
  : std::runtime_error(message), range_(range)
  {
  }

  [[nodiscard]] SourceRange range() const noexcept { return range_; }

private:
  SourceRange range_;
};

/// A file that could not be read.
class FileReadError : public std::runtime_error
{
public:
  FileReadError(std::string uri, const std::string & message)
  : std::runtime_error(message), uri_(std::move(uri))
  {
  }

  [[nodiscard]] const std::string & uri() const noexcept { return uri_; }

private:
  std::string uri_;
};

// ============================================================================
// FatalError - What an evaluation reports when it stops early
// ============================================================================

enum class FatalErrorKind : uint8_t {
  Parse,
  Evaluation,
  Internal,  ///< a bug in the evaluator, not in the input
};

struct RelatedInformation
{
  SourceRange range;
  std::string message;
};

struct FatalError
{
  FatalErrorKind kind = FatalErrorKind::Evaluation;
  std::string message;
  SourceRange range;
  std::vector<RelatedInformation> related;

  /// Error diagnostic with the related locations as secondary labels.
  [[nodiscard]] Diagnostic to_diagnostic() const;
};

[[nodiscard]] constexpr std::string_view to_string(FatalErrorKind k) noexcept
{
  switch (k) {
    case FatalErrorKind::Parse:
      return "parse";
    case FatalErrorKind::Evaluation:
      return "eval";
    case FatalErrorKind::Internal:
      return "internal";
  }
  return "";
}

}  // namespace bff
