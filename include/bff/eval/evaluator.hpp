// bff/eval/evaluator.hpp - Evaluation of a BFF file tree
//
// The evaluator runs the language semantics of a root file and everything it
// includes (scopes, the operator algebra, control flow, the preprocessor and
// user functions) without executing any build step. Its product is an
// EvaluatedData record for editor features.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "bff/basic/diagnostic.hpp"
#include "bff/eval/errors.hpp"
#include "bff/eval/evaluated_data.hpp"
#include "bff/eval/parse_data_provider.hpp"

namespace bff
{

// ============================================================================
// Options
// ============================================================================

enum class Platform : uint8_t {
  Linux,
  OSX,
  Windows,
};

/// Platform this binary was built for.
[[nodiscard]] Platform host_platform() noexcept;

/// `__LINUX__`, `__OSX__` or `__WINDOWS__`.
[[nodiscard]] std::string_view platform_define_symbol(Platform platform) noexcept;

/// Accepts `linux`, `osx` and `windows`.
[[nodiscard]] std::optional<Platform> parse_platform(std::string_view name) noexcept;

struct EvaluationOptions
{
  Platform platform = host_platform();
  /// Environment visible to `exists()` and `#import`.
  std::map<std::string, std::string> environment;
};

// ============================================================================
// Result
// ============================================================================

struct EvaluationResult
{
  /// Everything recorded before evaluation finished or stopped.
  EvaluatedData data;
  /// Set when evaluation stopped early.
  std::optional<FatalError> error;
  /// Problems that did not stop evaluation.
  DiagnosticBag warnings;
};

// ============================================================================
// Evaluator
// ============================================================================

/**
 * Evaluates a root BFF file.
 *
 * Each call to evaluate() is an independent session with its own scopes,
 * definition ids and include state, so evaluating unchanged input twice
 * produces identical results.
 *
 * Example:
 * @code
 *   DiskFileSystem fs;
 *   ParseDataProvider provider(fs);
 *   Evaluator evaluator(provider);
 *   EvaluationResult result = evaluator.evaluate(path_to_file_uri("/p/fbuild.bff"));
 * @endcode
 */
class Evaluator
{
public:
  explicit Evaluator(ParseDataProvider & provider, EvaluationOptions options = {});

  [[nodiscard]] EvaluationResult evaluate(const std::string & root_uri);

private:
  ParseDataProvider & provider_;
  EvaluationOptions options_;
};

}  // namespace bff
