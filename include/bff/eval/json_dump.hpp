// bff/eval/json_dump.hpp - JSON serialization of evaluation results
//
// Used by `bffc dump`. Ranges are written as editor ranges:
// {"uri", "start": {"line", "character"}, "end": {...}}, zero-based.
//
#pragma once

#include <nlohmann/json.hpp>

#include "bff/basic/source_manager.hpp"
#include "bff/eval/evaluated_data.hpp"
#include "bff/eval/evaluator.hpp"
#include "bff/eval/value.hpp"

namespace bff
{

[[nodiscard]] nlohmann::json to_json(const FileRange & range);

/**
 * Booleans, integers and strings map to JSON scalars, arrays to JSON arrays
 * and structs to objects keyed by member name.
 */
[[nodiscard]] nlohmann::json to_json(const Value & value);

[[nodiscard]] nlohmann::json to_json(const EvaluatedData & data);

/**
 * The data plus "error" (null when evaluation finished) and "warnings".
 *
 * `sources` resolves the byte ranges of the error and warnings.
 */
[[nodiscard]] nlohmann::json to_json(const EvaluationResult & result, const SourceRegistry & sources);

}  // namespace bff
