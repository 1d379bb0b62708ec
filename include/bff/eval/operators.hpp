// bff/eval/operators.hpp - The `+` and `-` algebra over values
#pragma once

#include "bff/ast/ast_enums.hpp"
#include "bff/basic/source_manager.hpp"
#include "bff/eval/value.hpp"

namespace bff
{

/**
 * `existing + rhs`, updating `existing` in place.
 *
 * | existing        | rhs                              | result                      |
 * |-----------------|----------------------------------|-----------------------------|
 * | Integer         | Integer                          | sum                         |
 * | String          | String                           | concatenation               |
 * | Array (empty)   | String, Struct or Array          | append                      |
 * | Array of T      | T or Array of T                  | append                      |
 * | Struct          | Struct                           | merge, rhs members win      |
 *
 * Anything else throws EvaluationError at `range`.
 */
void add_in_place(Value & existing, const Value & rhs, SourceRange range);

/**
 * `existing - rhs`, updating `existing` in place.
 *
 * Integers subtract, Strings drop every occurrence of the rhs text and
 * Arrays of Strings drop every item equal to the rhs. Subtracting from an
 * empty Array does nothing.
 */
void subtract_in_place(Value & existing, const Value & rhs, SourceRange range);

inline void apply_in_place(SumOp op, Value & existing, const Value & rhs, SourceRange range)
{
  if (op == SumOp::Add) {
    add_in_place(existing, rhs, range);
  } else {
    subtract_in_place(existing, rhs, range);
  }
}

}  // namespace bff
