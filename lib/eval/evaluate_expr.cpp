// bff/eval/evaluate_expr.cpp - Expression evaluation
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bff/eval/errors.hpp"
#include "bff/eval/operators.hpp"
#include "evaluation_session.hpp"

namespace bff::detail
{

Evaluated EvaluationSession::evaluate_expr(const Expr * expr)
{
  const SourceRange range = expr->get_range();
  switch (expr->get_kind()) {
    case NodeKind::BoolLiteral:
      return {Value::make_bool(cast<BoolLiteral>(expr)->value), range};
    case NodeKind::IntLiteral:
      return {Value::make_integer(cast<IntLiteral>(expr)->value), range};
    case NodeKind::StringLiteral:
      return {Value::make_string(std::string(cast<StringLiteral>(expr)->value)), range};
    case NodeKind::StringTemplate:
      return evaluate_template(cast<StringTemplate>(expr));
    case NodeKind::EvaluatedVar:
      return evaluate_var(cast<EvaluatedVar>(expr));
    case NodeKind::ArrayLiteral:
      return evaluate_array(cast<ArrayLiteral>(expr));
    case NodeKind::StructLiteral:
      return evaluate_struct(cast<StructLiteral>(expr));
    case NodeKind::Sum:
      return evaluate_sum(cast<SumExpr>(expr));
    default:
      break;
  }
  throw std::logic_error("unexpected expression kind " + std::string(to_string(expr->get_kind())));
}

// ============================================================================
// Variables
// ============================================================================

std::string EvaluationSession::evaluate_var_name(const EvaluatedVar * var)
{
  if (const auto * literal = dyn_cast<StringLiteral>(var->name)) {
    return std::string(literal->value);
  }
  const Evaluated name = evaluate_expr(var->name);
  if (!name.value.is_string()) {
    throw EvaluationError(
      var->get_range(),
      "Variable name must evaluate to a String, but instead evaluates to " +
        type_name_a(name.value));
  }
  return name.value.as_string();
}

ScopeVariable & EvaluationSession::lookup_for_read(
  VarScope scope, const std::string & name, SourceRange range)
{
  if (scope == VarScope::Current) {
    ScopeVariable * variable = scopes_.find_visible(name);
    if (variable == nullptr) {
      throw EvaluationError(
        range, "Referencing variable \"" + name +
                 "\" that is not defined in the current scope or any of the parent scopes.");
    }
    return *variable;
  }

  if (!scopes_.has_parent()) {
    throw EvaluationError(range, "Cannot access parent scope because there is no parent scope.");
  }
  ScopeVariable * variable = scopes_.find_in_parents(name);
  if (variable == nullptr) {
    throw EvaluationError(
      range, "Referencing variable \"" + name +
               "\" in a parent scope that is not defined in any parent scope.");
  }
  return *variable;
}

Evaluated EvaluationSession::evaluate_var(const EvaluatedVar * var)
{
  const SourceRange range = var->get_range();
  const std::string name = evaluate_var_name(var);
  const ScopeVariable & variable = lookup_for_read(var->scope, name, range);

  Value value = variable.value;
  add_evaluated(value, range);
  add_reference(variable.definitions, range, ReferenceKind::Read);
  return {std::move(value), range};
}

Evaluated EvaluationSession::evaluate_template(const StringTemplate * tmpl)
{
  std::string out;
  for (const TemplatePart & part : tmpl->parts) {
    if (!part.isVariable) {
      out += part.text;
      continue;
    }

    const ScopeVariable & variable =
      lookup_for_read(VarScope::Current, std::string(part.text), part.range);
    add_evaluated(variable.value, part.range);
    add_reference(variable.definitions, part.range, ReferenceKind::Read);

    const std::optional<std::string> text = to_interpolated_string(variable.value);
    if (!text) {
      throw EvaluationError(
        part.range, "Cannot convert " + type_name_a_detailed(variable.value) + " to a String.");
    }
    out += *text;
  }
  return {Value::make_string(std::move(out)), tmpl->get_range()};
}

// ============================================================================
// Arrays
// ============================================================================

void EvaluationSession::append_array_items(
  gsl::span<Expr * const> items, std::vector<Value> & out, std::optional<Value> & first_item)
{
  auto check_same_type = [&](const Value & item, SourceRange range) {
    if (first_item && first_item->kind() != item.kind()) {
      throw EvaluationError(
        range, "All values in an Array must have the same type, but the first item is " +
                 type_name_a(*first_item) + " and this item is " + type_name_a(item));
    }
  };

  for (const Expr * item : items) {
    if (const auto * conditional = dyn_cast<ConditionalItems>(item)) {
      const bool taken = evaluate_condition(conditional->condition);
      append_array_items(
        taken ? conditional->thenItems : conditional->elseItems, out, first_item);
      continue;
    }

    Evaluated evaluated = evaluate_expr(item);

    // Arrays inside an array literal are flattened into it.
    if (evaluated.value.is_array()) {
      for (const Value & element : evaluated.value.as_array()) {
        check_same_type(element, evaluated.range);
        if (!first_item) {
          first_item = element;
        }
        out.push_back(element);
      }
      continue;
    }

    if (!first_item) {
      if (evaluated.value.is_bool() || evaluated.value.is_integer()) {
        throw EvaluationError(
          evaluated.range, "Cannot have an Array of " + std::string(type_name(evaluated.value)) +
                             "s. Only Arrays of Strings and Arrays of Structs are allowed.");
      }
      if (evaluated.value.is_struct() && !isa<EvaluatedVar>(item)) {
        throw EvaluationError(
          evaluated.range,
          "Cannot have an Array of literal Structs. Use an Array of evaluated variables instead.");
      }
      first_item = evaluated.value;
    } else {
      check_same_type(evaluated.value, evaluated.range);
    }
    out.push_back(std::move(evaluated.value));
  }
}

Evaluated EvaluationSession::evaluate_array(const ArrayLiteral * array)
{
  std::vector<Value> items;
  std::optional<Value> first_item;
  append_array_items(array->items, items, first_item);
  return {Value::make_array(std::move(items)), array->get_range()};
}

// ============================================================================
// Structs and sums
// ============================================================================

Evaluated EvaluationSession::evaluate_struct(const StructLiteral * literal)
{
  const std::optional<PreviousStatement> saved_previous = previous_;
  previous_.reset();
  scopes_.push();

  evaluate_statements(literal->statements);

  const Scope & scope = scopes_.current();
  std::vector<StructMember> members;
  members.reserve(scope.names().size());
  for (const std::string & name : scope.names()) {
    const ScopeVariable * variable = scope.find(name);
    members.push_back(StructMember{name, variable->value, variable->definitions});
  }

  scopes_.pop();
  previous_ = saved_previous;
  return {Value::make_struct(std::move(members)), literal->get_range()};
}

Evaluated EvaluationSession::evaluate_sum(const SumExpr * sum)
{
  Evaluated first = evaluate_expr(sum->first);
  Value result = std::move(first.value);
  SourceRange previous_range = first.range;

  for (const Summand & summand : sum->summands) {
    const Evaluated operand = evaluate_expr(summand.value);
    apply_in_place(
      summand.op, result, operand.value,
      SourceRange(previous_range.get_begin(), operand.range.get_end()));
    previous_range = operand.range;
  }
  return {std::move(result), sum->get_range()};
}

}  // namespace bff::detail
