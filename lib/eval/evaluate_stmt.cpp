// bff/eval/evaluate_stmt.cpp - Statement evaluation
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bff/eval/errors.hpp"
#include "bff/eval/generic_functions.hpp"
#include "bff/eval/operators.hpp"
#include "bff/syntax/keywords.hpp"
#include "evaluation_session.hpp"

namespace bff::detail
{

namespace
{

std::string argument_count(size_t n)
{
  return std::to_string(n) + (n == 1 ? " argument" : " arguments");
}

}  // namespace

void EvaluationSession::evaluate_statements(gsl::span<Stmt * const> statements)
{
  for (Stmt * stmt : statements) {
    evaluate_statement(stmt);
  }
}

void EvaluationSession::evaluate_statement(Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::Assignment:
      previous_ = evaluate_assignment(cast<AssignmentStmt>(stmt));
      return;
    case NodeKind::Operator:
      previous_ = evaluate_operator(cast<OperatorStmt>(stmt));
      return;
    case NodeKind::UnnamedOperator:
      previous_ = evaluate_unnamed_operator(cast<UnnamedOperatorStmt>(stmt));
      return;
    case NodeKind::IfDirective:
      // The taken branch decides what a following `+ value` applies to.
      evaluate_if_directive(cast<IfDirective>(stmt));
      return;
    default:
      break;
  }

  switch (stmt->get_kind()) {
    case NodeKind::ScopedBlock:
      evaluate_scoped_block(cast<ScopedBlockStmt>(stmt));
      break;
    case NodeKind::Using:
      evaluate_using(cast<UsingStmt>(stmt));
      break;
    case NodeKind::ForEach:
      evaluate_for_each(cast<ForEachStmt>(stmt));
      break;
    case NodeKind::If:
      evaluate_if(cast<IfStmt>(stmt));
      break;
    case NodeKind::GenericFunction:
      evaluate_generic_function(cast<GenericFunctionStmt>(stmt));
      break;
    case NodeKind::Print:
      evaluate_expr(cast<PrintStmt>(stmt)->value);
      break;
    case NodeKind::Error:
      evaluate_expr(cast<ErrorStmt>(stmt)->value);
      break;
    case NodeKind::UserFunctionDecl:
      evaluate_user_function_decl(cast<UserFunctionDeclStmt>(stmt));
      break;
    case NodeKind::UserFunctionCall:
      evaluate_user_function_call(cast<UserFunctionCallStmt>(stmt));
      break;
    case NodeKind::Include:
      evaluate_include(cast<IncludeDirective>(stmt));
      break;
    case NodeKind::Once:
      onceUris_.insert(currentFile_->uri);
      break;
    case NodeKind::Define:
      evaluate_define(cast<DefineDirective>(stmt));
      break;
    case NodeKind::Undef:
      evaluate_undef(cast<UndefDirective>(stmt));
      break;
    case NodeKind::Import:
      evaluate_import(cast<ImportDirective>(stmt));
      break;
    default:
      throw std::logic_error(
        "unexpected statement kind " + std::string(to_string(stmt->get_kind())));
  }
  previous_.reset();
}

// ============================================================================
// Assignment and operators
// ============================================================================

PreviousStatement EvaluationSession::evaluate_assignment(const AssignmentStmt * stmt)
{
  Evaluated rhs = evaluate_expr(stmt->rhs);
  const std::string name = evaluate_var_name(stmt->lhs);
  const SourceRange lhs_range = stmt->lhs->get_range();

  ScopeVariable * variable = nullptr;
  if (stmt->lhs->scope == VarScope::Current) {
    variable = scopes_.find_in_current(name);
    if (variable == nullptr) {
      const DefinitionId def = add_definition(name, lhs_range);
      variable = &scopes_.current().set(name, std::move(rhs.value), {def});
      const size_t index = add_evaluated(variable->value, lhs_range);
      add_reference(variable->definitions, lhs_range, ReferenceKind::Write);
      return PreviousStatement{variable, index};
    }
  } else {
    if (!scopes_.has_parent()) {
      throw EvaluationError(
        lhs_range, "Cannot access parent scope because there is no parent scope.");
    }
    variable = scopes_.find_in_parents(name);
    if (variable == nullptr) {
      throw EvaluationError(
        lhs_range, "Referencing variable \"" + name +
                     "\" in a parent scope that is not defined in any parent scope.");
    }
  }

  // Assigning a single item to an existing Array makes a one-item Array.
  Value value = std::move(rhs.value);
  if (variable->value.is_array() && !value.is_array()) {
    const auto element = variable->value.element_kind();
    if (!element) {
      if (!value.is_string() && !value.is_struct()) {
        throw EvaluationError(
          rhs.range, "Cannot assign " + type_name_a(value) +
                       " to an Array. Arrays can only contain Strings or Structs.");
      }
    } else if (value.kind() != *element) {
      throw EvaluationError(
        rhs.range, "Cannot assign " + type_name_a(value) + " to an Array of " +
                     std::string(type_name(variable->value.as_array().front())) + "s.");
    }
    std::vector<Value> items;
    items.push_back(std::move(value));
    value = Value::make_array(std::move(items));
  }

  variable->value = std::move(value);
  const size_t index = add_evaluated(variable->value, lhs_range);
  add_reference(variable->definitions, lhs_range, ReferenceKind::Write);
  return PreviousStatement{variable, index};
}

PreviousStatement EvaluationSession::evaluate_operator(const OperatorStmt * stmt)
{
  const std::string name = evaluate_var_name(stmt->lhs);
  const SourceRange lhs_range = stmt->lhs->get_range();

  ScopeVariable * variable = nullptr;
  if (stmt->lhs->scope == VarScope::Current) {
    variable = scopes_.find_in_current(name);
    if (variable == nullptr) {
      // `.A + x` on a variable from an outer scope modifies a local copy.
      const ScopeVariable * outer = scopes_.find_visible(name);
      if (outer == nullptr) {
        throw EvaluationError(
          lhs_range,
          "Referencing variable \"" + name + "\" that is not defined in the current scope.");
      }
      const DefinitionId def = add_definition(name, lhs_range);
      variable = &scopes_.current().set(name, outer->value, {def});
    }
  } else {
    variable = &lookup_for_read(VarScope::Parent, name, lhs_range);
  }

  const Evaluated rhs = evaluate_expr(stmt->rhs);
  apply_in_place(stmt->op, variable->value, rhs.value, join_ranges(lhs_range, rhs.range));

  const size_t index = add_evaluated(variable->value, lhs_range);
  add_reference(variable->definitions, lhs_range, ReferenceKind::ReadWrite);
  return PreviousStatement{variable, index};
}

PreviousStatement EvaluationSession::evaluate_unnamed_operator(const UnnamedOperatorStmt * stmt)
{
  // Taken before the rhs runs, which may itself contain statements.
  const std::optional<PreviousStatement> previous = previous_;
  if (!previous) {
    throw EvaluationError(
      stmt->get_range(),
      "Unnamed modification must follow a variable assignment in the same scope.");
  }

  const Evaluated rhs = evaluate_expr(stmt->rhs);
  const SourceRange range(stmt->get_range().get_begin(), rhs.range.get_end());
  apply_in_place(stmt->op, previous->variable->value, rhs.value, range);

  data_.evaluatedVariables[previous->recordIndex].value = previous->variable->value;
  return *previous;
}

// ============================================================================
// Blocks
// ============================================================================

void EvaluationSession::evaluate_scoped_block(const ScopedBlockStmt * stmt)
{
  scopes_.push();
  evaluate_statements(stmt->statements);
  scopes_.pop();
}

void EvaluationSession::evaluate_using(const UsingStmt * stmt)
{
  const Evaluated operand = evaluate_expr(stmt->operand);
  if (!operand.value.is_struct()) {
    throw EvaluationError(
      operand.range,
      "'Using' parameter must be a Struct, but instead is " + type_name_a(operand.value));
  }

  const SourceRange stmt_range = stmt->get_range();
  for (const StructMember & member : operand.value.members()) {
    std::vector<DefinitionId> defs;
    if (const ScopeVariable * existing = scopes_.find_visible(member.name)) {
      defs = existing->definitions;
    } else {
      defs = member.definitions;
      defs.push_back(add_definition(member.name, stmt_range));
    }

    scopes_.current().set(member.name, member.value, defs);

    add_reference(defs, stmt_range, ReferenceKind::Read);
    add_reference(member.definitions, stmt_range, ReferenceKind::Read);
    for (const DefinitionId member_def : member.definitions) {
      if (const VariableDefinition * d = data_.find_variable_definition(member_def)) {
        add_reference(defs, d->range, ReferenceKind::Read);
      }
    }
  }
}

void EvaluationSession::evaluate_for_each(const ForEachStmt * stmt)
{
  std::vector<Value> arrays;
  arrays.reserve(stmt->iterators.size());

  for (const ForEachIterator & it : stmt->iterators) {
    Evaluated array = evaluate_expr(it.array);
    if (!array.value.is_array()) {
      throw EvaluationError(
        array.range, "'ForEach' variable to loop over must be an Array, but instead is " +
                       type_name_a(array.value));
    }
    if (!arrays.empty() && array.value.as_array().size() != arrays.front().as_array().size()) {
      throw EvaluationError(
        array.range, "'ForEach' Array variable to loop over contains " +
                       std::to_string(array.value.as_array().size()) +
                       " elements, but the loop is for " +
                       std::to_string(arrays.front().as_array().size()) + " elements.");
    }
    arrays.push_back(std::move(array.value));
  }

  if (arrays.empty()) {
    return;
  }

  const size_t count = arrays.front().as_array().size();
  for (size_t i = 0; i < count; ++i) {
    scopes_.push();
    previous_.reset();
    for (size_t k = 0; k < arrays.size(); ++k) {
      const EvaluatedVar * loop_var = stmt->iterators[k].loopVar;
      const SourceRange range = loop_var->get_range();
      const std::string name = evaluate_var_name(loop_var);
      const Value & item = arrays[k].as_array()[i];

      const DefinitionId def = add_definition(name, range);
      scopes_.current().set(name, item, {def});
      add_evaluated(item, range);
      add_reference({def}, range, ReferenceKind::Write);
    }
    evaluate_statements(stmt->body);
    scopes_.pop();
  }
}

void EvaluationSession::evaluate_if(const IfStmt * stmt)
{
  if (!evaluate_condition(stmt->condition)) {
    return;
  }
  scopes_.push();
  previous_.reset();
  evaluate_statements(stmt->body);
  scopes_.pop();
}

// ============================================================================
// Build functions
// ============================================================================

void EvaluationSession::evaluate_generic_function(const GenericFunctionStmt * stmt)
{
  if (stmt->targetName != nullptr) {
    const Evaluated target = evaluate_expr(stmt->targetName);
    if (!target.value.is_string()) {
      throw EvaluationError(
        target.range, "Target name must evaluate to a String, but instead evaluates to " +
                        type_name_a(target.value));
    }

    const std::string & name = target.value.as_string();
    FileRange target_range = to_file_range(target.range);
    const auto it = targets_.find(name);
    if (it != targets_.end()) {
      warn(
        target.range, "Target name \"" + name + "\" already exists", it->second.range,
        "Defined here");
      data_.targetReferences.push_back(TargetReference{it->second.id, std::move(target_range)});
    } else {
      const DefinitionId id = nextDefinitionId_++;
      targets_.emplace(name, TargetEntry{id, target.range});
      data_.targetDefinitions.push_back(TargetDefinition{id, name, target_range});
      data_.targetReferences.push_back(TargetReference{id, std::move(target_range)});
    }
  }

  data_.genericFunctionBodies.push_back(
    GenericFunctionBody{std::string(stmt->functionName), to_file_range(stmt->bodyRange)});

  scopes_.push();
  previous_.reset();
  evaluate_statements(stmt->body);
  check_required_properties(stmt);
  if (stmt->functionName == "Alias") {
    collect_alias_targets();
  }
  scopes_.pop();
}

void EvaluationSession::check_required_properties(const GenericFunctionStmt * stmt)
{
  const GenericFunctionInfo * info = find_generic_function(stmt->functionName);
  if (info == nullptr) {
    return;
  }
  for (const FunctionProperty & property : info->properties) {
    if (property.required && scopes_.find_visible(property.name) == nullptr) {
      warn(
        stmt->headerRange, "Call to function \"" + std::string(stmt->functionName) +
                             "\" is missing required property \"" + std::string(property.name) +
                             "\".");
    }
  }
}

void EvaluationSession::collect_alias_targets()
{
  const ScopeVariable * targets = scopes_.find_visible("Targets");
  if (targets == nullptr || targets->definitions.empty()) {
    return;
  }
  const VariableDefinition * def = data_.find_variable_definition(targets->definitions.back());
  if (def == nullptr) {
    return;
  }

  const Value & value = targets->value;
  if (value.is_string()) {
    pendingTargetReferences_.push_back(PendingTargetReference{value.as_string(), def->range});
  } else if (value.is_array()) {
    for (const Value & item : value.as_array()) {
      if (item.is_string()) {
        pendingTargetReferences_.push_back(PendingTargetReference{item.as_string(), def->range});
      }
    }
  }
}

// ============================================================================
// User functions
// ============================================================================

void EvaluationSession::evaluate_user_function_decl(const UserFunctionDeclStmt * stmt)
{
  const std::string name(stmt->name);
  if (syntax::is_reserved_function_name(name)) {
    warn(
      stmt->nameRange, "Cannot use function name \"" + name + "\" because it is reserved.");
    return;
  }

  const auto existing = userFunctions_.find(name);
  if (existing != userFunctions_.end()) {
    warn(
      stmt->nameRange,
      "Cannot use function name \"" + name +
        "\" because it is already used by another user function. Functions must be uniquely "
        "named.",
      existing->second.nameRange, "Defined here");
    return;
  }

  UserFunction fn;
  fn.name = name;
  fn.nameRange = stmt->nameRange;
  fn.definition = add_definition(name, stmt->nameRange);
  add_reference({fn.definition}, stmt->nameRange, ReferenceKind::Write);

  std::set<std::string_view> seen;
  for (const FunctionParam & param : stmt->params) {
    if (!seen.insert(param.name).second) {
      warn(param.range, "User-function argument names must be unique.");
      continue;
    }
    const DefinitionId def = add_definition(std::string(param.name), param.range);
    add_reference({def}, param.range, ReferenceKind::Write);
    fn.params.push_back(UserFunctionParam{std::string(param.name), def});
  }

  fn.body = stmt->body;
  fn.file = currentFile_;
  userFunctions_.emplace(name, std::move(fn));
}

void EvaluationSession::evaluate_user_function_call(const UserFunctionCallStmt * stmt)
{
  const std::string name(stmt->name);
  const auto it = userFunctions_.find(name);
  if (it == userFunctions_.end()) {
    throw EvaluationError(stmt->nameRange, "No function exists with the name \"" + name + "\".");
  }
  // Copied: the body may declare further functions.
  const UserFunction fn = it->second;

  add_reference({fn.definition}, stmt->nameRange, ReferenceKind::Read);

  if (stmt->args.size() != fn.params.size()) {
    throw EvaluationError(
      stmt->get_range(), "User function \"" + name + "\" takes " +
                           argument_count(fn.params.size()) + " but passing " +
                           std::to_string(stmt->args.size()) + ".");
  }
  if (scopes_.depth() > k_max_scope_depth) {
    throw EvaluationError(
      stmt->get_range(),
      "Excessive scope depth. Possible infinite recursion from user function calls.");
  }

  std::vector<Value> args;
  args.reserve(stmt->args.size());
  for (const Expr * arg : stmt->args) {
    args.push_back(evaluate_expr(arg).value);
    // A variable argument is already recorded by its own read.
    if (!isa<EvaluatedVar>(arg)) {
      add_evaluated(args.back(), arg->get_range());
    }
  }

  // The body sees only its parameters, with a fresh set of #defines, and
  // resolves includes relative to the file that declared it.
  const DefineTable saved_defines = defines_;
  const ParsedFile * saved_file = currentFile_;
  defines_.user.clear();
  defines_.userRanges.clear();
  currentFile_ = fn.file;

  scopes_.push(false);
  previous_.reset();
  for (size_t i = 0; i < fn.params.size(); ++i) {
    scopes_.current().set(fn.params[i].name, std::move(args[i]), {fn.params[i].definition});
  }
  evaluate_statements(fn.body);
  scopes_.pop();

  defines_ = saved_defines;
  currentFile_ = saved_file;
}

}  // namespace bff::detail
