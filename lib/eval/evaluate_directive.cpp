// bff/eval/evaluate_directive.cpp - Conditions and preprocessor directives
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bff/basic/uri.hpp"
#include "bff/eval/errors.hpp"
#include "evaluation_session.hpp"

namespace bff::detail
{

namespace
{

template <typename T>
bool compare_with(CompareOp op, const T & lhs, const T & rhs)
{
  switch (op) {
    case CompareOp::Eq:
      return lhs == rhs;
    case CompareOp::Ne:
      return lhs != rhs;
    case CompareOp::Lt:
      return lhs < rhs;
    case CompareOp::Le:
      return lhs <= rhs;
    case CompareOp::Gt:
      return lhs > rhs;
    case CompareOp::Ge:
      return lhs >= rhs;
  }
  return false;
}

bool contains_string(const std::vector<Value> & haystack, const std::string & needle)
{
  return std::any_of(haystack.begin(), haystack.end(), [&](const Value & item) {
    return item.as_string() == needle;
  });
}

}  // namespace

// ============================================================================
// Conditions
// ============================================================================

bool EvaluationSession::evaluate_condition(const Cond * cond)
{
  switch (cond->get_kind()) {
    case NodeKind::BoolCond: {
      const Evaluated value = evaluate_expr(cast<BoolCond>(cond)->value);
      if (!value.value.is_bool()) {
        throw EvaluationError(
          value.range, "Condition must evaluate to a Boolean, but instead evaluates to " +
                         type_name_a(value.value));
      }
      return value.value.as_bool();
    }
    case NodeKind::CompareCond:
      return evaluate_compare(cast<CompareCond>(cond));
    case NodeKind::InCond:
      return evaluate_in(cast<InCond>(cond));
    case NodeKind::NotCond:
      return !evaluate_condition(cast<NotCond>(cond)->operand);
    case NodeKind::LogicalCond: {
      const auto * logical = cast<LogicalCond>(cond);
      // Both sides always run so that their references are recorded.
      const bool lhs = evaluate_condition(logical->lhs);
      const bool rhs = evaluate_condition(logical->rhs);
      return logical->op == LogicalOp::And ? (lhs && rhs) : (lhs || rhs);
    }
    case NodeKind::SymbolCond: {
      const auto * symbol_cond = cast<SymbolCond>(cond);
      const std::string symbol(symbol_cond->symbol);
      const auto it = defines_.user.find(symbol);
      if (it != defines_.user.end()) {
        add_reference({it->second}, symbol_cond->get_range(), ReferenceKind::Read);
      }
      return defines_.is_defined(symbol);
    }
    case NodeKind::EnvExistsCond:
      return options_.environment.count(std::string(cast<EnvExistsCond>(cond)->variable)) > 0;
    case NodeKind::FileExistsCond: {
      const auto * path = cast<FileExistsCond>(cond)->path;
      const std::string uri = resolve_uri(current_dir_uri(), path->value);
      return provider_.file_system().file_exists(uri);
    }
    default:
      break;
  }
  throw std::logic_error("unexpected condition kind " + std::string(to_string(cond->get_kind())));
}

bool EvaluationSession::evaluate_compare(const CompareCond * cond)
{
  const Evaluated lhs = evaluate_expr(cond->lhs);
  const Evaluated rhs = evaluate_expr(cond->rhs);
  const std::string op_text(to_string(cond->op));

  // Only the lhs type is checked here; the rhs must match it below.
  if (cond->op == CompareOp::Eq || cond->op == CompareOp::Ne) {
    if (!lhs.value.is_bool() && !lhs.value.is_string() && !lhs.value.is_integer()) {
      throw EvaluationError(
        cond->opRange, "'If' comparison using '" + op_text +
                         "' only supports comparing Booleans, Strings, and Integers, but " +
                         type_name_a(lhs.value) + " is used");
    }
  } else if (!lhs.value.is_string() && !lhs.value.is_integer()) {
    throw EvaluationError(
      cond->opRange, "'If' comparison using '" + op_text +
                       "' only supports comparing Strings and Integers, but " +
                       type_name_a(lhs.value) + " is used");
  }

  if (lhs.value.kind() != rhs.value.kind()) {
    throw EvaluationError(
      join_ranges(lhs.range, rhs.range),
      "'If' condition comparison must compare variables of the same type, but LHS is " +
        type_name_a(lhs.value) + " and RHS is " + type_name_a(rhs.value));
  }

  if (lhs.value.is_bool()) {
    return compare_with(cond->op, lhs.value.as_bool(), rhs.value.as_bool());
  }
  if (lhs.value.is_integer()) {
    return compare_with(cond->op, lhs.value.as_integer(), rhs.value.as_integer());
  }
  return compare_with(cond->op, lhs.value.as_string(), rhs.value.as_string());
}

bool EvaluationSession::evaluate_in(const InCond * cond)
{
  const Evaluated lhs = evaluate_expr(cond->lhs);
  const Evaluated rhs = evaluate_expr(cond->rhs);

  if (!rhs.value.is_array()) {
    throw EvaluationError(
      rhs.range, "'If' 'in' condition right-hand-side value must be an Array of Strings, but "
                 "instead is " +
                   type_name_a(rhs.value));
  }
  if (!isa<EvaluatedVar>(cond->rhs)) {
    throw EvaluationError(
      rhs.range,
      "'If' 'in' condition right-hand-side value cannot be a literal Array Of Strings. Instead "
      "use an evaluated variable.");
  }

  bool present = false;
  const std::vector<Value> & haystack = rhs.value.as_array();
  if (haystack.empty()) {
    present = false;
  } else if (!haystack.front().is_string()) {
    throw EvaluationError(
      rhs.range, "'If' 'in' condition right-hand-side value must be an Array of Strings, but "
                 "instead is " +
                   type_name_a_detailed(rhs.value));
  } else if (lhs.value.is_string()) {
    present = contains_string(haystack, lhs.value.as_string());
  } else if (lhs.value.is_array()) {
    if (!isa<EvaluatedVar>(cond->lhs)) {
      throw EvaluationError(
        lhs.range,
        "'If' 'in' condition left-hand-side value cannot be a literal Array Of Strings. Instead "
        "use an evaluated variable.");
    }
    const std::vector<Value> & needles = lhs.value.as_array();
    if (!needles.empty() && !needles.front().is_string()) {
      throw EvaluationError(
        lhs.range, "'If' 'in' condition left-hand-side value must be either a String or an "
                   "Array of Strings, but instead is " +
                     type_name_a_detailed(lhs.value));
    }
    // Every needle must be present.
    present = std::all_of(needles.begin(), needles.end(), [&](const Value & needle) {
      return contains_string(haystack, needle.as_string());
    });
  } else {
    throw EvaluationError(
      lhs.range, "'If' 'in' condition left-hand-side value must be either a String or an Array "
                 "of Strings, but instead is " +
                   type_name_a(lhs.value));
  }

  return cond->negated ? !present : present;
}

// ============================================================================
// Directives
// ============================================================================

void EvaluationSession::evaluate_include(const IncludeDirective * stmt)
{
  const SourceRange path_range = stmt->path->get_range();
  const std::string uri = resolve_uri(current_dir_uri(), stmt->path->value);

  data_.includeReferences.push_back(IncludeReference{uri, to_file_range(path_range)});
  data_.add_include_definition(uri);

  if (onceUris_.count(uri) > 0) {
    return;
  }

  const ParsedFile * file = nullptr;
  try {
    file = &provider_.get_parse_data(uri);
  } catch (const FileReadError & e) {
    throw EvaluationError(path_range, std::string("Unable to open include: ") + e.what());
  }

  ScopeVariable * current_dir = scopes_.root().find("_CURRENT_BFF_DIR_");
  Value saved_dir;
  if (current_dir != nullptr) {
    saved_dir = current_dir->value;
    current_dir->value = Value::make_string(relative_path(rootDirUri_, uri_dirname(uri)));
  }
  const ParsedFile * saved_file = currentFile_;

  evaluate_file(*file);

  currentFile_ = saved_file;
  if (current_dir != nullptr) {
    current_dir->value = std::move(saved_dir);
  }
}

void EvaluationSession::evaluate_if_directive(const IfDirective * stmt)
{
  const bool taken = evaluate_condition(stmt->condition);
  evaluate_statements(taken ? stmt->thenBody : stmt->elseBody);
}

void EvaluationSession::evaluate_define(const DefineDirective * stmt)
{
  const std::string symbol(stmt->symbol);
  const SourceRange range = stmt->get_range();

  if (defines_.is_defined(symbol)) {
    const auto it = defines_.userRanges.find(symbol);
    const SourceRange related = it != defines_.userRanges.end() ? it->second : SourceRange{};
    warn(
      range, "Cannot #define already defined symbol \"" + symbol + "\".", related,
      "Defined here");
    return;
  }

  const DefinitionId def = add_definition(symbol, range);
  add_reference({def}, range, ReferenceKind::Write);
  defines_.user.emplace(symbol, def);
  defines_.userRanges.emplace(symbol, range);
}

void EvaluationSession::evaluate_undef(const UndefDirective * stmt)
{
  const std::string symbol(stmt->symbol);
  if (symbol == defines_.builtin) {
    throw EvaluationError(
      stmt->get_range(), "Cannot #undef built-in symbol \"" + symbol + "\".");
  }
  if (defines_.user.count(symbol) == 0) {
    throw EvaluationError(
      stmt->get_range(), "Cannot #undef undefined symbol \"" + symbol + "\".");
  }
  defines_.user.erase(symbol);
  defines_.userRanges.erase(symbol);
}

void EvaluationSession::evaluate_import(const ImportDirective * stmt)
{
  const std::string name(stmt->variable);
  const SourceRange range = stmt->get_range();

  if (options_.environment.count(name) == 0) {
    throw EvaluationError(
      range, "Cannot import environment variable \"" + name + "\" because it does not exist.");
  }

  // The real environment value is not known at edit time.
  Value value = Value::make_string("placeholder-" + name + "-value");
  if (ScopeVariable * existing = scopes_.find_in_current(name)) {
    existing->value = std::move(value);
    add_reference(existing->definitions, range, ReferenceKind::Write);
    return;
  }
  const DefinitionId def = add_definition(name, range);
  scopes_.current().set(name, std::move(value), {def});
  add_reference({def}, range, ReferenceKind::Write);
}

void EvaluationSession::evaluate_file(const ParsedFile & file)
{
  currentFile_ = &file;
  evaluate_statements(file.program->statements);
}

}  // namespace bff::detail
