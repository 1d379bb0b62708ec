// bff/eval/evaluation_session.hpp - State of one evaluation (internal)
#pragma once

#include <gsl/span>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "bff/ast/ast.hpp"
#include "bff/basic/diagnostic.hpp"
#include "bff/eval/evaluated_data.hpp"
#include "bff/eval/evaluator.hpp"
#include "bff/eval/parse_data_provider.hpp"
#include "bff/eval/scope_stack.hpp"

namespace bff::detail
{

/// Scope depth past which user-function calls are treated as runaway recursion.
inline constexpr size_t k_max_scope_depth = 128;

/// A value together with the source it came from.
struct Evaluated
{
  Value value;
  SourceRange range;
};

/// `#define` symbols. The platform symbol has no source definition.
struct DefineTable
{
  std::string builtin;
  std::map<std::string, DefinitionId> user;
  std::map<std::string, SourceRange> userRanges;

  [[nodiscard]] bool is_defined(const std::string & symbol) const
  {
    return symbol == builtin || user.count(symbol) > 0;
  }
};

struct UserFunctionParam
{
  std::string name;
  DefinitionId definition = 0;
};

/// A declared user function. The body is evaluated only when called.
struct UserFunction
{
  std::string name;
  DefinitionId definition = 0;
  SourceRange nameRange;
  std::vector<UserFunctionParam> params;
  gsl::span<Stmt *> body;
  const ParsedFile * file = nullptr;
};

/// The statement an unnamed `+ value` line applies to.
struct PreviousStatement
{
  ScopeVariable * variable = nullptr;
  size_t recordIndex = 0;  ///< index into EvaluatedData::evaluatedVariables
};

struct TargetEntry
{
  DefinitionId id = 0;
  SourceRange range;
};

/// `.Targets` string of an Alias, resolved once all targets are known.
struct PendingTargetReference
{
  std::string name;
  FileRange range;
};

/**
 * Everything one evaluation mutates.
 *
 * Fatal problems are thrown as EvaluationError, ParseError or FileReadError
 * and caught by Evaluator::evaluate(); records written up to that point stay
 * in `data_`.
 */
class EvaluationSession
{
public:
  EvaluationSession(
    ParseDataProvider & provider, const EvaluationOptions & options, EvaluatedData & data,
    DiagnosticBag & warnings);

  void run(const std::string & root_uri);

  /// Resolves Alias `.Targets` names against all target definitions.
  void resolve_pending_target_references();

private:
  // ---------------------------------------------------------------------------
  // Statements (evaluate_stmt.cpp)
  // ---------------------------------------------------------------------------

  void evaluate_statements(gsl::span<Stmt * const> statements);
  void evaluate_statement(Stmt * stmt);

  PreviousStatement evaluate_assignment(const AssignmentStmt * stmt);
  PreviousStatement evaluate_operator(const OperatorStmt * stmt);
  PreviousStatement evaluate_unnamed_operator(const UnnamedOperatorStmt * stmt);
  void evaluate_scoped_block(const ScopedBlockStmt * stmt);
  void evaluate_using(const UsingStmt * stmt);
  void evaluate_for_each(const ForEachStmt * stmt);
  void evaluate_if(const IfStmt * stmt);
  void evaluate_generic_function(const GenericFunctionStmt * stmt);
  void evaluate_user_function_decl(const UserFunctionDeclStmt * stmt);
  void evaluate_user_function_call(const UserFunctionCallStmt * stmt);

  void check_required_properties(const GenericFunctionStmt * stmt);
  void collect_alias_targets();

  // ---------------------------------------------------------------------------
  // Expressions (evaluate_expr.cpp)
  // ---------------------------------------------------------------------------

  Evaluated evaluate_expr(const Expr * expr);
  Evaluated evaluate_var(const EvaluatedVar * var);
  Evaluated evaluate_template(const StringTemplate * tmpl);
  Evaluated evaluate_array(const ArrayLiteral * array);
  Evaluated evaluate_struct(const StructLiteral * literal);
  Evaluated evaluate_sum(const SumExpr * sum);

  /// Name of a `.Name` / `."$Dynamic$"` variable. Must evaluate to a String.
  std::string evaluate_var_name(const EvaluatedVar * var);

  /// Looks up a variable for reading by its scope rules, or throws.
  ScopeVariable & lookup_for_read(VarScope scope, const std::string & name, SourceRange range);

  void append_array_items(
    gsl::span<Expr * const> items, std::vector<Value> & out, std::optional<Value> & first_item);

  // ---------------------------------------------------------------------------
  // Conditions and the preprocessor (evaluate_directive.cpp)
  // ---------------------------------------------------------------------------

  bool evaluate_condition(const Cond * cond);
  bool evaluate_compare(const CompareCond * cond);
  bool evaluate_in(const InCond * cond);

  void evaluate_include(const IncludeDirective * stmt);
  void evaluate_if_directive(const IfDirective * stmt);
  void evaluate_define(const DefineDirective * stmt);
  void evaluate_undef(const UndefDirective * stmt);
  void evaluate_import(const ImportDirective * stmt);

  void evaluate_file(const ParsedFile & file);
  void bind_builtins();

  // ---------------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------------

  [[nodiscard]] FileRange to_file_range(SourceRange range) const;

  DefinitionId add_definition(const std::string & name, SourceRange range);
  void add_reference(std::vector<DefinitionId> definitions, SourceRange range, ReferenceKind kind);
  void add_reference(std::vector<DefinitionId> definitions, FileRange range, ReferenceKind kind);
  /// Returns the index of the new record.
  size_t add_evaluated(const Value & value, SourceRange range);

  void warn(SourceRange range, std::string message);
  void warn(SourceRange range, std::string message, SourceRange related, std::string related_message);

  [[nodiscard]] std::string current_dir_uri() const;

  ParseDataProvider & provider_;
  const EvaluationOptions & options_;
  EvaluatedData & data_;
  DiagnosticBag & warnings_;

  ScopeStack scopes_;
  DefineTable defines_;
  DefinitionId nextDefinitionId_ = 1;

  std::string rootDirUri_;
  const ParsedFile * currentFile_ = nullptr;
  std::set<std::string> onceUris_;

  std::unordered_map<std::string, UserFunction> userFunctions_;
  std::unordered_map<std::string, TargetEntry> targets_;
  std::vector<PendingTargetReference> pendingTargetReferences_;

  /// Target of a following `+ value` line, if the last statement left one.
  std::optional<PreviousStatement> previous_;
};

}  // namespace bff::detail
