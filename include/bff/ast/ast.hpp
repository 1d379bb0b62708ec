// bff/ast/ast.hpp - AST node class definitions for BFF files
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "bff/ast/ast_enums.hpp"
#include "bff/basic/casting.hpp"
#include "bff/basic/source_manager.hpp"

namespace bff
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceRegistry.

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  /// Get the node kind
  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  /// Get the source range (byte offsets only)
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for values: literals, evaluated variables, arrays, structs
 * and sums.
 */
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for the conditions of If() and #if.
 */
class Cond : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_cond_kind(node->kind); }

protected:
  explicit Cond(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements, preprocessor directives included.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// `true` / `false`
class BoolLiteral : public NodeBase<BoolLiteral, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteral(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Decimal integer, possibly negative.
class IntLiteral : public NodeBase<IntLiteral, Expr, NodeKind::IntLiteral>
{
public:
  int32_t value;

  explicit IntLiteral(int32_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String without interpolation. `value` has its escapes resolved.
class StringLiteral : public NodeBase<StringLiteral, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteral(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/**
 * One piece of a string template: either literal text or a `$Name$`
 * interpolation. For interpolations `text` is the variable name and `range`
 * covers the dollars.
 */
struct TemplatePart
{
  bool isVariable = false;
  std::string_view text;
  SourceRange range;
};

/// String containing at least one `$Name$` interpolation.
class StringTemplate : public NodeBase<StringTemplate, Expr, NodeKind::StringTemplate>
{
public:
  gsl::span<TemplatePart> parts;

  explicit StringTemplate(gsl::span<TemplatePart> p, SourceRange r = {}) : NodeBase(r), parts(p) {}
};

/**
 * `.Name`, `^Name` or a dynamic `."$Prefix$Name"`.
 *
 * `name` is a StringLiteral for static names (its range excludes the sigil)
 * or a StringTemplate for dynamic ones. The node's own range includes the
 * sigil.
 */
class EvaluatedVar : public NodeBase<EvaluatedVar, Expr, NodeKind::EvaluatedVar>
{
public:
  VarScope scope;
  Expr * name;

  EvaluatedVar(VarScope s, Expr * n, SourceRange r = {}) : NodeBase(r), scope(s), name(n) {}
};

/// `{ item, item ... }`
class ArrayLiteral : public NodeBase<ArrayLiteral, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> items;

  explicit ArrayLiteral(gsl::span<Expr *> i, SourceRange r = {}) : NodeBase(r), items(i) {}
};

/// `#if` block of array items. Only appears inside ArrayLiteral::items.
class ConditionalItems : public NodeBase<ConditionalItems, Expr, NodeKind::ConditionalItems>
{
public:
  Cond * condition;
  gsl::span<Expr *> thenItems;
  gsl::span<Expr *> elseItems;

  explicit ConditionalItems(Cond * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/// `[ statements ]`
class StructLiteral : public NodeBase<StructLiteral, Expr, NodeKind::StructLiteral>
{
public:
  gsl::span<Stmt *> statements;

  explicit StructLiteral(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

/// One `+ value` / `- value` term of a sum. `opRange` covers the operator.
struct Summand
{
  SumOp op = SumOp::Add;
  SourceRange opRange;
  Expr * value = nullptr;
};

/// `first + a - b ...` written on one logical line.
class SumExpr : public NodeBase<SumExpr, Expr, NodeKind::Sum>
{
public:
  Expr * first;
  gsl::span<Summand> summands;

  SumExpr(Expr * f, gsl::span<Summand> s, SourceRange r = {})
  : NodeBase(r), first(f), summands(s)
  {
  }
};

// ============================================================================
// Condition Nodes
// ============================================================================

/// A value used as a condition: `If( .Flag )`, `If( true )`.
class BoolCond : public NodeBase<BoolCond, Cond, NodeKind::BoolCond>
{
public:
  Expr * value;

  explicit BoolCond(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `lhs == rhs` and the other ordering comparisons.
class CompareCond : public NodeBase<CompareCond, Cond, NodeKind::CompareCond>
{
public:
  CompareOp op;
  SourceRange opRange;
  Expr * lhs;
  Expr * rhs;

  CompareCond(CompareOp o, SourceRange opr, Expr * l, Expr * r, SourceRange range = {})
  : NodeBase(range), op(o), opRange(opr), lhs(l), rhs(r)
  {
  }
};

/// `lhs in rhs` / `lhs not in rhs`
class InCond : public NodeBase<InCond, Cond, NodeKind::InCond>
{
public:
  bool negated;
  Expr * lhs;
  Expr * rhs;

  InCond(bool n, Expr * l, Expr * r, SourceRange range = {})
  : NodeBase(range), negated(n), lhs(l), rhs(r)
  {
  }
};

/// `!cond`
class NotCond : public NodeBase<NotCond, Cond, NodeKind::NotCond>
{
public:
  Cond * operand;

  explicit NotCond(Cond * o, SourceRange r = {}) : NodeBase(r), operand(o) {}
};

/// `lhs && rhs`, `lhs || rhs`
class LogicalCond : public NodeBase<LogicalCond, Cond, NodeKind::LogicalCond>
{
public:
  LogicalOp op;
  Cond * lhs;
  Cond * rhs;

  LogicalCond(LogicalOp o, Cond * l, Cond * r, SourceRange range = {})
  : NodeBase(range), op(o), lhs(l), rhs(r)
  {
  }
};

/// `#if SYMBOL`
class SymbolCond : public NodeBase<SymbolCond, Cond, NodeKind::SymbolCond>
{
public:
  std::string_view symbol;

  explicit SymbolCond(std::string_view s, SourceRange r = {}) : NodeBase(r), symbol(s) {}
};

/// `#if exists( ENV_VAR )`
class EnvExistsCond : public NodeBase<EnvExistsCond, Cond, NodeKind::EnvExistsCond>
{
public:
  std::string_view variable;

  explicit EnvExistsCond(std::string_view v, SourceRange r = {}) : NodeBase(r), variable(v) {}
};

/// `#if file_exists( 'path' )`
class FileExistsCond : public NodeBase<FileExistsCond, Cond, NodeKind::FileExistsCond>
{
public:
  StringLiteral * path;

  explicit FileExistsCond(StringLiteral * p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `lhs = rhs`
class AssignmentStmt : public NodeBase<AssignmentStmt, Stmt, NodeKind::Assignment>
{
public:
  EvaluatedVar * lhs;
  Expr * rhs;

  AssignmentStmt(EvaluatedVar * l, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), rhs(r)
  {
  }
};

/// `lhs + rhs`, `lhs - rhs`
class OperatorStmt : public NodeBase<OperatorStmt, Stmt, NodeKind::Operator>
{
public:
  EvaluatedVar * lhs;
  SumOp op;
  Expr * rhs;

  OperatorStmt(EvaluatedVar * l, SumOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// `+ rhs` at the start of a line. The range starts at the operator.
class UnnamedOperatorStmt
: public NodeBase<UnnamedOperatorStmt, Stmt, NodeKind::UnnamedOperator>
{
public:
  SumOp op;
  Expr * rhs;

  UnnamedOperatorStmt(SumOp o, Expr * r, SourceRange range = {}) : NodeBase(range), op(o), rhs(r)
  {
  }
};

/// `{ statements }`
class ScopedBlockStmt : public NodeBase<ScopedBlockStmt, Stmt, NodeKind::ScopedBlock>
{
public:
  gsl::span<Stmt *> statements;

  explicit ScopedBlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), statements(s) {}
};

/// `Using( .Struct )`
class UsingStmt : public NodeBase<UsingStmt, Stmt, NodeKind::Using>
{
public:
  Expr * operand;

  explicit UsingStmt(Expr * o, SourceRange r = {}) : NodeBase(r), operand(o) {}
};

/// `.Item in .Array` inside ForEach( ... )
struct ForEachIterator
{
  EvaluatedVar * loopVar = nullptr;
  Expr * array = nullptr;
};

/// `ForEach( .Item in .Array [, ...] ) { body }`
class ForEachStmt : public NodeBase<ForEachStmt, Stmt, NodeKind::ForEach>
{
public:
  gsl::span<ForEachIterator> iterators;
  gsl::span<Stmt *> body;

  explicit ForEachStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `If( condition ) { body }`
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  Cond * condition;
  gsl::span<Stmt *> body;

  explicit IfStmt(Cond * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/**
 * Build-declaration function: `Alias( 'Name' ) { ... }`, `Settings { ... }`
 * and the rest of the built-in function set.
 *
 * `headerRange` runs from the function name through the closing `)` (or the
 * name alone when there are no parentheses). `bodyRange` excludes the braces.
 */
class GenericFunctionStmt
: public NodeBase<GenericFunctionStmt, Stmt, NodeKind::GenericFunction>
{
public:
  std::string_view functionName;
  SourceRange nameRange;
  SourceRange headerRange;
  Expr * targetName = nullptr;  ///< nullptr when the function takes no argument
  gsl::span<Stmt *> body;
  SourceRange bodyRange;

  GenericFunctionStmt(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), functionName(n), nameRange(nr)
  {
  }
};

/// `Print( value )`
class PrintStmt : public NodeBase<PrintStmt, Stmt, NodeKind::Print>
{
public:
  Expr * value;

  explicit PrintStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `Error( message )`
class ErrorStmt : public NodeBase<ErrorStmt, Stmt, NodeKind::Error>
{
public:
  Expr * value;

  explicit ErrorStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Parameter of a user function. `name` excludes the leading `.`.
struct FunctionParam
{
  std::string_view name;
  SourceRange range;
};

/// `function Name( .A .B ) { body }`
class UserFunctionDeclStmt
: public NodeBase<UserFunctionDeclStmt, Stmt, NodeKind::UserFunctionDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  gsl::span<FunctionParam> params;
  gsl::span<Stmt *> body;

  UserFunctionDeclStmt(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// `Name( args )` for a name that is not a built-in function.
class UserFunctionCallStmt
: public NodeBase<UserFunctionCallStmt, Stmt, NodeKind::UserFunctionCall>
{
public:
  std::string_view name;
  SourceRange nameRange;
  gsl::span<Expr *> args;

  UserFunctionCallStmt(std::string_view n, SourceRange nr, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr)
  {
  }
};

/// `#include 'path'`
class IncludeDirective : public NodeBase<IncludeDirective, Stmt, NodeKind::Include>
{
public:
  StringLiteral * path;

  explicit IncludeDirective(StringLiteral * p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

/// `#once`
class OnceDirective : public NodeBase<OnceDirective, Stmt, NodeKind::Once>
{
public:
  explicit OnceDirective(SourceRange r = {}) : NodeBase(r) {}
};

/// `#if cond ... [#else ...] #endif`
class IfDirective : public NodeBase<IfDirective, Stmt, NodeKind::IfDirective>
{
public:
  Cond * condition;
  gsl::span<Stmt *> thenBody;
  gsl::span<Stmt *> elseBody;

  explicit IfDirective(Cond * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/// `#define SYMBOL`. The range covers the whole directive.
class DefineDirective : public NodeBase<DefineDirective, Stmt, NodeKind::Define>
{
public:
  std::string_view symbol;

  explicit DefineDirective(std::string_view s, SourceRange r = {}) : NodeBase(r), symbol(s) {}
};

/// `#undef SYMBOL`
class UndefDirective : public NodeBase<UndefDirective, Stmt, NodeKind::Undef>
{
public:
  std::string_view symbol;

  explicit UndefDirective(std::string_view s, SourceRange r = {}) : NodeBase(r), symbol(s) {}
};

/// `#import ENV_VAR`
class ImportDirective : public NodeBase<ImportDirective, Stmt, NodeKind::Import>
{
public:
  std::string_view variable;

  explicit ImportDirective(std::string_view v, SourceRange r = {}) : NodeBase(r), variable(v) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// Program (root AST node): the statements of one file.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> statements;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Get the SourceRange from any AST node.
 */
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace bff
