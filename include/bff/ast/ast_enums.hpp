// bff/ast/ast_enums.hpp - AST enumeration definitions
//
// This header contains the enumeration types used in the BFF AST: node
// kinds, operators and variable scope markers.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace bff
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Auto-generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "bff/ast/ast_nodes.def"

// === Conditions ===
#define AST_NODE_COND(Class, Kind, Snake) Kind,
#include "bff/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "bff/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "bff/ast/ast_nodes.def"
};

// ============================================================================
// Variable scope
// ============================================================================

/**
 * Where a variable name is looked up.
 */
enum class VarScope : uint8_t {
  Current,  ///< .Name - the current scope, then outward
  Parent,   ///< ^Name - starting at the parent scope
};

// ============================================================================
// Operators
// ============================================================================

/// Value operators: the only arithmetic the language has.
enum class SumOp : uint8_t {
  Add,  ///< +
  Sub,  ///< -
};

/// Comparison operators of If().
enum class CompareOp : uint8_t {
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
};

/// Logical connectives of If() and #if.
enum class LogicalOp : uint8_t {
  And,  ///< &&
  Or,   ///< ||
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(VarScope scope) noexcept
{
  switch (scope) {
    case VarScope::Current:
      return "current";
    case VarScope::Parent:
      return "parent";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(SumOp op) noexcept
{
  switch (op) {
    case SumOp::Add:
      return "+";
    case SumOp::Sub:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(CompareOp op) noexcept
{
  switch (op) {
    case CompareOp::Eq:
      return "==";
    case CompareOp::Ne:
      return "!=";
    case CompareOp::Lt:
      return "<";
    case CompareOp::Le:
      return "<=";
    case CompareOp::Gt:
      return ">";
    case CompareOp::Ge:
      return ">=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(LogicalOp op) noexcept
{
  switch (op) {
    case LogicalOp::And:
      return "&&";
    case LogicalOp::Or:
      return "||";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_COND(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Kind;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Kind;
#include "bff/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Node Categories
// ============================================================================

namespace detail
{

/// First expression node kind
inline constexpr NodeKind k_first_expr_kind = NodeKind::BoolLiteral;
/// Last expression node kind
inline constexpr NodeKind k_last_expr_kind = NodeKind::Sum;

/// First condition node kind
inline constexpr NodeKind k_first_cond_kind = NodeKind::BoolCond;
/// Last condition node kind
inline constexpr NodeKind k_last_cond_kind = NodeKind::FileExistsCond;

/// First statement node kind
inline constexpr NodeKind k_first_stmt_kind = NodeKind::Assignment;
/// Last statement node kind
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Import;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a condition
[[nodiscard]] constexpr bool is_cond_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_cond_kind && kind <= detail::k_last_cond_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

}  // namespace bff
