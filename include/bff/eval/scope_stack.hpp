// bff/eval/scope_stack.hpp - Lexical scopes of an evaluation
#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bff/eval/value.hpp"

namespace bff
{

/**
 * A variable bound in a scope.
 *
 * `definitions` is empty for built-ins, which have no source location.
 */
struct ScopeVariable
{
  Value value;
  std::vector<DefinitionId> definitions;
};

// ============================================================================
// Scope
// ============================================================================

/**
 * Variables of one lexical scope, in insertion order.
 *
 * Struct literals turn their scope into a Struct, so the order in which
 * variables were first bound is kept.
 */
class Scope
{
public:
  explicit Scope(bool can_access_parent) : canAccessParent_(can_access_parent) {}

  [[nodiscard]] bool can_access_parent() const noexcept { return canAccessParent_; }

  [[nodiscard]] ScopeVariable * find(std::string_view name);
  [[nodiscard]] const ScopeVariable * find(std::string_view name) const;

  /// Binds `name`. An existing binding keeps its definitions; only the value changes.
  ScopeVariable & set(const std::string & name, Value value, std::vector<DefinitionId> definitions);

  /// Variable names in the order they were first bound.
  [[nodiscard]] const std::vector<std::string> & names() const noexcept { return order_; }

private:
  bool canAccessParent_;
  std::unordered_map<std::string, ScopeVariable> variables_;
  std::vector<std::string> order_;
};

// ============================================================================
// ScopeStack
// ============================================================================

/**
 * The chain of scopes from the root to the innermost one.
 *
 * A private scope (user function bodies) sees none of its ancestors.
 */
class ScopeStack
{
public:
  ScopeStack() { push(); }

  void push(bool can_access_parent = true) { scopes_.emplace_back(can_access_parent); }
  void pop() { scopes_.pop_back(); }

  [[nodiscard]] size_t depth() const noexcept { return scopes_.size(); }

  [[nodiscard]] Scope & current() noexcept { return scopes_.back(); }
  [[nodiscard]] Scope & root() noexcept { return scopes_.front(); }

  /// `.Name` for reads: the current scope, then each visible ancestor.
  [[nodiscard]] ScopeVariable * find_visible(std::string_view name);

  /// `^Name`: visible ancestors only, nullptr when there is none.
  [[nodiscard]] ScopeVariable * find_in_parents(std::string_view name);

  [[nodiscard]] ScopeVariable * find_in_current(std::string_view name)
  {
    return current().find(name);
  }

  /// True when `^` can be used at all: there is a scope above the current one.
  [[nodiscard]] bool has_parent() const noexcept { return scopes_.size() >= 2; }

private:
  // Outer scopes are held by reference while inner ones are pushed.
  std::deque<Scope> scopes_;
};

}  // namespace bff
