// bff/eval/scope_stack.cpp - Lexical scopes of an evaluation
#include "bff/eval/scope_stack.hpp"

#include <iterator>
#include <utility>

namespace bff
{

ScopeVariable * Scope::find(std::string_view name)
{
  const auto it = variables_.find(std::string(name));
  return it == variables_.end() ? nullptr : &it->second;
}

const ScopeVariable * Scope::find(std::string_view name) const
{
  const auto it = variables_.find(std::string(name));
  return it == variables_.end() ? nullptr : &it->second;
}

ScopeVariable & Scope::set(
  const std::string & name, Value value, std::vector<DefinitionId> definitions)
{
  const auto it = variables_.find(name);
  if (it != variables_.end()) {
    it->second.value = std::move(value);
    return it->second;
  }
  order_.push_back(name);
  auto & var = variables_[name];
  var.value = std::move(value);
  var.definitions = std::move(definitions);
  return var;
}

ScopeVariable * ScopeStack::find_visible(std::string_view name)
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (auto * var = it->find(name)) {
      return var;
    }
    if (!it->can_access_parent()) {
      return nullptr;
    }
  }
  return nullptr;
}

ScopeVariable * ScopeStack::find_in_parents(std::string_view name)
{
  if (!has_parent() || !current().can_access_parent()) {
    return nullptr;
  }
  // Start one below the innermost scope.
  for (auto it = std::next(scopes_.rbegin()); it != scopes_.rend(); ++it) {
    if (auto * var = it->find(name)) {
      return var;
    }
    if (!it->can_access_parent()) {
      return nullptr;
    }
  }
  return nullptr;
}

}  // namespace bff
