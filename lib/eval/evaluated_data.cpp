// bff/eval/evaluated_data.cpp - Records produced by one evaluation
#include "bff/eval/evaluated_data.hpp"

#include <algorithm>

namespace bff
{

const VariableDefinition * EvaluatedData::find_variable_definition(DefinitionId id) const noexcept
{
  const auto it = std::lower_bound(
    variableDefinitions.begin(), variableDefinitions.end(), id,
    [](const VariableDefinition & d, DefinitionId value) { return d.id < value; });
  if (it == variableDefinitions.end() || it->id != id) {
    return nullptr;
  }
  return &*it;
}

const TargetDefinition * EvaluatedData::find_target_definition(DefinitionId id) const noexcept
{
  const auto it = std::lower_bound(
    targetDefinitions.begin(), targetDefinitions.end(), id,
    [](const TargetDefinition & d, DefinitionId value) { return d.id < value; });
  if (it == targetDefinitions.end() || it->id != id) {
    return nullptr;
  }
  return &*it;
}

void EvaluatedData::add_include_definition(const std::string & uri)
{
  if (std::find(includeDefinitions.begin(), includeDefinitions.end(), uri) ==
      includeDefinitions.end()) {
    includeDefinitions.push_back(uri);
  }
}

}  // namespace bff
