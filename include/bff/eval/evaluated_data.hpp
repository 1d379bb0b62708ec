// bff/eval/evaluated_data.hpp - Records produced by one evaluation
//
// Everything editor features need is captured here as plain data addressed
// by URI ranges: the values seen at each variable occurrence, every variable
// definition and reference, build targets and include edges.
//
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bff/basic/source_manager.hpp"
#include "bff/eval/value.hpp"

namespace bff
{

/// A value observed at one textual occurrence of a variable.
struct EvaluatedVariable
{
  Value value;
  FileRange range;
};

/// One place where a variable is bound.
struct VariableDefinition
{
  DefinitionId id = 0;
  std::string name;
  FileRange range;
};

enum class ReferenceKind : uint8_t {
  Read,
  Write,
  ReadWrite,  ///< `.A + value`
};

[[nodiscard]] constexpr std::string_view to_string(ReferenceKind k) noexcept
{
  switch (k) {
    case ReferenceKind::Read:
      return "read";
    case ReferenceKind::Write:
      return "write";
    case ReferenceKind::ReadWrite:
      return "readWrite";
  }
  return "";
}

/// One use of a variable. A use can resolve to several definitions (Using).
struct VariableReference
{
  std::vector<DefinitionId> definitions;
  FileRange range;
  ReferenceKind kind = ReferenceKind::Read;
};

/// Target declared by a build function, e.g. `Alias( 'All' )`.
struct TargetDefinition
{
  DefinitionId id = 0;
  std::string name;
  FileRange range;
};

struct TargetReference
{
  DefinitionId definition = 0;
  FileRange range;
};

/// `#include 'path'`: the quoted path and the file it resolves to.
struct IncludeReference
{
  std::string includeUri;
  FileRange range;
};

/// Body of a build function, braces excluded.
struct GenericFunctionBody
{
  std::string functionName;
  FileRange bodyRange;
};

// ============================================================================
// EvaluatedData
// ============================================================================

class EvaluatedData
{
public:
  std::vector<EvaluatedVariable> evaluatedVariables;
  std::vector<VariableDefinition> variableDefinitions;
  std::vector<VariableReference> variableReferences;
  std::vector<TargetDefinition> targetDefinitions;
  std::vector<TargetReference> targetReferences;
  std::vector<IncludeReference> includeReferences;
  /// Included file URIs, in first-include order, without duplicates.
  std::vector<std::string> includeDefinitions;
  std::vector<GenericFunctionBody> genericFunctionBodies;

  /**
   * Definition with the given id, or nullptr.
   *
   * Definitions are appended in id order, so this is a binary search.
   */
  [[nodiscard]] const VariableDefinition * find_variable_definition(DefinitionId id) const noexcept;

  [[nodiscard]] const TargetDefinition * find_target_definition(DefinitionId id) const noexcept;

  void add_include_definition(const std::string & uri);
};

}  // namespace bff
