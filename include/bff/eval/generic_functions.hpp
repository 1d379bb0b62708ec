// bff/eval/generic_functions.hpp - Properties of the built-in build functions
#pragma once

#include <string_view>
#include <vector>

namespace bff
{

struct FunctionProperty
{
  std::string_view name;
  bool required = false;
};

/// A build function such as `Library` or `Settings` and the properties its body may set.
struct GenericFunctionInfo
{
  std::string_view name;
  bool takesTargetName = true;
  std::vector<FunctionProperty> properties;
};

/// Every build function, `Settings` included.
[[nodiscard]] const std::vector<GenericFunctionInfo> & generic_functions();

/// nullptr for names that are not build functions.
[[nodiscard]] const GenericFunctionInfo * find_generic_function(std::string_view name);

}  // namespace bff
