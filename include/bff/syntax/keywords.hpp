// bff/syntax/keywords.hpp - Reserved words and built-in function names
#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace bff::syntax
{

// Functions that declare a build target: `Name( 'target' ) { ... }`.
inline constexpr std::array<std::string_view, 19> k_generic_function_names = {
  "Alias",      "Compiler",   "Copy",      "CopyDir",      "CSAssembly",
  "DLL",        "Exec",       "Executable", "Library",     "ListDependencies",
  "ObjectList", "RemoveDir",  "Test",      "TextFile",     "Unity",
  "VCXProject", "VSProjectExternal", "VSSolution", "XCodeProject",
};

// Built-in statements with their own grammar.
inline constexpr std::array<std::string_view, 6> k_builtin_statement_names = {
  "ForEach", "If", "Using", "Print", "Error", "Settings",
};

// Words a user function may not be named after.
inline constexpr std::array<std::string_view, 5> k_reserved_function_names = {
  "true", "false", "in", "not", "function",
};

[[nodiscard]] inline bool is_generic_function_name(std::string_view name) noexcept
{
  return std::find(k_generic_function_names.begin(), k_generic_function_names.end(), name) !=
         k_generic_function_names.end();
}

[[nodiscard]] inline bool is_builtin_function_name(std::string_view name) noexcept
{
  return is_generic_function_name(name) ||
         std::find(k_builtin_statement_names.begin(), k_builtin_statement_names.end(), name) !=
           k_builtin_statement_names.end();
}

[[nodiscard]] inline bool is_reserved_function_name(std::string_view name) noexcept
{
  return is_builtin_function_name(name) ||
         std::find(k_reserved_function_names.begin(), k_reserved_function_names.end(), name) !=
           k_reserved_function_names.end();
}

}  // namespace bff::syntax
