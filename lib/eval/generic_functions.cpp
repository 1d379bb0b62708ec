// bff/eval/generic_functions.cpp - Properties of the built-in build functions
#include "bff/eval/generic_functions.hpp"

#include <algorithm>

namespace bff
{
namespace
{

constexpr bool k_required = true;
constexpr bool k_optional = false;

std::vector<GenericFunctionInfo> build_table()
{
  const std::vector<FunctionProperty> linker = {
    {"Linker", k_required},
    {"LinkerOutput", k_required},
    {"LinkerOptions", k_required},
    {"Libraries", k_required},
    {"Libraries2", k_optional},
    {"LinkerType", k_optional},
    {"LinkerLinkObjects", k_optional},
    {"LinkerAssemblyResources", k_optional},
    {"LinkerStampExe", k_optional},
    {"LinkerStampExeArgs", k_optional},
    {"LinkerAllowResponseFile", k_optional},
    {"LinkerForceResponseFile", k_optional},
    {"Environment", k_optional},
    {"PreBuildDependencies", k_optional},
  };

  return {
    {"Alias", true, {{"Targets", k_required}, {"Hidden", k_optional}}},
    {"Compiler",
     true,
     {
       {"Executable", k_required},
       {"ExtraFiles", k_optional},
       {"CompilerFamily", k_optional},
       {"ExecutableRootPath", k_optional},
       {"AllowDistribution", k_optional},
       {"SimpleDistributionMode", k_optional},
       {"CustomEnvironmentVariables", k_optional},
       {"ClangRewriteIncludes", k_optional},
       {"AllowResponseFile", k_optional},
       {"ForceResponseFile", k_optional},
       {"Environment", k_optional},
     }},
    {"Copy",
     true,
     {
       {"Source", k_required},
       {"Dest", k_required},
       {"SourceBasePath", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"CopyDir",
     true,
     {
       {"SourcePaths", k_required},
       {"Dest", k_required},
       {"SourcePathsPattern", k_optional},
       {"SourcePathsRecurse", k_optional},
       {"SourceExcludePaths", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"CSAssembly",
     true,
     {
       {"Compiler", k_required},
       {"CompilerOptions", k_required},
       {"CompilerOutput", k_required},
       {"CompilerInputPath", k_optional},
       {"CompilerInputFiles", k_optional},
       {"CompilerReferences", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"DLL", true, linker},
    {"Exec",
     true,
     {
       {"ExecExecutable", k_required},
       {"ExecOutput", k_required},
       {"ExecInput", k_optional},
       {"ExecArguments", k_optional},
       {"ExecWorkingDir", k_optional},
       {"ExecReturnCode", k_optional},
       {"ExecUseStdOutAsOutput", k_optional},
       {"ExecAlways", k_optional},
       {"Environment", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"Executable", true, linker},
    {"Library",
     true,
     {
       {"Compiler", k_required},
       {"CompilerOptions", k_required},
       {"Librarian", k_required},
       {"LibrarianOptions", k_required},
       {"LibrarianOutput", k_required},
       {"LibrarianType", k_optional},
       {"LibrarianAdditionalInputs", k_optional},
       {"CompilerOutputPath", k_optional},
       {"CompilerInputPath", k_optional},
       {"CompilerInputPattern", k_optional},
       {"CompilerInputFiles", k_optional},
       {"CompilerInputUnity", k_optional},
       {"PCHInputFile", k_optional},
       {"PCHOutputFile", k_optional},
       {"PCHOptions", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"ListDependencies",
     true,
     {
       {"Source", k_required},
       {"Dest", k_required},
       {"Patterns", k_optional},
     }},
    {"ObjectList",
     true,
     {
       {"Compiler", k_required},
       {"CompilerOptions", k_required},
       {"CompilerOutputPath", k_optional},
       {"CompilerOutputExtension", k_optional},
       {"CompilerInputPath", k_optional},
       {"CompilerInputPattern", k_optional},
       {"CompilerInputFiles", k_optional},
       {"CompilerInputUnity", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"RemoveDir",
     true,
     {
       {"RemovePaths", k_required},
       {"RemovePathsRecurse", k_optional},
       {"RemovePatterns", k_optional},
       {"RemoveExcludePaths", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"Settings",
     false,
     {
       {"Environment", k_optional},
       {"CachePath", k_optional},
       {"CachePluginDLL", k_optional},
       {"Workers", k_optional},
       {"WorkerConnectionLimit", k_optional},
       {"DistributableJobMemoryLimitMiB", k_optional},
     }},
    {"Test",
     true,
     {
       {"TestExecutable", k_required},
       {"TestOutput", k_required},
       {"TestArguments", k_optional},
       {"TestWorkingDir", k_optional},
       {"TestTimeOut", k_optional},
       {"TestAlwaysShowOutput", k_optional},
       {"Environment", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"TextFile",
     true,
     {
       {"TextFileOutput", k_required},
       {"TextFileInputStrings", k_required},
       {"TextFileAlways", k_optional},
       {"Hidden", k_optional},
     }},
    {"Unity",
     true,
     {
       {"UnityOutputPath", k_required},
       {"UnityInputPath", k_optional},
       {"UnityInputPattern", k_optional},
       {"UnityInputFiles", k_optional},
       {"UnityInputExcludePath", k_optional},
       {"UnityNumFiles", k_optional},
       {"UnityOutputPattern", k_optional},
       {"UnityPCH", k_optional},
       {"PreBuildDependencies", k_optional},
     }},
    {"VCXProject",
     true,
     {
       {"ProjectOutput", k_required},
       {"ProjectInputPaths", k_optional},
       {"ProjectFiles", k_optional},
       {"ProjectConfigs", k_optional},
       {"ProjectBasePath", k_optional},
     }},
    {"VSProjectExternal",
     true,
     {
       {"ExternalProjectPath", k_required},
       {"ProjectGuid", k_optional},
       {"ProjectConfigs", k_optional},
     }},
    {"VSSolution",
     true,
     {
       {"SolutionOutput", k_required},
       {"SolutionProjects", k_optional},
       {"SolutionConfigs", k_optional},
       {"SolutionFolders", k_optional},
       {"SolutionVisualStudioVersion", k_optional},
     }},
    {"XCodeProject",
     true,
     {
       {"ProjectOutput", k_required},
       {"ProjectConfigs", k_required},
       {"ProjectInputPaths", k_optional},
       {"ProjectFiles", k_optional},
       {"ProjectBasePath", k_optional},
     }},
  };
}

}  // namespace

const std::vector<GenericFunctionInfo> & generic_functions()
{
  static const std::vector<GenericFunctionInfo> table = build_table();
  return table;
}

const GenericFunctionInfo * find_generic_function(std::string_view name)
{
  const auto & table = generic_functions();
  const auto it = std::find_if(
    table.begin(), table.end(), [&](const GenericFunctionInfo & f) { return f.name == name; });
  return it == table.end() ? nullptr : &*it;
}

}  // namespace bff
