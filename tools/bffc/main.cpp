// bffc - FASTBuild BFF evaluator command line interface
//
// Usage:
//   bffc check [file.bff | --project]
//   bffc dump  [file.bff | --project]
//   bffc parse <file.bff>
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "bff/ast/ast_context.hpp"
#include "bff/ast/json_visitor.hpp"
#include "bff/basic/diagnostic_printer.hpp"
#include "bff/basic/uri.hpp"
#include "bff/eval/evaluator.hpp"
#include "bff/eval/file_system.hpp"
#include "bff/eval/json_dump.hpp"
#include "bff/eval/parse_data_provider.hpp"
#include "bff/project/project_config.hpp"
#include "bff/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr const char * k_tool_name = "bffc";

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    std::cerr,
    "FASTBuild BFF evaluator v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  check [file.bff]          Evaluate and report errors and warnings\n"
    "  dump [file.bff]           Print the evaluated data as JSON\n"
    "  parse <file.bff>          Print the syntax tree as JSON\n\n"
    "Options:\n"
    "  --platform <name>         linux, osx or windows (default: host)\n"
    "  -D <NAME=VALUE>           Set an environment variable (repeatable)\n"
    "  --project                 Use bff.yaml found in the current directory or parents\n"
    "  -v, --verbose             Verbose output\n"
    "  -h, --help                Show this help message\n",
    program_name);
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string platform;
  std::vector<std::pair<std::string, std::string>> defines;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--platform") {
      if (i + 1 < argc) {
        args.platform = argv[++i];
      } else {
        args.error = "--platform requires a value";
      }
    } else if (arg == "-D") {
      if (i + 1 >= argc) {
        args.error = "-D requires NAME=VALUE";
        continue;
      }
      const std::string def = argv[++i];
      const auto eq = def.find('=');
      if (eq == std::string::npos || eq == 0) {
        args.error = fmt::format("invalid -D value '{}' (expected NAME=VALUE)", def);
      } else {
        args.defines.emplace_back(def.substr(0, eq), def.substr(eq + 1));
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = fmt::format("unexpected argument '{}'", arg);
    }
  }

  return args;
}

// ============================================================================
// Input Resolution
// ============================================================================

struct Input
{
  fs::path root_file;
  bff::EvaluationOptions options;
};

/// Root file and evaluation options from the arguments and, with --project, bff.yaml.
std::optional<Input> resolve_input(const CommandArgs & args)
{
  Input input;
  bff::ProjectConfig config;

  if (args.use_project) {
    const auto config_path = bff::find_project_config(fs::current_path());
    if (!config_path) {
      fmt::print(
        std::cerr, "error: no {} found in current directory or parents\n",
        bff::k_project_config_file_name);
      return std::nullopt;
    }

    auto loaded = bff::load_project_config(*config_path);
    if (!loaded.success) {
      fmt::print(std::cerr, "error: {}\n", loaded.error);
      return std::nullopt;
    }
    config = std::move(loaded.config);

    if (args.verbose) {
      fmt::print(std::cerr, "Using project: {}\n", config_path->string());
    }
  }

  if (!args.platform.empty()) {
    const auto platform = bff::parse_platform(args.platform);
    if (!platform) {
      fmt::print(
        std::cerr, "error: invalid platform '{}' (must be 'linux', 'osx' or 'windows')\n",
        args.platform);
      return std::nullopt;
    }
    config.platform = *platform;
  }

  for (const auto & [name, value] : args.defines) {
    config.environment[name] = value;
  }

  input.options = bff::make_evaluation_options(config);

  if (!args.input_file.empty()) {
    input.root_file = fs::absolute(args.input_file);
  } else if (config.root_file) {
    input.root_file = *config.root_file;
  } else {
    fmt::print(std::cerr, "error: no input file\n");
    return std::nullopt;
  }

  if (!fs::is_regular_file(input.root_file)) {
    fmt::print(std::cerr, "error: file not found: {}\n", input.root_file.string());
    return std::nullopt;
  }

  return input;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const auto input = resolve_input(args);
  if (!input) {
    return 1;
  }

  if (args.verbose) {
    fmt::print(std::cerr, "Checking: {}\n", input->root_file.string());
  }

  bff::DiskFileSystem fs;
  bff::ParseDataProvider provider(fs);
  bff::Evaluator evaluator(provider, input->options);
  const auto result = evaluator.evaluate(bff::path_to_file_uri(input->root_file.string()));

  bff::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(result.warnings, provider.sources());
  if (result.error) {
    printer.print(result.error->to_diagnostic(), provider.sources());
  }

  if (args.verbose || result.error || !result.warnings.empty()) {
    printer.print_summary(result.error ? 1 : 0, result.warnings.size());
  }

  if (result.error) {
    return 1;
  }

  fmt::print("{}: OK\n", input->root_file.string());
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  const auto input = resolve_input(args);
  if (!input) {
    return 1;
  }

  if (args.verbose) {
    fmt::print(std::cerr, "Evaluating: {}\n", input->root_file.string());
  }

  bff::DiskFileSystem fs;
  bff::ParseDataProvider provider(fs);
  bff::Evaluator evaluator(provider, input->options);
  const auto result = evaluator.evaluate(bff::path_to_file_uri(input->root_file.string()));

  std::cout << bff::to_json(result, provider.sources()).dump(2) << "\n";

  if (args.verbose) {
    fmt::print(
      std::cerr, "{} variables, {} targets, {} included files\n",
      result.data.variableDefinitions.size(), result.data.targetDefinitions.size(),
      result.data.includeDefinitions.size());
  }

  return result.error ? 1 : 0;
}

int cmd_parse(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    fmt::print(std::cerr, "error: input file required\n");
    fmt::print(std::cerr, "usage: {} parse <file.bff>\n", k_tool_name);
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);

  std::ifstream file(input_path, std::ios::binary);
  if (!file.is_open()) {
    fmt::print(std::cerr, "error: failed to open file: {}\n", input_path.string());
    return 1;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  bff::SourceRegistry sources;
  bff::AstContext ast;
  bff::DiagnosticBag diags;
  const auto parsed = bff::parse_source(
    sources, bff::path_to_file_uri(input_path.string()), buffer.str(), ast, diags);

  if (!diags.empty()) {
    bff::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
    printer.print_all(diags, sources);
  }
  if (diags.has_errors()) {
    return 1;
  }

  std::cout << bff::to_json(parsed.program).dump(2) << "\n";
  return 0;
}

int run(const CommandArgs & args, const char * program_name)
{
  if (args.show_help) {
    print_usage(program_name);
    return 0;
  }

  if (!args.error.empty()) {
    fmt::print(std::cerr, "error: {}\n", args.error);
    return 1;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  if (args.command == "parse") {
    return cmd_parse(args);
  }

  fmt::print(std::cerr, "error: unknown command '{}'\n", args.command);
  print_usage(program_name);
  return 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  try {
    return run(parse_args(argc, argv), argv[0]);
  } catch (const std::exception & e) {
    fmt::print(std::cerr, "{}: fatal error: {}\n", k_tool_name, e.what());
    return 1;
  }
}
