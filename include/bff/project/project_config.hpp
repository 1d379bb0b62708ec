// bff/project/project_config.hpp - Project configuration (bff.yaml)
//
// Parses and validates bff.yaml project configuration files.
// Shared by the CLI and the language server.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "bff/eval/evaluator.hpp"

namespace bff
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (bff.yaml).
 *
 * Example:
 * @code
 *   root_file: build/fbuild.bff
 *   platform: windows
 *   inherit_environment: false
 *   environment:
 *     VS_ROOT: C:/VS
 * @endcode
 */
struct ProjectConfig
{
  /// Absolute path of the root BFF file, when configured
  std::optional<std::filesystem::path> root_file;

  /// Platform whose symbol is pre-defined, when configured
  std::optional<Platform> platform;

  /// Variables visible to `exists()` and `#import`
  std::map<std::string, std::string> environment;

  /// Merge the process environment under `environment`
  bool inherit_environment = true;

  /// Directory containing bff.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a bff.yaml file.
 *
 * @param config_path Path to bff.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to bff.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Environment variables of the running process.
[[nodiscard]] std::map<std::string, std::string> process_environment();

/**
 * Evaluation options described by `config`.
 *
 * Explicit environment entries override inherited ones. The platform
 * defaults to the host's.
 */
[[nodiscard]] EvaluationOptions make_evaluation_options(const ProjectConfig & config);

inline constexpr const char * k_project_config_file_name = "bff.yaml";

}  // namespace bff
