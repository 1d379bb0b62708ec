// bff/project/project_config.cpp - Project configuration implementation
//
#include "bff/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstring>

#if defined(_WIN32)
#include <stdlib.h>
#define BFF_ENVIRON _environ
#else
extern char ** environ;
#define BFF_ENVIRON environ
#endif

namespace bff
{

namespace
{

/// Parse the 'environment' map
bool parse_environment(
  const YAML::Node & node, std::map<std::string, std::string> & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "environment must be a map";
    return false;
  }
  for (const auto & entry : node) {
    if (!entry.second.IsScalar()) {
      error = "environment value of '" + entry.first.as<std::string>() + "' must be a string";
      return false;
    }
    out[entry.first.as<std::string>()] = entry.second.as<std::string>();
  }
  return true;
}

ConfigLoadResult parse_config(const YAML::Node & root, const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  if (root["root_file"]) {
    fs::path root_file = root["root_file"].as<std::string>();
    if (root_file.is_relative()) {
      root_file = config.project_root / root_file;
    }
    config.root_file = root_file.lexically_normal();
  }

  if (root["platform"]) {
    const auto name = root["platform"].as<std::string>();
    config.platform = parse_platform(name);
    if (!config.platform) {
      return ConfigLoadResult::fail(
        "invalid platform: '" + name + "' (must be 'linux', 'osx' or 'windows')");
    }
  }

  if (root["inherit_environment"]) {
    config.inherit_environment = root["inherit_environment"].as<bool>();
  }

  if (root["environment"]) {
    std::string error;
    if (!parse_environment(root["environment"], config.environment, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  // Wrong scalar types (e.g. `inherit_environment: maybe`) surface as conversion errors.
  try {
    return parse_config(root, config_path);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::map<std::string, std::string> process_environment()
{
  std::map<std::string, std::string> out;
  for (char ** entry = BFF_ENVIRON; entry != nullptr && *entry != nullptr; ++entry) {
    const char * eq = std::strchr(*entry, '=');
    // Windows keeps per-drive entries such as `=C:=C:\`.
    if (eq == nullptr || eq == *entry) {
      continue;
    }
    out.emplace(std::string(*entry, eq), std::string(eq + 1));
  }
  return out;
}

EvaluationOptions make_evaluation_options(const ProjectConfig & config)
{
  EvaluationOptions options;
  if (config.platform) {
    options.platform = *config.platform;
  }
  if (config.inherit_environment) {
    options.environment = process_environment();
  }
  for (const auto & [name, value] : config.environment) {
    options.environment[name] = value;
  }
  return options;
}

}  // namespace bff
