// schema_dsl/project/project_config.cpp - Project configuration implementation
//
#include "schema_dsl/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace schema_dsl
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  if (root && !root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("sdc.yaml must contain a map at the top level");
  }

  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["schema"]) {
      config.compiler.schema = comp["schema"].as<std::string>();
    }
    if (comp["types_output"]) {
      config.compiler.types_output = comp["types_output"].as<std::string>();
    }
    if (comp["types_namespace"]) {
      config.compiler.types_namespace = comp["types_namespace"].as<std::string>();
      if (config.compiler.types_namespace.empty()) {
        return ConfigLoadResult::fail("compiler.types_namespace must not be empty");
      }
    }
    if (comp["dialect"]) {
      const auto name = comp["dialect"].as<std::string>();
      const auto dialect = parse_dialect(name);
      if (!dialect) {
        return ConfigLoadResult::fail(
          "invalid compiler.dialect: '" + name +
          "' (must be 'postgres', 'mysql', 'sqlite' or 'generic')");
      }
      config.compiler.dialect = *dialect;
    }
  }

  // Parse 'database' section
  if (root["database"]) {
    const auto & db = root["database"];
    if (db["url_env"]) {
      config.database.url_env = db["url_env"].as<std::string>();
      if (config.database.url_env.empty()) {
        return ConfigLoadResult::fail("database.url_env must not be empty");
      }
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

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

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

}  // namespace schema_dsl
