// schema_dsl/project/project_config.hpp - Project configuration (sdc.yaml)
//
// Parses and validates sdc.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "schema_dsl/codegen/dialect.hpp"

namespace schema_dsl
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Schema source, relative to sdc.yaml
  std::filesystem::path schema = "schema.sdl";

  /// Generated type header, relative to sdc.yaml
  std::filesystem::path types_output = "generated/schema_types.hpp";

  /// Namespace of the generated declarations
  std::string types_namespace = "models";

  /// Dialect used by `sdc sql` when none is given on the command line
  Dialect dialect = Dialect::Postgres;
};

/**
 * Database section.
 */
struct DatabaseConfig
{
  /// Environment variable holding the connection string
  std::string url_env = "DATABASE_URL";
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (sdc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;
  DatabaseConfig database;

  /// Directory containing sdc.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path schema_path() const { return project_root / compiler.schema; }
  [[nodiscard]] std::filesystem::path types_output_path() const
  {
    return project_root / compiler.types_output;
  }
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
 * Load a project configuration from an sdc.yaml file.
 *
 * @param config_path Path to sdc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse sdc.yaml content already in memory.
 *
 * @param yaml_text File content
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to sdc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "sdc.yaml";

}  // namespace schema_dsl
