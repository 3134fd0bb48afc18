// typed_select/project/project_config.hpp - Project configuration (tsel.yaml)
//
// Parses and validates tsel.yaml project configuration files.
//
//   project:
//     name: todo-api
//   schema:
//     files: [schema/todo.json]
//   validation:
//     max_selection_depth: 32
//     allow_duplicate_fields: false
//   emit:
//     output_dir: generated
//     indent: 2
//     export: true
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace typed_select
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct ProjectInfo
{
  std::string name;
};

/**
 * Schema section: JSON dumps produced by the reflection layer.
 */
struct SchemaConfig
{
  /// Schema files (relative to tsel.yaml)
  std::vector<std::filesystem::path> files;
};

struct ValidationConfig
{
  size_t max_selection_depth = 64;
  bool allow_duplicate_fields = false;
};

/**
 * TypeScript emission section.
 */
struct EmitConfig
{
  /// Output directory for generated declarations
  std::filesystem::path output_dir = "generated";

  int indent = 2;
  bool export_types = true;
};

/**
 * Complete project configuration (tsel.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  SchemaConfig schema;
  ValidationConfig validation;
  EmitConfig emit;

  /// Directory containing tsel.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Schema files resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> schema_paths() const;
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
 * Load a project configuration from a tsel.yaml file.
 *
 * @param config_path Path to tsel.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find tsel.yaml by searching upward from start_dir to the filesystem root.
 *
 * @return Path to tsel.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "tsel.yaml";

}  // namespace typed_select
