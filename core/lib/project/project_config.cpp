// typed_select/project/project_config.cpp - Project configuration implementation
//
#include "typed_select/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace typed_select
{

std::vector<std::filesystem::path> ProjectConfig::schema_paths() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(schema.files.size());
  for (const auto & file : schema.files) {
    out.push_back(file.is_absolute() ? file : project_root / file);
  }
  return out;
}

namespace
{

/// Parse the 'validation' section
std::optional<std::string> parse_validation(const YAML::Node & node, ValidationConfig & out)
{
  if (!node.IsMap()) {
    return "validation must be a map";
  }

  if (node["max_selection_depth"]) {
    const int depth = node["max_selection_depth"].as<int>();
    if (depth < 1) {
      return "validation.max_selection_depth must be at least 1";
    }
    out.max_selection_depth = static_cast<size_t>(depth);
  }

  if (node["allow_duplicate_fields"]) {
    out.allow_duplicate_fields = node["allow_duplicate_fields"].as<bool>();
  }
  return std::nullopt;
}

/// Parse the 'emit' section
std::optional<std::string> parse_emit(const YAML::Node & node, EmitConfig & out)
{
  if (!node.IsMap()) {
    return "emit must be a map";
  }

  if (node["output_dir"]) {
    out.output_dir = node["output_dir"].as<std::string>();
  }

  if (node["indent"]) {
    out.indent = node["indent"].as<int>();
    if (out.indent < 0 || out.indent > 8) {
      return "emit.indent must be between 0 and 8";
    }
  }

  if (node["export"]) {
    out.export_types = node["export"].as<bool>();
  }
  return std::nullopt;
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

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // Scalar conversions throw YAML::BadConversion on wrongly typed values
  try {
    if (root["project"] && root["project"]["name"]) {
      config.project.name = root["project"]["name"].as<std::string>();
    }

    if (root["schema"]) {
      const auto & schema = root["schema"];
      if (schema["files"]) {
        if (!schema["files"].IsSequence()) {
          return ConfigLoadResult::fail("schema.files must be a list");
        }
        for (const auto & file : schema["files"]) {
          config.schema.files.emplace_back(file.as<std::string>());
        }
      }
    }

    if (root["validation"]) {
      if (auto error = parse_validation(root["validation"], config.validation)) {
        return ConfigLoadResult::fail(*error);
      }
    }

    if (root["emit"]) {
      if (auto error = parse_emit(root["emit"], config.emit)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
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
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace typed_select
