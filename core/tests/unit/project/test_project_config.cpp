// tests/unit/project/test_project_config.cpp - tsel.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "typed_select/project/project_config.hpp"

using namespace typed_select;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

std::filesystem::path write_config(const std::filesystem::path & dir, const std::string & yaml)
{
  const auto path = dir / k_project_config_file_name;
  std::ofstream out(path);
  out << yaml;
  return path;
}

}  // namespace

TEST(ProjectConfigTest, LoadsAllSections)
{
  const TempDir tmp(std::filesystem::temp_directory_path() / "typed_select_config_full");
  const auto path = write_config(tmp.path, R"(
project:
  name: todo-api
schema:
  files:
    - schema/todo.json
    - /abs/users.json
validation:
  max_selection_depth: 12
  allow_duplicate_fields: true
emit:
  output_dir: out/types
  indent: 4
  export: false
)");

  const ConfigLoadResult res = load_project_config(path);
  ASSERT_TRUE(res.success) << res.error;

  const ProjectConfig & cfg = res.config;
  EXPECT_EQ(cfg.project.name, "todo-api");
  EXPECT_EQ(cfg.validation.max_selection_depth, 12U);
  EXPECT_TRUE(cfg.validation.allow_duplicate_fields);
  EXPECT_EQ(cfg.emit.output_dir, std::filesystem::path("out/types"));
  EXPECT_EQ(cfg.emit.indent, 4);
  EXPECT_FALSE(cfg.emit.export_types);

  const auto schemas = cfg.schema_paths();
  ASSERT_EQ(schemas.size(), 2U);
  EXPECT_EQ(schemas[0], cfg.project_root / "schema/todo.json");
  EXPECT_EQ(schemas[1], std::filesystem::path("/abs/users.json"));
}

TEST(ProjectConfigTest, DefaultsApplyToMissingSections)
{
  const TempDir tmp(std::filesystem::temp_directory_path() / "typed_select_config_defaults");
  const ConfigLoadResult res = load_project_config(write_config(tmp.path, "project:\n  name: x\n"));
  ASSERT_TRUE(res.success) << res.error;

  EXPECT_TRUE(res.config.schema.files.empty());
  EXPECT_EQ(res.config.validation.max_selection_depth, 64U);
  EXPECT_FALSE(res.config.validation.allow_duplicate_fields);
  EXPECT_EQ(res.config.emit.output_dir, std::filesystem::path("generated"));
  EXPECT_EQ(res.config.emit.indent, 2);
  EXPECT_TRUE(res.config.emit.export_types);
}

TEST(ProjectConfigTest, RejectsInvalidValues)
{
  const TempDir tmp(std::filesystem::temp_directory_path() / "typed_select_config_invalid");

  auto res = load_project_config(write_config(tmp.path, "validation:\n  max_selection_depth: 0\n"));
  EXPECT_FALSE(res.success);
  EXPECT_NE(res.error.find("max_selection_depth"), std::string::npos);

  res = load_project_config(write_config(tmp.path, "emit:\n  indent: 12\n"));
  EXPECT_FALSE(res.success);

  res = load_project_config(write_config(tmp.path, "schema:\n  files: todo.json\n"));
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error, "schema.files must be a list");

  res = load_project_config(
    write_config(tmp.path, "validation:\n  allow_duplicate_fields: maybe\n"));
  EXPECT_FALSE(res.success);
  EXPECT_NE(res.error.find("invalid configuration value"), std::string::npos);

  res = load_project_config(write_config(tmp.path, "project: [unclosed\n"));
  EXPECT_FALSE(res.success);
  EXPECT_NE(res.error.find("failed to parse YAML"), std::string::npos);

  res = load_project_config(tmp.path / "nope.yaml");
  EXPECT_FALSE(res.success);
}

TEST(ProjectConfigTest, FindsConfigInParentDirectories)
{
  const TempDir tmp(std::filesystem::temp_directory_path() / "typed_select_config_find");
  const auto nested = tmp.path / "a" / "b";
  std::filesystem::create_directories(nested);
  const auto path = write_config(tmp.path, "project:\n  name: x\n");

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(*found), std::filesystem::canonical(path));

  {
    std::ofstream(nested / "selection.json") << "[]";
  }
  const auto from_file = find_project_config(nested / "selection.json");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(std::filesystem::canonical(*from_file), std::filesystem::canonical(path));
}
