// test_project_config.cpp - sdc.yaml loading and discovery
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "schema_dsl/project/project_config.hpp"

using namespace schema_dsl;
namespace fs = std::filesystem;

namespace
{

struct TempDir
{
  fs::path path;
  explicit TempDir(std::string_view prefix)
  {
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
    fs::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(ProjectConfig, Defaults)
{
  const auto result = parse_project_config("", "/work/shop");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  EXPECT_EQ(config.compiler.schema, "schema.sdl");
  EXPECT_EQ(config.compiler.types_namespace, "models");
  EXPECT_EQ(config.compiler.dialect, Dialect::Postgres);
  EXPECT_EQ(config.database.url_env, "DATABASE_URL");
  EXPECT_EQ(config.schema_path(), fs::path("/work/shop/schema.sdl"));
  EXPECT_EQ(config.types_output_path(), fs::path("/work/shop/generated/schema_types.hpp"));
}

TEST(ProjectConfig, FullConfiguration)
{
  const auto result = parse_project_config(
    R"(
package:
  name: shop
  version: 0.3.0
compiler:
  schema: db/shop.sdl
  types_output: include/shop/models.hpp
  types_namespace: shop::models
  dialect: sqlite
database:
  url_env: SHOP_DB
)",
    "/work/shop");
  ASSERT_TRUE(result.success) << result.error;

  const ProjectConfig & config = result.config;
  EXPECT_EQ(config.package.name, "shop");
  EXPECT_EQ(config.package.version, "0.3.0");
  EXPECT_EQ(config.schema_path(), fs::path("/work/shop/db/shop.sdl"));
  EXPECT_EQ(config.types_output_path(), fs::path("/work/shop/include/shop/models.hpp"));
  EXPECT_EQ(config.compiler.types_namespace, "shop::models");
  EXPECT_EQ(config.compiler.dialect, Dialect::Sqlite);
  EXPECT_EQ(config.database.url_env, "SHOP_DB");
}

TEST(ProjectConfig, InvalidValues)
{
  const auto dialect = parse_project_config("compiler:\n  dialect: oracle\n", ".");
  EXPECT_FALSE(dialect.success);
  EXPECT_NE(dialect.error.find("'oracle'"), std::string::npos);

  const auto ns = parse_project_config("compiler:\n  types_namespace: \"\"\n", ".");
  EXPECT_FALSE(ns.success);

  const auto env = parse_project_config("database:\n  url_env: \"\"\n", ".");
  EXPECT_FALSE(env.success);

  const auto root = parse_project_config("- one\n- two\n", ".");
  EXPECT_FALSE(root.success);
  EXPECT_NE(root.error.find("map"), std::string::npos);

  const auto malformed = parse_project_config("compiler: [unclosed\n", ".");
  EXPECT_FALSE(malformed.success);
}

TEST(ProjectConfig, LoadFromFile)
{
  const TempDir dir("sdc_project_config");
  write_all(dir.path / "sdc.yaml", "compiler:\n  dialect: mysql\n");

  const auto result = load_project_config(dir.path / "sdc.yaml");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.compiler.dialect, Dialect::MySql);
  EXPECT_EQ(result.config.project_root, fs::absolute(dir.path));

  const auto missing = load_project_config(dir.path / "absent.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const TempDir dir("sdc_project_find");
  write_all(dir.path / "sdc.yaml", "");
  fs::create_directories(dir.path / "db" / "nested");
  write_all(dir.path / "db" / "nested" / "schema.sdl", "");

  const auto from_dir = find_project_config(dir.path / "db" / "nested");
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::weakly_canonical(*from_dir), fs::weakly_canonical(dir.path / "sdc.yaml"));

  const auto from_file = find_project_config(dir.path / "db" / "nested" / "schema.sdl");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::weakly_canonical(*from_file), fs::weakly_canonical(dir.path / "sdc.yaml"));
}
