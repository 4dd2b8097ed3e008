// tests/unit/project/test_project_config.cpp - crtl.yaml loading
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "contrtl/project/project_config.hpp"

using namespace contrtl;
namespace fs = std::filesystem;

namespace
{

class ProjectConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    const auto * info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::temp_directory_path() / (std::string("crtl_config_") + info->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path write_config(const std::string & text, const fs::path & dir = {})
  {
    const fs::path target = (dir.empty() ? root_ : dir) / k_project_config_file_name;
    std::ofstream out(target);
    out << text;
    return target;
  }

  fs::path root_;
};

}  // namespace

TEST_F(ProjectConfigTest, LoadsAllSections)
{
  const auto path = write_config(
    "package: { name: adder, version: 0.1.0 }\n"
    "compiler:\n"
    "  entry_points: [src/main.crtl, src/alu.crtl]\n"
    "  output_dir: out\n"
    "  emit: json\n");

  const ConfigLoadResult r = load_project_config(path);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "adder");
  EXPECT_EQ(r.config.package.version, "0.1.0");
  ASSERT_EQ(r.config.compiler.entry_points.size(), 2U);
  EXPECT_EQ(r.config.compiler.entry_points[1], fs::path("src/alu.crtl"));
  EXPECT_EQ(r.config.compiler.output_dir, fs::path("out"));
  EXPECT_EQ(r.config.compiler.emit, EmitFormat::Json);
  EXPECT_EQ(r.config.project_root, fs::absolute(root_));
}

TEST_F(ProjectConfigTest, DefaultsWhenSectionsAreMissing)
{
  const ConfigLoadResult r = load_project_config(write_config("package:\n  name: empty\n"));
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.compiler.entry_points.empty());
  EXPECT_EQ(r.config.compiler.output_dir, fs::path("generated"));
  EXPECT_EQ(r.config.compiler.emit, EmitFormat::Serialized);
}

TEST_F(ProjectConfigTest, RejectsUnknownEmitFormat)
{
  const ConfigLoadResult r = load_project_config(write_config("compiler:\n  emit: verilog\n"));
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("compiler.emit"), std::string::npos) << r.error;
}

TEST_F(ProjectConfigTest, RejectsScalarEntryPoints)
{
  const ConfigLoadResult r =
    load_project_config(write_config("compiler:\n  entry_points: main.crtl\n"));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.entry_points must be a list");
}

TEST_F(ProjectConfigTest, RejectsMalformedYaml)
{
  const ConfigLoadResult r = load_project_config(write_config("package: [unclosed\n"));
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos) << r.error;
}

TEST_F(ProjectConfigTest, MissingFile)
{
  const ConfigLoadResult r = load_project_config(root_ / "nope.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST_F(ProjectConfigTest, FindSearchesUpward)
{
  const auto config = write_config("package: { name: up }\n");
  const fs::path nested = root_ / "src" / "deep";
  fs::create_directories(nested);

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(config));
}

TEST_F(ProjectConfigTest, DefaultConfigRoundTrips)
{
  const auto path = write_config(default_project_config("fresh"));
  const ConfigLoadResult r = load_project_config(path);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "fresh");
  ASSERT_EQ(r.config.compiler.entry_points.size(), 1U);
  EXPECT_EQ(r.config.compiler.entry_points[0], fs::path("src/main.crtl"));
}

TEST(ProjectEmitFormat, ParseAndPrint)
{
  EXPECT_EQ(parse_emit_format("serialized"), EmitFormat::Serialized);
  EXPECT_EQ(parse_emit_format("json"), EmitFormat::Json);
  EXPECT_EQ(parse_emit_format("JSON"), std::nullopt);
  EXPECT_EQ(to_string(EmitFormat::Json), "json");
}
