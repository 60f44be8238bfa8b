// tests/unit/project/test_project_config.cpp - stacksynth.yaml loading and discovery

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "stacksynth/project/project_config.hpp"

using namespace stacksynth;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

class ProjectConfigTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("stacksynth_project_config"); }
  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

}  // namespace

TEST_F(ProjectConfigTest, LoadsAllSections)
{
  write_all(dir_ / k_project_config_file_name, R"yaml(
package:
  name: sample
  version: '0.1.0'
synth:
  stacks:
    - ./stacks/main.yaml
    - ./stacks/ci.yaml
  output_dir: ./out
  plan_file: main.tf.json
)yaml");

  const auto result = load_project_config(dir_ / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.package.name, "sample");
  EXPECT_EQ(result.config.package.version, "0.1.0");
  ASSERT_EQ(result.config.synth.stacks.size(), 2u);
  EXPECT_EQ(result.config.synth.stacks[1].string(), "./stacks/ci.yaml");
  EXPECT_EQ(result.config.synth.output_dir.string(), "./out");
  EXPECT_EQ(result.config.synth.plan_file, "main.tf.json");
  EXPECT_EQ(result.config.project_root, fs::absolute(dir_));
}

TEST_F(ProjectConfigTest, DefaultsApply)
{
  write_all(dir_ / k_project_config_file_name, "package:\n  name: bare\n");

  const auto result = load_project_config(dir_ / k_project_config_file_name);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.synth.stacks.empty());
  EXPECT_EQ(result.config.synth.output_dir.string(), "stacksynth.out");
  EXPECT_EQ(result.config.synth.plan_file, "cdk.tf.json");
}

TEST_F(ProjectConfigTest, RejectsInvalidValues)
{
  write_all(dir_ / "a.yaml", "synth:\n  stacks: ./stacks/main.yaml\n");
  EXPECT_FALSE(load_project_config(dir_ / "a.yaml").success);

  write_all(dir_ / "b.yaml", "synth:\n  plan_file: ../plan.json\n");
  const auto plan = load_project_config(dir_ / "b.yaml");
  EXPECT_FALSE(plan.success);
  EXPECT_NE(plan.error.find("plan_file"), std::string::npos);

  write_all(dir_ / "c.yaml", "- not\n- a map\n");
  EXPECT_FALSE(load_project_config(dir_ / "c.yaml").success);

  write_all(dir_ / "d.yaml", "synth: [unclosed\n");
  EXPECT_FALSE(load_project_config(dir_ / "d.yaml").success);

  EXPECT_FALSE(load_project_config(dir_ / "missing.yaml").success);
}

TEST_F(ProjectConfigTest, FindSearchesParentDirectories)
{
  write_all(dir_ / k_project_config_file_name, "package:\n  name: sample\n");
  const fs::path nested = dir_ / "stacks" / "nested";
  fs::create_directories(nested);
  write_all(nested / "main.yaml", "stack: main\n");

  const auto from_dir = find_project_config(nested);
  ASSERT_TRUE(from_dir.has_value());
  EXPECT_EQ(fs::canonical(*from_dir), fs::canonical(dir_ / k_project_config_file_name));

  const auto from_file = find_project_config(nested / "main.yaml");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(dir_ / k_project_config_file_name));
}
