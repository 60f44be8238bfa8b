// stacksynth/project/project_config.cpp - Project configuration implementation
//
#include "stacksynth/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace stacksynth
{

namespace
{

/// A plain file name: no directory part, not "." or "..".
bool is_plain_file_name(const std::string & name)
{
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
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

  if (root && !root.IsNull() && !root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
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

    // Parse 'synth' section
    if (root["synth"]) {
      const auto & synth = root["synth"];

      if (synth["stacks"]) {
        if (!synth["stacks"].IsSequence()) {
          return ConfigLoadResult::fail("synth.stacks must be a list");
        }
        for (const auto & stack : synth["stacks"]) {
          config.synth.stacks.emplace_back(stack.as<std::string>());
        }
      }

      if (synth["output_dir"]) {
        config.synth.output_dir = synth["output_dir"].as<std::string>();
      }

      if (synth["plan_file"]) {
        config.synth.plan_file = synth["plan_file"].as<std::string>();
        if (!is_plain_file_name(config.synth.plan_file)) {
          return ConfigLoadResult::fail(
            "invalid synth.plan_file: '" + config.synth.plan_file + "' (must be a file name)");
        }
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace stacksynth
