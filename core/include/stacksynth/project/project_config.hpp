// stacksynth/project/project_config.hpp - Project configuration (stacksynth.yaml)
//
// Parses and validates stacksynth.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stacksynth
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Synthesis configuration section.
 */
struct SynthConfig
{
  /// Stack definition files to synthesize
  std::vector<std::filesystem::path> stacks;

  /// Output directory for generated artifacts
  std::filesystem::path output_dir = "stacksynth.out";

  /// File name of the provisioning plan inside each stack directory
  std::string plan_file = "cdk.tf.json";
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
 * Complete project configuration (stacksynth.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SynthConfig synth;

  /// Directory containing stacksynth.yaml (for resolving relative paths)
  std::filesystem::path project_root;
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

  /// Whether loading succeeded
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
 * Load a project configuration from a stacksynth.yaml file.
 *
 * Relative stack paths and output_dir are kept as written; resolve them
 * against `project_root`.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find stacksynth.yaml by searching upward from start_dir to the filesystem
 * root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "stacksynth.yaml";

}  // namespace stacksynth
