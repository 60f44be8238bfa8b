// stacksynth/driver/synthesizer.hpp - Synthesis driver
//
// Single entry point for the synthesis pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/config/environment.hpp"
#include "stacksynth/construct/construct_tree.hpp"
#include "stacksynth/graph/reference_graph.hpp"
#include "stacksynth/project/project_config.hpp"

namespace stacksynth
{

// ============================================================================
// Synth Mode
// ============================================================================

enum class SynthMode {
  Check,  ///< Load, graph and resolve only (nothing is written)
  Synth,  ///< Full synthesis including artifact files
};

// ============================================================================
// Synth Options
// ============================================================================

struct SynthOptions
{
  /// Synth mode
  SynthMode mode = SynthMode::Synth;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Plan file name (overrides project config)
  std::optional<std::string> plan_file;

  /// Source of required environment values (process environment if empty)
  EnvLookup env_lookup;

  /// Enable verbose output
  bool verbose = false;
};

/// Name of the apply-order artifact written next to the plan.
inline constexpr const char * k_apply_order_file_name = "apply-order.json";

/// Default plan file name for single-file synthesis.
inline constexpr const char * k_default_plan_file_name = "cdk.tf.json";

// ============================================================================
// Synth Result
// ============================================================================

/**
 * One generated file, relative to its stack directory.
 */
struct Artifact
{
  std::string path;
  std::string content;
};

/**
 * Everything synthesized for one stack, in memory.
 *
 * Files are ordered: plan, apply order, then one file per document.
 */
struct StackArtifacts
{
  std::string stack_name;
  std::vector<Artifact> files;
  ReferenceGraph graph;
  std::vector<std::string> apply_order;  ///< addresses, dependencies first
};

struct SynthResult
{
  /// Whether synthesis succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Synthesized stacks (populated in both modes)
  std::vector<StackArtifacts> stacks;

  /// Written files (only populated for Synth mode)
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Synthesizer
// ============================================================================

/**
 * Synthesis driver that orchestrates the full pipeline.
 *
 * The pipeline consists of:
 * 1. Stack file loading (including required environment validation)
 * 2. Reference graph construction (dangling/self references, cycles)
 * 3. Resolution (tokens -> interpolation text, foreign text verbatim)
 * 4. Emission (plan, apply order, documents)
 * 5. Writing `<output_dir>/stacks/<stack>/...` (Synth mode only)
 */
class Synthesizer
{
public:
  /**
   * Synthesize a single stack file.
   *
   * Without an output directory override, artifacts go to
   * `<file dir>/stacksynth.out`.
   */
  [[nodiscard]] static SynthResult synth_single_file(
    const std::filesystem::path & file, const SynthOptions & options);

  /**
   * Synthesize every stack listed in a project configuration.
   */
  [[nodiscard]] static SynthResult synth_project(
    const ProjectConfig & config, const SynthOptions & options);

  /**
   * Resolve and emit a construct tree in memory.
   *
   * @return nullopt if any error was reported to `diags`
   */
  [[nodiscard]] static std::optional<StackArtifacts> synthesize(
    const ConstructTree & tree, const std::string & plan_file, DiagnosticBag & diags);

private:
  static bool synth_stack_file(
    const std::filesystem::path & file, const SynthOptions & options,
    const std::filesystem::path & output_dir, const std::string & plan_file, SynthResult & result);

  static bool write_artifacts(
    const StackArtifacts & artifacts, const std::filesystem::path & stack_dir,
    DiagnosticBag & diags, std::vector<std::filesystem::path> & written);
};

}  // namespace stacksynth
