// stacksynth/driver/synthesizer.cpp - Synthesis driver implementation
//
#include "stacksynth/driver/synthesizer.hpp"

#include <fstream>
#include <system_error>

#include "stacksynth/basic/diagnostic_codes.hpp"
#include "stacksynth/emit/document_emitter.hpp"
#include "stacksynth/loader/stack_loader.hpp"
#include "stacksynth/resolve/resolver.hpp"

namespace stacksynth
{

namespace
{

constexpr const char * k_default_output_dir = "stacksynth.out";

Location file_location(const std::filesystem::path & file)
{
  Location loc;
  loc.file = file;
  return loc;
}

// apply-order.json: provisioning order plus the edges that imply it.
Value apply_order_document(
  const ConstructTree & tree, const ReferenceGraph & graph, const std::vector<std::string> & order)
{
  Value addresses = Value::make_sequence({});
  for (const auto & address : order) {
    addresses.push_back(Value(address));
  }

  Value edges = Value::make_sequence({});
  for (const auto & edge : graph.edges()) {
    edges.push_back(Value::mapping({
      {"from", tree.node(edge.from)->address()},
      {"to", tree.node(edge.to)->address()},
      {"attribute", edge.attribute},
    }));
  }

  return Value::mapping({
    {"stack", tree.name()},
    {"order", std::move(addresses)},
    {"edges", std::move(edges)},
  });
}

}  // namespace

std::optional<StackArtifacts> Synthesizer::synthesize(
  const ConstructTree & tree, const std::string & plan_file, DiagnosticBag & diags)
{
  try {
    Resolver resolver(tree, &diags);
    auto resolved = resolver.resolve();
    if (!resolved) {
      return std::nullopt;
    }

    StackArtifacts artifacts;
    artifacts.stack_name = tree.name();
    for (const NodeId id : resolved->graph.topological_order()) {
      const ConstructNode * node = tree.node(id);
      if (node->has_attributes()) {
        artifacts.apply_order.push_back(node->address());
      }
    }

    artifacts.files.push_back(
      Artifact{plan_file, DocumentEmitter::emit_json(resolved->plan)});
    artifacts.files.push_back(Artifact{
      k_apply_order_file_name, DocumentEmitter::emit_json(apply_order_document(
                                 tree, resolved->graph, artifacts.apply_order))});
    for (const auto & doc : resolved->documents) {
      artifacts.files.push_back(Artifact{doc.path, DocumentEmitter::emit(doc.body, doc.format)});
    }

    artifacts.graph = std::move(resolved->graph);
    return artifacts;
  } catch (const UnresolvedTokenError & e) {
    Location where;
    where.construct = tree.name();
    diags.report_error(where, std::string("internal error: ") + e.what())
      .with_code(diag_code::k_unresolved_token);
    return std::nullopt;
  } catch (const UnrepresentableValueError & e) {
    Location where;
    where.construct = tree.name();
    diags.report_error(where, "cannot emit stack '" + tree.name() + "': " + e.what())
      .with_code(diag_code::k_emission_failed)
      .with_help("write the value as a string, or emit the document as YAML");
    return std::nullopt;
  } catch (const nlohmann::ordered_json::exception & e) {
    // e.g. a string that is not valid UTF-8
    Location where;
    where.construct = tree.name();
    diags.report_error(where, "JSON emission failed: " + std::string(e.what()))
      .with_code(diag_code::k_emission_failed);
    return std::nullopt;
  } catch (const std::runtime_error & e) {
    Location where;
    where.construct = tree.name();
    diags.report_error(where, "emission failed: " + std::string(e.what()))
      .with_code(diag_code::k_emission_failed);
    return std::nullopt;
  }
}

SynthResult Synthesizer::synth_single_file(
  const std::filesystem::path & file, const SynthOptions & options)
{
  SynthResult result;

  namespace fs = std::filesystem;

  // Ensure file exists
  if (!fs::exists(file)) {
    result.diagnostics.report_error(file_location(file), "file not found: " + file.string())
      .with_code(diag_code::k_stack_file);
    return result;
  }

  const fs::path output_dir =
    options.output_dir.value_or(file.parent_path() / k_default_output_dir);
  const std::string plan_file = options.plan_file.value_or(k_default_plan_file_name);

  synth_stack_file(file, options, output_dir, plan_file, result);

  result.success = !result.diagnostics.has_errors();
  return result;
}

SynthResult Synthesizer::synth_project(const ProjectConfig & config, const SynthOptions & options)
{
  SynthResult result;

  namespace fs = std::filesystem;

  // Handle empty stack list
  if (config.synth.stacks.empty()) {
    result.diagnostics.report_error(
      file_location(config.project_root / k_project_config_file_name),
      "no stacks defined in project configuration")
      .with_code(diag_code::k_stack_file)
      .with_help("list stack files under synth.stacks");
    return result;
  }

  // Determine output directory and plan file name
  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.synth.output_dir);
  const std::string plan_file = options.plan_file.value_or(config.synth.plan_file);

  for (const auto & stack_rel : config.synth.stacks) {
    const fs::path stack_path = config.project_root / stack_rel;

    if (!fs::exists(stack_path)) {
      result.diagnostics
        .report_error(file_location(stack_path), "stack file not found: " + stack_path.string())
        .with_code(diag_code::k_stack_file);
      continue;
    }

    synth_stack_file(stack_path, options, output_dir, plan_file, result);
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

bool Synthesizer::synth_stack_file(
  const std::filesystem::path & file, const SynthOptions & options,
  const std::filesystem::path & output_dir, const std::string & plan_file, SynthResult & result)
{
  StackLoader loader(
    &result.diagnostics, options.env_lookup ? options.env_lookup : process_env_lookup());
  auto loaded = loader.load_file(file);
  if (!loaded) {
    return false;
  }

  auto artifacts = synthesize(*loaded->tree, plan_file, result.diagnostics);
  if (!artifacts) {
    return false;
  }

  // Two stacks with one name would write to the same directory.
  for (const auto & existing : result.stacks) {
    if (existing.stack_name == artifacts->stack_name) {
      result.diagnostics
        .report_error(file_location(file), "stack '" + artifacts->stack_name + "' is defined twice")
        .with_code(diag_code::k_duplicate_construct);
      return false;
    }
  }

  bool ok = true;
  if (options.mode == SynthMode::Synth) {
    const std::filesystem::path stack_dir = output_dir / "stacks" / artifacts->stack_name;
    ok = write_artifacts(*artifacts, stack_dir, result.diagnostics, result.generated_files);
  }
  result.stacks.push_back(std::move(*artifacts));
  return ok;
}

bool Synthesizer::write_artifacts(
  const StackArtifacts & artifacts, const std::filesystem::path & stack_dir,
  DiagnosticBag & diags, std::vector<std::filesystem::path> & written)
{
  namespace fs = std::filesystem;

  for (const auto & file : artifacts.files) {
    const fs::path output_path = stack_dir / file.path;

    std::error_code ec;
    fs::create_directories(output_path.parent_path(), ec);
    if (ec) {
      diags
        .report_error(
          file_location(output_path),
          "failed to create directory " + output_path.parent_path().string() + ": " + ec.message())
        .with_code(diag_code::k_output_write);
      return false;
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      diags.report_error(file_location(output_path), "failed to open output file: " + output_path.string())
        .with_code(diag_code::k_output_write);
      return false;
    }
    out << file.content;
    if (!out) {
      diags.report_error(file_location(output_path), "failed to write output file: " + output_path.string())
        .with_code(diag_code::k_output_write);
      return false;
    }
    written.push_back(output_path);
  }
  return true;
}

}  // namespace stacksynth
