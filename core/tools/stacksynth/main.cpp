// stacksynth - Stack Synthesizer Command Line Interface
//
// Usage:
//   stacksynth synth [stack.yaml | --project] [-o output]
//   stacksynth check [stack.yaml | --project]
//   stacksynth graph <stack.yaml>
//   stacksynth init <project-name>
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "stacksynth/basic/diagnostic_printer.hpp"
#include "stacksynth/driver/synthesizer.hpp"
#include "stacksynth/graph/reference_graph.hpp"
#include "stacksynth/loader/stack_loader.hpp"
#include "stacksynth/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "stacksynth v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  synth [stack.yaml]       Synthesize a stack file or project\n"
            << "  check [stack.yaml]       Load, graph and resolve (nothing is written)\n"
            << "  graph <stack.yaml>       Print the apply order and the reference edges\n"
            << "  init <project-name>      Initialize a new project\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output directory\n"
            << "  --project                Synthesize project from stacksynth.yaml\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const stacksynth::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  stacksynth::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

void verbose(bool enabled, const std::string & message)
{
  if (enabled) {
    fmt::print(stderr, "[stacksynth] {}\n", message);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  bool use_project = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int run_pipeline(const CommandArgs & args, stacksynth::SynthMode mode)
{
  const bool synth = mode == stacksynth::SynthMode::Synth;

  stacksynth::SynthOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  if (synth && !args.output_path.empty()) {
    options.output_dir = fs::absolute(args.output_path);
  }

  stacksynth::SynthResult result;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find stacksynth.yaml
    auto config_path = stacksynth::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << stacksynth::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = stacksynth::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }

    verbose(
      args.verbose, fmt::format(
                      "{} project: {} ({} stack(s))", synth ? "Synthesizing" : "Checking",
                      config_result.config.package.name, config_result.config.synth.stacks.size()));

    result = stacksynth::Synthesizer::synth_project(config_result.config, options);
  } else {
    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);

    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }

    verbose(
      args.verbose,
      fmt::format("{}: {}", synth ? "Synthesizing" : "Checking", input_path.string()));

    result = stacksynth::Synthesizer::synth_single_file(input_path, options);
  }

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  for (const auto & stack : result.stacks) {
    verbose(
      args.verbose, fmt::format(
                      "stack '{}': {} construct(s) in apply order, {} reference edge(s)",
                      stack.stack_name, stack.apply_order.size(), stack.graph.edge_count()));
  }

  if (!result.success) {
    return 1;
  }

  if (synth) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  } else {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
  }
  return 0;
}

int cmd_synth(const CommandArgs & args) { return run_pipeline(args, stacksynth::SynthMode::Synth); }

int cmd_check(const CommandArgs & args) { return run_pipeline(args, stacksynth::SynthMode::Check); }

int cmd_graph(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: stack file required\n";
    std::cerr << "usage: stacksynth graph <stack.yaml>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  stacksynth::DiagnosticBag diags;
  stacksynth::StackLoader loader(&diags);
  auto loaded = loader.load_file(input_path);
  if (!loaded) {
    print_diagnostics(diags);
    return 1;
  }

  const stacksynth::ConstructTree & tree = *loaded->tree;
  const stacksynth::ReferenceGraph graph = stacksynth::build_graph(tree, &diags);
  if (!diags.empty()) {
    print_diagnostics(diags);
  }
  if (diags.has_errors()) {
    return 1;
  }

  std::cout << "apply order:\n";
  size_t step = 1;
  for (const auto id : graph.topological_order()) {
    const auto * node = tree.node(id);
    if (!node->has_attributes()) {
      continue;
    }
    std::cout << fmt::format("  {:>3}. {}\n", step++, node->address());
  }

  std::cout << "edges:\n";
  for (const auto & edge : graph.edges()) {
    std::cout << fmt::format(
      "  {} -> {}  ({}{})\n", tree.node(edge.from)->name, tree.node(edge.to)->name,
      edge.explicit_dependency ? "" : tree.node(edge.from)->name + ".", edge.attribute);
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: project name required\n";
    std::cerr << "usage: stacksynth init <project-name>\n";
    return 1;
  }

  const fs::path project_dir = fs::current_path() / args.input_file;

  if (fs::exists(project_dir)) {
    std::cerr << "error: directory already exists: " << project_dir.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(project_dir / "stacks");

    // Create stacksynth.yaml
    std::ofstream config(project_dir / stacksynth::k_project_config_file_name);
    config << "package:\n"
           << "  name: '" << args.input_file << "'\n"
           << "  version: '0.1.0'\n\n"
           << "synth:\n"
           << "  stacks:\n"
           << "    - './stacks/main.yaml'\n"
           << "  output_dir: './stacksynth.out'\n"
           << "  plan_file: 'cdk.tf.json'\n";
    config.close();

    // Create a sample stack
    std::ofstream stack(project_dir / "stacks" / "main.yaml");
    stack << "stack: main\n"
          << "constructs:\n"
          << "  - kind: provider\n"
          << "    type: github\n"
          << "    name: GithubProvider\n"
          << "  - kind: resource\n"
          << "    type: github_repository\n"
          << "    name: SampleRepo\n"
          << "    config:\n"
          << "      name: sample-repo\n"
          << "      auto_init: true\n"
          << "  - kind: output\n"
          << "    name: RepoUrl\n"
          << "    value: !join [\"https://github.com/\", !ref SampleRepo.full_name]\n";
    stack.close();

    std::cout << "Initialized new stacksynth project in " << project_dir.string() << "\n";
    std::cout << "\nNext steps:\n"
              << "  cd " << args.input_file << "\n"
              << "  stacksynth synth\n";

    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "synth") {
    return cmd_synth(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "graph") {
    return cmd_graph(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
