// stacksynth/loader/stack_loader.hpp - Build a construct tree from a stack file
//
// Stack file layout (YAML):
//
//   stack: my-stack
//   required_env: [GITHUB_TOKEN]
//   constructs:
//     - kind: resource            # provider | resource | data | output
//       type: github_repository
//       name: SampleRepo
//       config: { name: sample-repo, auto_init: true }
//       depends_on: [OtherName]
//     - kind: output
//       name: RepoUrl
//       value: !join ["https://github.com/", !ref SampleRepo.full_name]
//   documents:
//     - name: hello-world
//       path: .github/workflows/hello-world.yml
//       body: { ... }
//
// Tags: !ref Name.attribute, !raw text, !join [parts], !env NAME,
//       !yaml node, !json node
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/config/environment.hpp"
#include "stacksynth/construct/construct_tree.hpp"

namespace stacksynth
{

/**
 * A stack file turned into a finalized construct tree.
 */
struct LoadedStack
{
  std::unique_ptr<ConstructTree> tree;
  std::vector<std::string> required_env;
  Environment environment;
  std::filesystem::path source;
};

class StackLoader
{
public:
  /**
   * @param diags Receives every load error (E0101, E0105, E0107, E0201, E0301...)
   * @param lookup Source of `required_env` values
   */
  explicit StackLoader(DiagnosticBag * diags, EnvLookup lookup = process_env_lookup())
  : diags_(diags), lookup_(std::move(lookup))
  {
  }

  /// Load and validate a stack file. nullopt if any error was reported.
  std::optional<LoadedStack> load_file(const std::filesystem::path & path);

  /**
   * Load a stack from YAML text. `display_path` is used in diagnostics.
   */
  std::optional<LoadedStack> load_string(
    std::string_view text, const std::filesystem::path & display_path = "<stack>");

private:
  DiagnosticBag * diags_;
  EnvLookup lookup_;
};

}  // namespace stacksynth
