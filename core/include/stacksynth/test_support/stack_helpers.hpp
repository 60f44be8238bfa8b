// stacksynth/test_support/stack_helpers.hpp - helpers for unit/integration tests
//
// Diagnostics queries, an in-memory environment and a stack-file loading
// wrapper. The DiagnosticBag is always owned by the caller because a loaded
// tree keeps a pointer to it.
//
#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/config/environment.hpp"
#include "stacksynth/loader/stack_loader.hpp"

namespace stacksynth::test_support
{

[[nodiscard]] inline bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  const auto & all = diags.all();
  return std::any_of(all.begin(), all.end(), [&](const Diagnostic & d) {
    if (d.severity != Severity::Error) return false;
    return d.message.find(needle) != std::string::npos;
  });
}

[[nodiscard]] inline size_t count_code(const DiagnosticBag & diags, std::string_view code)
{
  const auto & all = diags.all();
  return static_cast<size_t>(
    std::count_if(all.begin(), all.end(), [&](const Diagnostic & d) { return d.code == code; }));
}

/// First diagnostic with `code`, or nullptr.
[[nodiscard]] inline const Diagnostic * find_code(const DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) return &d;
  }
  return nullptr;
}

/// Environment lookup backed by a fixed map.
[[nodiscard]] inline EnvLookup map_env(std::map<std::string, std::string> values)
{
  return [values = std::move(values)](const std::string & name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
  };
}

[[nodiscard]] inline std::optional<LoadedStack> load_stack(
  DiagnosticBag & diags, std::string_view yaml, std::map<std::string, std::string> env = {})
{
  StackLoader loader(&diags, map_env(std::move(env)));
  return loader.load_string(yaml, "stack.yaml");
}

}  // namespace stacksynth::test_support
