// stacksynth/config/environment.hpp - Required environment values
//
// A stack declares the environment variables it needs. They are checked
// before any construct is created, and all missing names are reported at
// once.
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"

namespace stacksynth
{

/// Environment variable lookup; nullopt when the variable is not set.
using EnvLookup = std::function<std::optional<std::string>(const std::string & name)>;

/// Lookup backed by the process environment (std::getenv).
[[nodiscard]] EnvLookup process_env_lookup();

/**
 * Validated environment values, keyed by variable name.
 */
class Environment
{
public:
  Environment() = default;

  void set(std::string name, std::string value);

  [[nodiscard]] std::optional<std::string> get(const std::string & name) const;
  [[nodiscard]] bool contains(const std::string & name) const;
  [[nodiscard]] const std::map<std::string, std::string> & values() const noexcept
  {
    return values_;
  }

private:
  std::map<std::string, std::string> values_;
};

/**
 * Check that every required variable is set and non-empty.
 *
 * @param where Location reported with the E0201 diagnostic (e.g. the stack
 *              file's `required_env` key)
 * @return The values, or nullopt after reporting every missing name in a
 *         single diagnostic
 */
std::optional<Environment> validate_env(
  const std::vector<std::string> & required, const EnvLookup & lookup, DiagnosticBag * diags,
  const Location & where = {});

}  // namespace stacksynth
