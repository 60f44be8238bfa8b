// stacksynth/config/environment.cpp - Required environment values

#include "stacksynth/config/environment.hpp"

#include <cstdlib>
#include <fmt/core.h>
#include <utility>

#include "stacksynth/basic/diagnostic_codes.hpp"

namespace stacksynth
{

EnvLookup process_env_lookup()
{
  return [](const std::string & name) -> std::optional<std::string> {
    const char * value = std::getenv(name.c_str());
    if (!value) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

void Environment::set(std::string name, std::string value)
{
  values_[std::move(name)] = std::move(value);
}

std::optional<std::string> Environment::get(const std::string & name) const
{
  auto it = values_.find(name);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool Environment::contains(const std::string & name) const { return values_.count(name) > 0; }

std::optional<Environment> validate_env(
  const std::vector<std::string> & required, const EnvLookup & lookup, DiagnosticBag * diags,
  const Location & where)
{
  Environment env;
  std::vector<std::string> missing;

  for (const auto & name : required) {
    std::optional<std::string> value = lookup ? lookup(name) : std::nullopt;
    // An empty value is as good as unset.
    if (!value || value->empty()) {
      missing.push_back(name);
      continue;
    }
    env.set(name, std::move(*value));
  }

  if (missing.empty()) {
    return env;
  }

  if (diags) {
    std::string names;
    for (size_t i = 0; i < missing.size(); ++i) {
      if (i > 0) names += ", ";
      names += missing[i];
    }
    diags
      ->report_error(
        where,
        fmt::format(
          "missing required environment variable{}: {}", missing.size() == 1 ? "" : "s", names))
      .with_code(diag_code::k_missing_environment)
      .with_help("set the variables in the environment before running stacksynth");
  }
  return std::nullopt;
}

}  // namespace stacksynth
