// stacksynth/emit/document_emitter.hpp - Serialize resolved values to YAML/JSON
//
// The emitter only accepts fully resolved values: literals, sequences and
// mappings. Anything still deferred is an internal invariant violation.
//
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "stacksynth/construct/value.hpp"

namespace stacksynth
{

/**
 * A deferred value reached the emitter.
 *
 * Signals that resolution was skipped or the tree changed after it ran; never
 * a user error.
 */
class UnresolvedTokenError : public std::logic_error
{
public:
  UnresolvedTokenError(std::string path, ValueKind kind);

  /// Document path of the offending value, e.g. "$.jobs.build.runs-on".
  [[nodiscard]] const std::string & path() const noexcept { return path_; }
  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

private:
  std::string path_;
  ValueKind kind_;
};

/**
 * A resolved value cannot be written in the requested format without
 * changing its type, e.g. an infinite float in JSON.
 */
class UnrepresentableValueError : public std::runtime_error
{
public:
  UnrepresentableValueError(std::string path, const std::string & reason);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }

private:
  std::string path_;
};

/**
 * Resolved Value -> nlohmann::ordered_json (key order preserved).
 */
class JsonConverter
{
public:
  [[nodiscard]] static nlohmann::ordered_json convert(const Value & value);

private:
  static nlohmann::ordered_json convert_at(const Value & value, const std::string & path);
};

/**
 * Resolved Value -> YAML text using yaml-cpp's emitter.
 *
 * Block style, declared key order, scalar types preserved. Strings that
 * would read back as null, bool or a number are double quoted.
 */
class YamlSerializer
{
public:
  [[nodiscard]] static std::string serialize(const Value & value);
};

/**
 * High-level document emitter facade.
 */
class DocumentEmitter
{
public:
  DocumentEmitter() = default;

  /**
   * Serialize a resolved value.
   *
   * @throws UnresolvedTokenError if a Token, ForeignExpression, composed
   *         string or encoded document is still present
   * @throws UnrepresentableValueError if a NaN or infinite float is emitted
   *         as JSON
   */
  [[nodiscard]] static std::string emit(const Value & value, DocumentFormat format);

  [[nodiscard]] static std::string emit_yaml(const Value & value);
  [[nodiscard]] static std::string emit_json(const Value & value);
};

}  // namespace stacksynth
