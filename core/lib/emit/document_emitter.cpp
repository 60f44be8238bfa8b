// stacksynth/emit/document_emitter.cpp - Serialize resolved values to YAML/JSON

#include "stacksynth/emit/document_emitter.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "stacksynth/emit/yaml_scalar.hpp"

namespace stacksynth
{

UnresolvedTokenError::UnresolvedTokenError(std::string path, ValueKind kind)
: std::logic_error(
    "unresolved " + std::string(value_kind_name(kind)) + " at " + path +
    " reached the emitter; the value was not resolved"),
  path_(std::move(path)),
  kind_(kind)
{
}

UnrepresentableValueError::UnrepresentableValueError(std::string path, const std::string & reason)
: std::runtime_error(reason + " at " + path), path_(std::move(path))
{
}

namespace
{

std::string root_path() { return "$"; }

// ============================================================================
// YAML
// ============================================================================

// A block literal reads back exactly only when the text ends with a single
// newline and does not start with a space.
bool fits_block_literal(const std::string & s)
{
  if (s.size() < 2 || s.back() != '\n' || s[s.size() - 2] == '\n') {
    return false;
  }
  if (s.front() == ' ' || s.find('\r') != std::string::npos) {
    return false;
  }
  return s.find('\n') != s.size() - 1;
}

void write_yaml_string(YAML::Emitter & out, const std::string & s)
{
  if (classify_plain_scalar(s) != PlainScalarType::String) {
    out << YAML::DoubleQuoted << s;
    return;
  }
  if (fits_block_literal(s)) {
    out << YAML::Literal << s;
    return;
  }
  out << s;
}

void write_yaml(YAML::Emitter & out, const Value & value, const std::string & path)
{
  switch (value.kind()) {
    case ValueKind::Null:
      out << YAML::Null;
      return;
    case ValueKind::Bool:
      out << value.as_bool();
      return;
    case ValueKind::Integer:
      out << static_cast<long long>(value.as_integer());
      return;
    case ValueKind::Float:
      // Written as text so the shortest round-trip form is used.
      out << format_core_float(value.as_float());
      return;
    case ValueKind::String:
      write_yaml_string(out, value.as_string());
      return;
    case ValueKind::Token:
    case ValueKind::Foreign:
    case ValueKind::Composite:
    case ValueKind::Encoded:
      throw UnresolvedTokenError(path, value.kind());
    case ValueKind::Sequence: {
      const auto & items = value.items();
      if (items.empty()) {
        out << YAML::Flow << YAML::BeginSeq << YAML::EndSeq;
        return;
      }
      out << YAML::BeginSeq;
      for (size_t i = 0; i < items.size(); ++i) {
        write_yaml(out, items[i], path_index(path, i));
      }
      out << YAML::EndSeq;
      return;
    }
    case ValueKind::Mapping: {
      const auto & entries = value.entries();
      if (entries.empty()) {
        out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
        return;
      }
      out << YAML::BeginMap;
      for (const auto & e : entries) {
        out << YAML::Key;
        write_yaml_string(out, e.key);
        out << YAML::Value;
        write_yaml(out, e.value, path_join(path, e.key));
      }
      out << YAML::EndMap;
      return;
    }
  }
}

}  // namespace

// ============================================================================
// JsonConverter
// ============================================================================

nlohmann::ordered_json JsonConverter::convert(const Value & value)
{
  return convert_at(value, root_path());
}

nlohmann::ordered_json JsonConverter::convert_at(const Value & value, const std::string & path)
{
  switch (value.kind()) {
    case ValueKind::Null:
      return nullptr;
    case ValueKind::Bool:
      return value.as_bool();
    case ValueKind::Integer:
      return value.as_integer();
    case ValueKind::Float:
      // nlohmann dumps NaN and infinities as null.
      if (!std::isfinite(value.as_float())) {
        throw UnrepresentableValueError(
          path, "JSON has no representation for float " + format_core_float(value.as_float()));
      }
      return value.as_float();
    case ValueKind::String:
      return value.as_string();
    case ValueKind::Token:
    case ValueKind::Foreign:
    case ValueKind::Composite:
    case ValueKind::Encoded:
      throw UnresolvedTokenError(path, value.kind());
    case ValueKind::Sequence: {
      auto arr = nlohmann::ordered_json::array();
      const auto & items = value.items();
      for (size_t i = 0; i < items.size(); ++i) {
        arr.push_back(convert_at(items[i], path_index(path, i)));
      }
      return arr;
    }
    case ValueKind::Mapping: {
      auto obj = nlohmann::ordered_json::object();
      for (const auto & e : value.entries()) {
        obj[e.key] = convert_at(e.value, path_join(path, e.key));
      }
      return obj;
    }
  }
  return nullptr;
}

// ============================================================================
// YamlSerializer
// ============================================================================

std::string YamlSerializer::serialize(const Value & value)
{
  YAML::Emitter out;
  out.SetIndent(2);
  out.SetNullFormat(YAML::LowerNull);
  out.SetBoolFormat(YAML::TrueFalseBool);
  out.SetSeqFormat(YAML::Block);
  out.SetMapFormat(YAML::Block);

  write_yaml(out, value, root_path());

  if (!out.good()) {
    throw std::runtime_error("YAML emitter error: " + out.GetLastError());
  }
  std::string text = out.c_str();
  text += '\n';
  return text;
}

// ============================================================================
// DocumentEmitter
// ============================================================================

std::string DocumentEmitter::emit(const Value & value, DocumentFormat format)
{
  switch (format) {
    case DocumentFormat::Yaml:
      return emit_yaml(value);
    case DocumentFormat::Json:
      return emit_json(value);
  }
  throw std::invalid_argument("unknown document format");
}

std::string DocumentEmitter::emit_yaml(const Value & value) { return YamlSerializer::serialize(value); }

std::string DocumentEmitter::emit_json(const Value & value)
{
  return JsonConverter::convert(value).dump(2) + "\n";
}

}  // namespace stacksynth
