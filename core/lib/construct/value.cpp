// stacksynth/construct/value.cpp - Value construction and traversal
#include "stacksynth/construct/value.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace stacksynth
{

const char * value_kind_name(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Null:
      return "null";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::String:
      return "string";
    case ValueKind::Token:
      return "token";
    case ValueKind::Foreign:
      return "foreign expression";
    case ValueKind::Composite:
      return "composed string";
    case ValueKind::Sequence:
      return "sequence";
    case ValueKind::Mapping:
      return "mapping";
    case ValueKind::Encoded:
      return "encoded document";
  }
  return "unknown";
}

const char * document_format_name(DocumentFormat format) noexcept
{
  switch (format) {
    case DocumentFormat::Yaml:
      return "yaml";
    case DocumentFormat::Json:
      return "json";
  }
  return "unknown";
}

namespace
{

[[nodiscard]] std::string to_string_lossless(double v) { return fmt::format("{}", v); }

void append_part(std::vector<StringPart> & parts, StringPart part)
{
  if (
    part.kind == StringPartKind::Literal && !parts.empty() &&
    parts.back().kind == StringPartKind::Literal) {
    parts.back().text += part.text;
    return;
  }
  if (part.kind == StringPartKind::Literal && part.text.empty()) {
    return;
  }
  parts.push_back(std::move(part));
}

}  // namespace

// ============================================================================
// Factories
// ============================================================================

Value Value::make_null() { return Value(); }

Value Value::make_bool(bool value) { return Value(value); }

Value Value::make_integer(int64_t value) { return Value(value); }

Value Value::make_float(double value) { return Value(value); }

Value Value::make_string(std::string value) { return Value(std::move(value)); }

Value Value::make_token(TokenRef token) { return Value(token); }

Value Value::make_foreign(std::string raw) { return Value(ForeignExpression{std::move(raw)}); }

Value Value::make_sequence(Sequence items)
{
  Value v;
  v.kind_ = ValueKind::Sequence;
  v.items_ = std::move(items);
  return v;
}

Value Value::make_mapping(Mapping entries)
{
  Value v;
  v.kind_ = ValueKind::Mapping;
  for (auto & e : entries) {
    v.set(std::move(e.key), std::move(e.value));
  }
  return v;
}

Value Value::sequence(std::initializer_list<Value> items) { return make_sequence(Sequence(items)); }

Value Value::mapping(std::initializer_list<MapEntry> entries)
{
  return make_mapping(Mapping(entries));
}

Value Value::make_encoded(DocumentFormat format, Value body)
{
  Value v;
  v.kind_ = ValueKind::Encoded;
  v.format_ = format;
  v.items_.push_back(std::move(body));
  return v;
}

Value Value::concat(const std::vector<Value> & pieces)
{
  std::vector<StringPart> parts;
  parts.reserve(pieces.size());

  for (size_t i = 0; i < pieces.size(); ++i) {
    const Value & piece = pieces[i];
    switch (piece.kind()) {
      case ValueKind::String:
        append_part(parts, StringPart::literal(piece.as_string()));
        break;
      case ValueKind::Integer:
        append_part(parts, StringPart::literal(std::to_string(piece.as_integer())));
        break;
      case ValueKind::Float:
        append_part(parts, StringPart::literal(to_string_lossless(piece.as_float())));
        break;
      case ValueKind::Bool:
        append_part(parts, StringPart::literal(piece.as_bool() ? "true" : "false"));
        break;
      case ValueKind::Token:
        append_part(parts, StringPart::reference(piece.as_token()));
        break;
      case ValueKind::Foreign:
        append_part(parts, StringPart::foreign(piece.foreign_raw()));
        break;
      case ValueKind::Composite:
        for (const auto & p : piece.parts()) {
          append_part(parts, p);
        }
        break;
      case ValueKind::Null:
      case ValueKind::Sequence:
      case ValueKind::Mapping:
      case ValueKind::Encoded:
        throw std::invalid_argument(
          "cannot compose a " + std::string(value_kind_name(piece.kind())) +
          " into a string (piece " + std::to_string(i) + ")");
    }
  }

  if (parts.empty()) {
    return Value(std::string());
  }
  if (parts.size() == 1) {
    switch (parts.front().kind) {
      case StringPartKind::Literal:
        return Value(std::move(parts.front().text));
      case StringPartKind::Token:
        return Value(parts.front().token);
      case StringPartKind::Foreign:
        return make_foreign(std::move(parts.front().text));
    }
  }

  Value v;
  v.kind_ = ValueKind::Composite;
  v.parts_ = std::move(parts);
  return v;
}

// ============================================================================
// Queries
// ============================================================================

bool Value::is_string_like() const noexcept
{
  switch (kind_) {
    case ValueKind::String:
    case ValueKind::Token:
    case ValueKind::Foreign:
    case ValueKind::Composite:
      return true;
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::Sequence:
    case ValueKind::Mapping:
    case ValueKind::Encoded:
      return false;
  }
  return false;
}

bool Value::is_deferred() const
{
  switch (kind_) {
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
      return false;
    case ValueKind::Token:
    case ValueKind::Foreign:
    case ValueKind::Composite:
    case ValueKind::Encoded:
      return true;
    case ValueKind::Sequence:
      return std::any_of(
        items_.begin(), items_.end(), [](const Value & v) { return v.is_deferred(); });
    case ValueKind::Mapping:
      return std::any_of(
        entries_.begin(), entries_.end(), [](const MapEntry & e) { return e.value.is_deferred(); });
  }
  return false;
}

const Value * Value::find(std::string_view key) const
{
  if (kind_ != ValueKind::Mapping) {
    return nullptr;
  }
  for (const auto & e : entries_) {
    if (e.key == key) {
      return &e.value;
    }
  }
  return nullptr;
}

Value * Value::find(std::string_view key)
{
  return const_cast<Value *>(static_cast<const Value *>(this)->find(key));
}

void Value::set(std::string key, Value value)
{
  if (kind_ != ValueKind::Mapping) {
    throw std::logic_error("Value::set on a " + std::string(value_kind_name(kind_)));
  }
  if (Value * existing = find(key)) {
    *existing = std::move(value);
    return;
  }
  entries_.push_back(MapEntry{std::move(key), std::move(value)});
}

void Value::push_back(Value value)
{
  if (kind_ != ValueKind::Sequence) {
    throw std::logic_error("Value::push_back on a " + std::string(value_kind_name(kind_)));
  }
  items_.push_back(std::move(value));
}

size_t Value::size() const noexcept
{
  if (kind_ == ValueKind::Sequence) return items_.size();
  if (kind_ == ValueKind::Mapping) return entries_.size();
  return 0;
}

bool Value::operator==(const Value & other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case ValueKind::Null:
      return true;
    case ValueKind::Bool:
      return boolValue_ == other.boolValue_;
    case ValueKind::Integer:
      return intValue_ == other.intValue_;
    case ValueKind::Float:
      return floatValue_ == other.floatValue_;
    case ValueKind::String:
    case ValueKind::Foreign:
      return stringValue_ == other.stringValue_;
    case ValueKind::Token:
      return token_ == other.token_;
    case ValueKind::Composite:
      return parts_ == other.parts_;
    case ValueKind::Sequence:
      return items_ == other.items_;
    case ValueKind::Mapping:
      return entries_ == other.entries_;
    case ValueKind::Encoded:
      return format_ == other.format_ && items_ == other.items_;
  }
  return false;
}

// ============================================================================
// Traversal
// ============================================================================

std::string path_join(const std::string & path, std::string_view key)
{
  if (path.empty()) {
    return std::string(key);
  }
  std::string out = path;
  out += '.';
  out += key;
  return out;
}

std::string path_index(const std::string & path, size_t index)
{
  return path + "[" + std::to_string(index) + "]";
}

void for_each_token(const Value & value, const std::string & path, const TokenVisitor & visit)
{
  switch (value.kind()) {
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
    case ValueKind::Foreign:
      return;
    case ValueKind::Token:
      visit(value.as_token(), path);
      return;
    case ValueKind::Composite:
      for (const auto & part : value.parts()) {
        if (part.kind == StringPartKind::Token) {
          visit(part.token, path);
        }
      }
      return;
    case ValueKind::Sequence: {
      const auto & items = value.items();
      for (size_t i = 0; i < items.size(); ++i) {
        for_each_token(items[i], path_index(path, i), visit);
      }
      return;
    }
    case ValueKind::Mapping:
      for (const auto & e : value.entries()) {
        for_each_token(e.value, path_join(path, e.key), visit);
      }
      return;
    case ValueKind::Encoded:
      for_each_token(value.encoded_body(), path, visit);
      return;
  }
}

}  // namespace stacksynth
