// stacksynth/construct/value.hpp - Construct input values
//
// A Value is either known now (literals), known only after provisioning
// (tokens), opaque text for a foreign system (foreign expressions), or a
// structure mixing all of these. Nothing is evaluated at composition time.
//
#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "stacksynth/construct/ids.hpp"

namespace stacksynth
{

// ============================================================================
// Value Kind
// ============================================================================

enum class ValueKind : uint8_t {
  Null,
  Bool,
  Integer,    ///< 64-bit signed integer
  Float,      ///< 64-bit floating point
  String,     ///< Literal string
  Token,      ///< Deferred attribute of a construct
  Foreign,    ///< Raw text in another system's template syntax
  Composite,  ///< String composed of literal, token and foreign parts
  Sequence,
  Mapping,    ///< Ordered string -> Value mapping
  Encoded,    ///< Embedded document, serialized to text during resolution
};

[[nodiscard]] const char * value_kind_name(ValueKind kind) noexcept;

/**
 * Text format of an emitted document (and of an Encoded value).
 */
enum class DocumentFormat : uint8_t {
  Yaml,
  Json,
};

[[nodiscard]] const char * document_format_name(DocumentFormat format) noexcept;

// ============================================================================
// Composed strings
// ============================================================================

enum class StringPartKind : uint8_t {
  Literal,
  Token,
  Foreign,
};

/**
 * One fragment of a composed string.
 *
 * Literal and Foreign parts keep their text in `text`; Token parts keep the
 * reference in `token`.
 */
struct StringPart
{
  StringPartKind kind = StringPartKind::Literal;
  std::string text;
  TokenRef token;

  static StringPart literal(std::string text) { return {StringPartKind::Literal, std::move(text), {}}; }
  static StringPart foreign(std::string raw) { return {StringPartKind::Foreign, std::move(raw), {}}; }
  static StringPart reference(TokenRef token) { return {StringPartKind::Token, {}, token}; }

  [[nodiscard]] bool operator==(const StringPart & other) const noexcept
  {
    return kind == other.kind && text == other.text && token == other.token;
  }
};

/**
 * Opaque text in a remote system's own expression syntax
 * (e.g. "${{ github.run_id }}"). Passed through resolution untouched.
 */
struct ForeignExpression
{
  std::string raw;
};

// ============================================================================
// Value
// ============================================================================

struct MapEntry;

class Value
{
public:
  using Sequence = std::vector<Value>;
  using Mapping = std::vector<MapEntry>;

  // ===========================================================================
  // Construction
  // ===========================================================================

  Value();
  Value(std::nullptr_t);
  Value(bool value);
  Value(int value);
  Value(int64_t value);
  Value(double value);
  Value(const char * value);
  Value(std::string value);
  Value(TokenRef token);
  Value(ForeignExpression foreign);

  static Value make_null();
  static Value make_bool(bool value);
  static Value make_integer(int64_t value);
  static Value make_float(double value);
  static Value make_string(std::string value);
  static Value make_token(TokenRef token);
  static Value make_foreign(std::string raw);

  static Value make_sequence(Sequence items);
  static Value make_mapping(Mapping entries);
  static Value sequence(std::initializer_list<Value> items);
  static Value mapping(std::initializer_list<MapEntry> entries);

  /**
   * Wrap a document body that is serialized to text in `format` once it is
   * resolved. Tokens inside the body still count as references.
   */
  static Value make_encoded(DocumentFormat format, Value body);

  /**
   * Compose a string from pieces, structurally.
   *
   * String, number and bool pieces become literal fragments, tokens and
   * foreign expressions keep their identity, composite pieces are spliced.
   * Adjacent literal fragments are merged. A result made of literals only
   * collapses to a String; a single token or foreign fragment collapses to
   * that Token or Foreign value.
   *
   * @throws std::invalid_argument for Null, Sequence, Mapping or Encoded pieces
   */
  static Value concat(const std::vector<Value> & pieces);

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  [[nodiscard]] ValueKind kind() const noexcept { return kind_; }

  [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueKind::Null; }
  [[nodiscard]] bool is_bool() const noexcept { return kind_ == ValueKind::Bool; }
  [[nodiscard]] bool is_integer() const noexcept { return kind_ == ValueKind::Integer; }
  [[nodiscard]] bool is_float() const noexcept { return kind_ == ValueKind::Float; }
  [[nodiscard]] bool is_string() const noexcept { return kind_ == ValueKind::String; }
  [[nodiscard]] bool is_token() const noexcept { return kind_ == ValueKind::Token; }
  [[nodiscard]] bool is_foreign() const noexcept { return kind_ == ValueKind::Foreign; }
  [[nodiscard]] bool is_composite() const noexcept { return kind_ == ValueKind::Composite; }
  [[nodiscard]] bool is_sequence() const noexcept { return kind_ == ValueKind::Sequence; }
  [[nodiscard]] bool is_mapping() const noexcept { return kind_ == ValueKind::Mapping; }
  [[nodiscard]] bool is_encoded() const noexcept { return kind_ == ValueKind::Encoded; }

  /// True for values that may appear in a composed string.
  [[nodiscard]] bool is_string_like() const noexcept;

  /// True if this value, or anything nested in it, still needs resolution.
  [[nodiscard]] bool is_deferred() const;

  // ===========================================================================
  // Value Accessors (only valid for the matching kind)
  // ===========================================================================

  [[nodiscard]] bool as_bool() const noexcept { return boolValue_; }
  [[nodiscard]] int64_t as_integer() const noexcept { return intValue_; }
  [[nodiscard]] double as_float() const noexcept { return floatValue_; }
  [[nodiscard]] const std::string & as_string() const noexcept { return stringValue_; }
  [[nodiscard]] const std::string & foreign_raw() const noexcept { return stringValue_; }
  [[nodiscard]] TokenRef as_token() const noexcept { return token_; }
  [[nodiscard]] const std::vector<StringPart> & parts() const noexcept { return parts_; }
  [[nodiscard]] const Sequence & items() const noexcept { return items_; }
  [[nodiscard]] const Mapping & entries() const noexcept { return entries_; }
  [[nodiscard]] DocumentFormat encoded_format() const noexcept { return format_; }
  [[nodiscard]] const Value & encoded_body() const noexcept { return items_.front(); }

  // ===========================================================================
  // Structure Helpers
  // ===========================================================================

  /// Mapping lookup; nullptr if absent or not a mapping.
  [[nodiscard]] const Value * find(std::string_view key) const;
  [[nodiscard]] Value * find(std::string_view key);

  /// Replace the entry for `key` in place, or append it. Mapping only.
  void set(std::string key, Value value);

  /// Append to a sequence.
  void push_back(Value value);

  /// Number of items (sequence) or entries (mapping); 0 otherwise.
  [[nodiscard]] size_t size() const noexcept;

  [[nodiscard]] bool operator==(const Value & other) const;
  [[nodiscard]] bool operator!=(const Value & other) const { return !(*this == other); }

private:
  ValueKind kind_ = ValueKind::Null;
  bool boolValue_ = false;
  int64_t intValue_ = 0;
  double floatValue_ = 0.0;
  std::string stringValue_;  // String text or Foreign raw text
  TokenRef token_;
  std::vector<StringPart> parts_;
  Sequence items_;  // Sequence items, or the single Encoded body
  Mapping entries_;
  DocumentFormat format_ = DocumentFormat::Yaml;
};

struct MapEntry
{
  std::string key;
  Value value;

  [[nodiscard]] bool operator==(const MapEntry & other) const
  {
    return key == other.key && value == other.value;
  }
};

// Constructors are defined once MapEntry is complete.
inline Value::Value() = default;
inline Value::Value(std::nullptr_t) {}
inline Value::Value(bool value) : kind_(ValueKind::Bool), boolValue_(value) {}
inline Value::Value(int value) : kind_(ValueKind::Integer), intValue_(value) {}
inline Value::Value(int64_t value) : kind_(ValueKind::Integer), intValue_(value) {}
inline Value::Value(double value) : kind_(ValueKind::Float), floatValue_(value) {}
inline Value::Value(const char * value) : kind_(ValueKind::String), stringValue_(value) {}
inline Value::Value(std::string value) : kind_(ValueKind::String), stringValue_(std::move(value))
{
}
inline Value::Value(TokenRef token) : kind_(ValueKind::Token), token_(token) {}
inline Value::Value(ForeignExpression foreign)
: kind_(ValueKind::Foreign), stringValue_(std::move(foreign.raw))
{
}

// ============================================================================
// Traversal
// ============================================================================

using TokenVisitor = std::function<void(TokenRef token, const std::string & path)>;

/**
 * Visit every token occurrence in `value`, depth first in declared order.
 *
 * `path` is the attribute path of `value` itself ("" for the root); nested
 * paths look like "statement[0].principals[0].identifiers".
 */
void for_each_token(const Value & value, const std::string & path, const TokenVisitor & visit);

/// Append a mapping key to an attribute path.
[[nodiscard]] std::string path_join(const std::string & path, std::string_view key);

/// Append a sequence index to an attribute path.
[[nodiscard]] std::string path_index(const std::string & path, size_t index);

}  // namespace stacksynth
