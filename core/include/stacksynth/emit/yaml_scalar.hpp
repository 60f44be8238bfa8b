// stacksynth/emit/yaml_scalar.hpp - YAML 1.2 core schema scalar resolution
//
// Shared by the loader (typing untagged plain scalars) and the emitter
// (quoting strings that would otherwise read back as another type).
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace stacksynth
{

enum class PlainScalarType : uint8_t {
  Null,
  Bool,
  Integer,
  Float,
  String,
};

/**
 * Type a YAML 1.2 core schema reader assigns to an untagged plain scalar.
 *
 *   null:  "" ~ null Null NULL
 *   bool:  true True TRUE false False FALSE
 *   int:   [-+]?[0-9]+  0o[0-7]+  0x[0-9a-fA-F]+
 *   float: [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
 *          [-+]?\.(inf|Inf|INF)  \.(nan|NaN|NAN)
 *
 * Everything else (including YAML 1.1 words such as "on" or "yes") is a
 * string.
 */
[[nodiscard]] PlainScalarType classify_plain_scalar(std::string_view text) noexcept;

/// Value of a scalar classified as Bool.
[[nodiscard]] bool parse_core_bool(std::string_view text) noexcept;

/// Value of a scalar classified as Integer; nullopt if it overflows int64.
[[nodiscard]] std::optional<int64_t> parse_core_integer(std::string_view text) noexcept;

/// Value of a scalar classified as Float (or an overflowing Integer).
[[nodiscard]] std::optional<double> parse_core_float(std::string_view text) noexcept;

/**
 * Shortest text that reads back as the same double and still reads as a
 * float ("1.0", not "1"). Infinity and NaN use the YAML spelling.
 */
[[nodiscard]] std::string format_core_float(double value);

}  // namespace stacksynth
