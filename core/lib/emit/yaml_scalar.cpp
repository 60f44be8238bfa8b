// stacksynth/emit/yaml_scalar.cpp - YAML 1.2 core schema scalar resolution

#include "stacksynth/emit/yaml_scalar.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fmt/core.h>
#include <limits>

namespace stacksynth
{

namespace
{

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

bool is_octal_digit(char c) noexcept { return c >= '0' && c <= '7'; }

bool is_hex_digit(char c) noexcept
{
  return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

template <typename Pred>
bool all_of(std::string_view s, Pred pred) noexcept
{
  if (s.empty()) return false;
  for (const char c : s) {
    if (!pred(c)) return false;
  }
  return true;
}

std::string_view strip_sign(std::string_view s) noexcept
{
  if (!s.empty() && (s.front() == '-' || s.front() == '+')) {
    s.remove_prefix(1);
  }
  return s;
}

bool is_core_null(std::string_view s) noexcept
{
  return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

bool is_core_bool(std::string_view s) noexcept
{
  return s == "true" || s == "True" || s == "TRUE" || s == "false" || s == "False" ||
         s == "FALSE";
}

bool is_core_int(std::string_view s) noexcept
{
  if (s.size() > 2 && s[0] == '0' && s[1] == 'o') {
    return all_of(s.substr(2), is_octal_digit);
  }
  if (s.size() > 2 && s[0] == '0' && s[1] == 'x') {
    return all_of(s.substr(2), is_hex_digit);
  }
  return all_of(strip_sign(s), is_digit);
}

bool is_special_float(std::string_view s) noexcept
{
  if (s == ".nan" || s == ".NaN" || s == ".NAN") {
    return true;
  }
  const std::string_view u = strip_sign(s);
  return u == ".inf" || u == ".Inf" || u == ".INF";
}

// [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?
bool is_core_float(std::string_view s) noexcept
{
  if (is_special_float(s)) {
    return true;
  }
  std::string_view u = strip_sign(s);
  size_t i = 0;
  const auto digits = [&]() {
    const size_t start = i;
    while (i < u.size() && is_digit(u[i])) ++i;
    return i - start;
  };

  if (i < u.size() && u[i] == '.') {
    ++i;
    if (digits() == 0) return false;
  } else {
    if (digits() == 0) return false;
    if (i < u.size() && u[i] == '.') {
      ++i;
      digits();
    }
  }
  if (i < u.size() && (u[i] == 'e' || u[i] == 'E')) {
    ++i;
    if (i < u.size() && (u[i] == '-' || u[i] == '+')) ++i;
    if (digits() == 0) return false;
  }
  return i == u.size();
}

}  // namespace

PlainScalarType classify_plain_scalar(std::string_view text) noexcept
{
  if (is_core_null(text)) return PlainScalarType::Null;
  if (is_core_bool(text)) return PlainScalarType::Bool;
  if (is_core_int(text)) return PlainScalarType::Integer;
  if (is_core_float(text)) return PlainScalarType::Float;
  return PlainScalarType::String;
}

bool parse_core_bool(std::string_view text) noexcept
{
  return text == "true" || text == "True" || text == "TRUE";
}

std::optional<int64_t> parse_core_integer(std::string_view text) noexcept
{
  int base = 10;
  std::string_view digits = text;
  bool negative = false;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'x')) {
    base = text[1] == 'o' ? 8 : 16;
    digits = text.substr(2);
  } else if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    digits = text.substr(1);
  }

  // Parse the magnitude unsigned so INT64_MIN is still representable.
  uint64_t magnitude = 0;
  const auto [ptr, ec] =
    std::from_chars(digits.data(), digits.data() + digits.size(), magnitude, base);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) {
    return std::nullopt;
  }
  constexpr auto k_max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  if (negative) {
    if (magnitude > k_max + 1) return std::nullopt;
    if (magnitude == k_max + 1) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(magnitude);
  }
  if (magnitude > k_max) return std::nullopt;
  return static_cast<int64_t>(magnitude);
}

std::optional<double> parse_core_float(std::string_view text) noexcept
{
  if (text == ".nan" || text == ".NaN" || text == ".NAN") {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const std::string_view u = strip_sign(text);
  if (u == ".inf" || u == ".Inf" || u == ".INF") {
    const double inf = std::numeric_limits<double>::infinity();
    return (!text.empty() && text.front() == '-') ? -inf : inf;
  }

  const std::string buffer(text);
  char * end = nullptr;
  const double value = std::strtod(buffer.c_str(), &end);
  if (end != buffer.c_str() + buffer.size()) {
    return std::nullopt;
  }
  return value;
}

std::string format_core_float(double value)
{
  if (std::isnan(value)) return ".nan";
  if (std::isinf(value)) return value < 0 ? "-.inf" : ".inf";

  std::string out = fmt::format("{}", value);
  if (out.find_first_of(".eE") == std::string::npos) {
    out += ".0";
  }
  return out;
}

}  // namespace stacksynth
