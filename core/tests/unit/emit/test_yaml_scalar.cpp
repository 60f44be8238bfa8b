// tests/unit/emit/test_yaml_scalar.cpp - Core schema scalar typing

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "stacksynth/emit/yaml_scalar.hpp"

using namespace stacksynth;

TEST(EmitYamlScalar, ClassifiesCoreSchemaScalars)
{
  EXPECT_EQ(classify_plain_scalar(""), PlainScalarType::Null);
  EXPECT_EQ(classify_plain_scalar("~"), PlainScalarType::Null);
  EXPECT_EQ(classify_plain_scalar("NULL"), PlainScalarType::Null);
  EXPECT_EQ(classify_plain_scalar("True"), PlainScalarType::Bool);
  EXPECT_EQ(classify_plain_scalar("FALSE"), PlainScalarType::Bool);
  EXPECT_EQ(classify_plain_scalar("123"), PlainScalarType::Integer);
  EXPECT_EQ(classify_plain_scalar("-7"), PlainScalarType::Integer);
  EXPECT_EQ(classify_plain_scalar("0x1F"), PlainScalarType::Integer);
  EXPECT_EQ(classify_plain_scalar("0o17"), PlainScalarType::Integer);
  EXPECT_EQ(classify_plain_scalar("1.5"), PlainScalarType::Float);
  EXPECT_EQ(classify_plain_scalar(".5"), PlainScalarType::Float);
  EXPECT_EQ(classify_plain_scalar("1e10"), PlainScalarType::Float);
  EXPECT_EQ(classify_plain_scalar("-.inf"), PlainScalarType::Float);
  EXPECT_EQ(classify_plain_scalar(".NaN"), PlainScalarType::Float);
}

TEST(EmitYamlScalar, YamlOneOneWordsStayStrings)
{
  EXPECT_EQ(classify_plain_scalar("on"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("yes"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("off"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("1.2.3"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("0o8"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("-"), PlainScalarType::String);
  EXPECT_EQ(classify_plain_scalar("ubuntu-latest"), PlainScalarType::String);
}

TEST(EmitYamlScalar, ParsesIntegers)
{
  EXPECT_EQ(parse_core_integer("42"), 42);
  EXPECT_EQ(parse_core_integer("+42"), 42);
  EXPECT_EQ(parse_core_integer("-42"), -42);
  EXPECT_EQ(parse_core_integer("0x10"), 16);
  EXPECT_EQ(parse_core_integer("0o10"), 8);
  EXPECT_EQ(parse_core_integer("-9223372036854775808"), std::numeric_limits<int64_t>::min());
  EXPECT_FALSE(parse_core_integer("9223372036854775808").has_value());
}

TEST(EmitYamlScalar, ParsesFloatsAndBools)
{
  EXPECT_DOUBLE_EQ(*parse_core_float("1.25"), 1.25);
  EXPECT_TRUE(std::isinf(*parse_core_float("-.inf")));
  EXPECT_LT(*parse_core_float("-.inf"), 0.0);
  EXPECT_TRUE(std::isnan(*parse_core_float(".nan")));
  EXPECT_TRUE(parse_core_bool("TRUE"));
  EXPECT_FALSE(parse_core_bool("false"));
}

TEST(EmitYamlScalar, FormatsFloatsAsFloats)
{
  EXPECT_EQ(format_core_float(1.0), "1.0");
  EXPECT_EQ(format_core_float(0.1), "0.1");
  EXPECT_EQ(format_core_float(-2.5), "-2.5");
  EXPECT_EQ(format_core_float(std::numeric_limits<double>::infinity()), ".inf");
  EXPECT_EQ(format_core_float(-std::numeric_limits<double>::infinity()), "-.inf");
  EXPECT_EQ(format_core_float(std::numeric_limits<double>::quiet_NaN()), ".nan");
  EXPECT_EQ(classify_plain_scalar(format_core_float(1e20)), PlainScalarType::Float);
}
