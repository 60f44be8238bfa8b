// tests/unit/construct/test_value.cpp - Value composition and traversal

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "stacksynth/construct/value.hpp"

using namespace stacksynth;

TEST(ConstructValue, LiteralKinds)
{
  EXPECT_TRUE(Value().is_null());
  EXPECT_TRUE(Value(true).is_bool());
  EXPECT_TRUE(Value(42).is_integer());
  EXPECT_TRUE(Value(1.5).is_float());
  EXPECT_TRUE(Value("text").is_string());
  EXPECT_TRUE(Value(ForeignExpression{"${{ github.run_id }}"}).is_foreign());
  EXPECT_FALSE(Value("text").is_deferred());
}

TEST(ConstructValue, ConcatMergesAdjacentLiterals)
{
  const Value v = Value::concat({Value("a"), Value(1), Value("-"), Value(true)});
  ASSERT_TRUE(v.is_string());
  EXPECT_EQ(v.as_string(), "a1-true");
}

TEST(ConstructValue, ConcatKeepsTokenAndForeignIdentity)
{
  const TokenRef tok{7, 0};
  const Value v = Value::concat(
    {Value("codebuild-"), Value(tok), Value("-"), Value::make_foreign("${{ github.run_id }}")});

  ASSERT_TRUE(v.is_composite());
  ASSERT_EQ(v.parts().size(), 4u);
  EXPECT_EQ(v.parts()[0].kind, StringPartKind::Literal);
  EXPECT_EQ(v.parts()[1].kind, StringPartKind::Token);
  EXPECT_EQ(v.parts()[1].token, tok);
  EXPECT_EQ(v.parts()[3].kind, StringPartKind::Foreign);
  EXPECT_EQ(v.parts()[3].text, "${{ github.run_id }}");
  EXPECT_TRUE(v.is_deferred());
}

TEST(ConstructValue, ConcatCollapsesSingleFragment)
{
  const TokenRef tok{3, 2};
  const Value only_token = Value::concat({Value(""), Value(tok)});
  ASSERT_TRUE(only_token.is_token());
  EXPECT_EQ(only_token.as_token(), tok);

  EXPECT_TRUE(Value::concat({Value::make_foreign("${{ x }}")}).is_foreign());
  EXPECT_EQ(Value::concat({}).as_string(), "");
}

TEST(ConstructValue, ConcatSplicesComposites)
{
  const TokenRef tok{5, 1};
  const Value inner = Value::concat({Value("a-"), Value(tok)});
  const Value outer = Value::concat({inner, Value("-b")});
  ASSERT_TRUE(outer.is_composite());
  ASSERT_EQ(outer.parts().size(), 3u);
  EXPECT_EQ(outer.parts()[2].text, "-b");
}

TEST(ConstructValue, ConcatRejectsStructures)
{
  EXPECT_THROW(Value::concat({Value("a"), Value::sequence({Value(1)})}), std::invalid_argument);
  EXPECT_THROW(Value::concat({Value()}), std::invalid_argument);
}

TEST(ConstructValue, MappingKeepsInsertionOrderAndReplacesInPlace)
{
  Value m = Value::mapping({{"b", 1}, {"a", 2}});
  m.set("c", Value(3));
  m.set("b", Value("replaced"));

  ASSERT_EQ(m.size(), 3u);
  EXPECT_EQ(m.entries()[0].key, "b");
  EXPECT_EQ(m.entries()[0].value.as_string(), "replaced");
  EXPECT_EQ(m.entries()[1].key, "a");
  EXPECT_EQ(m.entries()[2].key, "c");
  EXPECT_EQ(m.find("missing"), nullptr);
  EXPECT_THROW(Value(1).push_back(Value(2)), std::logic_error);
}

TEST(ConstructValue, ForEachTokenReportsNestedPaths)
{
  const TokenRef a{9, 0};
  const TokenRef b{9, 1};
  const Value v = Value::mapping({
    {"statement",
     Value::sequence({Value::mapping({
       {"principals", Value::sequence({Value::mapping({{"identifiers", Value(a)}})})},
     })})},
    {"name", Value::concat({Value("x-"), Value(b)})},
    {"doc", Value::make_encoded(DocumentFormat::Json, Value::mapping({{"arn", Value(a)}}))},
  });

  std::vector<std::string> paths;
  for_each_token(v, "", [&](TokenRef, const std::string & path) { paths.push_back(path); });

  const std::vector<std::string> expected = {
    "statement[0].principals[0].identifiers", "name", "doc.arn"};
  EXPECT_EQ(paths, expected);
}

TEST(ConstructValue, EqualityIsStructural)
{
  EXPECT_EQ(Value::sequence({Value(1), Value("a")}), Value::sequence({Value(1), Value("a")}));
  EXPECT_NE(Value("1"), Value(1));
  EXPECT_NE(Value::make_foreign("x"), Value("x"));
}
