// tests/unit/emit/test_document_emitter.cpp - YAML/JSON emission of resolved values

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "stacksynth/construct/construct_tree.hpp"
#include "stacksynth/emit/document_emitter.hpp"
#include "stacksynth/resolve/resolver.hpp"

using namespace stacksynth;

namespace
{

Value workflow()
{
  return Value::mapping({
    {"name", "CI"},
    {"on", Value::mapping({{"push", Value::mapping({{"branches", Value::sequence({"main"})}})}})},
    {"jobs",
     Value::mapping({
       {"build",
        Value::mapping({
          {"runs-on", "codebuild-sample-${{ github.run_id }}"},
          {"timeout-minutes", 30},
          {"steps", Value::sequence({Value::mapping({{"run", "echo hello"}})})},
        })},
     })},
  });
}

}  // namespace

TEST(EmitDocumentEmitter, YamlReadsBackWithSameStructure)
{
  const std::string text = DocumentEmitter::emit_yaml(workflow());
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.back(), '\n');

  const YAML::Node root = YAML::Load(text);
  EXPECT_EQ(root["name"].as<std::string>(), "CI");
  EXPECT_EQ(
    root["jobs"]["build"]["runs-on"].as<std::string>(), "codebuild-sample-${{ github.run_id }}");
  EXPECT_EQ(root["jobs"]["build"]["timeout-minutes"].as<int>(), 30);
  EXPECT_EQ(root["on"]["push"]["branches"][0].as<std::string>(), "main");
}

TEST(EmitDocumentEmitter, YamlKeepsDeclaredKeyOrder)
{
  const std::string text = DocumentEmitter::emit_yaml(workflow());
  const auto name_pos = text.find("name:");
  const auto on_pos = text.find("on:");
  const auto jobs_pos = text.find("jobs:");
  ASSERT_NE(name_pos, std::string::npos);
  ASSERT_NE(on_pos, std::string::npos);
  ASSERT_NE(jobs_pos, std::string::npos);
  EXPECT_LT(name_pos, on_pos);
  EXPECT_LT(on_pos, jobs_pos);
}

TEST(EmitDocumentEmitter, OnKeyStaysPlain)
{
  const std::string text = DocumentEmitter::emit_yaml(Value::mapping({{"on", "push"}}));
  EXPECT_EQ(text.find('"'), std::string::npos);

  const YAML::Node root = YAML::Load(text);
  EXPECT_EQ(root["on"].as<std::string>(), "push");
}

TEST(EmitDocumentEmitter, NumberLikeStringsAreQuoted)
{
  const Value doc = Value::mapping({
    {"version", "123"},
    {"flag", "true"},
    {"nothing", "null"},
    {"count", 123},
  });
  const YAML::Node root = YAML::Load(DocumentEmitter::emit_yaml(doc));

  // Quoted scalars carry the non-specific "!" tag; plain ones "?".
  EXPECT_EQ(root["version"].Tag(), "!");
  EXPECT_EQ(root["flag"].Tag(), "!");
  EXPECT_EQ(root["nothing"].Tag(), "!");
  EXPECT_EQ(root["count"].Tag(), "?");
  EXPECT_EQ(root["version"].as<std::string>(), "123");
}

TEST(EmitDocumentEmitter, ScalarTypesArePreserved)
{
  const Value doc = Value::mapping({
    {"null", Value()},
    {"bool", true},
    {"int", -5},
    {"float", 1.0},
    {"empty_list", Value::make_sequence({})},
    {"empty_map", Value::make_mapping({})},
  });
  const std::string text = DocumentEmitter::emit_yaml(doc);
  EXPECT_NE(text.find("float: 1.0"), std::string::npos);
  EXPECT_NE(text.find("bool: true"), std::string::npos);
  EXPECT_NE(text.find("empty_list: []"), std::string::npos);
  EXPECT_NE(text.find("empty_map: {}"), std::string::npos);

  const YAML::Node root = YAML::Load(text);
  EXPECT_TRUE(root["null"].IsNull());
  EXPECT_EQ(root["int"].as<int>(), -5);
}

TEST(EmitDocumentEmitter, MultiLineStringUsesBlockLiteral)
{
  const Value doc = Value::mapping({{"run", "npm ci\nnpm test\n"}});
  const std::string text = DocumentEmitter::emit_yaml(doc);
  EXPECT_NE(text.find("run: |"), std::string::npos);
  EXPECT_EQ(YAML::Load(text)["run"].as<std::string>(), "npm ci\nnpm test\n");
}

TEST(EmitDocumentEmitter, JsonPreservesKeyOrder)
{
  const Value doc = Value::mapping({{"z", 1}, {"a", 2}, {"m", Value::sequence({"x", 1.5})}});
  const std::string text = DocumentEmitter::emit_json(doc);
  EXPECT_LT(text.find("\"z\""), text.find("\"a\""));
  EXPECT_LT(text.find("\"a\""), text.find("\"m\""));
  EXPECT_EQ(text.back(), '\n');

  const auto parsed = nlohmann::ordered_json::parse(text);
  EXPECT_EQ(parsed["m"][1].get<double>(), 1.5);
  EXPECT_EQ(parsed.begin().key(), "z");
}

TEST(EmitDocumentEmitter, DeferredValueIsRejectedWithPath)
{
  const Value doc = Value::mapping({
    {"jobs", Value::mapping({{"x", Value(TokenRef{1, 0})}})},
  });

  try {
    (void)DocumentEmitter::emit_yaml(doc);
    FAIL() << "expected UnresolvedTokenError";
  } catch (const UnresolvedTokenError & e) {
    EXPECT_EQ(e.path(), "$.jobs.x");
    EXPECT_EQ(e.kind(), ValueKind::Token);
  }

  EXPECT_THROW(
    (void)DocumentEmitter::emit_json(Value::sequence({Value::make_foreign("${{ x }}")})),
    UnresolvedTokenError);
  try {
    (void)DocumentEmitter::emit_json(Value::sequence({Value::make_foreign("${{ x }}")}));
  } catch (const UnresolvedTokenError & e) {
    EXPECT_EQ(e.path(), "$[0]");
    EXPECT_EQ(e.kind(), ValueKind::Foreign);
  }
}

TEST(EmitDocumentEmitter, NonFiniteFloatsAreRejectedInJson)
{
  const Value config = Value::mapping({
    {"limit", std::numeric_limits<double>::infinity()},
    {"ratio", std::numeric_limits<double>::quiet_NaN()},
  });

  try {
    (void)DocumentEmitter::emit_json(config);
    FAIL() << "expected UnrepresentableValueError";
  } catch (const UnrepresentableValueError & e) {
    EXPECT_EQ(e.path(), "$.limit");
    EXPECT_NE(std::string(e.what()).find(".inf"), std::string::npos);
  }

  try {
    (void)DocumentEmitter::emit_json(Value::mapping({{"ratio", std::nan("")}}));
    FAIL() << "expected UnrepresentableValueError";
  } catch (const UnrepresentableValueError & e) {
    EXPECT_EQ(e.path(), "$.ratio");
    EXPECT_NE(std::string(e.what()).find(".nan"), std::string::npos);
  }

  EXPECT_THROW(
    (void)DocumentEmitter::emit_json(Value::sequence({-std::numeric_limits<double>::infinity()})),
    UnrepresentableValueError);
}

TEST(EmitDocumentEmitter, NonFiniteFloatsStayFloatsInYaml)
{
  const Value config = Value::mapping({
    {"limit", std::numeric_limits<double>::infinity()},
    {"floor", -std::numeric_limits<double>::infinity()},
    {"ratio", std::numeric_limits<double>::quiet_NaN()},
  });

  const std::string text = DocumentEmitter::emit_yaml(config);
  EXPECT_NE(text.find("limit: .inf"), std::string::npos);
  EXPECT_NE(text.find("floor: -.inf"), std::string::npos);
  EXPECT_NE(text.find("ratio: .nan"), std::string::npos);

  const YAML::Node root = YAML::Load(text);
  EXPECT_TRUE(std::isinf(root["limit"].as<double>()));
  EXPECT_LT(root["floor"].as<double>(), 0.0);
  EXPECT_TRUE(std::isnan(root["ratio"].as<double>()));
}

// Foreign text must come back byte for byte after the format's own quoting
// is undone, whatever YAML indicators it contains.
TEST(EmitDocumentEmitter, ForeignTextSurvivesFormatEscaping)
{
  const std::vector<std::string> raws = {
    "say: \"hi\" # ${{ x }}",
    "- ${{ matrix.os }}",
    "${{ github.event_name == 'push' && 'main' || 'dev' }}",
    "key: ${{ secrets.TOKEN }}",
    "${{ a }} #not a comment",
    "{ ${{ inputs.flow }} }",
    "[${{ inputs.list }}]",
    "*${{ env.ALIAS }}",
    "&${{ env.ANCHOR }}",
    "!${{ env.TAG }}",
    "%{{ x }}",
    "@${{ env.AT }}",
    "`${{ env.TICK }}`",
    "'${{ env.QUOTED }}'",
    "tab\t${{ x }}\\back",
    "  ${{ padded }}  ",
    "${{ steps.a.outputs.b }}\n${{ steps.c.outputs.d }}\n",
  };

  ConstructTree tree("s");
  Value::Mapping entries;
  for (size_t i = 0; i < raws.size(); ++i) {
    entries.push_back(MapEntry{"k" + std::to_string(i), Value::make_foreign(raws[i])});
  }
  tree.add_document(
    "workflow", "workflow.yml", DocumentFormat::Yaml, Value::make_mapping(std::move(entries)));

  Resolver resolver(tree);
  const auto resolved = resolver.resolve();
  ASSERT_TRUE(resolved.has_value());
  const Value & body = resolved->documents.front().body;

  const YAML::Node yaml = YAML::Load(DocumentEmitter::emit_yaml(body));
  const auto json = nlohmann::ordered_json::parse(DocumentEmitter::emit_json(body));
  for (size_t i = 0; i < raws.size(); ++i) {
    const std::string key = "k" + std::to_string(i);
    EXPECT_EQ(yaml[key].as<std::string>(), raws[i]) << key;
    EXPECT_EQ(json[key].get<std::string>(), raws[i]) << key;
  }
}

TEST(EmitDocumentEmitter, ForeignTextNextToTokenSurvivesFormatEscaping)
{
  ConstructTree tree("s");
  const NodeId project = tree.add_resource("aws_codebuild_project", "Project");
  const std::string raw = "\" # ${{ github.run_id }}: ok";
  tree.add_document(
    "workflow", "workflow.yml", DocumentFormat::Yaml,
    Value::mapping({
      {"runs-on",
       Value::concat({Value("- "), Value(tree.output(project, "name")), Value::make_foreign(raw)})},
    }));

  Resolver resolver(tree);
  const auto resolved = resolver.resolve();
  ASSERT_TRUE(resolved.has_value());
  const Value & body = resolved->documents.front().body;

  const std::string expected = "- ${aws_codebuild_project.Project.name}" + raw;
  EXPECT_EQ(YAML::Load(DocumentEmitter::emit_yaml(body))["runs-on"].as<std::string>(), expected);
  EXPECT_EQ(
    nlohmann::ordered_json::parse(DocumentEmitter::emit_json(body))["runs-on"].get<std::string>(),
    expected);
}
