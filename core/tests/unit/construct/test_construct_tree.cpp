// tests/unit/construct/test_construct_tree.cpp - ConstructTree declarations and tokens

#include <gtest/gtest.h>

#include <stdexcept>

#include "stacksynth/basic/diagnostic_codes.hpp"
#include "stacksynth/construct/construct_tree.hpp"
#include "stacksynth/test_support/stack_helpers.hpp"

using namespace stacksynth;
using stacksynth::test_support::count_code;
using stacksynth::test_support::find_code;

TEST(ConstructTree, AddressesFollowConstructKind)
{
  DiagnosticBag diags;
  ConstructTree tree("my-stack", &diags);
  const NodeId provider = tree.add_provider("aws", "AwsProvider");
  const NodeId repo = tree.add_resource("github_repository", "SampleRepo");
  const NodeId policy = tree.add_data_source("aws_iam_policy_document", "Policy");
  const NodeId out = tree.add_output("RepoUrl");

  EXPECT_EQ(tree.node(provider)->address(), "AwsProvider");
  EXPECT_EQ(tree.node(repo)->address(), "github_repository.SampleRepo");
  EXPECT_EQ(tree.node(policy)->address(), "data.aws_iam_policy_document.Policy");
  EXPECT_EQ(tree.node(out)->address(), "RepoUrl");
  EXPECT_EQ(tree.find("SampleRepo"), repo);
  EXPECT_FALSE(tree.find("Missing").is_valid());
  EXPECT_TRUE(diags.empty());
}

TEST(ConstructTree, DuplicateIdIsRejected)
{
  DiagnosticBag diags;
  ConstructTree tree("s", &diags);
  EXPECT_TRUE(tree.add_resource("aws_vpc", "Net").is_valid());
  EXPECT_FALSE(tree.add_resource("aws_subnet", "Net").is_valid());

  const Diagnostic * d = find_code(diags, diag_code::k_duplicate_construct);
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->labels.size(), 2u);
  EXPECT_EQ(tree.size(), 1u);
}

TEST(ConstructTree, OutputReturnsSameTokenForSameAttribute)
{
  ConstructTree tree("s");
  const NodeId net = tree.add_resource("aws_vpc", "Net");
  const TokenRef id1 = tree.output(net, "id");
  const TokenRef id2 = tree.output(net, "id");
  const TokenRef arn = tree.output(net, "arn");

  EXPECT_EQ(id1, id2);
  EXPECT_NE(id1, arn);

  const Token * token = tree.token(id1);
  ASSERT_NE(token, nullptr);
  EXPECT_EQ(token->owner, net);
  EXPECT_EQ(token->attribute, "id");
  EXPECT_EQ(token->display_hint, "Net.id");
}

TEST(ConstructTree, OutputOnProviderOrOutputThrows)
{
  ConstructTree tree("s");
  const NodeId provider = tree.add_provider("aws", "Aws");
  const NodeId out = tree.add_output("Url");
  EXPECT_THROW((void)tree.output(provider, "region"), std::invalid_argument);
  EXPECT_THROW((void)tree.output(out, "value"), std::invalid_argument);
  EXPECT_THROW((void)tree.output(NodeId{42}, "id"), std::invalid_argument);
}

TEST(ConstructTree, TokenFromAnotherTreeIsDangling)
{
  DiagnosticBag diags;
  ConstructTree other("other");
  const TokenRef foreign_token = other.output(other.add_resource("aws_vpc", "Net"), "id");

  ConstructTree tree("s", &diags);
  const NodeId host = tree.add_resource("aws_instance", "Host");
  EXPECT_EQ(tree.token(foreign_token), nullptr);
  EXPECT_FALSE(tree.set_input(host, "subnet", Value::mapping({{"id", Value(foreign_token)}})));

  const Diagnostic * d = find_code(diags, diag_code::k_dangling_reference);
  ASSERT_NE(d, nullptr);
  EXPECT_NE(d->message.find("Host.subnet.id"), std::string::npos);
  EXPECT_EQ(tree.node(host)->inputs.find("subnet"), nullptr);
}

TEST(ConstructTree, NodeIdFromAnotherTreeIsRejected)
{
  DiagnosticBag diags;
  ConstructTree other("other");
  const NodeId other_net = other.add_resource("aws_vpc", "Net");

  ConstructTree tree("s", &diags);
  const NodeId net = tree.add_resource("aws_vpc", "Net");
  const NodeId host = tree.add_resource("aws_instance", "Host");

  // Same index, different tree.
  ASSERT_EQ(other_net.value, net.value);
  EXPECT_NE(other_net, net);
  EXPECT_EQ(tree.node(other_net), nullptr);

  EXPECT_THROW((void)tree.output(other_net, "id"), std::invalid_argument);
  EXPECT_THROW((void)tree.set_input(other_net, "cidr", Value("10.0.0.0/16")), std::invalid_argument);

  EXPECT_FALSE(tree.add_dependency(host, other_net));
  EXPECT_EQ(count_code(diags, diag_code::k_dangling_reference), 1u);
  EXPECT_TRUE(tree.node(host)->depends_on.empty());
}

TEST(ConstructTree, SetInputReplacesExistingAttribute)
{
  ConstructTree tree("s");
  const NodeId repo = tree.add_resource("github_repository", "Repo");
  EXPECT_TRUE(tree.set_input(repo, "name", Value("a")));
  EXPECT_TRUE(tree.set_input(repo, "auto_init", Value(true)));
  EXPECT_TRUE(tree.set_input(repo, "name", Value("b")));

  const Value & inputs = tree.node(repo)->inputs;
  ASSERT_EQ(inputs.size(), 2u);
  EXPECT_EQ(inputs.entries()[0].key, "name");
  EXPECT_EQ(inputs.entries()[0].value.as_string(), "b");
}

TEST(ConstructTree, AddDependencyValidatesTarget)
{
  DiagnosticBag diags;
  ConstructTree tree("s", &diags);
  const NodeId provider = tree.add_provider("aws", "Aws");
  const NodeId net = tree.add_resource("aws_vpc", "Net");
  const NodeId host = tree.add_resource("aws_instance", "Host");

  EXPECT_TRUE(tree.add_dependency(host, net));
  EXPECT_TRUE(tree.add_dependency(host, net));
  EXPECT_EQ(tree.node(host)->depends_on.size(), 1u);

  EXPECT_FALSE(tree.add_dependency(host, provider));
  EXPECT_FALSE(tree.add_dependency(provider, net));
  EXPECT_EQ(count_code(diags, diag_code::k_invalid_reference), 2u);

  EXPECT_FALSE(tree.add_dependency(host, NodeId{99}));
  EXPECT_EQ(count_code(diags, diag_code::k_dangling_reference), 1u);
}

TEST(ConstructTree, DocumentPathMustStayInsideOutput)
{
  DiagnosticBag diags;
  ConstructTree tree("s", &diags);
  EXPECT_TRUE(
    tree.add_document("ci", ".github/workflows/ci.yml", DocumentFormat::Yaml, Value::mapping({})));
  EXPECT_FALSE(tree.add_document("abs", "/etc/passwd", DocumentFormat::Yaml, Value()));
  EXPECT_FALSE(tree.add_document("up", "../escape.yml", DocumentFormat::Yaml, Value()));
  EXPECT_FALSE(tree.add_document("empty", "", DocumentFormat::Yaml, Value()));
  EXPECT_EQ(count_code(diags, diag_code::k_invalid_document_path), 3u);

  EXPECT_FALSE(tree.add_document("ci", "other.yml", DocumentFormat::Yaml, Value()));
  EXPECT_EQ(count_code(diags, diag_code::k_duplicate_construct), 1u);
  EXPECT_EQ(tree.documents().size(), 1u);
}

TEST(ConstructTree, FinalizedTreeRejectsMutation)
{
  DiagnosticBag diags;
  ConstructTree tree("s", &diags);
  const NodeId net = tree.add_resource("aws_vpc", "Net");
  tree.finalize();

  EXPECT_TRUE(tree.is_finalized());
  EXPECT_FALSE(tree.add_resource("aws_subnet", "Sub").is_valid());
  EXPECT_FALSE(tree.set_input(net, "cidr_block", Value("10.0.0.0/16")));
  EXPECT_FALSE(tree.add_document("d", "d.yml", DocumentFormat::Yaml, Value()));
  EXPECT_EQ(count_code(diags, diag_code::k_finalized_tree), 3u);
}
