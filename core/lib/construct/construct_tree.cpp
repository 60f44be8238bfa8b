// stacksynth/construct/construct_tree.cpp - Construct tree implementation
#include "stacksynth/construct/construct_tree.hpp"

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "stacksynth/basic/diagnostic_codes.hpp"

namespace stacksynth
{

namespace
{

// Serial 0 is never handed out, so a default TokenRef never matches a tree.
std::atomic<uint32_t> g_next_tree_serial{1};

bool is_contained_relative_path(const std::string & path)
{
  if (path.empty()) {
    return false;
  }
  const std::filesystem::path p(path);
  if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) {
    return false;
  }
  for (const auto & part : p.lexically_normal()) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

}  // namespace

const char * construct_kind_name(ConstructKind kind) noexcept
{
  switch (kind) {
    case ConstructKind::Provider:
      return "provider";
    case ConstructKind::Resource:
      return "resource";
    case ConstructKind::DataSource:
      return "data source";
    case ConstructKind::Output:
      return "output";
  }
  return "construct";
}

// ============================================================================
// ConstructNode
// ============================================================================

std::string ConstructNode::address() const
{
  switch (kind) {
    case ConstructKind::Resource:
      return type + "." + name;
    case ConstructKind::DataSource:
      return "data." + type + "." + name;
    case ConstructKind::Provider:
    case ConstructKind::Output:
      return name;
  }
  return name;
}

Location ConstructNode::location(std::string attribute) const
{
  Location loc = origin;
  loc.construct = name;
  loc.attribute = std::move(attribute);
  return loc;
}

// ============================================================================
// ConstructTree
// ============================================================================

ConstructTree::ConstructTree(std::string name, DiagnosticBag * diags)
: name_(std::move(name)), serial_(g_next_tree_serial.fetch_add(1)), diags_(diags)
{
}

bool ConstructTree::check_mutable(const Location & where)
{
  if (!finalized_) {
    return true;
  }
  if (diags_) {
    diags_->report_error(where, "stack '" + name_ + "' is finalized and can no longer change")
      .with_code(diag_code::k_finalized_tree);
  }
  return false;
}

NodeId ConstructTree::add_node(
  ConstructKind kind, std::string type, std::string name, Location origin)
{
  Location where = origin;
  where.construct = name;
  if (!check_mutable(where)) {
    return NodeId::invalid();
  }

  if (auto it = byName_.find(name); it != byName_.end()) {
    if (diags_) {
      const ConstructNode & first = *nodes_[it->second.value];
      diags_
        ->report_error(
          where, "construct id '" + name + "' is already declared", "duplicate declaration")
        .with_code(diag_code::k_duplicate_construct)
        .with_secondary_label(first.location(), "first declared here");
    }
    return NodeId::invalid();
  }

  const NodeId id{static_cast<uint32_t>(nodes_.size()), serial_};
  auto node = std::make_unique<ConstructNode>();
  node->id = id;
  node->kind = kind;
  node->type = std::move(type);
  node->name = name;
  node->origin = std::move(origin);
  nodes_.push_back(std::move(node));
  byName_.emplace(std::move(name), id);
  return id;
}

NodeId ConstructTree::add_provider(std::string type, std::string name, Location origin)
{
  return add_node(ConstructKind::Provider, std::move(type), std::move(name), std::move(origin));
}

NodeId ConstructTree::add_resource(std::string type, std::string name, Location origin)
{
  return add_node(ConstructKind::Resource, std::move(type), std::move(name), std::move(origin));
}

NodeId ConstructTree::add_data_source(std::string type, std::string name, Location origin)
{
  return add_node(ConstructKind::DataSource, std::move(type), std::move(name), std::move(origin));
}

NodeId ConstructTree::add_output(std::string name, Location origin)
{
  return add_node(ConstructKind::Output, {}, std::move(name), std::move(origin));
}

ConstructNode * ConstructTree::mutable_node(NodeId id)
{
  if (!id.is_valid() || id.tree != serial_ || id.value >= nodes_.size()) {
    return nullptr;
  }
  return nodes_[id.value].get();
}

TokenRef ConstructTree::output(NodeId owner, std::string_view attribute)
{
  ConstructNode * node = mutable_node(owner);
  if (!node) {
    throw std::invalid_argument("output(): construct is not part of stack '" + name_ + "'");
  }
  if (!node->has_attributes()) {
    throw std::invalid_argument(
      "output(): " + std::string(construct_kind_name(node->kind)) + " '" + node->name +
      "' has no referenceable attributes");
  }

  for (const TokenRef ref : node->outputs) {
    if (tokens_[ref.index].attribute == attribute) {
      return ref;
    }
  }

  Token token;
  token.ref = TokenRef{serial_, static_cast<uint32_t>(tokens_.size())};
  token.owner = owner;
  token.attribute = std::string(attribute);
  token.display_hint = node->name + "." + token.attribute;
  tokens_.push_back(std::move(token));

  node->outputs.push_back(tokens_.back().ref);
  return tokens_.back().ref;
}

bool ConstructTree::set_input(NodeId id, std::string attribute, Value value)
{
  ConstructNode * node = mutable_node(id);
  if (!node) {
    throw std::invalid_argument("set_input(): construct is not part of stack '" + name_ + "'");
  }
  if (!check_mutable(node->location(attribute))) {
    return false;
  }

  bool ok = true;
  for_each_token(value, attribute, [&](TokenRef ref, const std::string & path) {
    if (token(ref) != nullptr) {
      return;
    }
    ok = false;
    if (diags_) {
      diags_
        ->report_error(
          node->location(path),
          "dangling reference in '" + node->name + "." + path +
            "': the referenced attribute does not belong to a construct of stack '" + name_ + "'",
          "reference to a construct outside this stack")
        .with_code(diag_code::k_dangling_reference);
    }
  });
  if (!ok) {
    return false;
  }

  node->inputs.set(std::move(attribute), std::move(value));
  return true;
}

bool ConstructTree::add_dependency(NodeId id, NodeId dependency)
{
  ConstructNode * node = mutable_node(id);
  if (!node) {
    throw std::invalid_argument("add_dependency(): construct is not part of stack '" + name_ + "'");
  }
  if (!check_mutable(node->location("depends_on"))) {
    return false;
  }
  const ConstructNode * target = mutable_node(dependency);
  if (!target) {
    if (diags_) {
      diags_
        ->report_error(
          node->location("depends_on"),
          "dangling reference in '" + node->name + ".depends_on': unknown construct")
        .with_code(diag_code::k_dangling_reference);
    }
    return false;
  }
  if (node->kind == ConstructKind::Provider || !target->has_attributes()) {
    if (diags_) {
      const std::string target_kind = construct_kind_name(target->kind);
      diags_
        ->report_error(
          node->location("depends_on"),
          "'" + node->name + "' cannot depend on " + target_kind + " '" + target->name + "'",
          "invalid dependency")
        .with_code(diag_code::k_invalid_reference)
        .with_help("only resources, data sources and outputs can depend on resources or data sources");
    }
    return false;
  }
  for (const NodeId existing : node->depends_on) {
    if (existing == dependency) {
      return true;
    }
  }
  node->depends_on.push_back(dependency);
  return true;
}

bool ConstructTree::add_document(
  std::string name, std::string path, DocumentFormat format, Value body, Location origin)
{
  Location where = origin;
  where.construct = name;
  if (!check_mutable(where)) {
    return false;
  }

  if (!is_contained_relative_path(path)) {
    if (diags_) {
      diags_
        ->report_error(
          where, "document path '" + path + "' must be relative and stay inside the stack output",
          "invalid document path")
        .with_code(diag_code::k_invalid_document_path);
    }
    return false;
  }

  for (const auto & existing : documents_) {
    if (existing.name == name || existing.path == path) {
      if (diags_) {
        diags_->report_error(where, "document '" + name + "' (" + path + ") is already declared")
          .with_code(diag_code::k_duplicate_construct)
          .with_secondary_label(existing.origin, "first declared here");
      }
      return false;
    }
  }

  bool ok = true;
  for_each_token(body, {}, [&](TokenRef ref, const std::string & attr_path) {
    if (token(ref) != nullptr) {
      return;
    }
    ok = false;
    if (diags_) {
      Location loc = where;
      loc.attribute = attr_path;
      diags_
        ->report_error(
          loc, "dangling reference in document '" + name + "' at '" + attr_path + "'",
          "reference to a construct outside this stack")
        .with_code(diag_code::k_dangling_reference);
    }
  });
  if (!ok) {
    return false;
  }

  Document doc;
  doc.name = std::move(name);
  doc.path = std::move(path);
  doc.format = format;
  doc.body = std::move(body);
  doc.origin = std::move(origin);
  documents_.push_back(std::move(doc));
  return true;
}

const ConstructNode * ConstructTree::node(NodeId id) const
{
  if (!id.is_valid() || id.tree != serial_ || id.value >= nodes_.size()) {
    return nullptr;
  }
  return nodes_[id.value].get();
}

NodeId ConstructTree::find(std::string_view name) const
{
  auto it = byName_.find(std::string(name));
  if (it == byName_.end()) {
    return NodeId::invalid();
  }
  return it->second;
}

const Token * ConstructTree::token(TokenRef ref) const
{
  if (ref.tree != serial_ || ref.index >= tokens_.size()) {
    return nullptr;
  }
  return &tokens_[ref.index];
}

std::vector<const ConstructNode *> ConstructTree::nodes() const
{
  std::vector<const ConstructNode *> result;
  result.reserve(nodes_.size());
  for (const auto & n : nodes_) {
    result.push_back(n.get());
  }
  return result;
}

}  // namespace stacksynth
