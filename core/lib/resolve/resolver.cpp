// stacksynth/resolve/resolver.cpp - Substitute tokens and build the provisioning plan

#include "stacksynth/resolve/resolver.hpp"

#include <utility>

#include "stacksynth/basic/diagnostic_codes.hpp"
#include "stacksynth/emit/document_emitter.hpp"

namespace stacksynth
{

namespace
{

constexpr const char * k_generator_name = "stacksynth";

// `map[key]`, created as `empty` on first use.
Value & entry(Value & map, const std::string & key, Value empty)
{
  if (Value * existing = map.find(key)) {
    return *existing;
  }
  map.set(key, std::move(empty));
  return *map.find(key);
}

}  // namespace

std::string Resolver::render_token(const ConstructTree & tree, const Token & token)
{
  const ConstructNode * owner = tree.node(token.owner);
  return "${" + owner->address() + "." + token.attribute + "}";
}

std::optional<ResolvedStack> Resolver::resolve()
{
  hasErrors_ = false;

  // Graph first: cycles and dangling references abort before any value is
  // touched.
  ReferenceGraphBuilder builder(diags_);
  ReferenceGraph graph = builder.build(tree_);
  if (builder.has_errors()) {
    hasErrors_ = true;
    return std::nullopt;
  }

  ResolvedStack stack;
  stack.name = tree_.name();
  stack.plan = build_plan(graph);

  for (const auto & doc : tree_.documents()) {
    Location where = doc.origin;
    where.construct = doc.name;
    ResolvedDocument resolved;
    resolved.name = doc.name;
    resolved.path = doc.path;
    resolved.format = doc.format;
    resolved.body = resolve_at(doc.body, where, {});
    stack.documents.push_back(std::move(resolved));
  }

  if (hasErrors_) {
    return std::nullopt;
  }
  stack.graph = std::move(graph);
  return stack;
}

std::optional<Value> Resolver::resolve_value(const Value & value, const Location & where)
{
  const bool hadErrors = hasErrors_;
  hasErrors_ = false;
  Value resolved = resolve_at(value, where, where.attribute);
  const bool failed = hasErrors_;
  hasErrors_ = hadErrors || failed;
  if (failed) {
    return std::nullopt;
  }
  return resolved;
}

// ============================================================================
// Values
// ============================================================================

std::string Resolver::token_text(TokenRef ref, const Location & where, const std::string & path)
{
  const Token * token = tree_.token(ref);
  if (!token) {
    hasErrors_ = true;
    if (diags_) {
      Location loc = where;
      loc.attribute = path;
      diags_
        ->report_error(
          loc, "dangling reference at '" + loc.qualified_path() +
                 "': the token's owner is not part of stack '" + tree_.name() + "'")
        .with_code(diag_code::k_dangling_reference);
    }
    return {};
  }
  return render_token(tree_, *token);
}

std::string Resolver::resolve_parts(
  const std::vector<StringPart> & parts, const Location & where, const std::string & path)
{
  std::string out;
  for (const auto & part : parts) {
    switch (part.kind) {
      case StringPartKind::Literal:
      case StringPartKind::Foreign:
        out += part.text;
        break;
      case StringPartKind::Token:
        out += token_text(part.token, where, path);
        break;
    }
  }
  return out;
}

Value Resolver::resolve_at(const Value & value, const Location & where, const std::string & path)
{
  switch (value.kind()) {
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::Integer:
    case ValueKind::Float:
    case ValueKind::String:
      return value;
    case ValueKind::Token:
      return Value(token_text(value.as_token(), where, path));
    case ValueKind::Foreign:
      return Value(value.foreign_raw());
    case ValueKind::Composite:
      return Value(resolve_parts(value.parts(), where, path));
    case ValueKind::Sequence: {
      Value::Sequence items;
      items.reserve(value.items().size());
      for (size_t i = 0; i < value.items().size(); ++i) {
        items.push_back(resolve_at(value.items()[i], where, path_index(path, i)));
      }
      return Value::make_sequence(std::move(items));
    }
    case ValueKind::Mapping: {
      Value::Mapping entries;
      entries.reserve(value.entries().size());
      for (const auto & e : value.entries()) {
        entries.push_back(MapEntry{e.key, resolve_at(e.value, where, path_join(path, e.key))});
      }
      return Value::make_mapping(std::move(entries));
    }
    case ValueKind::Encoded: {
      const Value body = resolve_at(value.encoded_body(), where, path);
      return Value(DocumentEmitter::emit(body, value.encoded_format()));
    }
  }
  return value;
}

// ============================================================================
// Plan
// ============================================================================

Value Resolver::resolve_inputs(const ConstructNode & node)
{
  Value inputs = resolve_at(node.inputs, node.location(), {});
  if (!node.depends_on.empty()) {
    Value deps = Value::make_sequence({});
    for (const NodeId dep : node.depends_on) {
      deps.push_back(Value(tree_.node(dep)->address()));
    }
    inputs.set("depends_on", std::move(deps));
  }
  return inputs;
}

Value Resolver::build_plan(const ReferenceGraph & graph)
{
  Value plan = Value::make_mapping({});
  plan.set(
    "//", Value::mapping(
            {{"metadata",
              Value::mapping({{"stackName", tree_.name()}, {"generator", k_generator_name}})}}));

  // Sections appear in a fixed order; types and names keep declaration order.
  Value providers = Value::make_mapping({});
  Value data = Value::make_mapping({});
  Value resources = Value::make_mapping({});
  Value outputs = Value::make_mapping({});

  for (const NodeId id : graph.nodes()) {
    const ConstructNode & node = *tree_.node(id);
    switch (node.kind) {
      case ConstructKind::Provider:
        entry(providers, node.type, Value::make_sequence({})).push_back(resolve_inputs(node));
        break;
      case ConstructKind::DataSource:
        entry(data, node.type, Value::make_mapping({})).set(node.name, resolve_inputs(node));
        break;
      case ConstructKind::Resource:
        entry(resources, node.type, Value::make_mapping({})).set(node.name, resolve_inputs(node));
        break;
      case ConstructKind::Output:
        outputs.set(node.name, resolve_inputs(node));
        break;
    }
  }

  if (providers.size() > 0) plan.set("provider", std::move(providers));
  if (data.size() > 0) plan.set("data", std::move(data));
  if (resources.size() > 0) plan.set("resource", std::move(resources));
  if (outputs.size() > 0) plan.set("output", std::move(outputs));
  return plan;
}

}  // namespace stacksynth
