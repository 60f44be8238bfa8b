// stacksynth/loader/stack_loader.cpp - Build a construct tree from a stack file

#include "stacksynth/loader/stack_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "stacksynth/basic/diagnostic_codes.hpp"
#include "stacksynth/emit/yaml_scalar.hpp"

namespace stacksynth
{

namespace
{

// Tags understood in stack files.
constexpr std::string_view k_tag_ref = "!ref";
constexpr std::string_view k_tag_raw = "!raw";
constexpr std::string_view k_tag_join = "!join";
constexpr std::string_view k_tag_env = "!env";
constexpr std::string_view k_tag_yaml = "!yaml";
constexpr std::string_view k_tag_json = "!json";

// Tags yaml-cpp assigns to untagged (plain "?") and quoted ("!") nodes.
constexpr std::string_view k_tag_plain = "?";
constexpr std::string_view k_tag_quoted = "!";
constexpr std::string_view k_tag_str = "tag:yaml.org,2002:str";

/**
 * One pass over a parsed stack document.
 *
 * Constructs are declared first and configured second, so `!ref` may point
 * at a construct declared further down the file.
 */
class StackFileReader
{
public:
  StackFileReader(DiagnosticBag & bag, DiagnosticBag * treeDiags, std::filesystem::path file)
  : bag_(bag), treeDiags_(treeDiags), file_(std::move(file))
  {
  }

  std::optional<LoadedStack> read(const YAML::Node & root, const EnvLookup & lookup);

private:
  struct PendingConstruct
  {
    NodeId id;
    ConstructKind kind;
    YAML::Node node;
  };

  // Diagnostics -------------------------------------------------------------

  Location location_of(const YAML::Node & node, std::string construct = {}, std::string attr = {})
    const
  {
    Location loc;
    loc.construct = std::move(construct);
    loc.attribute = std::move(attr);
    loc.file = file_;
    const YAML::Mark mark = node.Mark();
    if (!mark.is_null()) {
      loc.line = static_cast<uint32_t>(mark.line + 1);
      loc.column = static_cast<uint32_t>(mark.column + 1);
    }
    return loc;
  }

  DiagnosticBuilder error(Location where, std::string message, const char * code)
  {
    failed_ = true;
    auto builder = bag_.report_error(std::move(where), std::move(message));
    builder.with_code(code);
    return builder;
  }

  // Sections ----------------------------------------------------------------

  bool read_required_env(const YAML::Node & root, const EnvLookup & lookup, LoadedStack & out);
  void declare_constructs(const YAML::Node & list);
  void configure_construct(const PendingConstruct & pending);
  void read_documents(const YAML::Node & list);

  std::optional<std::string> scalar_field(
    const YAML::Node & map, const char * key, const std::string & construct, bool required);

  // Values ------------------------------------------------------------------

  std::optional<Value> convert(
    const YAML::Node & node, const std::string & construct, const std::string & path);
  std::optional<Value> convert_untagged(
    const YAML::Node & node, const std::string & construct, const std::string & path);
  std::optional<Value> convert_ref(
    const YAML::Node & node, const std::string & construct, const std::string & path);
  std::optional<Value> convert_join(
    const YAML::Node & node, const std::string & construct, const std::string & path);
  std::optional<Value> convert_env(
    const YAML::Node & node, const std::string & construct, const std::string & path);

  DiagnosticBag & bag_;
  DiagnosticBag * treeDiags_;
  std::filesystem::path file_;
  bool failed_ = false;

  std::unique_ptr<ConstructTree> tree_;
  std::vector<PendingConstruct> pending_;
  std::vector<std::string> declaredEnv_;
  Environment env_;
};

std::optional<ConstructKind> parse_kind(const std::string & kind)
{
  if (kind == "provider") return ConstructKind::Provider;
  if (kind == "resource") return ConstructKind::Resource;
  if (kind == "data") return ConstructKind::DataSource;
  if (kind == "output") return ConstructKind::Output;
  return std::nullopt;
}

DocumentFormat format_from_path(const std::string & path)
{
  const std::string ext = std::filesystem::path(path).extension().string();
  return ext == ".json" ? DocumentFormat::Json : DocumentFormat::Yaml;
}

// ============================================================================
// Top Level
// ============================================================================

std::optional<LoadedStack> StackFileReader::read(const YAML::Node & root, const EnvLookup & lookup)
{
  if (!root.IsMap()) {
    error(location_of(root), "stack file must be a mapping", diag_code::k_stack_file);
    return std::nullopt;
  }

  for (const auto & kv : root) {
    const std::string key = kv.first.as<std::string>();
    if (key != "stack" && key != "required_env" && key != "constructs" && key != "documents") {
      bag_.report_warning(location_of(kv.first), "unknown top-level key '" + key + "' is ignored")
        .with_code(diag_code::k_stack_file);
    }
  }

  const auto name = scalar_field(root, "stack", {}, true);
  if (!name) {
    return std::nullopt;
  }
  // The stack name becomes a directory under <output_dir>/stacks.
  if (*name == "." || *name == ".." || name->find_first_of("/\\") != std::string::npos) {
    error(
      location_of(root["stack"], {}, "stack"), "stack name '" + *name + "' must be a plain name",
      diag_code::k_stack_file);
    return std::nullopt;
  }

  LoadedStack out;
  out.source = file_;

  // Environment is a precondition: nothing is built when it is incomplete.
  if (!read_required_env(root, lookup, out)) {
    return std::nullopt;
  }

  tree_ = std::make_unique<ConstructTree>(*name, treeDiags_);

  if (const YAML::Node constructs = root["constructs"]) {
    if (!constructs.IsSequence()) {
      error(location_of(constructs), "'constructs' must be a list", diag_code::k_stack_file);
    } else {
      declare_constructs(constructs);
      for (const auto & pending : pending_) {
        configure_construct(pending);
      }
    }
  }

  if (const YAML::Node documents = root["documents"]) {
    if (!documents.IsSequence()) {
      error(location_of(documents), "'documents' must be a list", diag_code::k_stack_file);
    } else {
      read_documents(documents);
    }
  }

  if (failed_) {
    return std::nullopt;
  }

  tree_->finalize();
  out.tree = std::move(tree_);
  out.environment = std::move(env_);
  return out;
}

bool StackFileReader::read_required_env(
  const YAML::Node & root, const EnvLookup & lookup, LoadedStack & out)
{
  const YAML::Node required = root["required_env"];
  if (!required) {
    return true;
  }
  if (!required.IsSequence()) {
    error(location_of(required), "'required_env' must be a list of names", diag_code::k_stack_file);
    return false;
  }
  for (const auto & item : required) {
    if (!item.IsScalar() || item.Scalar().empty()) {
      error(location_of(item), "'required_env' entries must be names", diag_code::k_stack_file);
      return false;
    }
    declaredEnv_.push_back(item.Scalar());
  }

  auto env = validate_env(declaredEnv_, lookup, &bag_, location_of(required, {}, "required_env"));
  if (!env) {
    failed_ = true;
    return false;
  }
  env_ = std::move(*env);
  out.required_env = declaredEnv_;
  return true;
}

std::optional<std::string> StackFileReader::scalar_field(
  const YAML::Node & map, const char * key, const std::string & construct, bool required)
{
  const YAML::Node field = map[key];
  if (!field) {
    if (required) {
      error(
        location_of(map, construct), std::string("missing required field '") + key + "'",
        diag_code::k_stack_file);
    }
    return std::nullopt;
  }
  if (!field.IsScalar() || field.Scalar().empty()) {
    error(
      location_of(field, construct, key), std::string("'") + key + "' must be a non-empty string",
      diag_code::k_stack_file);
    return std::nullopt;
  }
  return field.Scalar();
}

// ============================================================================
// Constructs
// ============================================================================

void StackFileReader::declare_constructs(const YAML::Node & list)
{
  for (const auto & entry : list) {
    if (!entry.IsMap()) {
      error(location_of(entry), "construct entry must be a mapping", diag_code::k_stack_file);
      continue;
    }

    const auto kindText = scalar_field(entry, "kind", {}, true);
    const auto name = scalar_field(entry, "name", {}, true);
    if (!kindText || !name) {
      continue;
    }
    const auto kind = parse_kind(*kindText);
    if (!kind) {
      error(
        location_of(entry["kind"], *name, "kind"),
        "unknown construct kind '" + *kindText + "'", diag_code::k_stack_file)
        .with_help("expected one of: provider, resource, data, output");
      continue;
    }

    std::string type;
    if (*kind != ConstructKind::Output) {
      const auto t = scalar_field(entry, "type", *name, true);
      if (!t) {
        continue;
      }
      type = *t;
    }

    const Location origin = location_of(entry, *name);
    NodeId id = NodeId::invalid();
    switch (*kind) {
      case ConstructKind::Provider:
        id = tree_->add_provider(type, *name, origin);
        break;
      case ConstructKind::Resource:
        id = tree_->add_resource(type, *name, origin);
        break;
      case ConstructKind::DataSource:
        id = tree_->add_data_source(type, *name, origin);
        break;
      case ConstructKind::Output:
        id = tree_->add_output(*name, origin);
        break;
    }
    if (!id.is_valid()) {
      failed_ = true;
      continue;
    }
    pending_.push_back(PendingConstruct{id, *kind, entry});
  }
}

void StackFileReader::configure_construct(const PendingConstruct & pending)
{
  const std::string name = tree_->node(pending.id)->name;
  const YAML::Node & entry = pending.node;

  const auto set = [&](const std::string & attribute, const YAML::Node & node) {
    auto value = convert(node, name, attribute);
    if (!value) {
      return;
    }
    if (!tree_->set_input(pending.id, attribute, std::move(*value))) {
      failed_ = true;
    }
  };

  if (pending.kind == ConstructKind::Output) {
    const YAML::Node value = entry["value"];
    if (!value) {
      error(location_of(entry, name), "output requires a 'value'", diag_code::k_stack_file);
    } else {
      set("value", value);
    }
    if (const YAML::Node description = entry["description"]) {
      set("description", description);
    }
    if (const YAML::Node sensitive = entry["sensitive"]) {
      set("sensitive", sensitive);
    }
    if (entry["config"]) {
      error(
        location_of(entry["config"], name, "config"), "outputs take 'value', not 'config'",
        diag_code::k_stack_file);
    }
  } else if (const YAML::Node config = entry["config"]) {
    if (!config.IsMap()) {
      error(location_of(config, name, "config"), "'config' must be a mapping", diag_code::k_stack_file);
    } else {
      for (const auto & kv : config) {
        set(kv.first.as<std::string>(), kv.second);
      }
    }
  }

  if (const YAML::Node deps = entry["depends_on"]) {
    if (!deps.IsSequence()) {
      error(
        location_of(deps, name, "depends_on"), "'depends_on' must be a list of construct names",
        diag_code::k_stack_file);
      return;
    }
    for (const auto & dep : deps) {
      const std::string depName = dep.IsScalar() ? dep.Scalar() : std::string();
      const NodeId target = tree_->find(depName);
      if (!target.is_valid()) {
        error(
          location_of(dep, name, "depends_on"),
          "dangling reference: unknown construct '" + depName + "' in '" + name + ".depends_on'",
          diag_code::k_dangling_reference);
        continue;
      }
      if (!tree_->add_dependency(pending.id, target)) {
        failed_ = true;
      }
    }
  }
}

// ============================================================================
// Documents
// ============================================================================

void StackFileReader::read_documents(const YAML::Node & list)
{
  for (const auto & entry : list) {
    if (!entry.IsMap()) {
      error(location_of(entry), "document entry must be a mapping", diag_code::k_stack_file);
      continue;
    }
    const auto name = scalar_field(entry, "name", {}, true);
    if (!name) {
      continue;
    }
    const auto path = scalar_field(entry, "path", *name, true);
    if (!path) {
      continue;
    }

    DocumentFormat format = format_from_path(*path);
    if (const auto fmtText = scalar_field(entry, "format", *name, false)) {
      if (*fmtText == "yaml") {
        format = DocumentFormat::Yaml;
      } else if (*fmtText == "json") {
        format = DocumentFormat::Json;
      } else {
        error(
          location_of(entry["format"], *name, "format"),
          "unknown document format '" + *fmtText + "' (must be 'yaml' or 'json')",
          diag_code::k_stack_file);
        continue;
      }
    }

    const YAML::Node bodyNode = entry["body"];
    if (!bodyNode) {
      error(location_of(entry, *name), "document requires a 'body'", diag_code::k_stack_file);
      continue;
    }
    auto body = convert(bodyNode, *name, {});
    if (!body) {
      continue;
    }
    if (!tree_->add_document(*name, *path, format, std::move(*body), location_of(entry, *name))) {
      failed_ = true;
    }
  }
}

// ============================================================================
// Values
// ============================================================================

std::optional<Value> StackFileReader::convert(
  const YAML::Node & node, const std::string & construct, const std::string & path)
{
  const std::string & tag = node.Tag();

  if (tag == k_tag_ref) return convert_ref(node, construct, path);
  if (tag == k_tag_join) return convert_join(node, construct, path);
  if (tag == k_tag_env) return convert_env(node, construct, path);
  if (tag == k_tag_raw) {
    if (!node.IsScalar()) {
      error(location_of(node, construct, path), "!raw takes a string", diag_code::k_stack_file);
      return std::nullopt;
    }
    return Value::make_foreign(node.Scalar());
  }
  if (tag == k_tag_yaml || tag == k_tag_json) {
    auto body = convert_untagged(node, construct, path);
    if (!body) {
      return std::nullopt;
    }
    return Value::make_encoded(
      tag == k_tag_yaml ? DocumentFormat::Yaml : DocumentFormat::Json, std::move(*body));
  }
  if (tag == k_tag_quoted || tag == k_tag_str) {
    if (node.IsScalar()) {
      return Value::make_string(node.Scalar());
    }
    return convert_untagged(node, construct, path);
  }
  if (tag.empty() || tag == k_tag_plain) {
    return convert_untagged(node, construct, path);
  }

  error(location_of(node, construct, path), "unknown tag '" + tag + "'", diag_code::k_stack_file)
    .with_help("supported tags: !ref, !raw, !join, !env, !yaml, !json");
  return std::nullopt;
}

std::optional<Value> StackFileReader::convert_untagged(
  const YAML::Node & node, const std::string & construct, const std::string & path)
{
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return Value::make_null();
    case YAML::NodeType::Scalar: {
      const std::string & text = node.Scalar();
      if (node.Tag() == k_tag_quoted) {
        return Value::make_string(text);
      }
      switch (classify_plain_scalar(text)) {
        case PlainScalarType::Null:
          return Value::make_null();
        case PlainScalarType::Bool:
          return Value::make_bool(parse_core_bool(text));
        case PlainScalarType::Integer:
          if (auto i = parse_core_integer(text)) {
            return Value::make_integer(*i);
          }
          // Too large for int64: keep the magnitude as a float.
          if (auto f = parse_core_float(text)) {
            bag_
              .report_warning(
                location_of(node, construct, path),
                "integer " + text + " does not fit in 64 bits and is stored as float " +
                  format_core_float(*f))
              .with_code(diag_code::k_stack_file)
              .with_help("quote the value to keep every digit");
            return Value::make_float(*f);
          }
          return Value::make_string(text);
        case PlainScalarType::Float:
          if (auto f = parse_core_float(text)) {
            return Value::make_float(*f);
          }
          return Value::make_string(text);
        case PlainScalarType::String:
          return Value::make_string(text);
      }
      return Value::make_string(text);
    }
    case YAML::NodeType::Sequence: {
      Value::Sequence items;
      bool ok = true;
      size_t i = 0;
      for (const auto & item : node) {
        auto v = convert(item, construct, path_index(path, i++));
        if (!v) {
          ok = false;
          continue;
        }
        items.push_back(std::move(*v));
      }
      if (!ok) return std::nullopt;
      return Value::make_sequence(std::move(items));
    }
    case YAML::NodeType::Map: {
      Value result = Value::make_mapping({});
      bool ok = true;
      for (const auto & kv : node) {
        if (!kv.first.IsScalar()) {
          error(
            location_of(kv.first, construct, path), "mapping keys must be strings",
            diag_code::k_stack_file);
          ok = false;
          continue;
        }
        const std::string key = kv.first.Scalar();
        if (result.find(key)) {
          error(
            location_of(kv.first, construct, path_join(path, key)),
            "duplicate key '" + key + "'", diag_code::k_stack_file);
          ok = false;
          continue;
        }
        auto v = convert(kv.second, construct, path_join(path, key));
        if (!v) {
          ok = false;
          continue;
        }
        result.set(key, std::move(*v));
      }
      if (!ok) return std::nullopt;
      return result;
    }
  }
  return std::nullopt;
}

std::optional<Value> StackFileReader::convert_ref(
  const YAML::Node & node, const std::string & construct, const std::string & path)
{
  const Location where = location_of(node, construct, path);
  if (!node.IsScalar()) {
    error(where, "!ref takes 'Construct.attribute'", diag_code::k_invalid_reference);
    return std::nullopt;
  }

  const std::string & text = node.Scalar();
  const size_t dot = text.find('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == text.size()) {
    error(where, "malformed reference '" + text + "'", diag_code::k_invalid_reference)
      .with_help("write references as !ref Construct.attribute");
    return std::nullopt;
  }

  const std::string owner = text.substr(0, dot);
  const std::string attribute = text.substr(dot + 1);
  const NodeId id = tree_->find(owner);
  if (!id.is_valid()) {
    error(
      where, "dangling reference: unknown construct '" + owner + "' in '" + text + "'",
      diag_code::k_dangling_reference);
    return std::nullopt;
  }

  const ConstructNode * target = tree_->node(id);
  if (!target->has_attributes()) {
    error(
      where,
      "cannot reference " + std::string(construct_kind_name(target->kind)) + " '" + owner +
        "': only resources and data sources have attributes",
      diag_code::k_invalid_reference);
    return std::nullopt;
  }
  return Value::make_token(tree_->output(id, attribute));
}

std::optional<Value> StackFileReader::convert_join(
  const YAML::Node & node, const std::string & construct, const std::string & path)
{
  const Location where = location_of(node, construct, path);
  if (!node.IsSequence()) {
    error(where, "!join takes a list of parts", diag_code::k_stack_file);
    return std::nullopt;
  }

  std::vector<Value> pieces;
  bool ok = true;
  for (const auto & item : node) {
    auto v = convert(item, construct, path);
    if (!v) {
      ok = false;
      continue;
    }
    pieces.push_back(std::move(*v));
  }
  if (!ok) {
    return std::nullopt;
  }

  try {
    return Value::concat(pieces);
  } catch (const std::invalid_argument & e) {
    error(where, std::string("invalid !join part: ") + e.what(), diag_code::k_stack_file);
    return std::nullopt;
  }
}

std::optional<Value> StackFileReader::convert_env(
  const YAML::Node & node, const std::string & construct, const std::string & path)
{
  const Location where = location_of(node, construct, path);
  if (!node.IsScalar()) {
    error(where, "!env takes a variable name", diag_code::k_stack_file);
    return std::nullopt;
  }
  const std::string & name = node.Scalar();
  if (auto value = env_.get(name)) {
    return Value::make_string(*value);
  }
  error(
    where, "environment variable '" + name + "' is not declared in 'required_env'",
    diag_code::k_missing_environment)
    .with_help("add '" + name + "' to the stack's required_env list");
  return std::nullopt;
}

}  // namespace

// ============================================================================
// StackLoader
// ============================================================================

std::optional<LoadedStack> StackLoader::load_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    DiagnosticBag scratch;
    DiagnosticBag & bag = diags_ ? *diags_ : scratch;
    Location where;
    where.file = path;
    bag.report_error(where, "cannot open stack file: " + path.string())
      .with_code(diag_code::k_stack_file);
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return load_string(ss.str(), path);
}

std::optional<LoadedStack> StackLoader::load_string(
  std::string_view text, const std::filesystem::path & display_path)
{
  DiagnosticBag scratch;
  DiagnosticBag & bag = diags_ ? *diags_ : scratch;

  YAML::Node root;
  try {
    root = YAML::Load(std::string(text));
  } catch (const YAML::ParserException & e) {
    Location where;
    where.file = display_path;
    if (!e.mark.is_null()) {
      where.line = static_cast<uint32_t>(e.mark.line + 1);
      where.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    bag.report_error(where, "invalid YAML: " + e.msg).with_code(diag_code::k_stack_file);
    return std::nullopt;
  }

  StackFileReader reader(bag, diags_, display_path);
  try {
    return reader.read(root, lookup_);
  } catch (const YAML::Exception & e) {
    Location where;
    where.file = display_path;
    if (!e.mark.is_null()) {
      where.line = static_cast<uint32_t>(e.mark.line + 1);
      where.column = static_cast<uint32_t>(e.mark.column + 1);
    }
    bag.report_error(where, "invalid stack file: " + e.msg).with_code(diag_code::k_stack_file);
    return std::nullopt;
  }
}

}  // namespace stacksynth
