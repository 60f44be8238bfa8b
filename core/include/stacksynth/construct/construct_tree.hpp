// stacksynth/construct/construct_tree.hpp - Construct tree (stack) ownership
//
// A ConstructTree owns every construct, every token and every document of
// one stack. Constructs reference each other only through tokens, which are
// indices into the tree's token table.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/construct/ids.hpp"
#include "stacksynth/construct/value.hpp"

namespace stacksynth
{

// ============================================================================
// Constructs
// ============================================================================

enum class ConstructKind : uint8_t {
  Provider,    ///< Provider configuration block
  Resource,    ///< Managed resource
  DataSource,  ///< Read-only lookup
  Output,      ///< Stack output
};

[[nodiscard]] const char * construct_kind_name(ConstructKind kind) noexcept;

/**
 * Placeholder for an attribute known only after provisioning.
 *
 * Immutable once minted; owned by the tree, weakly referenced by values.
 */
struct Token
{
  TokenRef ref;
  NodeId owner;
  std::string attribute;
  std::string display_hint;  ///< "Owner.attribute", for diagnostics
};

struct ConstructNode
{
  NodeId id;
  ConstructKind kind = ConstructKind::Resource;
  std::string type;  ///< e.g. "github_repository"; empty for outputs
  std::string name;  ///< construct id, unique within the tree

  /// Input attributes in declaration order (always a Mapping).
  Value inputs = Value::make_mapping({});

  /// Tokens minted for this construct, in minting order.
  std::vector<TokenRef> outputs;

  /// Explicit ordering constraints (in addition to token references).
  std::vector<NodeId> depends_on;

  /// Where the construct was declared, when it came from a stack file.
  Location origin;

  /// Native address: "type.name" or "data.type.name"; name otherwise.
  [[nodiscard]] std::string address() const;

  /// Whether tokens may be minted for this construct.
  [[nodiscard]] bool has_attributes() const noexcept
  {
    return kind == ConstructKind::Resource || kind == ConstructKind::DataSource;
  }

  [[nodiscard]] Location location(std::string attribute = {}) const;
};

/**
 * A workflow/config document emitted as its own artifact.
 */
struct Document
{
  std::string name;
  std::string path;  ///< relative output path, e.g. ".github/workflows/ci.yml"
  DocumentFormat format = DocumentFormat::Yaml;
  Value body;
  Location origin;
};

// ============================================================================
// ConstructTree
// ============================================================================

class ConstructTree
{
public:
  explicit ConstructTree(std::string name, DiagnosticBag * diags = nullptr);

  // Non-copyable (tokens are bound to the tree serial), movable
  ConstructTree(const ConstructTree &) = delete;
  ConstructTree & operator=(const ConstructTree &) = delete;
  ConstructTree(ConstructTree &&) = default;
  ConstructTree & operator=(ConstructTree &&) = default;

  // ===========================================================================
  // Construct Creation
  // ===========================================================================

  /**
   * Declare a construct.
   *
   * @return Its id, or NodeId::invalid() if the name is already taken
   *         (reported as E0105) or the tree is finalized (E0106).
   */
  NodeId add_provider(std::string type, std::string name, Location origin = {});
  NodeId add_resource(std::string type, std::string name, Location origin = {});
  NodeId add_data_source(std::string type, std::string name, Location origin = {});
  NodeId add_output(std::string name, Location origin = {});

  /**
   * Token for `(owner, attribute)`. The same pair always yields the same token.
   *
   * @throws std::invalid_argument if `owner` is not a resource or data source
   *         of this tree
   */
  TokenRef output(NodeId owner, std::string_view attribute);

  /**
   * Set an input attribute.
   *
   * Every token inside `value` must belong to this tree; otherwise a
   * dangling reference (E0101) naming the attribute path is reported and the
   * value is not stored.
   */
  bool set_input(NodeId node, std::string attribute, Value value);

  /// Explicit dependency of `node` on `dependency`. An id minted by another
  /// tree is a dangling reference (E0101).
  bool add_dependency(NodeId node, NodeId dependency);

  /**
   * Register a standalone document. `path` must be relative and stay inside
   * the stack output directory (E0108 otherwise).
   */
  bool add_document(
    std::string name, std::string path, DocumentFormat format, Value body, Location origin = {});

  /// Freeze the tree; further mutation is reported as E0106.
  void finalize() noexcept { finalized_ = true; }
  [[nodiscard]] bool is_finalized() const noexcept { return finalized_; }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] uint32_t serial() const noexcept { return serial_; }

  [[nodiscard]] const ConstructNode * node(NodeId id) const;
  [[nodiscard]] NodeId find(std::string_view name) const;

  /**
   * Token behind a reference, or nullptr if the reference does not belong
   * to this tree.
   */
  [[nodiscard]] const Token * token(TokenRef ref) const;

  /// All constructs in declaration order.
  [[nodiscard]] std::vector<const ConstructNode *> nodes() const;

  [[nodiscard]] const std::vector<Document> & documents() const noexcept { return documents_; }

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

private:
  NodeId add_node(ConstructKind kind, std::string type, std::string name, Location origin);
  bool check_mutable(const Location & where);
  ConstructNode * mutable_node(NodeId id);

  std::string name_;
  uint32_t serial_ = 0;
  DiagnosticBag * diags_ = nullptr;
  bool finalized_ = false;

  std::vector<std::unique_ptr<ConstructNode>> nodes_;  // indexed by NodeId::value
  std::vector<Token> tokens_;                          // indexed by TokenRef::index
  std::unordered_map<std::string, NodeId> byName_;
  std::vector<Document> documents_;
};

}  // namespace stacksynth
