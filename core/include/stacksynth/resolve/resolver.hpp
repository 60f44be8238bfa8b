// stacksynth/resolve/resolver.hpp - Substitute tokens and build the provisioning plan
//
// Resolution is purely syntactic: a token becomes the provisioning system's
// interpolation text for its owner's attribute, a foreign expression becomes
// its raw text untouched. Nothing is evaluated.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/construct/construct_tree.hpp"
#include "stacksynth/graph/reference_graph.hpp"

namespace stacksynth
{

struct ResolvedDocument
{
  std::string name;
  std::string path;
  DocumentFormat format = DocumentFormat::Yaml;
  Value body;  ///< literals, sequences and mappings only
};

struct ResolvedStack
{
  std::string name;
  Value plan;  ///< provisioning plan in the native JSON layout
  std::vector<ResolvedDocument> documents;
  ReferenceGraph graph;
};

class Resolver
{
public:
  explicit Resolver(const ConstructTree & tree, DiagnosticBag * diags = nullptr)
  : tree_(tree), diags_(diags)
  {
  }

  /**
   * Build the reference graph, then resolve every construct and document.
   *
   * Graph errors (dangling/self references, cycles) abort before any value
   * is resolved.
   *
   * @return nullopt if any error was reported
   */
  std::optional<ResolvedStack> resolve();

  /**
   * Resolve a single value. `where` locates it in diagnostics.
   *
   * @return nullopt if the value holds a token that does not belong to the
   *         tree (reported as E0101)
   */
  std::optional<Value> resolve_value(const Value & value, const Location & where);

  /// Interpolation text for a token, e.g. "${aws_vpc.Net.id}".
  [[nodiscard]] static std::string render_token(const ConstructTree & tree, const Token & token);

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }

private:
  Value resolve_at(const Value & value, const Location & where, const std::string & path);
  std::string resolve_parts(
    const std::vector<StringPart> & parts, const Location & where, const std::string & path);
  std::string token_text(TokenRef ref, const Location & where, const std::string & path);

  Value build_plan(const ReferenceGraph & graph);
  Value resolve_inputs(const ConstructNode & node);

  const ConstructTree & tree_;
  DiagnosticBag * diags_ = nullptr;
  bool hasErrors_ = false;
};

}  // namespace stacksynth
