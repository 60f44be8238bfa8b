// stacksynth/graph/reference_graph.hpp - Construct dependency graph + cycle detection
//
// The graph is derived data: it is recomputed from the tokens found in the
// construct inputs every time it is built and is never mutated afterwards.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "stacksynth/basic/diagnostic.hpp"
#include "stacksynth/construct/construct_tree.hpp"

namespace stacksynth
{

/**
 * `from` depends on `to`: some input of `from` holds a token owned by `to`,
 * or `from` declares an explicit dependency on `to`.
 */
struct GraphEdge
{
  NodeId from;
  NodeId to;
  std::string attribute;  ///< first attribute path that produced the edge
  bool explicit_dependency = false;
};

class ReferenceGraph
{
public:
  ReferenceGraph() = default;

  /// Construct ids in declaration order.
  [[nodiscard]] const std::vector<NodeId> & nodes() const noexcept { return nodes_; }

  /// Edges in discovery order (declaration order of `from`, then input order).
  [[nodiscard]] const std::vector<GraphEdge> & edges() const noexcept { return edges_; }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

  /// Direct dependencies of `node`, in edge discovery order.
  [[nodiscard]] std::vector<NodeId> dependencies(NodeId node) const;

  [[nodiscard]] bool has_edge(NodeId from, NodeId to) const;
  [[nodiscard]] const GraphEdge * find_edge(NodeId from, NodeId to) const;

  /**
   * Dependencies first; ties keep declaration order.
   * Empty when the graph contains a cycle.
   */
  [[nodiscard]] const std::vector<NodeId> & topological_order() const noexcept
  {
    return order_;
  }

  /// Every detected cycle, as the node path without the closing repetition.
  [[nodiscard]] const std::vector<std::vector<NodeId>> & cycles() const noexcept
  {
    return cycles_;
  }

  [[nodiscard]] bool is_acyclic() const noexcept { return cycles_.empty(); }

private:
  friend class ReferenceGraphBuilder;

  std::vector<NodeId> nodes_;
  std::vector<GraphEdge> edges_;
  std::vector<std::vector<size_t>> outgoing_;  // node index -> edge indices
  std::vector<NodeId> order_;
  std::vector<std::vector<NodeId>> cycles_;
};

/**
 * Build the reference graph of a construct tree.
 *
 * Reports dangling references (E0101), self references (E0102) and cycles
 * (E0103). The returned graph always holds the nodes and the valid edges;
 * its topological order is only filled in when no error was found.
 */
class ReferenceGraphBuilder
{
public:
  explicit ReferenceGraphBuilder(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  ReferenceGraph build(const ConstructTree & tree);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return hasErrors_; }
  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }

  // Internal (exposed for helper routines in the implementation unit).
  DiagnosticBuilder report_error(Location location, std::string message, std::string code);

private:
  DiagnosticBag * diags_ = nullptr;
  DiagnosticBag scratch_;  // sink when no bag was supplied
  bool hasErrors_ = false;
  size_t errorCount_ = 0;
};

/// Convenience wrapper around ReferenceGraphBuilder.
ReferenceGraph build_graph(const ConstructTree & tree, DiagnosticBag * diags = nullptr);

}  // namespace stacksynth
