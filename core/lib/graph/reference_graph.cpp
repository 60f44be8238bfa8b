// stacksynth/graph/reference_graph.cpp - Construct dependency graph + cycle detection

#include "stacksynth/graph/reference_graph.hpp"

#include <algorithm>
#include <functional>
#include <gsl/span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "stacksynth/basic/diagnostic_codes.hpp"

namespace stacksynth
{

// ============================================================================
// ReferenceGraph
// ============================================================================

std::vector<NodeId> ReferenceGraph::dependencies(NodeId node) const
{
  std::vector<NodeId> result;
  if (!node.is_valid() || node.value >= outgoing_.size()) {
    return result;
  }
  result.reserve(outgoing_[node.value].size());
  for (const size_t e : outgoing_[node.value]) {
    result.push_back(edges_[e].to);
  }
  return result;
}

const GraphEdge * ReferenceGraph::find_edge(NodeId from, NodeId to) const
{
  if (!from.is_valid() || from.value >= outgoing_.size()) {
    return nullptr;
  }
  for (const size_t e : outgoing_[from.value]) {
    if (edges_[e].to == to) {
      return &edges_[e];
    }
  }
  return nullptr;
}

bool ReferenceGraph::has_edge(NodeId from, NodeId to) const
{
  return find_edge(from, to) != nullptr;
}

// ============================================================================
// ReferenceGraphBuilder
// ============================================================================

namespace
{

enum class Color : uint8_t { White, Gray, Black };

std::string cycle_message(
  const ConstructTree & tree, gsl::span<const NodeId> stack, NodeId target)
{
  std::string msg = "Cyclic dependency: ";

  size_t start = 0;
  for (; start < stack.size(); ++start) {
    if (stack[start] == target) {
      break;
    }
  }
  // A back edge always targets a node on the stack.
  if (start >= stack.size()) {
    start = 0;
  }

  for (size_t i = start; i < stack.size(); ++i) {
    if (i > start) msg += " -> ";
    msg += tree.node(stack[i])->name;
  }
  msg += " -> ";
  msg += tree.node(target)->name;
  return msg;
}

// Edge `from -> to` is appended unless it already exists.
void add_edge(
  std::vector<GraphEdge> & edges, std::vector<std::vector<size_t>> & outgoing, GraphEdge edge)
{
  for (const size_t e : outgoing[edge.from.value]) {
    if (edges[e].to == edge.to) {
      return;
    }
  }
  outgoing[edge.from.value].push_back(edges.size());
  edges.push_back(std::move(edge));
}

}  // namespace

DiagnosticBuilder ReferenceGraphBuilder::report_error(
  Location location, std::string message, std::string code)
{
  hasErrors_ = true;
  ++errorCount_;
  DiagnosticBag & bag = diags_ ? *diags_ : scratch_;
  auto builder = bag.report_error(std::move(location), std::move(message));
  builder.with_code(std::move(code));
  return builder;
}

ReferenceGraph ReferenceGraphBuilder::build(const ConstructTree & tree)
{
  hasErrors_ = false;
  errorCount_ = 0;

  ReferenceGraph graph;
  const auto constructs = tree.nodes();
  graph.nodes_.reserve(constructs.size());
  graph.outgoing_.resize(constructs.size());

  // Collect edges from token occurrences, then explicit dependencies.
  for (const ConstructNode * node : constructs) {
    graph.nodes_.push_back(node->id);

    std::unordered_set<std::string> reportedSelf;
    for_each_token(node->inputs, {}, [&](TokenRef ref, const std::string & path) {
      const Token * token = tree.token(ref);
      if (!token) {
        report_error(
          node->location(path),
          "dangling reference in '" + node->name + "." + path +
            "': the referenced attribute does not belong to a construct of stack '" +
            tree.name() + "'",
          diag_code::k_dangling_reference);
        return;
      }
      if (token->owner == node->id) {
        if (reportedSelf.insert(path).second) {
          report_error(
            node->location(path),
            "construct '" + node->name + "' references its own attribute '" + token->attribute +
              "' in '" + path + "'",
            diag_code::k_self_reference)
            .with_help("a construct cannot depend on its own outputs");
        }
        return;
      }
      add_edge(
        graph.edges_, graph.outgoing_, GraphEdge{node->id, token->owner, path, false});
    });

    for (const NodeId dep : node->depends_on) {
      if (dep == node->id) {
        report_error(
          node->location("depends_on"), "construct '" + node->name + "' depends on itself",
          diag_code::k_self_reference);
        continue;
      }
      add_edge(graph.edges_, graph.outgoing_, GraphEdge{node->id, dep, "depends_on", true});
    }
  }

  // Three-color DFS. Dependencies are visited in declaration order, so the
  // post-order is deterministic and puts dependencies first.
  std::vector<Color> color(constructs.size(), Color::White);
  std::vector<NodeId> stack;
  stack.reserve(constructs.size());
  std::vector<NodeId> postorder;
  postorder.reserve(constructs.size());

  std::function<void(NodeId)> dfs;
  dfs = [&](NodeId u) {
    color[u.value] = Color::Gray;
    stack.push_back(u);

    std::vector<size_t> out = graph.outgoing_[u.value];
    std::stable_sort(out.begin(), out.end(), [&](size_t a, size_t b) {
      return graph.edges_[a].to < graph.edges_[b].to;
    });

    for (const size_t e : out) {
      const GraphEdge & edge = graph.edges_[e];
      const Color c = color[edge.to.value];

      if (c == Color::Gray) {
        const gsl::span<const NodeId> stack_view(stack.data(), stack.size());
        const auto start = std::find(stack.begin(), stack.end(), edge.to);
        std::vector<NodeId> cycle(start, stack.end());

        const ConstructNode * from = tree.node(edge.from);
        auto builder = report_error(
          from->location(edge.attribute), cycle_message(tree, stack_view, edge.to),
          diag_code::k_cyclic_dependency);
        for (size_t i = 0; i < cycle.size(); ++i) {
          const NodeId a = cycle[i];
          const NodeId b = (i + 1 < cycle.size()) ? cycle[i + 1] : edge.to;
          const GraphEdge * link = graph.find_edge(a, b);
          const ConstructNode * an = tree.node(a);
          const std::string attr = link ? link->attribute : std::string();
          builder.with_secondary_label(
            an->location(attr), an->name + (attr.empty() ? "" : "." + attr) + " references " +
                                  tree.node(b)->name);
        }
        builder.with_help("break the cycle by removing one of these references");
        graph.cycles_.push_back(std::move(cycle));
        continue;
      }
      if (c == Color::White) {
        dfs(edge.to);
      }
    }

    stack.pop_back();
    color[u.value] = Color::Black;
    postorder.push_back(u);
  };

  for (const NodeId id : graph.nodes_) {
    if (color[id.value] == Color::White) {
      dfs(id);
    }
  }

  if (!hasErrors_) {
    graph.order_ = std::move(postorder);
  }
  return graph;
}

ReferenceGraph build_graph(const ConstructTree & tree, DiagnosticBag * diags)
{
  ReferenceGraphBuilder builder(diags);
  return builder.build(tree);
}

}  // namespace stacksynth
