#pragma once
#include <cstddef>
#include <memory>
#include <vector>
#include "sg/core/value.hpp"

namespace sg {

// Every node reachable from root, operands before the nodes that consume them.
std::vector<Value> topo_order(const Value& root);

// Read-only view of a graph for renderers: each reachable node exactly once
// (in topological order) plus one edge per operand slot.
struct GraphEdge {
  std::size_t operand;   // index into GraphTrace::nodes
  std::size_t consumer;  // index into GraphTrace::nodes
  std::size_t slot;      // operand position in the consumer's input list
};

struct GraphTrace {
  std::vector<std::shared_ptr<const Node>> nodes;
  std::vector<GraphEdge> edges;
  std::size_t root = 0;  // index of the root in nodes (always the last one)
};

GraphTrace trace(const Value& root);

// Returns a detached copy: same value and label, no history, grad 0.
Value stop_gradient(const Value& x);

Value detach(const Value& x);

} // namespace sg
