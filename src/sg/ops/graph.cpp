#include "sg/ops/graph.hpp"
#include <unordered_map>

namespace sg {

std::vector<Value> topo_order(const Value& root) {
  std::vector<Value> out;
  for (auto& n : detail::topo_collect(root.n)) out.push_back(make_from_node(std::move(n)));
  return out;
}

GraphTrace trace(const Value& root) {
  GraphTrace g;
  const auto order = detail::topo_collect(root.n);
  std::unordered_map<const Node*, std::size_t> index;
  index.reserve(order.size());

  g.nodes.reserve(order.size());
  for (const auto& n : order) {
    index.emplace(n.get(), g.nodes.size());
    g.nodes.push_back(n);
  }
  // operands precede consumers in order, so every lookup below hits
  for (std::size_t c = 0; c < order.size(); ++c) {
    const auto& parents = order[c]->parents;
    for (std::size_t s = 0; s < parents.size(); ++s) {
      g.edges.push_back({index.at(parents[s].get()), c, s});
    }
  }
  g.root = g.nodes.empty() ? 0 : g.nodes.size() - 1;
  return g;
}

Value stop_gradient(const Value& x) {
  auto n = std::make_shared<Node>();
  n->value = x.n->value;
  n->label = x.n->label;
  return make_from_node(n);
}

Value detach(const Value& x) {
  return stop_gradient(x);
}

} // namespace sg
