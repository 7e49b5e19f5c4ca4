#pragma once
#include <string>
#include "sg/core/value.hpp"

namespace sg {

struct DotOptions {
  std::string graph_name;  // empty -> anonymous digraph
  int precision = 0;       // significant digits; 0 -> config::dot_precision()
  bool left_to_right = false;
};

// Graphviz DOT text for the graph reachable from root. Value nodes are
// records "<label|value>|grad", each producing operation gets its own circle
// node between operands and result.
std::string to_dot(const Value& root, const DotOptions& opts = {});

// Writes to_dot() to path. Throws std::runtime_error if the file cannot be
// written.
void write_dot(const Value& root, const std::string& path, const DotOptions& opts = {});

} // namespace sg
