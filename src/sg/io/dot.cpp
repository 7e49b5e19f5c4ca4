#include "sg/io/dot.hpp"
#include "sg/core/config.hpp"
#include "sg/core/log.hpp"
#include "sg/ops/graph.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace sg {

namespace {

constexpr const char* kLeafColor  = "#d9ed92";
constexpr const char* kValueColor = "#8ecae6";
constexpr const char* kOpColor    = "#ffb703";
constexpr const char* kGradColor  = "#219ebc";

// Escape for a record label: braces, bars and angle brackets are structural.
std::string escape_record(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '{': case '}': case '|': case '<': case '>':
      case '"': case '\\':
        out.push_back('\\');
        out.push_back(c);
        break;
      case '\n':
        out += "\\n";
        break;
      default:
        out.push_back(c);
    }
  }
  return out;
}

std::string escape_plain(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::string num(double v, int precision) {
  std::ostringstream oss;
  oss << std::setprecision(precision) << v;
  return oss.str();
}

} // anon

std::string to_dot(const Value& root, const DotOptions& opts) {
  const int prec = opts.precision > 0 ? opts.precision : config::dot_precision();
  const GraphTrace g = trace(root);

  std::ostringstream out;
  out << "digraph";
  if (!opts.graph_name.empty()) out << " \"" << escape_plain(opts.graph_name) << "\"";
  out << " {\n";
  out << "  bgcolor=\"white\";\n";
  if (opts.left_to_right) out << "  rankdir=LR;\n";
  out << "  node [shape=record, style=filled, fontname=\"Helvetica\", fontsize=\"12\"];\n";

  for (std::size_t i = 0; i < g.nodes.size(); ++i) {
    const Node& n = *g.nodes[i];
    const std::string head = n.label ? escape_record(*n.label)
                                     : "value=" + num(n.value, prec);
    out << "  n" << i << " [label=\"<v> " << head << "|<g> grad=" << num(n.grad, prec)
        << "\", fillcolor=\"" << (n.parents.empty() ? kLeafColor : kValueColor) << "\"];\n";
    if (n.op) {
      out << "  op_n" << i << " [label=\"" << escape_plain(symbol(*n.op))
          << "\", shape=circle, fillcolor=\"" << kOpColor
          << "\", fontsize=\"16\", fontcolor=\"black\"];\n";
      out << "  op_n" << i << " -> n" << i
          << " [color=\"" << kOpColor << "\", penwidth=\"2\"];\n";
    }
  }
  for (const auto& e : g.edges) {
    out << "  n" << e.operand << " -> op_n" << e.consumer
        << " [color=\"" << kGradColor << "\", penwidth=\"2\"];\n";
  }
  out << "}\n";

  sg::log::debug("to_dot: ", g.nodes.size(), " nodes, ", g.edges.size(), " edges");
  return out.str();
}

void write_dot(const Value& root, const std::string& path, const DotOptions& opts) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("write_dot: cannot open '" + path + "' for writing");
  f << to_dot(root, opts);
  if (!f) throw std::runtime_error("write_dot: failed writing '" + path + "'");
}

} // namespace sg
