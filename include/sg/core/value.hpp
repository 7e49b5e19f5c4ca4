#pragma once
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "sg/core/operation.hpp"

namespace sg {

// One point of the computation. value/op/parents are fixed at construction;
// only grad, label and hook change afterwards.
//
// Operand edges always point at nodes that existed before this one, so the
// graph is acyclic by construction and traversals never check for cycles.
struct Node {
  double value = 0.0;
  double grad  = 0.0;
  std::optional<OpKind> op;                    // empty for leaves
  std::vector<std::shared_ptr<Node>> parents;  // operands, in input order
  std::optional<std::string> label;
  std::function<void(Node&)> hook;             // runs after this node's accumulation

  Node() = default;
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;
  ~Node();

  bool is_leaf() const { return !op.has_value(); }
};

class Operand;

class Value {
public:
  Value();                                   // leaf holding 0.0
  explicit Value(double value);              // leaf
  Value(double value, std::string label);    // labelled leaf
  explicit Value(std::shared_ptr<Node> node);

  // The one place a numeric literal becomes a node: a fresh zero-grad leaf.
  static Value from_literal(double literal);

  double value() const;
  double grad()  const;
  std::optional<OpKind> op() const;
  bool is_leaf() const;
  std::vector<Value> parents() const;

  const std::optional<std::string>& label() const;
  void set_label(std::string label);
  void clear_label();

  // Optional post-processing step, invoked during backward right after this
  // node has distributed its gradient to its operands.
  void set_backward_hook(std::function<void(Node&)> hook);

  void zero_grad();   // zero across reachable subgraph
  void backward();    // seed 1 at this node, accumulate into every ancestor

  Value pow(const Operand& exponent) const;
  Value exp()  const;
  Value log()  const;
  Value sin()  const;
  Value cos()  const;
  Value tan()  const;
  Value cot()  const;
  Value sinh() const;
  Value cosh() const;
  Value tanh() const;
  Value coth() const;

  // expose node handle for ops implementation
  std::shared_ptr<Node> n;
};

Value make_from_node(std::shared_ptr<Node> node);

// Either a Value or an arithmetic literal; literals go through
// Value::from_literal. Every construction function takes its operands this way.
class Operand {
public:
  Operand(const Value& v);

  template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
  Operand(T literal)
    : v_(Value::from_literal(static_cast<double>(literal))) {}

  const Value& value() const { return v_; }
  const std::shared_ptr<Node>& node() const { return v_.n; }

private:
  Value v_;
};

// Display form: Value(value=8, grad=1, op=+, label='z')
std::string to_string(const Value& v);
std::ostream& operator<<(std::ostream& os, const Value& v);

namespace detail {

// Evaluate k eagerly and wrap the result in a new node referencing the operands.
// Throws DomainError (from the forward rule) before any node is created.
Value apply(OpKind k, const Operand& a);
Value apply(OpKind k, const Operand& a, const Operand& b);

// Operands-first order of every node reachable from root, each node once.
// Iterative, so depth is not bounded by the call stack.
std::vector<std::shared_ptr<Node>> topo_collect(const std::shared_ptr<Node>& root);

} // namespace detail

} // namespace sg
