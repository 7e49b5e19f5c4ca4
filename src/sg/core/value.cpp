#include "sg/core/value.hpp"
#include "sg/core/errors.hpp"
#include "sg/core/config.hpp"
#include "sg/core/log.hpp"
#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sg {

// Release the operand chain without recursing once per level: long chains
// (x + 1 + 1 + ...) would otherwise overflow the stack in ~shared_ptr.
Node::~Node() {
  std::vector<std::shared_ptr<Node>> pending = std::move(parents);
  while (!pending.empty()) {
    std::shared_ptr<Node> p = std::move(pending.back());
    pending.pop_back();
    if (p && p.use_count() == 1) {
      for (auto& q : p->parents) pending.push_back(std::move(q));
      p->parents.clear();
    }
  }
}

namespace detail {

std::vector<std::shared_ptr<Node>> topo_collect(const std::shared_ptr<Node>& root) {
  std::vector<std::shared_ptr<Node>> order;
  if (!root) return order;

  // (node, index of next operand to descend into)
  std::vector<std::pair<Node*, std::size_t>> stack;
  std::unordered_set<const Node*> seen;
  std::vector<std::shared_ptr<Node>> owners;  // keeps stacked nodes addressable

  seen.insert(root.get());
  stack.emplace_back(root.get(), 0);
  owners.push_back(root);

  while (!stack.empty()) {
    auto& top = stack.back();
    Node* node = top.first;
    if (top.second < node->parents.size()) {
      const auto& p = node->parents[top.second++];
      if (p && seen.insert(p.get()).second) {
        stack.emplace_back(p.get(), 0);
        owners.push_back(p);
      }
      continue;
    }
    order.push_back(std::move(owners.back()));
    owners.pop_back();
    stack.pop_back();
  }
  return order;
}

Value apply(OpKind k, const Operand& a) {
  if (arity(k) != 1) throw std::invalid_argument(std::string(name(k)) + " takes two operands");
  const auto& an = a.node();
  const double v = forward(k, an->value);
  auto out = std::make_shared<Node>();
  out->value = v;
  out->op = k;
  out->parents = {an};
  return make_from_node(out);
}

Value apply(OpKind k, const Operand& a, const Operand& b) {
  if (arity(k) != 2) throw std::invalid_argument(std::string(name(k)) + " takes one operand");
  const auto& an = a.node();
  const auto& bn = b.node();
  const double v = forward(k, an->value, bn->value);
  auto out = std::make_shared<Node>();
  out->value = v;
  out->op = k;
  out->parents = {an, bn};
  return make_from_node(out);
}

} // namespace detail

Value::Value() : n(std::make_shared<Node>()) {}

Value::Value(double value) : n(std::make_shared<Node>()) {
  n->value = value;
}

Value::Value(double value, std::string label) : n(std::make_shared<Node>()) {
  n->value = value;
  n->label = std::move(label);
}

Value::Value(std::shared_ptr<Node> node) : n(std::move(node)) {}

Value Value::from_literal(double literal) { return Value(literal); }

Value make_from_node(std::shared_ptr<Node> node) { return Value(std::move(node)); }

double Value::value() const { return n->value; }
double Value::grad()  const { return n->grad; }
std::optional<OpKind> Value::op() const { return n->op; }
bool Value::is_leaf() const { return n->is_leaf(); }

std::vector<Value> Value::parents() const {
  std::vector<Value> out;
  out.reserve(n->parents.size());
  for (const auto& p : n->parents) out.push_back(make_from_node(p));
  return out;
}

const std::optional<std::string>& Value::label() const { return n->label; }
void Value::set_label(std::string label) { n->label = std::move(label); }
void Value::clear_label() { n->label.reset(); }

void Value::set_backward_hook(std::function<void(Node&)> hook) { n->hook = std::move(hook); }

void Value::zero_grad() {
  for (auto& x : detail::topo_collect(n)) x->grad = 0.0;
}

void Value::backward() {
  const auto order = detail::topo_collect(n);

  for (auto& x : order) x->grad = 0.0;
  n->grad = 1.0;

  const bool warn = config::warn_nonfinite();
  bool warned = false;
  sg::log::debug("backward: ", order.size(), " nodes reachable");

  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    Node& node = **it;
    if (node.op && !node.parents.empty()) {
      const double a = node.parents[0]->value;
      const double b = node.parents.size() > 1 ? node.parents[1]->value : 0.0;
      const Grads g = sg::backward(*node.op, node.grad, a, b);
      for (std::size_t i = 0; i < node.parents.size(); ++i) {
        Node& p = *node.parents[i];
        p.grad += g[i];
        if (warn && !warned && !std::isfinite(p.grad)) {
          sg::log::warn("non-finite gradient ", p.grad, " reached operand ", i,
                    " of '", symbol(*node.op), "' node (value=", node.value, ")");
          warned = true;
        }
      }
      sg::log::debug("  ", symbol(*node.op), " value=", node.value, " grad=", node.grad);
    }
    if (node.hook) node.hook(node);
  }
}

Value Value::pow(const Operand& exponent) const { return detail::apply(OpKind::Pow, *this, exponent); }
Value Value::exp()  const { return detail::apply(OpKind::Exp,  *this); }
Value Value::log()  const { return detail::apply(OpKind::Log,  *this); }
Value Value::sin()  const { return detail::apply(OpKind::Sin,  *this); }
Value Value::cos()  const { return detail::apply(OpKind::Cos,  *this); }
Value Value::tan()  const { return detail::apply(OpKind::Tan,  *this); }
Value Value::cot()  const { return detail::apply(OpKind::Cot,  *this); }
Value Value::sinh() const { return detail::apply(OpKind::Sinh, *this); }
Value Value::cosh() const { return detail::apply(OpKind::Cosh, *this); }
Value Value::tanh() const { return detail::apply(OpKind::Tanh, *this); }
Value Value::coth() const { return detail::apply(OpKind::Coth, *this); }

Operand::Operand(const Value& v) : v_(v) {
  if (!v_.n) throw TypeCoercionError("operand is an empty Value handle (moved-from?)");
}

std::string to_string(const Value& v) {
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
  if (!v.n) return os << "Value(<empty>)";
  os << "Value(value=" << v.n->value << ", grad=" << v.n->grad
     << ", op=" << (v.n->op ? symbol(*v.n->op) : "None");
  if (v.n->label) os << ", label='" << *v.n->label << "'";
  return os << ")";
}

} // namespace sg
