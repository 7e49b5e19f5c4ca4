// Labelled graphs: build a few expressions, run backward, print the
// gradients and dump each graph as Graphviz DOT (render with `dot -Tsvg`).
#include <iostream>
#include <string>
#include "sg/all.hpp"

using sg::Value;

static void dump(const Value& root, const std::string& name) {
  const std::string path = name + ".dot";
  try {
    sg::write_dot(root, path);
    std::cout << "  graph written to " << path << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "  " << e.what() << "\n";
  }
}

int main() {
  Value x(2.0, "x");
  Value y(3.0, "y");
  std::cout << "inputs: " << x << ", " << y << "\n";

  Value z = x * y;
  z.set_label("z = x*y");
  Value w = z + x;
  w.set_label("w = z+x");
  Value result = w.pow(2);
  result.set_label("result = w^2");

  result.backward();
  std::cout << result << "\n";
  std::cout << "  d(result)/dx = " << x.grad() << "\n";
  std::cout << "  d(result)/dy = " << y.grad() << "\n";
  dump(result, "graph_with_labels");

  Value angle(0.5, "theta");
  Value s = angle.sin();
  s.set_label("sin(theta)");
  Value c = angle.cos();
  c.set_label("cos(theta)");
  Value trig = s + c;
  trig.set_label("sin(theta) + cos(theta)");
  trig.backward();
  std::cout << "sin(theta) + cos(theta) = " << trig.value() << "\n";
  std::cout << "  d/dtheta = " << angle.grad() << "\n";
  dump(trig, "graph_trigonometric");

  try {
    Value bad = Value(0.0, "zero").log();
    std::cout << bad << "\n";
  } catch (const sg::DomainError& e) {
    std::cerr << "log(0) rejected: " << e.what() << "\n";
  }
  return 0;
}
