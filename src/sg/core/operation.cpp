#include "sg/core/operation.hpp"
#include "sg/core/errors.hpp"
#include <cmath>
#include <sstream>
#include <string>

namespace sg {

namespace {

[[noreturn]] void domain_fail(const char* op, double a, const char* why) {
  std::ostringstream oss;
  oss << op << "(" << a << "): " << why;
  throw DomainError(oss.str());
}

// ---- forward rules ----
double add_f(double a, double b) { return a + b; }
double sub_f(double a, double b) { return a - b; }
double mul_f(double a, double b) { return a * b; }

double div_f(double a, double b) {
  if (b == 0.0) domain_fail("div", a, "division by zero");
  return a / b;
}

double neg_f(double a, double) { return -a; }

double pow_f(double a, double b) {
  if (a == 0.0 && b < 0.0) domain_fail("pow", a, "zero raised to a negative power");
  if (a < 0.0 && std::isfinite(b) && std::floor(b) != b)
    domain_fail("pow", a, "negative base with non-integer exponent");
  return std::pow(a, b);
}

double exp_f(double a, double) { return std::exp(a); }

double log_f(double a, double) {
  if (a <= 0.0) domain_fail("log", a, "argument must be positive");
  return std::log(a);
}

double sin_f(double a, double) { return std::sin(a); }
double cos_f(double a, double) { return std::cos(a); }

double tan_f(double a, double) {
  if (std::cos(a) == 0.0) domain_fail("tan", a, "asymptote (cos == 0)");
  return std::tan(a);
}

double cot_f(double a, double) {
  const double t = std::tan(a);
  if (t == 0.0) domain_fail("cot", a, "asymptote (tan == 0)");
  return 1.0 / t;
}

double sinh_f(double a, double) { return std::sinh(a); }
double cosh_f(double a, double) { return std::cosh(a); }
double tanh_f(double a, double) { return std::tanh(a); }

double coth_f(double a, double) {
  const double t = std::tanh(a);
  if (t == 0.0) domain_fail("coth", a, "asymptote (tanh == 0)");
  return 1.0 / t;
}

// ---- backward rules ----
Grads add_b(double g, double, double) { return {g, g}; }
Grads sub_b(double g, double, double) { return {g, -g}; }
Grads mul_b(double g, double a, double b) { return {g * b, g * a}; }
Grads div_b(double g, double a, double b) { return {g / b, -g * a / (b * b)}; }
Grads neg_b(double g, double, double) { return {-g, 0.0}; }

// d/db is defined as 0 for a non-positive base: ln(a) does not exist there.
Grads pow_b(double g, double a, double b) {
  const double da = g * b * std::pow(a, b - 1.0);
  const double db = (a > 0.0) ? g * std::pow(a, b) * std::log(a) : 0.0;
  return {da, db};
}

Grads exp_b(double g, double a, double) { return {g * std::exp(a), 0.0}; }
Grads log_b(double g, double a, double) { return {g / a, 0.0}; }
Grads sin_b(double g, double a, double) { return {g * std::cos(a), 0.0}; }
Grads cos_b(double g, double a, double) { return {-g * std::sin(a), 0.0}; }

Grads tan_b(double g, double a, double) {
  const double c = std::cos(a);
  return {g / (c * c), 0.0};
}

Grads cot_b(double g, double a, double) {
  const double s = std::sin(a);
  return {-g / (s * s), 0.0};
}

Grads sinh_b(double g, double a, double) { return {g * std::cosh(a), 0.0}; }
Grads cosh_b(double g, double a, double) { return {g * std::sinh(a), 0.0}; }

Grads tanh_b(double g, double a, double) {
  const double t = std::tanh(a);
  return {g * (1.0 - t * t), 0.0};
}

Grads coth_b(double g, double a, double) {
  const double s = std::sinh(a);
  return {-g / (s * s), 0.0};
}

// Indexed by OpKind.
const OpInfo kOps[kNumOps] = {
  {OpKind::Add,  "Add",  "+",    2, add_f,  add_b},
  {OpKind::Sub,  "Sub",  "-",    2, sub_f,  sub_b},
  {OpKind::Mul,  "Mul",  "*",    2, mul_f,  mul_b},
  {OpKind::Div,  "Div",  "/",    2, div_f,  div_b},
  {OpKind::Neg,  "Neg",  "neg",  1, neg_f,  neg_b},
  {OpKind::Pow,  "Pow",  "**",   2, pow_f,  pow_b},
  {OpKind::Exp,  "Exp",  "exp",  1, exp_f,  exp_b},
  {OpKind::Log,  "Log",  "log",  1, log_f,  log_b},
  {OpKind::Sin,  "Sin",  "sin",  1, sin_f,  sin_b},
  {OpKind::Cos,  "Cos",  "cos",  1, cos_f,  cos_b},
  {OpKind::Tan,  "Tan",  "tan",  1, tan_f,  tan_b},
  {OpKind::Cot,  "Cot",  "cot",  1, cot_f,  cot_b},
  {OpKind::Sinh, "Sinh", "sinh", 1, sinh_f, sinh_b},
  {OpKind::Cosh, "Cosh", "cosh", 1, cosh_f, cosh_b},
  {OpKind::Tanh, "Tanh", "tanh", 1, tanh_f, tanh_b},
  {OpKind::Coth, "Coth", "coth", 1, coth_f, coth_b},
};

} // anon

const OpInfo& op_info(OpKind k) {
  return kOps[static_cast<std::size_t>(k)];
}

std::size_t arity(OpKind k) { return op_info(k).arity; }
const char* symbol(OpKind k) { return op_info(k).symbol; }
const char* name(OpKind k) { return op_info(k).name; }

double forward(OpKind k, double a, double b) {
  return op_info(k).forward(a, b);
}

Grads backward(OpKind k, double g, double a, double b) {
  return op_info(k).backward(g, a, b);
}

} // namespace sg
