#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace sg {

// Closed set of scalar operations. Order matches the descriptor table in
// operation.cpp.
enum class OpKind : std::uint8_t {
  Add, Sub, Mul, Div, Neg, Pow,
  Exp, Log,
  Sin, Cos, Tan, Cot,
  Sinh, Cosh, Tanh, Coth,
};

inline constexpr std::size_t kNumOps = 16;

// Local gradient contributions, one per input in input order.
// Unary ops leave the second slot at 0.
using Grads = std::array<double, 2>;

using ForwardFn  = double (*)(double a, double b);
using BackwardFn = Grads  (*)(double g, double a, double b);

struct OpInfo {
  OpKind kind;
  const char* name;    // "Add", "Sin", ...
  const char* symbol;  // "+", "sin", ...
  std::size_t arity;   // 1 or 2
  ForwardFn forward;   // throws DomainError outside the domain
  BackwardFn backward; // pure; never throws
};

const OpInfo& op_info(OpKind k);

std::size_t arity(OpKind k);
const char* symbol(OpKind k);
const char* name(OpKind k);

// Forward value. For unary kinds b is ignored.
double forward(OpKind k, double a, double b = 0.0);

// Vector-Jacobian product at (a, b) for upstream gradient g.
Grads backward(OpKind k, double g, double a, double b = 0.0);

} // namespace sg
