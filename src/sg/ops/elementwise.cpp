#include "sg/ops/elementwise.hpp"

namespace sg {
using detail::apply;

Value add(const Operand& a, const Operand& b) { return apply(OpKind::Add, a, b); }
Value sub(const Operand& a, const Operand& b) { return apply(OpKind::Sub, a, b); }
Value mul(const Operand& a, const Operand& b) { return apply(OpKind::Mul, a, b); }
Value div(const Operand& a, const Operand& b) { return apply(OpKind::Div, a, b); }
Value neg(const Operand& x) { return apply(OpKind::Neg, x); }
Value pow(const Operand& base, const Operand& exponent) { return apply(OpKind::Pow, base, exponent); }

Value expv(const Operand& x)  { return apply(OpKind::Exp,  x); }
Value logv(const Operand& x)  { return apply(OpKind::Log,  x); }
Value sinv(const Operand& x)  { return apply(OpKind::Sin,  x); }
Value cosv(const Operand& x)  { return apply(OpKind::Cos,  x); }
Value tanv(const Operand& x)  { return apply(OpKind::Tan,  x); }
Value cotv(const Operand& x)  { return apply(OpKind::Cot,  x); }
Value sinhv(const Operand& x) { return apply(OpKind::Sinh, x); }
Value coshv(const Operand& x) { return apply(OpKind::Cosh, x); }
Value tanhv(const Operand& x) { return apply(OpKind::Tanh, x); }
Value cothv(const Operand& x) { return apply(OpKind::Coth, x); }

Value operator+(const Operand& a, const Operand& b) { return add(a, b); }
Value operator-(const Operand& a, const Operand& b) { return sub(a, b); }
Value operator*(const Operand& a, const Operand& b) { return mul(a, b); }
Value operator/(const Operand& a, const Operand& b) { return div(a, b); }
Value operator-(const Value& x) { return neg(x); }

} // namespace sg
