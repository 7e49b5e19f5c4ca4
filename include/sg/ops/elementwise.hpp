#pragma once
#include "sg/core/value.hpp"

namespace sg {

// Arithmetic. Either side may be a Value or a numeric literal.
Value add(const Operand& a, const Operand& b);
Value sub(const Operand& a, const Operand& b);
Value mul(const Operand& a, const Operand& b);
Value div(const Operand& a, const Operand& b);
Value neg(const Operand& x);
Value pow(const Operand& base, const Operand& exponent);

// Transcendentals. Named with a 'v' suffix to avoid clashes with <cmath>.
Value expv(const Operand& x);
Value logv(const Operand& x);    // DomainError for x <= 0
Value sinv(const Operand& x);
Value cosv(const Operand& x);
Value tanv(const Operand& x);    // DomainError where cos(x) == 0
Value cotv(const Operand& x);    // DomainError where tan(x) == 0
Value sinhv(const Operand& x);
Value coshv(const Operand& x);
Value tanhv(const Operand& x);
Value cothv(const Operand& x);   // DomainError at x == 0

// Infix forms.
Value operator+(const Operand& a, const Operand& b);
Value operator-(const Operand& a, const Operand& b);
Value operator*(const Operand& a, const Operand& b);
Value operator/(const Operand& a, const Operand& b);
Value operator-(const Value& x);

} // namespace sg
