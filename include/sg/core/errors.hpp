#pragma once
#include <stdexcept>
#include <string>

namespace sg {

// Forward input outside the function's mathematical domain
// (log of non-positive, tan/cot/coth at an asymptote, division by zero).
struct DomainError : public std::domain_error {
  explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

// Operand that is neither a node nor a numeric literal.
struct TypeCoercionError : public std::invalid_argument {
  explicit TypeCoercionError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace sg
