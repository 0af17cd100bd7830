#ifndef MAPA_RUNTIME_OPS_H_
#define MAPA_RUNTIME_OPS_H_

#include <functional>

#include "runtime/number.h"

namespace mapa::runtime {

using UnaryCallable = std::function<Number(const Number&)>;
using BinaryCallable = std::function<Number(const Number&, const Number&)>;

// Arithmetic never throws: division by zero and roots of negatives follow IEEE
// (inf/nan) or std::complex conventions.
Number Add(const Number& lhs, const Number& rhs);
Number Subtract(const Number& lhs, const Number& rhs);
Number Multiply(const Number& lhs, const Number& rhs);
/// Always real or complex, even for two integers.
Number Divide(const Number& lhs, const Number& rhs);
/// Integer base and non-negative integer exponent stay integer while they fit. A negative
/// real base with a fractional exponent gives NaN in the real domain and the principal
/// complex value in the complex domain.
Number Power(const Number& base, const Number& exponent,
             NumericDomain domain = NumericDomain::kReal);
/// n-th root: `radicand ^ (1 / degree)`.
Number Root(const Number& degree, const Number& radicand,
            NumericDomain domain = NumericDomain::kReal);
Number Negate(const Number& operand);
/// `operand ^ 0.5`.
Number SquareRoot(const Number& operand, NumericDomain domain = NumericDomain::kReal);

/// Integer when `value` is integral and fits in 64 bits, real otherwise.
Number IntegralOrReal(double value);

}  // namespace mapa::runtime

#endif  // MAPA_RUNTIME_OPS_H_
