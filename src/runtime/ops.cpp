#include "runtime/ops.h"

#include <cmath>
#include <complex>
#include <cstdint>
#include <limits>

namespace mapa::runtime {

namespace {

NumberKind Promote(const Number& lhs, const Number& rhs) {
  if (lhs.is_complex() || rhs.is_complex()) return NumberKind::kComplex;
  if (lhs.is_integer() && rhs.is_integer()) return NumberKind::kInteger;
  return NumberKind::kReal;
}

bool PowerOverflows(int64_t base, int64_t exponent, int64_t* out) {
  int64_t result = 1;
  int64_t factor = base;
  while (exponent > 0) {
    if (exponent & 1) {
      if (__builtin_mul_overflow(result, factor, &result)) return true;
    }
    exponent >>= 1;
    if (exponent > 0 && __builtin_mul_overflow(factor, factor, &factor)) return true;
  }
  *out = result;
  return false;
}

Number RealPower(double base, double exponent, NumericDomain domain) {
  double out = std::pow(base, exponent);
  if (domain == NumericDomain::kComplex && std::isnan(out) && !std::isnan(base) &&
      !std::isnan(exponent)) {
    return Number::Complex(
        std::pow(std::complex<double>(base, 0.0), std::complex<double>(exponent, 0.0)));
  }
  return Number::Real(out);
}

}  // namespace

Number IntegralOrReal(double value) {
  // 2^63 is exactly representable; anything at or above it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (std::isfinite(value) && std::trunc(value) == value && value >= -kLimit && value < kLimit) {
    return Number::Integer(static_cast<int64_t>(value));
  }
  return Number::Real(value);
}

Number Add(const Number& lhs, const Number& rhs) {
  switch (Promote(lhs, rhs)) {
    case NumberKind::kInteger: {
      int64_t out = 0;
      if (!__builtin_add_overflow(lhs.i64, rhs.i64, &out)) return Number::Integer(out);
      return Number::Real(lhs.AsReal() + rhs.AsReal());
    }
    case NumberKind::kReal:
      return Number::Real(lhs.AsReal() + rhs.AsReal());
    case NumberKind::kComplex:
      return Number::Complex(lhs.AsComplex() + rhs.AsComplex());
  }
  return Number::Real(lhs.AsReal() + rhs.AsReal());
}

Number Subtract(const Number& lhs, const Number& rhs) {
  switch (Promote(lhs, rhs)) {
    case NumberKind::kInteger: {
      int64_t out = 0;
      if (!__builtin_sub_overflow(lhs.i64, rhs.i64, &out)) return Number::Integer(out);
      return Number::Real(lhs.AsReal() - rhs.AsReal());
    }
    case NumberKind::kReal:
      return Number::Real(lhs.AsReal() - rhs.AsReal());
    case NumberKind::kComplex:
      return Number::Complex(lhs.AsComplex() - rhs.AsComplex());
  }
  return Number::Real(lhs.AsReal() - rhs.AsReal());
}

Number Multiply(const Number& lhs, const Number& rhs) {
  switch (Promote(lhs, rhs)) {
    case NumberKind::kInteger: {
      int64_t out = 0;
      if (!__builtin_mul_overflow(lhs.i64, rhs.i64, &out)) return Number::Integer(out);
      return Number::Real(lhs.AsReal() * rhs.AsReal());
    }
    case NumberKind::kReal:
      return Number::Real(lhs.AsReal() * rhs.AsReal());
    case NumberKind::kComplex:
      return Number::Complex(lhs.AsComplex() * rhs.AsComplex());
  }
  return Number::Real(lhs.AsReal() * rhs.AsReal());
}

Number Divide(const Number& lhs, const Number& rhs) {
  if (Promote(lhs, rhs) == NumberKind::kComplex) {
    return Number::Complex(lhs.AsComplex() / rhs.AsComplex());
  }
  return Number::Real(lhs.AsReal() / rhs.AsReal());
}

Number Power(const Number& base, const Number& exponent, NumericDomain domain) {
  switch (Promote(base, exponent)) {
    case NumberKind::kInteger: {
      if (exponent.i64 >= 0) {
        int64_t out = 0;
        if (!PowerOverflows(base.i64, exponent.i64, &out)) return Number::Integer(out);
      }
      return RealPower(base.AsReal(), exponent.AsReal(), domain);
    }
    case NumberKind::kReal:
      return RealPower(base.AsReal(), exponent.AsReal(), domain);
    case NumberKind::kComplex:
      return Number::Complex(std::pow(base.AsComplex(), exponent.AsComplex()));
  }
  return RealPower(base.AsReal(), exponent.AsReal(), domain);
}

Number Root(const Number& degree, const Number& radicand, NumericDomain domain) {
  return Power(radicand, Divide(Number::Integer(1), degree), domain);
}

Number Negate(const Number& operand) {
  switch (operand.kind) {
    case NumberKind::kInteger:
      if (operand.i64 != std::numeric_limits<int64_t>::min()) {
        return Number::Integer(-operand.i64);
      }
      return Number::Real(-operand.AsReal());
    case NumberKind::kReal:
      return Number::Real(-operand.f64);
    case NumberKind::kComplex:
      return Number::Complex(-operand.complex);
  }
  return Number::Real(-operand.AsReal());
}

Number SquareRoot(const Number& operand, NumericDomain domain) {
  return Power(operand, Number::Real(0.5), domain);
}

}  // namespace mapa::runtime
