#ifndef MAPA_RUNTIME_NUMBER_H_
#define MAPA_RUNTIME_NUMBER_H_

#include <complex>
#include <cstdint>
#include <string>

namespace mapa::runtime {

enum class NumberKind { kInteger, kReal, kComplex };

/// Number system of a session. Complex sessions take principal complex values where
/// real arithmetic would give NaN.
enum class NumericDomain { kReal, kComplex };

/// A concrete numeric value. Integer results promote to real and real to complex when mixed.
struct Number {
  NumberKind kind = NumberKind::kInteger;
  // Only the slot matching `kind` is meaningful.
  int64_t i64 = 0;
  double f64 = 0.0;
  std::complex<double> complex = {0.0, 0.0};

  static Number Integer(int64_t v) {
    Number n;
    n.kind = NumberKind::kInteger;
    n.i64 = v;
    return n;
  }

  static Number Real(double v) {
    Number n;
    n.kind = NumberKind::kReal;
    n.f64 = v;
    return n;
  }

  static Number Complex(std::complex<double> v) {
    Number n;
    n.kind = NumberKind::kComplex;
    n.complex = v;
    return n;
  }

  bool is_integer() const { return kind == NumberKind::kInteger; }
  bool is_complex() const { return kind == NumberKind::kComplex; }

  /// Value as a double; the real part for complex numbers.
  double AsReal() const;
  std::complex<double> AsComplex() const;

  /// Python-style rendering: `8`, `2.5`, `3.0`, `1e+20`, `2j`, `(1-2j)`.
  std::string ToString() const;

  /// Same kind and same value; NaNs compare equal to each other.
  bool operator==(const Number& other) const;
  bool operator!=(const Number& other) const { return !(*this == other); }
};

/// Shortest round-tripping decimal form of a double. With `force_point` an integral
/// value keeps a trailing ".0".
std::string FormatReal(double value, bool force_point = true);

}  // namespace mapa::runtime

#endif  // MAPA_RUNTIME_NUMBER_H_
