#include "runtime/number.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace mapa::runtime {

namespace {

bool SameReal(double a, double b) {
  if (std::isnan(a) && std::isnan(b)) return true;
  return a == b;
}

}  // namespace

double Number::AsReal() const {
  switch (kind) {
    case NumberKind::kInteger:
      return static_cast<double>(i64);
    case NumberKind::kReal:
      return f64;
    case NumberKind::kComplex:
      return complex.real();
  }
  return f64;
}

std::complex<double> Number::AsComplex() const {
  if (kind == NumberKind::kComplex) {
    return complex;
  }
  return {AsReal(), 0.0};
}

bool Number::operator==(const Number& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case NumberKind::kInteger:
      return i64 == other.i64;
    case NumberKind::kReal:
      return SameReal(f64, other.f64);
    case NumberKind::kComplex:
      return SameReal(complex.real(), other.complex.real()) &&
             SameReal(complex.imag(), other.complex.imag());
  }
  return false;
}

std::string FormatReal(double value, bool force_point) {
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

  // Find the fewest significant digits that read back to the same double.
  char buf[64];
  int digits = 1;
  for (; digits <= 17; ++digits) {
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
    if (std::strtod(buf, nullptr) == value) break;
  }
  if (digits > 17) digits = 17;
  std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, value);
  const char* exp_pos = std::strchr(buf, 'e');
  int exponent = exp_pos ? std::atoi(exp_pos + 1) : 0;

  if (exponent < -4 || exponent >= 16) {
    return buf;
  }
  int decimals = digits - 1 - exponent;
  if (decimals < 0) decimals = 0;
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  std::string out(buf);
  if (force_point && out.find('.') == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string Number::ToString() const {
  switch (kind) {
    case NumberKind::kInteger:
      return std::to_string(i64);
    case NumberKind::kReal:
      return FormatReal(f64);
    case NumberKind::kComplex: {
      std::string imag = FormatReal(complex.imag(), false) + "j";
      if (complex.real() == 0.0 && !std::signbit(complex.real())) {
        return imag;
      }
      std::string sign = (std::signbit(complex.imag()) && !std::isnan(complex.imag())) ? "" : "+";
      return "(" + FormatReal(complex.real(), false) + sign + imag + ")";
    }
  }
  return "";
}

}  // namespace mapa::runtime
