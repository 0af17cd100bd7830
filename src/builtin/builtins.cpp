#include "builtin/builtins.h"

#include <cmath>
#include <complex>

namespace mapa::builtin {

namespace {

using runtime::Number;

// Real functions read the real part of their argument; in the real domain no
// complex value can reach them.
template <typename Fn>
runtime::UnaryCallable Real(Fn fn) {
  return [fn](const Number& x) { return Number::Real(fn(x.AsReal())); };
}

template <typename Fn>
runtime::UnaryCallable Complex(Fn fn) {
  return [fn](const Number& z) { return Number::Complex(fn(z.AsComplex())); };
}

runtime::UnaryFunctionTable RealUnaryFunctions() {
  return {
      {"exp", Real([](double x) { return std::exp(x); })},
      {"expm1", Real([](double x) { return std::expm1(x); })},
      {"log", Real([](double x) { return std::log(x); })},
      {"log1p", Real([](double x) { return std::log1p(x); })},
      {"log2", Real([](double x) { return std::log2(x); })},
      {"log10", Real([](double x) { return std::log10(x); })},
      {"sqrt", Real([](double x) { return std::sqrt(x); })},
      {"asin", Real([](double x) { return std::asin(x); })},
      {"acos", Real([](double x) { return std::acos(x); })},
      {"atan", Real([](double x) { return std::atan(x); })},
      {"cos", Real([](double x) { return std::cos(x); })},
      {"sin", Real([](double x) { return std::sin(x); })},
      {"tan", Real([](double x) { return std::tan(x); })},
      {"fabs", Real([](double x) { return std::fabs(x); })},
      {"floor",
       [](const Number& x) {
         return x.is_integer() ? x : runtime::IntegralOrReal(std::floor(x.AsReal()));
       }},
      {"ceil",
       [](const Number& x) {
         return x.is_integer() ? x : runtime::IntegralOrReal(std::ceil(x.AsReal()));
       }},
  };
}

runtime::UnaryFunctionTable ComplexUnaryFunctions() {
  using C = std::complex<double>;
  return {
      {"phase", [](const Number& z) { return Number::Real(std::arg(z.AsComplex())); }},
      // Polar coordinates packed as |z| + arg(z)j.
      {"polar",
       [](const Number& z) {
         C c = z.AsComplex();
         return Number::Complex(C(std::abs(c), std::arg(c)));
       }},
      {"exp", Complex([](C z) { return std::exp(z); })},
      {"log", Complex([](C z) { return std::log(z); })},
      {"log10", Complex([](C z) { return std::log10(z); })},
      {"sqrt", Complex([](C z) { return std::sqrt(z); })},
      {"asin", Complex([](C z) { return std::asin(z); })},
      {"acos", Complex([](C z) { return std::acos(z); })},
      {"atan", Complex([](C z) { return std::atan(z); })},
      {"cos", Complex([](C z) { return std::cos(z); })},
      {"sin", Complex([](C z) { return std::sin(z); })},
      {"tan", Complex([](C z) { return std::tan(z); })},
  };
}

}  // namespace

runtime::ConstantTable DefaultConstants() {
  return {
      {"pi", Number::Real(std::acos(-1.0))},
      {"e", Number::Real(std::exp(1.0))},
  };
}

runtime::UnaryFunctionTable DefaultUnaryFunctions(runtime::NumericDomain domain) {
  if (domain == runtime::NumericDomain::kComplex) {
    return ComplexUnaryFunctions();
  }
  return RealUnaryFunctions();
}

runtime::BinaryFunctionTable DefaultBinaryFunctions(runtime::NumericDomain domain) {
  if (domain == runtime::NumericDomain::kComplex) {
    using C = std::complex<double>;
    return {
        {"rect",
         [](const Number& r, const Number& phi) {
           const double radius = r.AsReal();
           const double angle = phi.AsReal();
           return Number::Complex(C(radius * std::cos(angle), radius * std::sin(angle)));
         }},
        {"log",
         [](const Number& x, const Number& base) {
           return Number::Complex(std::log(x.AsComplex()) / std::log(base.AsComplex()));
         }},
    };
  }
  return {
      {"pow",
       [](const Number& x, const Number& y) {
         return Number::Real(std::pow(x.AsReal(), y.AsReal()));
       }},
      {"atan2",
       [](const Number& y, const Number& x) {
         return Number::Real(std::atan2(y.AsReal(), x.AsReal()));
       }},
      {"log",
       [](const Number& x, const Number& base) {
         return Number::Real(std::log(x.AsReal()) / std::log(base.AsReal()));
       }},
  };
}

}  // namespace mapa::builtin
