#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include "expr/expression.h"

namespace mapa::expr {

namespace {

// Highest priority any operator uses; a right operand formatted at this level
// brackets every binary operation.
constexpr int kMaxPriority = 7;

bool NeedsBrackets(int parent_priority, int own_priority, bool readable) {
  return !readable || parent_priority > own_priority;
}

/// Priority passed to the right operand so that right-nested chains of the same
/// level keep their brackets: `a-(b-c)`, `a/(b/c)`, `2^(3^2)`.
int RightOperandPriority(BinaryOp op) {
  switch (op) {
    case BinaryOp::kSubtract:
    case BinaryOp::kDivide:
      return Priority(op) + 1;
    case BinaryOp::kPower:
    case BinaryOp::kRoot:
      return kMaxPriority;
    case BinaryOp::kAdd:
    case BinaryOp::kMultiply:
      return Priority(op);
  }
  return Priority(op);
}

// Real leaf in canonical form: inf and nan are written as divisions that fold back to them.
std::string CanonicalReal(double value) {
  if (std::isnan(value)) return "(0/0)";
  if (std::isinf(value)) return value < 0 ? "(-1/0)" : "(1/0)";
  return runtime::FormatReal(value, false);
}

// Imaginary part as a signed term: `+2j`, `-1e999j`, `+(1e999j-1e999j)` for nan.
std::string CanonicalImaginaryTerm(double value) {
  if (std::isnan(value)) return "+(1e999j-1e999j)";
  if (std::isinf(value)) return value < 0 ? "-1e999j" : "+1e999j";
  if (std::signbit(value)) return "-" + runtime::FormatReal(-value, false) + "j";
  return "+" + runtime::FormatReal(value, false) + "j";
}

// Canonical text of a number that does not read back from its display form.
std::optional<std::string> CanonicalSpecialNumber(const runtime::Number& number) {
  switch (number.kind) {
    case runtime::NumberKind::kInteger:
      // The positive literal 9223372036854775808 does not fit in an integer.
      if (number.i64 == std::numeric_limits<int64_t>::min()) {
        return std::string("(-9223372036854775807-1)");
      }
      return std::nullopt;
    case runtime::NumberKind::kReal:
      if (std::isfinite(number.f64)) return std::nullopt;
      return CanonicalReal(number.f64);
    case runtime::NumberKind::kComplex: {
      const double re = number.complex.real();
      const double im = number.complex.imag();
      if (std::isfinite(re) && std::isfinite(im)) return std::nullopt;
      return "(" + CanonicalReal(re) + CanonicalImaginaryTerm(im) + ")";
    }
  }
  return std::nullopt;
}

std::string FormatNumber(const runtime::Number& number, int parent_priority, bool readable) {
  if (!readable) {
    if (auto special = CanonicalSpecialNumber(number)) {
      return *special;
    }
  }
  std::string text = number.ToString();
  // A leading minus sign reads like a unary negation.
  if (!text.empty() && text[0] == '-' &&
      NeedsBrackets(parent_priority, Priority(UnaryOp::kNegate), readable)) {
    return "(" + text + ")";
  }
  return text;
}

struct FormatVisitor {
  int parent_priority;
  bool readable;

  std::string operator()(const Variable& node) const { return node.name; }

  std::string operator()(const UnaryOperation& node) const {
    const int own = Priority(node.op);
    std::string text = Symbol(node.op) + Format(node.operand, own, readable);
    return NeedsBrackets(parent_priority, own, readable) ? "(" + text + ")" : text;
  }

  std::string operator()(const BinaryOperation& node) const {
    const int own = Priority(node.op);
    std::string text = Format(node.lhs, own, readable) + Symbol(node.op) +
                       Format(node.rhs, RightOperandPriority(node.op), readable);
    return NeedsBrackets(parent_priority, own, readable) ? "(" + text + ")" : text;
  }

  std::string operator()(const UnaryFunction& node) const {
    return node.name + "(" + Format(node.operand, 0, readable) + ")";
  }

  std::string operator()(const BinaryFunction& node) const {
    return node.name + "(" + Format(node.lhs, 0, readable) + "," + Format(node.rhs, 0, readable) +
           ")";
  }
};

}  // namespace

int Priority(UnaryOp op) {
  switch (op) {
    case UnaryOp::kNegate:
      return 3;
    case UnaryOp::kSquareRoot:
      return 7;
  }
  return 0;
}

int Priority(BinaryOp op) {
  // '-' above '+' and '/' above '*' only to decide bracketing on output.
  switch (op) {
    case BinaryOp::kAdd:
      return 0;
    case BinaryOp::kSubtract:
      return 1;
    case BinaryOp::kMultiply:
      return 3;
    case BinaryOp::kDivide:
      return 4;
    case BinaryOp::kPower:
      return 5;
    case BinaryOp::kRoot:
      return 6;
  }
  return 0;
}

const char* Symbol(UnaryOp op) {
  switch (op) {
    case UnaryOp::kNegate:
      return "-";
    case UnaryOp::kSquareRoot:
      return "%";
  }
  return "?";
}

const char* Symbol(BinaryOp op) {
  switch (op) {
    case BinaryOp::kAdd:
      return "+";
    case BinaryOp::kSubtract:
      return "-";
    case BinaryOp::kMultiply:
      return "*";
    case BinaryOp::kDivide:
      return "/";
    case BinaryOp::kPower:
      return "^";
    case BinaryOp::kRoot:
      return "%";
  }
  return "?";
}

std::string Format(const Value& value, int parent_priority, bool readable) {
  if (value.is_number()) {
    return FormatNumber(value.number(), parent_priority, readable);
  }
  return std::visit(FormatVisitor{parent_priority, readable}, value.expression().node());
}

std::string Value::ToString() const {
  return Format(*this, 0, true);
}

std::string Value::ToCanonicalString() const {
  return Format(*this, 0, false);
}

}  // namespace mapa::expr
