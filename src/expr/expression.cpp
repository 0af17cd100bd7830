#include "expr/expression.h"

#include <memory>
#include <set>
#include <string>
#include <utility>

namespace mapa::expr {

namespace {

// Each visitor handles every node kind, so adding a kind without updating the
// visitors fails to compile.

struct EvaluateVisitor {
  const ExpressionPtr& self;
  const Bindings& bindings;

  Value operator()(const Variable& node) const {
    auto it = bindings.find(node.name);
    if (it == bindings.end()) {
      return self;
    }
    return it->second;
  }

  Value operator()(const UnaryOperation& node) const {
    return ReduceUnary(node.op, Evaluate(node.operand, bindings), node.domain);
  }

  Value operator()(const BinaryOperation& node) const {
    return ReduceBinary(node.op, Evaluate(node.lhs, bindings), Evaluate(node.rhs, bindings),
                        node.domain);
  }

  Value operator()(const UnaryFunction& node) const {
    return ReduceCall(node.name, node.function, Evaluate(node.operand, bindings));
  }

  Value operator()(const BinaryFunction& node) const {
    return ReduceCall(node.name, node.function, Evaluate(node.lhs, bindings),
                      Evaluate(node.rhs, bindings));
  }
};

void CollectFreeVariables(const Value& value, std::set<std::string>* out);

struct FreeVariableVisitor {
  std::set<std::string>* out;

  void operator()(const Variable& node) const { out->insert(node.name); }
  void operator()(const UnaryOperation& node) const { CollectFreeVariables(node.operand, out); }
  void operator()(const BinaryOperation& node) const {
    CollectFreeVariables(node.lhs, out);
    CollectFreeVariables(node.rhs, out);
  }
  void operator()(const UnaryFunction& node) const { CollectFreeVariables(node.operand, out); }
  void operator()(const BinaryFunction& node) const {
    CollectFreeVariables(node.lhs, out);
    CollectFreeVariables(node.rhs, out);
  }
};

void CollectFreeVariables(const Value& value, std::set<std::string>* out) {
  if (value.is_number()) {
    return;
  }
  std::visit(FreeVariableVisitor{out}, value.expression().node());
}

bool SameNode(const Expression::Node& lhs, const Expression::Node& rhs) {
  if (lhs.index() != rhs.index()) {
    return false;
  }
  if (const auto* a = std::get_if<Variable>(&lhs)) {
    return a->name == std::get<Variable>(rhs).name;
  }
  if (const auto* a = std::get_if<UnaryOperation>(&lhs)) {
    const auto& b = std::get<UnaryOperation>(rhs);
    return a->op == b.op && StructurallyEqual(a->operand, b.operand);
  }
  if (const auto* a = std::get_if<BinaryOperation>(&lhs)) {
    const auto& b = std::get<BinaryOperation>(rhs);
    return a->op == b.op && StructurallyEqual(a->lhs, b.lhs) && StructurallyEqual(a->rhs, b.rhs);
  }
  if (const auto* a = std::get_if<UnaryFunction>(&lhs)) {
    const auto& b = std::get<UnaryFunction>(rhs);
    return a->name == b.name && StructurallyEqual(a->operand, b.operand);
  }
  const auto& a = std::get<BinaryFunction>(lhs);
  const auto& b = std::get<BinaryFunction>(rhs);
  return a.name == b.name && StructurallyEqual(a.lhs, b.lhs) && StructurallyEqual(a.rhs, b.rhs);
}

}  // namespace

ExpressionPtr Expression::MakeVariable(std::string name) {
  return std::make_shared<const Expression>(Variable{std::move(name)});
}

ExpressionPtr Expression::MakeUnary(UnaryOp op, Value operand, runtime::NumericDomain domain) {
  return std::make_shared<const Expression>(UnaryOperation{op, std::move(operand), domain});
}

ExpressionPtr Expression::MakeBinary(BinaryOp op, Value lhs, Value rhs,
                                     runtime::NumericDomain domain) {
  return std::make_shared<const Expression>(
      BinaryOperation{op, std::move(lhs), std::move(rhs), domain});
}

ExpressionPtr Expression::MakeCall(std::string name, runtime::UnaryCallable function,
                                   Value operand) {
  return std::make_shared<const Expression>(
      UnaryFunction{std::move(name), std::move(function), std::move(operand)});
}

ExpressionPtr Expression::MakeCall(std::string name, runtime::BinaryCallable function, Value lhs,
                                   Value rhs) {
  return std::make_shared<const Expression>(
      BinaryFunction{std::move(name), std::move(function), std::move(lhs), std::move(rhs)});
}

runtime::Number Apply(UnaryOp op, const runtime::Number& operand,
                      runtime::NumericDomain domain) {
  switch (op) {
    case UnaryOp::kNegate:
      return runtime::Negate(operand);
    case UnaryOp::kSquareRoot:
      return runtime::SquareRoot(operand, domain);
  }
  return operand;
}

runtime::Number Apply(BinaryOp op, const runtime::Number& lhs, const runtime::Number& rhs,
                      runtime::NumericDomain domain) {
  switch (op) {
    case BinaryOp::kAdd:
      return runtime::Add(lhs, rhs);
    case BinaryOp::kSubtract:
      return runtime::Subtract(lhs, rhs);
    case BinaryOp::kMultiply:
      return runtime::Multiply(lhs, rhs);
    case BinaryOp::kDivide:
      return runtime::Divide(lhs, rhs);
    case BinaryOp::kPower:
      return runtime::Power(lhs, rhs, domain);
    case BinaryOp::kRoot:
      return runtime::Root(lhs, rhs, domain);
  }
  return lhs;
}

Value ReduceUnary(UnaryOp op, Value operand, runtime::NumericDomain domain) {
  if (operand.is_number()) {
    return Apply(op, operand.number(), domain);
  }
  return Expression::MakeUnary(op, std::move(operand), domain);
}

Value ReduceBinary(BinaryOp op, Value lhs, Value rhs, runtime::NumericDomain domain) {
  if (lhs.is_number() && rhs.is_number()) {
    return Apply(op, lhs.number(), rhs.number(), domain);
  }
  return Expression::MakeBinary(op, std::move(lhs), std::move(rhs), domain);
}

Value ReduceCall(const std::string& name, const runtime::UnaryCallable& function, Value operand) {
  if (operand.is_number()) {
    return function(operand.number());
  }
  return Expression::MakeCall(name, function, std::move(operand));
}

Value ReduceCall(const std::string& name, const runtime::BinaryCallable& function, Value lhs,
                 Value rhs) {
  if (lhs.is_number() && rhs.is_number()) {
    return function(lhs.number(), rhs.number());
  }
  return Expression::MakeCall(name, function, std::move(lhs), std::move(rhs));
}

Value Evaluate(const Value& value, const Bindings& bindings) {
  if (value.is_number()) {
    return value;
  }
  return std::visit(EvaluateVisitor{value.expression_ptr(), bindings},
                    value.expression().node());
}

std::set<std::string> FreeVariables(const Value& value) {
  std::set<std::string> names;
  CollectFreeVariables(value, &names);
  return names;
}

bool StructurallyEqual(const Value& lhs, const Value& rhs) {
  if (lhs.is_number() || rhs.is_number()) {
    return lhs.is_number() && rhs.is_number() && lhs.number() == rhs.number();
  }
  if (lhs.expression_ptr() == rhs.expression_ptr()) {
    return true;
  }
  return SameNode(lhs.expression().node(), rhs.expression().node());
}

}  // namespace mapa::expr
