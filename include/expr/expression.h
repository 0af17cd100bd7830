#ifndef MAPA_EXPR_EXPRESSION_H_
#define MAPA_EXPR_EXPRESSION_H_

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

#include "runtime/number.h"
#include "runtime/ops.h"

// Symbolic expression trees produced when a parse leaves variables unbound.

namespace mapa::expr {

class Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;
using Bindings = std::unordered_map<std::string, runtime::Number>;

/// Result of a parse or an evaluation: a concrete number or an immutable tree.
class Value {
 public:
  Value(runtime::Number number) : data_(number) {}
  Value(ExpressionPtr expression) : data_(std::move(expression)) {}

  bool is_number() const { return std::holds_alternative<runtime::Number>(data_); }
  bool is_expression() const { return !is_number(); }

  const runtime::Number& number() const { return std::get<runtime::Number>(data_); }
  const ExpressionPtr& expression_ptr() const { return std::get<ExpressionPtr>(data_); }
  const Expression& expression() const { return *expression_ptr(); }

  /// Readable form with minimal brackets.
  std::string ToString() const;
  /// Fully bracketed form that parses back to the same tree.
  std::string ToCanonicalString() const;

 private:
  std::variant<runtime::Number, ExpressionPtr> data_;
};

enum class UnaryOp { kNegate, kSquareRoot };
enum class BinaryOp { kAdd, kSubtract, kMultiply, kDivide, kPower, kRoot };

/// Named unknown.
struct Variable {
  std::string name;
};

/// `-x` or `%x` (square root). `domain` is the number system of the session that built
/// the node and is used again when Evaluate folds it.
struct UnaryOperation {
  UnaryOp op;
  Value operand;
  runtime::NumericDomain domain = runtime::NumericDomain::kReal;
};

/// Infix arithmetic; for kRoot the left operand is the degree.
struct BinaryOperation {
  BinaryOp op;
  Value lhs;
  Value rhs;
  runtime::NumericDomain domain = runtime::NumericDomain::kReal;
};

/// Call of a one-argument function resolved at parse time.
struct UnaryFunction {
  std::string name;
  runtime::UnaryCallable function;
  Value operand;
};

/// Call of a two-argument function resolved at parse time.
struct BinaryFunction {
  std::string name;
  runtime::BinaryCallable function;
  Value lhs;
  Value rhs;
};

class Expression {
 public:
  using Node =
      std::variant<Variable, UnaryOperation, BinaryOperation, UnaryFunction, BinaryFunction>;

  explicit Expression(Node node) : node_(std::move(node)) {}

  static ExpressionPtr MakeVariable(std::string name);
  static ExpressionPtr MakeUnary(UnaryOp op, Value operand,
                                 runtime::NumericDomain domain = runtime::NumericDomain::kReal);
  static ExpressionPtr MakeBinary(BinaryOp op, Value lhs, Value rhs,
                                  runtime::NumericDomain domain = runtime::NumericDomain::kReal);
  static ExpressionPtr MakeCall(std::string name, runtime::UnaryCallable function, Value operand);
  static ExpressionPtr MakeCall(std::string name, runtime::BinaryCallable function, Value lhs,
                                Value rhs);

  const Node& node() const { return node_; }

 private:
  Node node_;
};

// Fold-or-build: apply the operator when every operand is concrete, otherwise
// wrap the operands in a new node. Shared by the parser and Evaluate.
Value ReduceUnary(UnaryOp op, Value operand,
                  runtime::NumericDomain domain = runtime::NumericDomain::kReal);
Value ReduceBinary(BinaryOp op, Value lhs, Value rhs,
                   runtime::NumericDomain domain = runtime::NumericDomain::kReal);
Value ReduceCall(const std::string& name, const runtime::UnaryCallable& function, Value operand);
Value ReduceCall(const std::string& name, const runtime::BinaryCallable& function, Value lhs,
                 Value rhs);

runtime::Number Apply(UnaryOp op, const runtime::Number& operand,
                      runtime::NumericDomain domain = runtime::NumericDomain::kReal);
runtime::Number Apply(BinaryOp op, const runtime::Number& lhs, const runtime::Number& rhs,
                      runtime::NumericDomain domain = runtime::NumericDomain::kReal);

/// Substitutes bound variables and folds every subtree that becomes concrete.
/// Operator nodes fold in the domain they were built in. Never modifies `value`; an
/// unbound Variable is returned as the same node.
Value Evaluate(const Value& value, const Bindings& bindings);

/// Names of the unbound variables reachable from `value`.
std::set<std::string> FreeVariables(const Value& value);

/// True when both values have the same shape, operators, function names and numbers.
bool StructurallyEqual(const Value& lhs, const Value& rhs);

int Priority(UnaryOp op);
int Priority(BinaryOp op);
const char* Symbol(UnaryOp op);
const char* Symbol(BinaryOp op);

/// Renders `value` for a parent of `parent_priority`. Brackets are added when the
/// parent binds tighter, or always when `readable` is false.
std::string Format(const Value& value, int parent_priority, bool readable = true);

}  // namespace mapa::expr

#endif  // MAPA_EXPR_EXPRESSION_H_
