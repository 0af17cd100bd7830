#ifndef MAPA_RUNTIME_ENVIRONMENT_H_
#define MAPA_RUNTIME_ENVIRONMENT_H_

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "expr/expression.h"
#include "runtime/number.h"
#include "runtime/ops.h"

namespace mapa::runtime {

using ConstantTable = std::unordered_map<std::string, Number>;
using VariableTable = std::unordered_map<std::string, expr::Value>;
using UnaryFunctionTable = std::unordered_map<std::string, UnaryCallable>;
using BinaryFunctionTable = std::unordered_map<std::string, BinaryCallable>;

/// Name tables used while parsing. Only the variable table changes after construction.
class Environment {
 public:
  Environment(ConstantTable constants, UnaryFunctionTable unary_functions,
              BinaryFunctionTable binary_functions, VariableTable variables = {})
      : constants_(std::move(constants)),
        unary_functions_(std::move(unary_functions)),
        binary_functions_(std::move(binary_functions)),
        variables_(std::move(variables)) {}

  /// Stores or replaces a variable binding.
  void Define(const std::string& name, const expr::Value& value) {
    variables_.insert_or_assign(name, value);
  }

  /// Looks up a variable, returning std::nullopt if it is undefined.
  std::optional<expr::Value> GetVariable(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<Number> GetConstant(const std::string& name) const {
    auto it = constants_.find(name);
    if (it == constants_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  /// Returns nullptr when no one-argument function has this name.
  const UnaryCallable* FindUnaryFunction(const std::string& name) const {
    auto it = unary_functions_.find(name);
    return it == unary_functions_.end() ? nullptr : &it->second;
  }

  /// Returns nullptr when no two-argument function has this name.
  const BinaryCallable* FindBinaryFunction(const std::string& name) const {
    auto it = binary_functions_.find(name);
    return it == binary_functions_.end() ? nullptr : &it->second;
  }

  const VariableTable& variables() const { return variables_; }
  const ConstantTable& constants() const { return constants_; }

 private:
  ConstantTable constants_;
  UnaryFunctionTable unary_functions_;
  BinaryFunctionTable binary_functions_;
  VariableTable variables_;
};

}  // namespace mapa::runtime

#endif  // MAPA_RUNTIME_ENVIRONMENT_H_
