#ifndef MAPA_RUNTIME_SESSION_H_
#define MAPA_RUNTIME_SESSION_H_

#include <optional>

#include "runtime/environment.h"

namespace mapa::runtime {

const char* NumericDomainName(NumericDomain domain);

/// Configuration for a Session. Unset tables fall back to the builtin defaults
/// for the chosen domain.
struct SessionOptions {
  NumericDomain domain = NumericDomain::kReal;
  bool allow_assignment = true;
  bool allow_free_variables = true;
  VariableTable initial_variables;
  std::optional<ConstantTable> constants;
  std::optional<UnaryFunctionTable> unary_functions;
  std::optional<BinaryFunctionTable> binary_functions;
};

/// Fixed configuration plus the mutable variable table of one caller.
/// Not synchronized: callers sharing a session across threads must serialize access.
class Session {
 public:
  explicit Session(SessionOptions options = SessionOptions());

  NumericDomain domain() const { return domain_; }
  bool allow_assignment() const { return allow_assignment_; }
  bool allow_free_variables() const { return allow_free_variables_; }

  Environment& environment() { return env_; }
  const Environment& environment() const { return env_; }

 private:
  NumericDomain domain_;
  bool allow_assignment_;
  bool allow_free_variables_;
  Environment env_;
};

}  // namespace mapa::runtime

#endif  // MAPA_RUNTIME_SESSION_H_
