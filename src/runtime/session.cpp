#include "runtime/session.h"

#include <string>
#include <utility>

#include "builtin/builtins.h"
#include "util/log.h"

namespace mapa::runtime {

const char* NumericDomainName(NumericDomain domain) {
  switch (domain) {
    case NumericDomain::kReal:
      return "real";
    case NumericDomain::kComplex:
      return "complex";
  }
  return "real";
}

Session::Session(SessionOptions options)
    : domain_(options.domain),
      allow_assignment_(options.allow_assignment),
      allow_free_variables_(options.allow_free_variables),
      env_(options.constants ? std::move(*options.constants) : builtin::DefaultConstants(),
           options.unary_functions ? std::move(*options.unary_functions)
                                   : builtin::DefaultUnaryFunctions(options.domain),
           options.binary_functions ? std::move(*options.binary_functions)
                                    : builtin::DefaultBinaryFunctions(options.domain),
           std::move(options.initial_variables)) {
  util::LogRecord rec;
  rec.level = util::LogLevel::kDebug;
  rec.component = "session";
  rec.message = std::string("created session domain=") + NumericDomainName(domain_) +
                " assignment=" + (allow_assignment_ ? "on" : "off") +
                " free_variables=" + (allow_free_variables_ ? "on" : "off");
  util::Log(rec);
}

}  // namespace mapa::runtime
