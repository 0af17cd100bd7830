#ifndef MAPA_BUILTIN_BUILTINS_H_
#define MAPA_BUILTIN_BUILTINS_H_

#include "runtime/environment.h"
#include "runtime/session.h"

namespace mapa::builtin {

/// Default constants: pi and e.
runtime::ConstantTable DefaultConstants();

/// Real domain: exp/log family, trigonometry, fabs, floor, ceil, sqrt.
/// Complex domain: exp/log family, trigonometry, sqrt, phase, polar.
runtime::UnaryFunctionTable DefaultUnaryFunctions(runtime::NumericDomain domain);

/// Real domain: pow, atan2, log(x, base). Complex domain: rect(r, phi), log(x, base).
runtime::BinaryFunctionTable DefaultBinaryFunctions(runtime::NumericDomain domain);

}  // namespace mapa::builtin

#endif  // MAPA_BUILTIN_BUILTINS_H_
