// Entry point for the mapa-calc command-line calculator.
#include <cstring>
#include <iostream>
#include <utility>

#include "repl/repl.h"
#include "runtime/session.h"

namespace {

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [--complex] [--no-vars] [--unknown]\n"
            << "  --complex   switch on complex number mode\n"
            << "  --no-vars   switch off use of variables\n"
            << "  --unknown   allow expressions with unknown variables\n";
}

}  // namespace

int main(int argc, char** argv) {
  mapa::runtime::SessionOptions options;
  // Unlike the library default, the calculator rejects unknown names unless asked.
  options.allow_free_variables = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--complex") == 0) {
      options.domain = mapa::runtime::NumericDomain::kComplex;
    } else if (std::strcmp(argv[i], "--no-vars") == 0) {
      options.allow_assignment = false;
    } else if (std::strcmp(argv[i], "--unknown") == 0) {
      options.allow_free_variables = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      PrintUsage(argv[0]);
      return 2;
    }
  }

  mapa::repl::Repl repl(std::move(options));
  repl.Run();
  return 0;
}
