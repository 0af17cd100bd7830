#include "repl/repl.h"

#include <iostream>
#include <string>
#include <utility>

#include "util/log.h"

namespace mapa::repl {

Repl::Repl(runtime::SessionOptions options) : session_(std::move(options)) {}

void Repl::Run() {
  util::LogRecord rec;
  rec.level = util::LogLevel::kInfo;
  rec.component = "repl";
  rec.message = std::string("starting calculator in ") +
                runtime::NumericDomainName(session_.domain()) + " mode";
  util::Log(rec);

  std::cout << "Calculator\n";
  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    if (ProcessLine(line)) {
      break;
    }
  }
  std::cout << "\nGoodbye...\n";
}

bool Repl::ProcessLine(const std::string& line) {
  std::string trimmed = util::Trim(line);
  if (trimmed.empty()) {
    return false;
  }
  if (trimmed == "exit" || trimmed == "quit") {
    return true;
  }
  try {
    auto result = parser::Parse(session_, trimmed);
    if (result.has_value()) {
      std::cout << result->ToString() << "\n";
    }
  } catch (const util::Error& err) {
    std::cerr << "Error: " << err.what() << " (line " << err.line() << ", column "
              << err.column() << ")\n";
  } catch (const std::exception& ex) {
    std::cerr << "Unhandled error: " << ex.what() << "\n";
  }
  return false;
}

}  // namespace mapa::repl
