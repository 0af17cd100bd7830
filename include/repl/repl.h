#ifndef MAPA_REPL_REPL_H_
#define MAPA_REPL_REPL_H_

#include <iostream>
#include <string>

#include "parser/parser.h"
#include "runtime/session.h"
#include "util/string.h"

namespace mapa::repl {

class Repl {
 public:
  /// Creates the calculator loop around a session built from `options`.
  explicit Repl(runtime::SessionOptions options = runtime::SessionOptions());

  /// Reads lines from std::cin until EOF, "exit" or "quit".
  void Run();

  /// Processes one line; returns true when the loop should terminate.
  bool ProcessLine(const std::string& line);

  runtime::Session& session() { return session_; }

 private:
  runtime::Session session_;
};

}  // namespace mapa::repl

#endif  // MAPA_REPL_REPL_H_
