#ifndef MAPA_UTIL_ERROR_H_
#define MAPA_UTIL_ERROR_H_

#include <stdexcept>
#include <string>

namespace mapa::util {

class Error : public std::runtime_error {
 public:
  /// Creates an error with message and source location (1-based line/column).
  Error(const std::string& message, int line, int column)
      : std::runtime_error(message), line_(line), column_(column) {}

  /// Line where the error was detected.
  int line() const { return line_; }
  /// Column where the error was detected.
  int column() const { return column_; }

  /// Returns a human-readable string with location context.
  std::string formatted() const {
    return "Error at " + std::to_string(line_) + ":" + std::to_string(column_) + " - " + what();
  }

 private:
  int line_;
  int column_;
};

/// Illegal character in the input text.
class LexicalError : public Error {
 public:
  LexicalError(char character, const std::string& context, int line, int column)
      : Error("Illegal character '" + std::string(1, character) + "' near \"... " + context +
                  "...\"",
              line, column),
        character_(character),
        context_(context) {}

  char character() const { return character_; }
  /// Up to ten characters of input starting at the offending one.
  const std::string& context() const { return context_; }

 private:
  char character_;
  std::string context_;
};

/// Malformed token sequence.
class SyntaxError : public Error {
 public:
  using Error::Error;
};

/// Unknown variable, constant or function.
class NameResolutionError : public Error {
 public:
  NameResolutionError(const std::string& message, const std::string& name, int line, int column)
      : Error(message, line, column), name_(name) {}

  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

/// A feature disabled by the session configuration was used.
class CapabilityError : public Error {
 public:
  using Error::Error;
};

}  // namespace mapa::util

#endif  // MAPA_UTIL_ERROR_H_
