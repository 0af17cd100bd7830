#ifndef MAPA_LEXER_LEXER_H_
#define MAPA_LEXER_LEXER_H_

#include <string>

#include "lexer/token.h"
#include "util/error.h"

namespace mapa::lexer {

class Lexer {
 public:
  /// Initializes a lexer over the provided source string. Imaginary literals
  /// (`2j`) are accepted only when `allow_imaginary` is set.
  explicit Lexer(const std::string& source, bool allow_imaginary = false);

  /// Returns the next token, throwing util::LexicalError on an illegal character
  /// and util::CapabilityError on a disallowed imaginary literal. Once the input
  /// is exhausted every call returns kEof.
  Token NextToken();

  /// Rewinds to the start of the input.
  void Reset();

 private:
  char Peek() const;
  char PeekAt(size_t offset) const;
  char Advance();
  bool IsAtEnd() const;
  void SkipWhitespace();
  bool AtExponent() const;
  Token NumberToken();
  Token IdentifierToken();
  Token SeparatorToken();

  std::string source_;
  bool allow_imaginary_;
  size_t index_;
  int line_;
  int column_;
};

}  // namespace mapa::lexer

#endif  // MAPA_LEXER_LEXER_H_
