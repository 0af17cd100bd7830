#ifndef MAPA_LEXER_TOKEN_H_
#define MAPA_LEXER_TOKEN_H_

#include <string>

namespace mapa::lexer {

enum class TokenType {
  kEof,
  kSeparator,
  kAssign,
  kLParen,
  kRParen,
  kComma,
  kPlus,
  kMinus,
  kStar,
  kSlash,
  kCaret,
  kPercent,
  kInteger,
  kFloat,
  kIdentifier,
};

/// A lexical token with type, original lexeme, and source location.
struct Token {
  TokenType type;
  std::string lexeme;
  int line;
  int column;
};

const char* TokenTypeName(TokenType type);

}  // namespace mapa::lexer

#endif  // MAPA_LEXER_TOKEN_H_
