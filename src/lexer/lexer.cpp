#include "lexer/lexer.h"

#include <cctype>

namespace mapa::lexer {

namespace {

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool IsIdentifierStart(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool IsIdentifierPart(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

constexpr size_t kContextLength = 10;

}  // namespace

const char* TokenTypeName(TokenType type) {
  switch (type) {
    case TokenType::kEof:
      return "end of input";
    case TokenType::kSeparator:
      return "separator";
    case TokenType::kAssign:
      return "'='";
    case TokenType::kLParen:
      return "'('";
    case TokenType::kRParen:
      return "')'";
    case TokenType::kComma:
      return "','";
    case TokenType::kPlus:
      return "'+'";
    case TokenType::kMinus:
      return "'-'";
    case TokenType::kStar:
      return "'*'";
    case TokenType::kSlash:
      return "'/'";
    case TokenType::kCaret:
      return "'^'";
    case TokenType::kPercent:
      return "'%'";
    case TokenType::kInteger:
      return "integer";
    case TokenType::kFloat:
      return "number";
    case TokenType::kIdentifier:
      return "identifier";
  }
  return "token";
}

Lexer::Lexer(const std::string& source, bool allow_imaginary)
    : source_(source), allow_imaginary_(allow_imaginary), index_(0), line_(1), column_(1) {}

void Lexer::Reset() {
  index_ = 0;
  line_ = 1;
  column_ = 1;
}

char Lexer::Peek() const {
  return PeekAt(0);
}

char Lexer::PeekAt(size_t offset) const {
  if (index_ + offset >= source_.size()) {
    return '\0';
  }
  return source_[index_ + offset];
}

char Lexer::Advance() {
  char ch = Peek();
  ++index_;
  if (ch == '\n') {
    ++line_;
    column_ = 1;
  } else {
    ++column_;
  }
  return ch;
}

bool Lexer::IsAtEnd() const {
  return index_ >= source_.size();
}

void Lexer::SkipWhitespace() {
  while (!IsAtEnd()) {
    char ch = Peek();
    if (ch == ' ' || ch == '\t' || ch == '\r') {
      Advance();
    } else {
      break;
    }
  }
}

bool Lexer::AtExponent() const {
  if (Peek() != 'e' && Peek() != 'E') {
    return false;
  }
  if (IsDigit(PeekAt(1))) {
    return true;
  }
  return (PeekAt(1) == '+' || PeekAt(1) == '-') && IsDigit(PeekAt(2));
}

Token Lexer::NumberToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  bool is_integer = true;
  while (IsDigit(Peek())) {
    lexeme.push_back(Advance());
  }
  if (Peek() == '.') {
    is_integer = false;
    lexeme.push_back(Advance());
    while (IsDigit(Peek())) {
      lexeme.push_back(Advance());
    }
  }
  if (AtExponent()) {
    is_integer = false;
    lexeme.push_back(Advance());
    if (Peek() == '+' || Peek() == '-') {
      lexeme.push_back(Advance());
    }
    while (IsDigit(Peek())) {
      lexeme.push_back(Advance());
    }
  }
  if (Peek() == 'j') {
    if (!allow_imaginary_) {
      throw util::CapabilityError("Complex numbers not supported: " + lexeme + "j", token_line,
                                  token_column);
    }
    is_integer = false;
    lexeme.push_back(Advance());
  }
  return Token{is_integer ? TokenType::kInteger : TokenType::kFloat, lexeme, token_line,
               token_column};
}

Token Lexer::IdentifierToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  while (IsIdentifierPart(Peek())) {
    lexeme.push_back(Advance());
  }
  return Token{TokenType::kIdentifier, lexeme, token_line, token_column};
}

Token Lexer::SeparatorToken() {
  int token_line = line_;
  int token_column = column_;
  std::string lexeme;
  // A run of ';' and newlines (with blanks between them) is a single separator.
  while (true) {
    SkipWhitespace();
    if (Peek() != ';' && Peek() != '\n') {
      break;
    }
    lexeme.push_back(Advance());
  }
  return Token{TokenType::kSeparator, lexeme, token_line, token_column};
}

Token Lexer::NextToken() {
  SkipWhitespace();
  int token_line = line_;
  int token_column = column_;

  if (IsAtEnd()) {
    return Token{TokenType::kEof, "", token_line, token_column};
  }

  char ch = Peek();
  if (ch == ';' || ch == '\n') {
    return SeparatorToken();
  }
  if (IsDigit(ch) || (ch == '.' && IsDigit(PeekAt(1)))) {
    return NumberToken();
  }
  if (IsIdentifierStart(ch)) {
    return IdentifierToken();
  }

  Advance();
  switch (ch) {
    case '+':
      return Token{TokenType::kPlus, "+", token_line, token_column};
    case '-':
      return Token{TokenType::kMinus, "-", token_line, token_column};
    case '*':
      if (Peek() == '*') {
        Advance();
        return Token{TokenType::kCaret, "^", token_line, token_column};
      }
      return Token{TokenType::kStar, "*", token_line, token_column};
    case '/':
      return Token{TokenType::kSlash, "/", token_line, token_column};
    case '^':
      return Token{TokenType::kCaret, "^", token_line, token_column};
    case '%':
      return Token{TokenType::kPercent, "%", token_line, token_column};
    case ',':
      return Token{TokenType::kComma, ",", token_line, token_column};
    case '=':
      return Token{TokenType::kAssign, "=", token_line, token_column};
    case '(':
      return Token{TokenType::kLParen, "(", token_line, token_column};
    case ')':
      return Token{TokenType::kRParen, ")", token_line, token_column};
    default:
      break;
  }

  throw util::LexicalError(ch, source_.substr(index_ - 1, kContextLength), token_line,
                           token_column);
}

}  // namespace mapa::lexer
