#ifndef MAPA_PARSER_PARSER_H_
#define MAPA_PARSER_PARSER_H_

#include <optional>
#include <string>
#include <unordered_map>

#include "expr/expression.h"
#include "lexer/lexer.h"
#include "runtime/session.h"
#include "util/error.h"

namespace mapa::parser {

/// Recursive-descent parser that folds concrete operands into numbers and builds
/// expression nodes around unbound variables as it reduces each rule.
///
/// Priority, low to high: `+ -`, `* /`, unary `-`, binary `^ %`, unary `%`.
/// All binary operators are left-associative. A parser is built for one parse of
/// one session and keeps no state between parses.
class Parser {
 public:
  /// Builds a parser reading from `lexer` and resolving names against `session`.
  Parser(lexer::Lexer lexer, runtime::Session& session);

  /// Parses lines separated by ';' or newlines and returns the value of the last
  /// non-empty one (std::nullopt when every line is empty). Assignments are
  /// committed to the session only if the whole program parses.
  std::optional<expr::Value> ParseProgram();

 private:
  const lexer::Token& Peek() const;
  const lexer::Token& Next() const;
  const lexer::Token& Previous() const;
  lexer::Token Advance();
  bool Match(lexer::TokenType type);
  void Consume(lexer::TokenType type);
  [[noreturn]] void FailAt(const lexer::Token& token) const;
  runtime::NumericDomain Domain() const;

  std::optional<expr::Value> Line();
  expr::Value Assignment();
  expr::Value ExpressionRule();
  expr::Value Term();
  expr::Value Unary();
  expr::Value Power();
  expr::Value PowerOperand();
  expr::Value Root();
  expr::Value Primary();
  expr::Value NumberLiteral(const lexer::Token& token) const;
  expr::Value Identifier(const lexer::Token& token) const;
  expr::Value FinishCall(const lexer::Token& callee);
  void Commit();

  lexer::Lexer lexer_;
  runtime::Session& session_;
  lexer::Token current_;
  lexer::Token lookahead_;
  lexer::Token previous_;
  // Assignments made by earlier lines of the program, applied by Commit().
  std::unordered_map<std::string, expr::Value> staged_;
};

/// Parses `source` against `session`. Throws a util::Error subclass on failure,
/// leaving the session unchanged.
std::optional<expr::Value> Parse(runtime::Session& session, const std::string& source);

}  // namespace mapa::parser

#endif  // MAPA_PARSER_PARSER_H_
