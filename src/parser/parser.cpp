#include "parser/parser.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include "util/log.h"

namespace mapa::parser {

namespace {

void LogParseEvent(util::LogLevel level, const std::string& message, int line, int column) {
  util::LogRecord rec;
  rec.level = level;
  rec.component = "parser";
  rec.message = message;
  rec.line = line;
  rec.column = column;
  util::Log(rec);
}

}  // namespace

Parser::Parser(lexer::Lexer lexer, runtime::Session& session)
    : lexer_(std::move(lexer)),
      session_(session),
      current_(lexer_.NextToken()),
      lookahead_(lexer_.NextToken()),
      previous_{lexer::TokenType::kEof, "", 0, 0} {}

const lexer::Token& Parser::Peek() const {
  return current_;
}

const lexer::Token& Parser::Next() const {
  return lookahead_;
}

const lexer::Token& Parser::Previous() const {
  return previous_;
}

lexer::Token Parser::Advance() {
  previous_ = current_;
  current_ = lookahead_;
  if (current_.type != lexer::TokenType::kEof) {
    lookahead_ = lexer_.NextToken();
  }
  return previous_;
}

bool Parser::Match(lexer::TokenType type) {
  if (Peek().type == type) {
    Advance();
    return true;
  }
  return false;
}

void Parser::Consume(lexer::TokenType type) {
  if (Peek().type == type) {
    Advance();
    return;
  }
  FailAt(Peek());
}

runtime::NumericDomain Parser::Domain() const {
  return session_.domain();
}

void Parser::FailAt(const lexer::Token& token) const {
  std::string where;
  switch (token.type) {
    case lexer::TokenType::kEof:
      where = "end of input";
      break;
    case lexer::TokenType::kSeparator:
      where = "end of line";
      break;
    default:
      where = "'" + token.lexeme + "'";
      break;
  }
  throw util::SyntaxError("Syntax error at " + where, token.line, token.column);
}

std::optional<expr::Value> Parser::ParseProgram() {
  std::optional<expr::Value> result;
  while (true) {
    std::optional<expr::Value> value = Line();
    if (value.has_value()) {
      result = std::move(value);
    }
    if (Match(lexer::TokenType::kSeparator)) {
      continue;
    }
    if (Peek().type != lexer::TokenType::kEof) {
      FailAt(Peek());
    }
    break;
  }
  Commit();
  return result;
}

std::optional<expr::Value> Parser::Line() {
  if (Peek().type == lexer::TokenType::kSeparator || Peek().type == lexer::TokenType::kEof) {
    return std::nullopt;
  }
  if (Peek().type == lexer::TokenType::kIdentifier &&
      Next().type == lexer::TokenType::kAssign) {
    return Assignment();
  }
  return ExpressionRule();
}

expr::Value Parser::Assignment() {
  lexer::Token target = Advance();
  Advance();  // '='
  expr::Value value = ExpressionRule();
  if (!session_.allow_assignment()) {
    throw util::CapabilityError("Assignment not supported", target.line, target.column);
  }
  staged_.insert_or_assign(target.lexeme, value);
  return value;
}

expr::Value Parser::ExpressionRule() {
  expr::Value value = Term();
  while (true) {
    if (Match(lexer::TokenType::kPlus)) {
      value = expr::ReduceBinary(expr::BinaryOp::kAdd, std::move(value), Term(), Domain());
      continue;
    }
    if (Match(lexer::TokenType::kMinus)) {
      value =
          expr::ReduceBinary(expr::BinaryOp::kSubtract, std::move(value), Term(), Domain());
      continue;
    }
    break;
  }
  return value;
}

expr::Value Parser::Term() {
  expr::Value value = Unary();
  while (true) {
    if (Match(lexer::TokenType::kStar)) {
      value =
          expr::ReduceBinary(expr::BinaryOp::kMultiply, std::move(value), Unary(), Domain());
      continue;
    }
    if (Match(lexer::TokenType::kSlash)) {
      value =
          expr::ReduceBinary(expr::BinaryOp::kDivide, std::move(value), Unary(), Domain());
      continue;
    }
    break;
  }
  return value;
}

expr::Value Parser::Unary() {
  if (Match(lexer::TokenType::kMinus)) {
    return expr::ReduceUnary(expr::UnaryOp::kNegate, Unary(), Domain());
  }
  return Power();
}

expr::Value Parser::Power() {
  expr::Value value = Root();
  while (true) {
    if (Match(lexer::TokenType::kCaret)) {
      value = expr::ReduceBinary(expr::BinaryOp::kPower, std::move(value), PowerOperand(),
                                 Domain());
      continue;
    }
    if (Match(lexer::TokenType::kPercent)) {
      value = expr::ReduceBinary(expr::BinaryOp::kRoot, std::move(value), PowerOperand(),
                                 Domain());
      continue;
    }
    break;
  }
  return value;
}

// Right of '^', '%' or unary '%': a leading minus takes the following power chain
// as its operand, so 2^-3^2 is 2^(-(3^2)).
expr::Value Parser::PowerOperand() {
  if (Peek().type == lexer::TokenType::kMinus) {
    return Unary();
  }
  return Root();
}

expr::Value Parser::Root() {
  if (Match(lexer::TokenType::kPercent)) {
    return expr::ReduceUnary(expr::UnaryOp::kSquareRoot, PowerOperand(), Domain());
  }
  return Primary();
}

expr::Value Parser::Primary() {
  if (Match(lexer::TokenType::kInteger) || Match(lexer::TokenType::kFloat)) {
    return NumberLiteral(Previous());
  }
  if (Match(lexer::TokenType::kIdentifier)) {
    lexer::Token name = Previous();
    if (Peek().type == lexer::TokenType::kLParen) {
      return FinishCall(name);
    }
    return Identifier(name);
  }
  if (Match(lexer::TokenType::kLParen)) {
    expr::Value value = ExpressionRule();
    Consume(lexer::TokenType::kRParen);
    return value;
  }
  FailAt(Peek());
}

expr::Value Parser::NumberLiteral(const lexer::Token& token) const {
  const std::string& lexeme = token.lexeme;
  if (token.type == lexer::TokenType::kInteger) {
    errno = 0;
    long long value = std::strtoll(lexeme.c_str(), nullptr, 10);
    if (errno != ERANGE) {
      return runtime::Number::Integer(static_cast<int64_t>(value));
    }
    return runtime::Number::Real(std::strtod(lexeme.c_str(), nullptr));
  }
  if (!lexeme.empty() && lexeme.back() == 'j') {
    double imag = std::strtod(lexeme.substr(0, lexeme.size() - 1).c_str(), nullptr);
    return runtime::Number::Complex({0.0, imag});
  }
  return runtime::Number::Real(std::strtod(lexeme.c_str(), nullptr));
}

// Variables shadow constants; unknown names become free variables when allowed.
expr::Value Parser::Identifier(const lexer::Token& token) const {
  const std::string& name = token.lexeme;
  auto staged = staged_.find(name);
  if (staged != staged_.end()) {
    return staged->second;
  }
  const runtime::Environment& env = session_.environment();
  if (auto variable = env.GetVariable(name)) {
    return *variable;
  }
  if (auto constant = env.GetConstant(name)) {
    return *constant;
  }
  if (session_.allow_free_variables()) {
    return expr::Expression::MakeVariable(name);
  }
  throw util::NameResolutionError("Unknown variable or constant " + name, name, token.line,
                                  token.column);
}

expr::Value Parser::FinishCall(const lexer::Token& callee) {
  Consume(lexer::TokenType::kLParen);
  expr::Value first = ExpressionRule();
  std::optional<expr::Value> second;
  if (Match(lexer::TokenType::kComma)) {
    second = ExpressionRule();
  }
  Consume(lexer::TokenType::kRParen);

  const std::string& name = callee.lexeme;
  const runtime::Environment& env = session_.environment();
  if (!second.has_value()) {
    const runtime::UnaryCallable* fn = env.FindUnaryFunction(name);
    if (fn == nullptr) {
      throw util::NameResolutionError("Unknown univariate function " + name, name, callee.line,
                                      callee.column);
    }
    return expr::ReduceCall(name, *fn, std::move(first));
  }
  const runtime::BinaryCallable* fn = env.FindBinaryFunction(name);
  if (fn == nullptr) {
    throw util::NameResolutionError("Unknown bivariate function " + name, name, callee.line,
                                    callee.column);
  }
  return expr::ReduceCall(name, *fn, std::move(first), std::move(*second));
}

void Parser::Commit() {
  runtime::Environment& env = session_.environment();
  for (const auto& [name, value] : staged_) {
    env.Define(name, value);
    LogParseEvent(util::LogLevel::kDebug, "assigned " + name + " = " + value.ToString(), 0, 0);
  }
  staged_.clear();
}

std::optional<expr::Value> Parse(runtime::Session& session, const std::string& source) {
  try {
    lexer::Lexer lex(source, session.domain() == runtime::NumericDomain::kComplex);
    Parser parser(std::move(lex), session);
    return parser.ParseProgram();
  } catch (const util::Error& err) {
    LogParseEvent(util::LogLevel::kDebug, std::string("parse failed: ") + err.what(), err.line(),
                  err.column());
    throw;
  }
}

}  // namespace mapa::parser
