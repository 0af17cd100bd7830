#include <iostream>

#include "test_util.h"

namespace test {
void RunLexerTests(TestContext* ctx);
void RunNumberTests(TestContext* ctx);
void RunBuiltinTests(TestContext* ctx);
void RunSessionTests(TestContext* ctx);
void RunExpressionTests(TestContext* ctx);
void RunFormatTests(TestContext* ctx);
void RunParserTests(TestContext* ctx);
void RunScenarioTests(TestContext* ctx);
void RunUtilTests(TestContext* ctx);
void RunLogTests(TestContext* ctx);
void RunReplTests(TestContext* ctx);
}  // namespace test

int main() {
  test::TestContext ctx;
  test::RunLexerTests(&ctx);
  test::RunNumberTests(&ctx);
  test::RunBuiltinTests(&ctx);
  test::RunSessionTests(&ctx);
  test::RunExpressionTests(&ctx);
  test::RunFormatTests(&ctx);
  test::RunParserTests(&ctx);
  test::RunScenarioTests(&ctx);
  test::RunUtilTests(&ctx);
  test::RunLogTests(&ctx);
  test::RunReplTests(&ctx);

  std::cout << "[RESULT] passed=" << ctx.passed << " failed=" << ctx.failed << "\n";
  return ctx.failed == 0 ? 0 : 1;
}
