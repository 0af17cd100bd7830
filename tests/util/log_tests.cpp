#include <sstream>

#include "test_util.h"
#include "util/log.h"

namespace test {

void RunLogTests(TestContext* ctx) {
  util::LogRecord rec;
  rec.level = util::LogLevel::kWarn;
  rec.component = "parser";
  rec.message = "say \"hi\"\n";
  rec.line = 2;
  rec.column = 5;

  ExpectEqual(util::FormatLogLine(rec, util::LogFormat::kText),
              "level=warn component=parser at=2:5 message=\"say \\\"hi\\\"\\n\"", "text_format",
              ctx);
  ExpectEqual(util::FormatLogLine(rec, util::LogFormat::kJson),
              "{\"level\":\"warn\",\"component\":\"parser\",\"line\":2,\"column\":5,"
              "\"message\":\"say \\\"hi\\\"\\n\"}",
              "json_format", ctx);

  util::LogRecord bare;
  bare.message = "ready";
  ExpectEqual(util::FormatLogLine(bare, util::LogFormat::kText), "level=info message=\"ready\"",
              "text_without_location", ctx);

  {
    ScopedEnvVar level("MAPA_LOG_LEVEL", "debug");
    ExpectTrue(util::LogEnabled(util::LogLevel::kDebug), "level_debug_enables_debug", ctx);
    ExpectTrue(!util::LogEnabled(util::LogLevel::kTrace), "level_debug_hides_trace", ctx);
  }
  {
    ScopedEnvVar level("MAPA_LOG_LEVEL", "ERROR");
    ExpectTrue(util::LogEnabled(util::LogLevel::kError), "level_case_insensitive", ctx);
    ExpectTrue(!util::LogEnabled(util::LogLevel::kWarn), "level_error_hides_warn", ctx);
  }

  {
    ScopedEnvVar level("MAPA_LOG_LEVEL", "debug");
    ScopedEnvVar format("MAPA_LOG_FORMAT", "json");
    std::ostringstream captured;
    std::streambuf* orig = std::cerr.rdbuf(captured.rdbuf());
    rt::Session session;
    ParseText("q = 7", &session);
    std::cerr.rdbuf(orig);
    ExpectTrue(captured.str().find("\"component\":\"parser\"") != std::string::npos,
               "parser_logs_assignment", ctx);
    ExpectTrue(captured.str().find("assigned q = 7") != std::string::npos,
               "assignment_log_message", ctx);
  }
}

}  // namespace test
