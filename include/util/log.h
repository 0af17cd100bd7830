#ifndef MAPA_UTIL_LOG_H_
#define MAPA_UTIL_LOG_H_

#include <string>

namespace mapa::util {

enum class LogLevel { kError, kWarn, kInfo, kDebug, kTrace };
enum class LogFormat { kText, kJson };

struct LogRecord {
  LogLevel level = LogLevel::kInfo;
  std::string component;
  std::string message;
  int line = 0;
  int column = 0;
};

const char* LogLevelName(LogLevel level);
std::string FormatLogLine(const LogRecord& record, LogFormat format);

/// Writes the record to stderr when MAPA_LOG / MAPA_LOG_LEVEL enable its level.
void Log(const LogRecord& record);
bool LogEnabled(LogLevel level);

}  // namespace mapa::util

#endif  // MAPA_UTIL_LOG_H_
