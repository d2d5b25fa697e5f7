#ifndef UPIFINDER_CORE_LOGGER_HPP
#define UPIFINDER_CORE_LOGGER_HPP

#include <cstdio>
#include <memory>
#include <optional>
#include <string>

namespace UPIFINDER {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (any case)
 */
std::optional<LogLevel> ParseLogLevel(const std::string &text);

/**
 * @brief Component logger
 *
 * Every line is "[timestamp] [LEVEL] [component] message". Lines at or
 * above the global level go to std::clog, and to the log file when one
 * was given to Initialize(). Writes from several threads are serialized.
 *
 * Usage:
 *   auto log = Logger::GetLogger("scanner");
 *   log->Info("scanning %zu roots", roots.size());
 */
class Logger {
public:
  // Get logger instance for component
  static std::shared_ptr<Logger> GetLogger(const std::string &component);

  /**
   * @brief Set the global level and optionally mirror output to a file
   * @return false if the log file cannot be opened
   */
  static bool Initialize(LogLevel level, const std::string &logFile = "");

  static void SetLogLevel(LogLevel level);
  static LogLevel GetLogLevel();

  void Debug(const std::string &message);
  void Info(const std::string &message);
  void Warning(const std::string &message);
  void Error(const std::string &message);

  // Log with format
  template <typename... Args>
  void Debug(const char *format, Args &&...args);

  template <typename... Args>
  void Info(const char *format, Args &&...args);

  template <typename... Args>
  void Warning(const char *format, Args &&...args);

  template <typename... Args>
  void Error(const char *format, Args &&...args);

  void Flush();

  const std::string &GetComponent() const { return fComponent; }

private:
  explicit Logger(std::string component);

  bool Enabled(LogLevel level) const;
  void WriteLog(LogLevel level, const std::string &message);
  static std::string GetTimestamp();
  static std::string LogLevelToString(LogLevel level);

  std::string fComponent;
};

template <typename... Args>
void Logger::Debug(const char *format, Args &&...args) {
  if (!Enabled(LogLevel::DEBUG)) {
    return;
  }
  char buffer[1024];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  Debug(std::string(buffer));
}

template <typename... Args>
void Logger::Info(const char *format, Args &&...args) {
  if (!Enabled(LogLevel::INFO)) {
    return;
  }
  char buffer[1024];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  Info(std::string(buffer));
}

template <typename... Args>
void Logger::Warning(const char *format, Args &&...args) {
  char buffer[1024];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  Warning(std::string(buffer));
}

template <typename... Args>
void Logger::Error(const char *format, Args &&...args) {
  char buffer[1024];
  std::snprintf(buffer, sizeof(buffer), format, args...);
  Error(std::string(buffer));
}

}  // namespace UPIFINDER

#endif  // UPIFINDER_CORE_LOGGER_HPP
