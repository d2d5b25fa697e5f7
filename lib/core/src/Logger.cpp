#include "upifinder/core/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace UPIFINDER {

namespace {

std::atomic<LogLevel> gLogLevel{LogLevel::INFO};
std::mutex gSinkMutex;
std::ofstream gLogFile;

}  // namespace

std::optional<LogLevel> ParseLogLevel(const std::string &text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return LogLevel::DEBUG;
  }
  if (lower == "info") {
    return LogLevel::INFO;
  }
  if (lower == "warning" || lower == "warn") {
    return LogLevel::WARNING;
  }
  if (lower == "error") {
    return LogLevel::ERROR;
  }
  return std::nullopt;
}

std::shared_ptr<Logger> Logger::GetLogger(const std::string &component) {
  static std::map<std::string, std::shared_ptr<Logger>> loggers;
  static std::mutex loggerMutex;

  std::lock_guard<std::mutex> lock(loggerMutex);

  auto it = loggers.find(component);
  if (it != loggers.end()) {
    return it->second;
  }

  auto logger = std::shared_ptr<Logger>(new Logger(component));
  loggers[component] = logger;
  return logger;
}

bool Logger::Initialize(LogLevel level, const std::string &logFile) {
  gLogLevel = level;

  std::lock_guard<std::mutex> lock(gSinkMutex);
  if (gLogFile.is_open()) {
    gLogFile.close();
  }
  if (logFile.empty()) {
    return true;
  }
  gLogFile.open(logFile, std::ios::out | std::ios::app);
  if (!gLogFile.is_open()) {
    std::cerr << "Failed to open log file: " << logFile << std::endl;
    return false;
  }
  return true;
}

void Logger::SetLogLevel(LogLevel level) { gLogLevel = level; }

LogLevel Logger::GetLogLevel() { return gLogLevel.load(); }

Logger::Logger(std::string component) : fComponent(std::move(component)) {}

bool Logger::Enabled(LogLevel level) const { return level >= gLogLevel.load(); }

void Logger::Debug(const std::string &message) {
  WriteLog(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string &message) {
  WriteLog(LogLevel::INFO, message);
}

void Logger::Warning(const std::string &message) {
  WriteLog(LogLevel::WARNING, message);
}

void Logger::Error(const std::string &message) {
  WriteLog(LogLevel::ERROR, message);
}

void Logger::Flush() {
  std::lock_guard<std::mutex> lock(gSinkMutex);
  std::clog.flush();
  if (gLogFile.is_open()) {
    gLogFile.flush();
  }
}

void Logger::WriteLog(LogLevel level, const std::string &message) {
  if (!Enabled(level)) {
    return;
  }

  std::string logEntry = "[" + GetTimestamp() + "] [" +
                         LogLevelToString(level) + "] [" + fComponent + "] " +
                         message;

  std::lock_guard<std::mutex> lock(gSinkMutex);
  std::clog << logEntry << '\n';
  if (gLogFile.is_open()) {
    gLogFile << logEntry << '\n';
  }
}

std::string Logger::GetTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm_now{};
  localtime_r(&time_t, &tm_now);

  std::ostringstream oss;
  oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

std::string Logger::LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

}  // namespace UPIFINDER
