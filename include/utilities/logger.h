#pragma once
#ifndef CHUNKVAULT_LOGGER_H
#define CHUNKVAULT_LOGGER_H
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Structured key/value context attached to a log record.
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is written as a single JSON object containing
 * `timestamp`, `level`, `message` and, when present, a `fields` object.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &message, const LogFields &fields);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  static std::string levelToString(LogLevel level);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // CHUNKVAULT_LOGGER_H
