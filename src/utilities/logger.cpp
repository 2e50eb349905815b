#include "utilities/logger.h"

#include <nlohmann/json.hpp>

#include <cstdarg> // For va_list, va_start, va_end
#include <cstdio>  // For std::rename and std::remove
#include <ctime>
#include <new> // For std::bad_alloc
#include <string>

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

namespace {

// Replaces the singleton. Caller must hold the logger mutex.
void replaceInstance(Logger *&instance, Logger *next) {
  delete instance;
  instance = next;
}

} // namespace

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  try {
    replaceInstance(s_instance, new Logger(logFile, level, maxFileSizeVal,
                                           maxBackupFilesVal));
  } catch (const std::bad_alloc &bae) {
    replaceInstance(s_instance, nullptr);
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(). Falling back to console output."
              << std::endl;
    try {
      s_instance = new Logger(CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 0, 0);
    } catch (const std::bad_alloc &e) {
      std::cerr << "CRITICAL_ERROR: Emergency logger allocation failed: "
                << e.what() << std::endl;
    }
    if (!s_instance) {
      throw std::runtime_error("Logger not initialized. Call Logger::init() "
                               "first. Emergency init also failed.");
    }
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, message, LogFields{});
}

void Logger::log(LogLevel level, const std::string &message,
                 const LogFields &fields) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  nlohmann::json record;
  record["timestamp"] = getTimestamp();
  record["level"] = levelToString(level);
  record["message"] = message;
  if (!fields.empty()) {
    record["fields"] = fields;
  }
  // Invalid UTF-8 in tenant supplied names must not take the logger down.
  const std::string jsonLine =
      record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();

  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath =
        logFilePath + "." + std::to_string(maxBackupFiles + 1);
    std::remove(tooOldPath.c_str());

    for (int i = maxBackupFiles; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::remove(newPath.c_str());
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }

  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::trace(const char *format, ...) {
  char buffer[512];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);
  Logger::getInstance().log(LogLevel::TRACE, buffer);
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
