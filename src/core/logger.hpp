#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  CORE,
  CONFIG,

  // Input
  SERIES,

  // Calculation stages
  AVERAGE,
  DEGREE_HOUR,
  GATE,
  SEASON,
  BINNING,
  AGGREGATE,

  // Orchestration
  SCENARIO,
  BATCH
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;

    return level >= it->second;
  }

  // Serializes whole lines so worker threads do not interleave output
  void write_line(const std::string &line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line << std::endl;
  }

private:
  LogManager() = default;
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex mutex_;
  std::mutex output_mutex_;
};

// Macro so that a disabled level never evaluates the message expression
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm utc_tm{};                                                        \
      gmtime_r(&time_t_now, &utc_tm);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write_line(oss.str());                            \
    }                                                                          \
  } while (0)

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::SERIES:
    return "SERIES";
  case LogComponent::AVERAGE:
    return "CALC.AVERAGE";
  case LogComponent::DEGREE_HOUR:
    return "CALC.DEGREE_HOUR";
  case LogComponent::GATE:
    return "CALC.GATE";
  case LogComponent::SEASON:
    return "CALC.SEASON";
  case LogComponent::BINNING:
    return "CALC.BINNING";
  case LogComponent::AGGREGATE:
    return "CALC.AGGREGATE";
  case LogComponent::SCENARIO:
    return "RUN.SCENARIO";
  case LogComponent::BATCH:
    return "RUN.BATCH";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
