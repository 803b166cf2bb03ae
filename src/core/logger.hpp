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
  // Top-level components
  CORE,
  CONFIG,

  // Pipeline stages
  ADMISSION,
  ROUTING,
  INDEX,
  CACHE,
  EVAL,
  BATCH,
  TUNER,
  BUFFER,
  DISPATCH,

  // IO sub-components
  IO_RULES,
  IO_EVENTS,
  IO_ACTIONS,

  METRICS
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(levels_mutex_);
    log_levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(levels_mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return false;

    return level >= it->second;
  }

  // Serializes whole lines so records from worker threads never interleave
  std::mutex &output_mutex() { return output_mutex_; }

private:
  LogManager() = default; // Private constructor for singleton
  std::map<LogComponent, LogLevel> log_levels_;
  mutable std::mutex levels_mutex_;
  std::mutex output_mutex_;
};

// --- The Core Logging Macro ---
// It's a macro so that if `should_log` returns false, the message and its
// arguments are never even evaluated.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto log_now = std::chrono::system_clock::now();                         \
      auto time_t_now = std::chrono::system_clock::to_time_t(log_now);         \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(     \
                    log_now.time_since_epoch()) %                              \
                1000;                                                          \
      std::tm tm_utc{};                                                        \
      gmtime_r(&time_t_now, &tm_utc);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      std::lock_guard<std::mutex> log_output_lock(                             \
          LogManager::instance().output_mutex());                              \
      std::cout << oss.str() << std::endl;                                     \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

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
  case LogComponent::ADMISSION:
    return "PIPELINE.ADMISSION";
  case LogComponent::ROUTING:
    return "PIPELINE.ROUTING";
  case LogComponent::INDEX:
    return "PIPELINE.INDEX";
  case LogComponent::CACHE:
    return "PIPELINE.CACHE";
  case LogComponent::EVAL:
    return "PIPELINE.EVAL";
  case LogComponent::BATCH:
    return "PIPELINE.BATCH";
  case LogComponent::TUNER:
    return "PIPELINE.TUNER";
  case LogComponent::BUFFER:
    return "PIPELINE.BUFFER";
  case LogComponent::DISPATCH:
    return "PIPELINE.DISPATCH";
  case LogComponent::IO_RULES:
    return "IO.RULES";
  case LogComponent::IO_EVENTS:
    return "IO.EVENTS";
  case LogComponent::IO_ACTIONS:
    return "IO.ACTIONS";
  case LogComponent::METRICS:
    return "METRICS";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
