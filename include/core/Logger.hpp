/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Traverse {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Traverse - [%s] %s: %s\n", system, getLevelString(level), message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define TRAVERSE_CRITICAL(system, msg)                                         \
  Traverse::Logger::Log(Traverse::LogLevel::CRITICAL, system, msg)
#define TRAVERSE_ERROR(system, msg)                                            \
  Traverse::Logger::Log(Traverse::LogLevel::ERROR_LEVEL, system, msg)
#define TRAVERSE_WARN(system, msg)                                             \
  Traverse::Logger::Log(Traverse::LogLevel::WARNING, system, msg)
#define TRAVERSE_INFO(system, msg)                                             \
  Traverse::Logger::Log(Traverse::LogLevel::INFO, system, msg)
#define TRAVERSE_DEBUG(system, msg)                                            \
  Traverse::Logger::Log(Traverse::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - only CRITICAL and ERROR survive, written to a log file
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Defined in Logger.cpp
  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define TRAVERSE_CRITICAL(system, msg)                                         \
  Traverse::Logger::Log("CRITICAL", system, msg)

#define TRAVERSE_ERROR(system, msg) Traverse::Logger::Log("ERROR", system, msg)

#define TRAVERSE_WARN(system, msg) ((void)0)  // Zero overhead
#define TRAVERSE_INFO(system, msg) ((void)0)  // Zero overhead
#define TRAVERSE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

} // namespace Traverse

// Per-subsystem convenience macros

#define PHYSICS_CRITICAL(msg) TRAVERSE_CRITICAL("PhysicsWorld", msg)
#define PHYSICS_ERROR(msg) TRAVERSE_ERROR("PhysicsWorld", msg)
#define PHYSICS_WARN(msg) TRAVERSE_WARN("PhysicsWorld", msg)
#define PHYSICS_INFO(msg) TRAVERSE_INFO("PhysicsWorld", msg)
#define PHYSICS_DEBUG(msg) TRAVERSE_DEBUG("PhysicsWorld", msg)

#define MOVER_CRITICAL(msg) TRAVERSE_CRITICAL("Mover", msg)
#define MOVER_ERROR(msg) TRAVERSE_ERROR("Mover", msg)
#define MOVER_WARN(msg) TRAVERSE_WARN("Mover", msg)
#define MOVER_INFO(msg) TRAVERSE_INFO("Mover", msg)
#define MOVER_DEBUG(msg) TRAVERSE_DEBUG("Mover", msg)

#define TRIGGER_CRITICAL(msg) TRAVERSE_CRITICAL("TriggerDispatcher", msg)
#define TRIGGER_ERROR(msg) TRAVERSE_ERROR("TriggerDispatcher", msg)
#define TRIGGER_WARN(msg) TRAVERSE_WARN("TriggerDispatcher", msg)
#define TRIGGER_INFO(msg) TRAVERSE_INFO("TriggerDispatcher", msg)
#define TRIGGER_DEBUG(msg) TRAVERSE_DEBUG("TriggerDispatcher", msg)

#define ENTITY_CRITICAL(msg) TRAVERSE_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) TRAVERSE_ERROR("Entity", msg)
#define ENTITY_WARN(msg) TRAVERSE_WARN("Entity", msg)
#define ENTITY_INFO(msg) TRAVERSE_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) TRAVERSE_DEBUG("Entity", msg)

#define SETTINGS_CRITICAL(msg) TRAVERSE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) TRAVERSE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) TRAVERSE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) TRAVERSE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) TRAVERSE_DEBUG("SettingsManager", msg)

#endif // LOGGER_HPP
