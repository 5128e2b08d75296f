/**
 * @file logging.hpp
 * @brief Library logging over spdlog
 *
 * Compiled in when JWSIGN_ENABLE_LOGGING is defined; the macros expand to
 * nothing otherwise. Messages go to the spdlog logger named "jwsign", which
 * applications may register themselves or replace with setLogger() to route
 * library output into their own sinks. The initial level is "error" unless
 * the JWSIGN_LOG_LEVEL environment variable names another one.
 *
 * Secrets and signature bytes are never logged.
 */

#pragma once

#include <string_view>

#ifdef JWSIGN_ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>
#endif

namespace jwsign {
namespace logging {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL, OFF };

constexpr std::string_view LOGGER_NAME = "jwsign";
constexpr const char* LEVEL_ENV_VAR = "JWSIGN_LOG_LEVEL";

#ifdef JWSIGN_ENABLE_LOGGING

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) { logger_->set_level(toSpdlog(level)); }

  /**
   * @brief Set the level by name ("trace" ... "critical", "off")
   * @return false if the name is not a level; the level is left unchanged
   */
  bool setLogLevel(std::string_view name) {
    auto level = spdlog::level::from_str(std::string(name));
    // from_str reports unknown names as off
    if (level == spdlog::level::off && name != "off") {
      return false;
    }
    logger_->set_level(level);
    return true;
  }

  /**
   * @brief Send library messages to an application-owned logger
   *
   * Not synchronized with concurrent logging; call during start-up.
   */
  void setLogger(std::shared_ptr<spdlog::logger> logger) {
    if (logger) {
      logger_ = std::move(logger);
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

 private:
  Logger() {
    logger_ = spdlog::get(std::string(LOGGER_NAME));
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt(std::string(LOGGER_NAME));
      logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
      logger_->set_level(spdlog::level::err);
    }
    if (const char* env = std::getenv(LEVEL_ENV_VAR)) {
      setLogLevel(env);
    }
  }

  static spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        return spdlog::level::trace;
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::CRITICAL:
        return spdlog::level::critical;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::err;
  }

  std::shared_ptr<spdlog::logger> logger_;
};

#else

// Keeps callers compiling when logging is compiled out
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLevel(LogLevel) {}
  bool setLogLevel(std::string_view) { return false; }
};

#endif

}  // namespace logging
}  // namespace jwsign

#ifdef JWSIGN_ENABLE_LOGGING
#define JWSIGN_LOG_TRACE(...) \
  jwsign::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define JWSIGN_LOG_DEBUG(...) \
  jwsign::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define JWSIGN_LOG_INFO(...) \
  jwsign::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define JWSIGN_LOG_WARN(...) \
  jwsign::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define JWSIGN_LOG_ERROR(...) \
  jwsign::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define JWSIGN_LOG_CRITICAL(...) \
  jwsign::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)
#else
#define JWSIGN_LOG_TRACE(...)
#define JWSIGN_LOG_DEBUG(...)
#define JWSIGN_LOG_INFO(...)
#define JWSIGN_LOG_WARN(...)
#define JWSIGN_LOG_ERROR(...)
#define JWSIGN_LOG_CRITICAL(...)
#endif
