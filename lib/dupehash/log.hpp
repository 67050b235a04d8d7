/**
 * @file log.hpp
 * @brief Shared spdlog logger for the engine and the command line tool
 */

#ifndef LOG_HPP
#define LOG_HPP

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

/**
 * @brief Logging settings
 *
 * An empty file path disables the file sink. The rotating file sink keeps
 * maxFiles backups of at most maxFileSize bytes each.
 */
struct LogConfig {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string filePath;
  std::size_t maxFileSize = 2 * 1024 * 1024;
  std::size_t maxFiles = 3;
  bool console = true;
};

/**
 * @class Log
 * @brief Owns the named "dupehash" logger
 *
 * Until configure() is called, logger() returns a colored stderr logger at
 * info level. configure() replaces it with one built from a LogConfig.
 *
 * Example usage:
 * @code
 * Log::logger()->warn("Failed to hash {}: {}", path, error);
 * @endcode
 */
class Log {
public:
  static constexpr const char *kLoggerName = "dupehash";

  static std::shared_ptr<spdlog::logger> logger();

  /**
   * @brief Rebuilds the logger from the given settings
   *
   * @throws spdlog::spdlog_ex if the log file cannot be created
   */
  static void configure(const LogConfig &config);

  /**
   * @brief Parses "trace", "debug", "info", "warn", "error", "critical" or "off"
   * @return false if the name is unknown (level is left untouched)
   */
  static bool parseLevel(const std::string &name,
                         spdlog::level::level_enum &level);
};

#endif // LOG_HPP
