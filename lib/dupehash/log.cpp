/**
 * @file log.cpp
 * @brief Construction of the shared spdlog logger
 */

#include "log.hpp"

#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::mutex g_logMutex;
std::shared_ptr<spdlog::logger> g_logger;

constexpr const char *kPattern = "%Y-%m-%d %H:%M:%S.%e [%l] %v";

} // namespace

std::shared_ptr<spdlog::logger> Log::logger() {
  std::lock_guard<std::mutex> lock(g_logMutex);
  if (!g_logger) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    g_logger->set_pattern(kPattern);
    g_logger->set_level(spdlog::level::info);
  }
  return g_logger;
}

void Log::configure(const LogConfig &config) {
  std::vector<spdlog::sink_ptr> sinks;

  if (config.console) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  if (!config.filePath.empty()) {
    auto parent = std::filesystem::path(config.filePath).parent_path();
    if (!parent.empty()) {
      // A failure here surfaces as spdlog_ex from the file sink below
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
    }
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        config.filePath, config.maxFileSize, config.maxFiles));
  }

  // Everything disabled: keep a valid logger that drops messages
  if (sinks.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
  }

  auto logger =
      std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  logger->set_level(config.level);
  logger->flush_on(spdlog::level::warn);

  std::lock_guard<std::mutex> lock(g_logMutex);
  g_logger = std::move(logger);
}

bool Log::parseLevel(const std::string &name,
                     spdlog::level::level_enum &level) {
  auto parsed = spdlog::level::from_str(name);
  // from_str() maps unknown names to "off"
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  level = parsed;
  return true;
}
