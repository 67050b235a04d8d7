#ifndef ENGINECONFIG_HPP
#define ENGINECONFIG_HPP

#include <cstddef>

#include "hashengine.hpp"
#include "log.hpp"
#include "md5calculator.hpp"

/**
 * @brief Runtime settings of the command line tool
 *
 * Defaults match the engine's own defaults, so a default constructed
 * EngineConfig reproduces the behaviour without any option.
 */
struct EngineConfig {
  int concurrency = HashEngine::defaultConcurrency();
  std::size_t chunkSize = Md5Calculator::kChunkSize;
  bool showProgress = true;
  LogConfig log;
};

#endif // ENGINECONFIG_HPP
