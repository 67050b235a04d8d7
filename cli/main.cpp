#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "engineconfig.hpp"
#include "groupindex.hpp"
#include "hashengine.hpp"
#include "log.hpp"
#include "md5calculator.hpp"
#include "pathqueue.hpp"
#include "utils.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) { g_interrupted = 1; }

void printUsage() {
  std::cout
      << "Usage: dupehash-cli [options] <file|directory>...\n"
      << "  -j, --jobs N         number of files hashed in parallel (default: "
      << HashEngine::defaultConcurrency() << ")\n"
      << "      --log-file PATH  also write the log to a rotating file\n"
      << "      --log-level LVL  trace, debug, info, warn, error, off "
         "(default: info)\n"
      << "  -q, --quiet          no progress line\n"
      << "  -h, --help           show this help\n";
}

} // namespace

/**
 * @class Application
 * @brief Command line front end for duplicate detection by MD5
 *
 * Plays the part of the presentation layer: it fills a PathQueue from the
 * command line, submits it to a HashEngine, feeds every successful result
 * into a GroupIndex and finally prints the duplicate groups.
 *
 * Ctrl+C cancels the job. The files already being hashed report
 * "cancelled", the rest are skipped, and the groups found so far are still
 * printed.
 *
 * Exit codes
 *  - 0: every file was hashed
 *  - 2: at least one file failed or the run was cancelled
 */
class Application {
private:
  EngineConfig m_config;
  std::map<std::string, HashResult> m_results;
  GroupIndex m_groups;
  int m_failures = 0;

public:
  explicit Application(const EngineConfig &config) : m_config(config) {}

  int run(const std::vector<std::string> &inputs) {
    Md5Calculator md5(m_config.chunkSize);
    HashEngine engine(md5, m_config.concurrency);
    PathQueue queue(engine);

    auto added = queue.add(inputs);
    for (const auto &warning : added.warnings) {
      std::cerr << "Warning: " << warning << std::endl;
    }

    if (queue.empty()) {
      std::cout << "No files to hash." << std::endl;
      return added.warnings.empty() ? 0 : 2;
    }

    JobCallbacks callbacks;
    callbacks.onProgress = [this](int completed, int total) {
      if (m_config.showProgress) {
        std::cerr << "\rHashing " << completed << "/" << total << std::flush;
      }
    };
    callbacks.onResult = [this](const HashResult &result) {
      m_results.emplace(result.getPath(), result);
      if (result.isSuccess()) {
        m_groups.record(result.getPath(), result.getDigest());
      } else {
        ++m_failures;
      }
    };

    auto submission = engine.submit(queue.paths(), callbacks);
    if (!submission.ok()) {
      std::cerr << "Error: " << HashEngine::statusMessage(submission.status)
                << std::endl;
      return 2;
    }

    std::signal(SIGINT, onInterrupt);
    while (!submission.job->waitFor(std::chrono::milliseconds(100))) {
      if (g_interrupted) {
        submission.job->cancel();
      }
    }
    std::signal(SIGINT, SIG_DFL);

    if (m_config.showProgress) {
      std::cerr << std::endl;
    }

    const bool cancelled = submission.job->isCancelled();
    const int skipped = submission.job->total() - submission.job->completed();

    showFailures();
    showDuplicates();

    if (cancelled) {
      std::cout << "\nCancelled. " << skipped << " file(s) not processed."
                << std::endl;
    }

    return (cancelled || m_failures > 0 || !added.warnings.empty()) ? 2 : 0;
  }

private:
  void showFailures() const {
    if (m_failures == 0) {
      return;
    }

    std::cout << "\n--- Failed files (" << m_failures << ") ---" << std::endl;
    for (const auto &[path, result] : m_results) {
      if (!result.isSuccess()) {
        std::cout << "  " << path << ": " << result.getError() << std::endl;
      }
    }
  }

  void showDuplicates() const {
    std::cout << "\n--- Duplicate detection (MD5) ---" << std::endl;

    auto snapshot = m_groups.snapshot();
    std::vector<std::pair<std::string, GroupIndex::Group>> groups;
    for (const auto &[digest, group] : snapshot) {
      if (group.isDuplicate()) {
        groups.emplace_back(digest, group);
      }
    }
    std::sort(groups.begin(), groups.end(), [](const auto &a, const auto &b) {
      return a.second.id < b.second.id;
    });

    std::uint64_t wasted = 0;
    for (const auto &[digest, group] : groups) {
      std::cout << "\n# " << group.label() << " (MD5: " << digest << ", "
                << group.paths.size() << " files)" << std::endl;

      std::uint64_t size = 0;
      for (const auto &path : group.paths) {
        const HashResult &result = m_results.at(path);
        size = result.getFileSize();
        std::cout << "    -> " << path << " ("
                  << formatBytes(result.getFileSize()) << ", "
                  << formatDuration(result.getDuration()) << ")" << std::endl;
      }
      // Keep one copy, the rest is waste
      wasted += size * (group.paths.size() - 1);
    }

    if (groups.empty()) {
      std::cout << "\nNo duplicate groups found." << std::endl;
    } else {
      std::cout << "\nTotal " << groups.size() << " duplicate groups, "
                << formatBytes(wasted) << " reclaimable." << std::endl;
    }
  }
};

int main(int argc, char *argv[]) {
  EngineConfig config;
  std::vector<std::string> inputs;

  // Simple argument parser
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage();
      return 0;
    }

    if (arg == "-q" || arg == "--quiet") {
      config.showProgress = false;
    } else if (arg == "-j" || arg == "--jobs") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return 1;
      }
      config.concurrency = std::atoi(argv[++i]);
      if (config.concurrency < 1) {
        std::cerr << "Invalid job count: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "--log-file") {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return 1;
      }
      config.log.filePath = argv[++i];
    } else if (arg == "--log-level") {
      if (i + 1 >= argc || !Log::parseLevel(argv[i + 1], config.log.level)) {
        std::cerr << "Invalid log level" << std::endl;
        return 1;
      }
      ++i;
    } else {
      inputs.push_back(arg);
    }
  }

  if (inputs.empty()) {
    printUsage();
    return 1;
  }

  try {
    Log::configure(config.log);
    Application app(config);
    return app.run(inputs);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }
}
