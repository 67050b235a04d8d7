/**
 * @file pathcollector.hpp
 * @brief Expansion of file and directory inputs into a unique file list
 *
 * This header defines the PathCollector class which turns user supplied
 * inputs (files and directories, in any mix) into the ordered list of
 * absolute file paths that a hashing job consumes.
 */

#ifndef PATHCOLLECTOR_HPP
#define PATHCOLLECTOR_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @class PathCollector
 * @brief Collects regular files from a list of inputs without duplicates
 *
 * Key features:
 * - Directories are walked recursively with no depth limit
 * - Deterministic walk order: a directory's files (by name) before its
 *   subdirectories (by name)
 * - Global de-duplication, first occurrence wins
 * - Missing or unreadable inputs become warnings, never errors
 *
 * Example usage:
 * @code
 * auto result = PathCollector::collect({"/data/photos", "/tmp/a.jpg"});
 * for (const auto &w : result.warnings) std::cerr << w << "\n";
 * engine.submit(result.paths, 8, callbacks);
 * @endcode
 */
class PathCollector {
public:
  struct CollectResult {
    std::vector<std::string> paths;
    std::vector<std::string> warnings;
  };

  /**
   * @brief Expands inputs into absolute, normalized, unique file paths
   *
   * @param inputs File or directory paths, relative ones are resolved
   *               against the current working directory
   * @param known Paths to treat as already collected. They are never
   *              returned. Pass nullptr to start from an empty seen-set.
   *
   * @return CollectResult Paths in first-seen order plus warnings for inputs
   *         (or subdirectories) that could not be read
   */
  static CollectResult
  collect(const std::vector<std::string> &inputs,
          const std::unordered_set<std::string> *known = nullptr);

  /**
   * @brief Absolute, lexically normalized form of a path
   *
   * Symlinks are not resolved, so two links to one file stay two paths.
   */
  static std::string normalize(const std::string &path);

private:
  struct Walk {
    std::unordered_set<std::string> seen;
    CollectResult result;
  };

  static void addFile(const std::filesystem::path &path, Walk &walk);

  static void walkDirectory(const std::filesystem::path &dir, Walk &walk);
};

#endif // PATHCOLLECTOR_HPP
