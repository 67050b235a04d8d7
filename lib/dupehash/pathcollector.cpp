/**
 * @file pathcollector.cpp
 * @brief Implementation of input expansion and de-duplication
 */

#include "pathcollector.hpp"
#include "log.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Expands inputs into a unique list of absolute file paths
 *
 * Each non-empty input is normalized first. Directories are walked with
 * walkDirectory(), regular files are added directly and anything else is
 * reported as a warning. The seen-set spans all inputs, so a file reachable
 * from two inputs keeps the position of its first occurrence.
 *
 * @param inputs File or directory paths in the order the user supplied them
 * @param known Optional set of paths that must not be returned again
 *
 * @return CollectResult Paths in first-seen order and human readable warnings
 *
 * @see walkDirectory()
 * @see normalize()
 */
PathCollector::CollectResult
PathCollector::collect(const std::vector<std::string> &inputs,
                       const std::unordered_set<std::string> *known) {
  Walk walk;
  if (known) {
    walk.seen = *known;
  }

  for (const auto &input : inputs) {
    if (input.empty()) {
      continue;
    }

    fs::path path(normalize(input));
    std::error_code ec;

    if (fs::is_directory(path, ec)) {
      Log::logger()->info("Scanning directory: {}", path.string());
      walkDirectory(path, walk);
    } else if (fs::is_regular_file(path, ec)) {
      addFile(path, walk);
    } else {
      std::string warning =
          "Path does not exist or is not accessible: " + path.string();
      Log::logger()->warn(warning);
      walk.result.warnings.push_back(warning);
    }
  }

  Log::logger()->info("Collected {} file(s) from {} path(s)",
                      walk.result.paths.size(), inputs.size());
  return walk.result;
}

std::string PathCollector::normalize(const std::string &path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    absolute = fs::path(path);
  }

  fs::path normal = absolute.lexically_normal();

  // "/a/b/" normalizes to "/a/b/" - drop the trailing separator
  std::string result = normal.string();
  while (result.size() > 1 && result.back() == fs::path::preferred_separator) {
    result.pop_back();
  }
  return result;
}

void PathCollector::addFile(const fs::path &path, Walk &walk) {
  std::string key = path.string();
  if (walk.seen.insert(key).second) {
    walk.result.paths.push_back(std::move(key));
  }
}

/**
 * @brief Walks a directory tree in a reproducible order
 *
 * Uses an explicit stack instead of recursion so deep trees cannot exhaust
 * the call stack. For every directory:
 * 1. Its entries are listed and sorted by filename
 * 2. Regular files (including symlinks to regular files) are added
 * 3. Real subdirectories are walked next, in filename order
 *
 * Symlinks to directories are not followed. A directory that cannot be
 * listed produces a warning and the walk continues with its siblings.
 *
 * @param dir Normalized directory path
 * @param walk Accumulated state shared with collect()
 */
void PathCollector::walkDirectory(const fs::path &dir, Walk &walk) {
  std::vector<fs::path> pending{dir};

  while (!pending.empty()) {
    fs::path current = pending.back();
    pending.pop_back();

    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(current, ec), end; !ec && it != end;
         it.increment(ec)) {
      entries.push_back(*it);
    }

    if (ec) {
      std::string warning =
          "Cannot read directory " + current.string() + ": " + ec.message();
      Log::logger()->warn(warning);
      walk.result.warnings.push_back(warning);
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.path().filename() < b.path().filename();
              });

    std::vector<fs::path> subdirs;
    for (const auto &entry : entries) {
      std::error_code entryEc;
      if (entry.is_symlink(entryEc)) {
        if (entry.is_regular_file(entryEc)) {
          addFile(entry.path(), walk);
        }
        continue;
      }
      if (entry.is_directory(entryEc)) {
        subdirs.push_back(entry.path());
      } else if (entry.is_regular_file(entryEc)) {
        addFile(entry.path(), walk);
      }
    }

    // Reverse so the first subdirectory is walked next
    for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
      pending.push_back(*it);
    }
  }
}
