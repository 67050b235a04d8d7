#ifndef PATHQUEUE_HPP
#define PATHQUEUE_HPP

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "hashengine.hpp"

/**
 * @brief Ordered list of files waiting to be hashed
 *
 * PathQueue keeps the unique, first-seen-ordered paths a front end shows and
 * later submits. Every mutation is refused with QueueStatus::Busy while the
 * engine it is bound to runs a job, so the list cannot change under a job.
 */
class PathQueue {
public:
  enum class QueueStatus { Ok, Busy };

  struct AddResult {
    QueueStatus status = QueueStatus::Ok;
    std::size_t added = 0;
    std::vector<std::string> warnings;
  };

  explicit PathQueue(const HashEngine &engine) : m_engine(engine) {}

  /**
   * @brief Collects inputs and appends the paths not queued yet
   * @see PathCollector::collect()
   */
  AddResult add(const std::vector<std::string> &inputs);

  QueueStatus remove(const std::vector<std::string> &paths);

  QueueStatus clear();

  const std::vector<std::string> &paths() const { return m_paths; }
  bool contains(const std::string &path) const {
    return m_seen.count(path) > 0;
  }
  std::size_t size() const { return m_paths.size(); }
  bool empty() const { return m_paths.empty(); }

  static std::string statusMessage(QueueStatus status);

private:
  bool isLocked() const { return m_engine.isActive(); }

  const HashEngine &m_engine;
  std::vector<std::string> m_paths;
  std::unordered_set<std::string> m_seen;
};

#endif // PATHQUEUE_HPP
