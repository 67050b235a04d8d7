#include "pathqueue.hpp"
#include "log.hpp"
#include "pathcollector.hpp"

#include <algorithm>

PathQueue::AddResult PathQueue::add(const std::vector<std::string> &inputs) {
  AddResult result;
  if (isLocked()) {
    result.status = QueueStatus::Busy;
    Log::logger()->warn("Cannot add paths: {}", statusMessage(result.status));
    return result;
  }

  auto collected = PathCollector::collect(inputs, &m_seen);
  for (auto &path : collected.paths) {
    m_seen.insert(path);
    m_paths.push_back(std::move(path));
  }

  result.added = collected.paths.size();
  result.warnings = std::move(collected.warnings);
  return result;
}

PathQueue::QueueStatus PathQueue::remove(const std::vector<std::string> &paths) {
  if (isLocked()) {
    Log::logger()->warn("Cannot remove paths: {}",
                        statusMessage(QueueStatus::Busy));
    return QueueStatus::Busy;
  }

  std::unordered_set<std::string> doomed(paths.begin(), paths.end());
  m_paths.erase(std::remove_if(m_paths.begin(), m_paths.end(),
                               [&doomed](const std::string &path) {
                                 return doomed.count(path) > 0;
                               }),
                m_paths.end());
  for (const auto &path : doomed) {
    m_seen.erase(path);
  }
  return QueueStatus::Ok;
}

PathQueue::QueueStatus PathQueue::clear() {
  if (isLocked()) {
    Log::logger()->warn("Cannot clear paths: {}",
                        statusMessage(QueueStatus::Busy));
    return QueueStatus::Busy;
  }

  m_paths.clear();
  m_seen.clear();
  return QueueStatus::Ok;
}

std::string PathQueue::statusMessage(QueueStatus status) {
  switch (status) {
  case QueueStatus::Ok:
    return "Ok";
  case QueueStatus::Busy:
    return "hashing in progress, cancel or wait before changing the list";
  default:
    return "Unknown status";
  }
}
