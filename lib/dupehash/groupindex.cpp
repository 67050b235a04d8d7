#include "groupindex.hpp"

void GroupIndex::record(const std::string &path, const std::string &digest) {
  bool renumber = false;

  auto known = m_digestOf.find(path);
  if (known != m_digestOf.end()) {
    if (known->second == digest) {
      return;
    }
    // Re-hashed with new content: leave the old group first
    renumber = retract(path);
  }

  auto group = m_groups.find(digest);
  if (group == m_groups.end()) {
    group = m_groups.emplace(digest, std::set<std::string>()).first;
    renumber = true;
  }
  group->second.insert(path);
  m_digestOf[path] = digest;

  // A new digest can sort before existing ones
  if (renumber) {
    recompact();
  }
}

void GroupIndex::remove(const std::vector<std::string> &paths) {
  for (const auto &path : paths) {
    retract(path);
  }

  // Ids follow digest order after every removal request, even a no-op one
  recompact();
}

GroupIndex::Snapshot GroupIndex::snapshot() const {
  Snapshot view;
  for (const auto &[digest, paths] : m_groups) {
    Group group;
    auto id = m_ids.find(digest);
    group.id = id != m_ids.end() ? id->second : 0;
    group.paths = paths;
    view.emplace(digest, std::move(group));
  }
  return view;
}

int GroupIndex::groupId(const std::string &path) const {
  auto known = m_digestOf.find(path);
  if (known == m_digestOf.end()) {
    return 0;
  }

  auto group = m_groups.find(known->second);
  if (group == m_groups.end() || group->second.size() < 2) {
    return 0;
  }

  auto id = m_ids.find(known->second);
  return id != m_ids.end() ? id->second : 0;
}

std::string GroupIndex::label(const std::string &path) const {
  int id = groupId(path);
  return id > 0 ? "Group " + std::to_string(id) : std::string();
}

bool GroupIndex::contains(const std::string &path) const {
  return m_digestOf.count(path) > 0;
}

std::string GroupIndex::digestOf(const std::string &path) const {
  auto known = m_digestOf.find(path);
  return known != m_digestOf.end() ? known->second : std::string();
}

std::size_t GroupIndex::duplicateGroupCount() const {
  std::size_t count = 0;
  for (const auto &entry : m_groups) {
    if (entry.second.size() > 1) {
      ++count;
    }
  }
  return count;
}

void GroupIndex::clear() {
  m_groups.clear();
  m_ids.clear();
  m_digestOf.clear();
}

bool GroupIndex::retract(const std::string &path) {
  auto known = m_digestOf.find(path);
  if (known == m_digestOf.end()) {
    return false;
  }

  const std::string digest = known->second;
  m_digestOf.erase(known);

  auto group = m_groups.find(digest);
  if (group == m_groups.end()) {
    return false;
  }

  group->second.erase(path);
  if (!group->second.empty()) {
    return false;
  }

  m_groups.erase(group);
  m_ids.erase(digest);
  return true;
}

void GroupIndex::recompact() {
  // m_groups is ordered by digest, so this is the lexical numbering
  int next = 1;
  for (const auto &entry : m_groups) {
    m_ids[entry.first] = next++;
  }
}
