#ifndef GROUPINDEX_HPP
#define GROUPINDEX_HPP

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Index of files grouped by identical content digest
 *
 * GroupIndex clusters paths whose digests are equal. Every digest seen gets a
 * small positive group id, but only groups with more than one member are
 * duplicates and carry a visible label. The index provides functionality to:
 * - Record a hashed file under its digest
 * - Retract files and keep group ids dense
 * - Hand out a read-only snapshot for rendering
 *
 * Group ids are positions, not permanent tags: groups are always numbered
 * 1..N in lexical order of their digests, independent of the order in which
 * files were recorded. Creating or deleting a group renumbers the others,
 * which can change the id of an untouched group.
 *
 * @note Not synchronised; mutate from one thread only (the job's callback
 *       context)
 *
 * Example usage:
 * @code
 * GroupIndex index;
 * index.record("/a.txt", "d41d8cd98f00b204e9800998ecf8427e");
 * index.record("/b.txt", "d41d8cd98f00b204e9800998ecf8427e");
 * std::cout << index.label("/a.txt") << "\n";   // "Group 1"
 * @endcode
 */
class GroupIndex {
public:
  struct Group {
    int id = 0;
    std::set<std::string> paths;

    bool isDuplicate() const { return paths.size() > 1; }

    // "Group N" for duplicates, empty for singletons
    std::string label() const {
      return isDuplicate() ? "Group " + std::to_string(id) : std::string();
    }
  };

  using Snapshot = std::map<std::string, Group>;

  /**
   * @brief Adds a path to the group of its digest
   *
   * Creates the group when the digest is new and renumbers all groups by
   * digest. A path already recorded under another digest is moved, which may
   * delete and renumber groups exactly like remove().
   */
  void record(const std::string &path, const std::string &digest);

  /**
   * @brief Removes paths from their groups and recompacts ids
   *
   * Unknown paths are ignored. Emptied groups are deleted together with their
   * ids, then all surviving groups are renumbered by sorted digest (also when
   * nothing was removed).
   */
  void remove(const std::vector<std::string> &paths);

  Snapshot snapshot() const;

  /**
   * @brief Id of the duplicate group holding path
   * @return 0 if the path is unknown or alone with its digest
   */
  int groupId(const std::string &path) const;

  std::string label(const std::string &path) const;

  bool contains(const std::string &path) const;

  // Digest recorded for path, empty if unknown
  std::string digestOf(const std::string &path) const;

  std::size_t duplicateGroupCount() const;

  // Number of recorded paths
  std::size_t size() const { return m_digestOf.size(); }

  void clear();

private:
  // Returns true if a group became empty and was deleted
  bool retract(const std::string &path);

  void recompact();

  std::map<std::string, std::set<std::string>> m_groups;
  std::map<std::string, int> m_ids;
  std::unordered_map<std::string, std::string> m_digestOf;
};

#endif // GROUPINDEX_HPP
