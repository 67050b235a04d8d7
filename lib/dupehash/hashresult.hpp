#ifndef HASH_RESULT_HPP
#define HASH_RESULT_HPP

#include <cstdint>
#include <string>

/**
 * @brief Outcome of digesting one file
 *
 * A HashResult is either a success carrying the hex digest or a failure
 * carrying an error message. Both variants report the bytes read and the
 * elapsed time, so a failed or cancelled file still shows how far it got.
 */
class HashResult {
private:
  std::string m_path;
  std::string m_digest;
  std::string m_error;
  std::uint64_t m_size = 0;
  double m_duration = 0.0;
  bool m_success = false;

  HashResult(const std::string &path, bool success, std::uint64_t size,
             double duration)
      : m_path(path), m_size(size), m_duration(duration), m_success(success) {}

public:
  HashResult() = default;

  static HashResult success(const std::string &path, const std::string &digest,
                            std::uint64_t size, double duration) {
    HashResult result(path, true, size, duration);
    result.m_digest = digest;
    return result;
  }

  static HashResult failure(const std::string &path, const std::string &error,
                            std::uint64_t size, double duration) {
    HashResult result(path, false, size, duration);
    result.m_error = error;
    return result;
  }

  const std::string &getPath() const { return m_path; }
  bool isSuccess() const { return m_success; }

  // Empty for failures
  const std::string &getDigest() const { return m_digest; }

  // Empty for successes
  const std::string &getError() const { return m_error; }

  std::uint64_t getFileSize() const { return m_size; }
  double getDuration() const { return m_duration; }

  bool isCancelled() const { return !m_success && m_error == "cancelled"; }
};

#endif // HASH_RESULT_HPP
