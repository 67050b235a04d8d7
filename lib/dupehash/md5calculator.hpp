#ifndef MD5CALCULATOR_HPP
#define MD5CALCULATOR_HPP

#include "ihashcalculator.hpp"
#include <cstddef>
#include <istream>

/**
 * @brief MD5 content digest backed by OpenSSL's EVP interface
 *
 * Reads the file sequentially in fixed-size chunks and checks the cancel flag
 * before each read, so a cancelled file stops within one chunk. Cancellation
 * and I/O errors produce a failure result; a partial digest is never returned.
 *
 * The reported duration is measured with std::chrono::steady_clock.
 *
 * @note Inherits from IHashCalculator interface
 */
class Md5Calculator : public IHashCalculator {
public:
  static constexpr std::size_t kChunkSize = 128 * 1024;

  explicit Md5Calculator(std::size_t chunkSize = kChunkSize)
      : m_chunkSize(chunkSize > 0 ? chunkSize : kChunkSize) {}

  HashResult calculate(const std::string &filePath,
                       const std::atomic<bool> &cancel) const override;

  // Digests an already opened binary stream, reported under filePath
  HashResult calculate(const std::string &filePath, std::istream &in,
                       const std::atomic<bool> &cancel) const;

  std::size_t chunkSize() const { return m_chunkSize; }

private:
  std::size_t m_chunkSize;
};

#endif // MD5CALCULATOR_HPP
