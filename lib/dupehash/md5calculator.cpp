/**
 * @file md5calculator.cpp
 * @brief Chunked, cancellable MD5 file digest
 */

#include "md5calculator.hpp"
#include "log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

#include <openssl/evp.h>

namespace {

struct EvpContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

std::string toHex(const unsigned char *bytes, unsigned int length) {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    ss << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return ss.str();
}

} // namespace

/**
 * @brief Computes the MD5 digest of a file
 *
 * Opens the file in binary mode and digests it with the stream overload.
 *
 * @param filePath Absolute path of the file to digest
 * @param cancel Shared cancellation flag of the running job
 */
HashResult Md5Calculator::calculate(const std::string &filePath,
                                    const std::atomic<bool> &cancel) const {
  const auto start = std::chrono::steady_clock::now();

  std::ifstream file(filePath, std::ios::binary);
  if (!file) {
    const std::string message =
        std::string("cannot open file: ") + std::strerror(errno);
    Log::logger()->warn("Failed to hash {}: {}", filePath, message);
    return HashResult::failure(
        filePath, message, 0,
        std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                      start)
            .count());
  }

  return calculate(filePath, file, cancel);
}

/**
 * @brief Computes the MD5 digest of an open stream
 *
 * Processing steps:
 * 1. Before each chunk, check the cancel flag
 * 2. Read up to chunkSize() bytes and feed them to the digest context
 * 3. Finalize and hex-encode once the stream is exhausted
 *
 * @param filePath Path reported in the result
 * @param in Binary input positioned at the first byte
 * @param cancel Shared cancellation flag of the running job
 *
 * @return HashResult Success with the lowercase hex digest, or a failure with
 *         "cancelled" or an error description. Size and duration are always
 *         filled with what was consumed so far.
 */
HashResult Md5Calculator::calculate(const std::string &filePath,
                                    std::istream &in,
                                    const std::atomic<bool> &cancel) const {
  const auto start = std::chrono::steady_clock::now();
  std::uint64_t size = 0;

  auto elapsed = [&start]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start)
        .count();
  };

  auto fail = [&](const std::string &message) {
    if (message != "cancelled") {
      Log::logger()->warn("Failed to hash {}: {}", filePath, message);
    }
    return HashResult::failure(filePath, message, size, elapsed());
  };

  EvpContext ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    return fail("cannot initialise MD5 context");
  }

  std::vector<char> buffer(m_chunkSize);

  while (true) {
    if (cancel.load(std::memory_order_acquire)) {
      return fail("cancelled");
    }

    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = in.gcount();

    if (in.bad()) {
      return fail(std::string("read error: ") + std::strerror(errno));
    }

    if (got <= 0) {
      break;
    }

    if (EVP_DigestUpdate(ctx.get(), buffer.data(),
                         static_cast<std::size_t>(got)) != 1) {
      return fail("MD5 update failed");
    }
    size += static_cast<std::uint64_t>(got);

    if (in.eof()) {
      break;
    }
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLength = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
    return fail("MD5 finalisation failed");
  }

  return HashResult::success(filePath, toHex(digest, digestLength), size,
                             elapsed());
}
