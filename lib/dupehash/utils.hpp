/**
 * @file utils.hpp
 * @brief Formatting helpers for sizes and durations
 *
 * Key utilities:
 * - formatBytes: Human-readable file size formatting
 * - formatDuration: Human-readable elapsed time formatting
 *
 * @see formatBytes()
 * @see formatDuration()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB). Plain bytes are printed as an
 * integer, every larger unit with two decimals. TB is the largest unit.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512 B"
 * - formatBytes(2048) → "2.00 KB"
 * - formatBytes(1048576) → "1.00 MB"
 *
 * @param bytes The number of bytes to format
 * @return std::string Formatted size, e.g. "1.50 KB"
 */
static std::string formatBytes(std::uint64_t bytes) {
  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  if (unit == 0) {
    snprintf(buf, sizeof(buf), "%llu B",
             static_cast<unsigned long long>(bytes));
  } else {
    snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
  }
  return std::string(buf);
}

/**
 * @brief Formats a duration in seconds
 *
 * Example outputs:
 * - formatDuration(0.032) → "32 ms"
 * - formatDuration(3.21) → "3.210 s"
 * - formatDuration(75) → "1 m 15 s"
 * - formatDuration(3700) → "1 h 1 m"
 *
 * @param seconds Non-negative elapsed time
 * @return std::string Formatted duration
 */
static std::string formatDuration(double seconds) {
  char buf[48];

  // Rounded before splitting into units
  const long long ms = std::llround(seconds * 1000.0);

  if (ms < 1000) {
    snprintf(buf, sizeof(buf), "%lld ms", ms);
  } else if (ms < 60000) {
    snprintf(buf, sizeof(buf), "%.3f s", static_cast<double>(ms) / 1000.0);
  } else {
    const long long total = std::llround(seconds);
    const long long minutes = total / 60;
    if (minutes < 60) {
      snprintf(buf, sizeof(buf), "%lld m %lld s", minutes, total % 60);
    } else {
      snprintf(buf, sizeof(buf), "%lld h %lld m", minutes / 60, minutes % 60);
    }
  }
  return std::string(buf);
}

#endif // UTILS_HPP
