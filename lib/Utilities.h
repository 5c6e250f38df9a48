#ifndef LEDGERFS_UTILITIES_H
#define LEDGERFS_UTILITIES_H

#include "ResultOrError.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lfs {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Local wall-clock time as ISO-8601 with microseconds,
 * e.g. "2024-05-01T12:30:45.123456"
 */
std::string isoTimestampNow();

/**
 * Compute SHA-256 using the OpenSSL EVP API
 * @param input Arbitrary bytes
 * @return Lowercase hex digest (64 chars)
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256(const std::string &input);

/**
 * Check that a string is exactly 64 lowercase hex characters
 */
bool isSha256Hex(const std::string &str);

/**
 * Check that a string is valid UTF-8, using the same rules nlohmann::json
 * applies when serializing it
 */
bool isValidUtf8(const std::string &str);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed document, or error (1 = missing, 2 = unreadable, 3 = bad JSON)
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Read a whole file in binary mode
 */
Roe<std::string> readFile(const std::string &path);

/**
 * Replace the content of a file atomically.
 * Writes to "<path>.tmp", flushes, then renames over the target.
 * Creates parent directories if needed.
 */
Roe<void> writeFileAtomic(const std::string &path, const std::string &content);

} // namespace utl
} // namespace lfs

#endif // LEDGERFS_UTILITIES_H
