#ifndef HASHCHAIN_UTILITIES_H
#define HASHCHAIN_UTILITIES_H

#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace hc {

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
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Parse a 64-bit unsigned integer from a string
 * @param str String to parse
 * @param value Output parameter for the parsed value
 * @return true if the whole string was a valid number
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON value or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Read a whole file into a string
 */
Roe<std::string> readFile(const std::string &path);

/**
 * Write a file through a temporary sibling and a rename, so readers never
 * observe a partially written file. Parent directories are created.
 */
Roe<void> writeFileAtomically(const std::string &path,
                              const std::string &content);

/**
 * Encode binary data as lowercase hex (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * @return true if every character of str is a hex digit and str is not empty
 */
bool isHexString(const std::string &str);

/**
 * Generate cryptographically random bytes (OpenSSL RAND_bytes), hex-encoded
 * @param byteCount Number of random bytes
 * @return 2 * byteCount hex characters, or error
 */
Roe<std::string> randomHex(size_t byteCount);

} // namespace utl
} // namespace hc

#endif // HASHCHAIN_UTILITIES_H
