#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <openssl/rand.h>
#include <sstream>

namespace hc {
namespace utl {

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  auto content = readFile(path);
  if (!content) {
    return content.error();
  }

  try {
    return nlohmann::json::parse(content.value());
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }
}

Roe<std::string> readFile(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }
  return content;
}

Roe<void> writeFileAtomically(const std::string &path,
                              const std::string &content) {
  std::filesystem::path target(path);
  std::filesystem::path parentDir = target.parent_path();
  std::error_code ec;
  if (!parentDir.empty() && !std::filesystem::exists(parentDir, ec)) {
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + path +
                          ": " + ec.message());
    }
  }

  std::string tmpPath = path + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(3, "Failed to open file for writing: " + tmpPath);
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return Error(4, "Failed to write content to file: " + tmpPath);
    }
  }

  std::filesystem::rename(tmpPath, target, ec);
  if (ec) {
    std::filesystem::remove(tmpPath, ec);
    return Error(5, "Failed to move " + tmpPath + " into place");
  }
  return {};
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

bool isHexString(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    bool isDigit = c >= '0' && c <= '9';
    bool isLower = c >= 'a' && c <= 'f';
    bool isUpper = c >= 'A' && c <= 'F';
    if (!isDigit && !isLower && !isUpper) {
      return false;
    }
  }
  return true;
}

Roe<std::string> randomHex(size_t byteCount) {
  if (byteCount == 0) {
    return std::string();
  }
  if (byteCount > static_cast<size_t>(std::numeric_limits<int>::max())) {
    return Error(2, "Too many random bytes requested: " +
                        std::to_string(byteCount));
  }
  std::string bytes(byteCount, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char *>(&bytes[0]),
                 static_cast<int>(byteCount)) != 1) {
    return Error(1, "RAND_bytes failed");
  }
  return hexEncode(bytes);
}

} // namespace utl
} // namespace hc
