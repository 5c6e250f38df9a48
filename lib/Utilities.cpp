#include "Utilities.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace lfs {
namespace utl {

std::string isoTimestampNow() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                now.time_since_epoch()) %
            1000000;

  std::tm local{};
  localtime_r(&time, &local);
  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(6) << us.count();
  return ss.str();
}

std::string sha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("SHA-256 digest failed");
  }
  EVP_MD_CTX_free(mdctx);

  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(hashLen * 2);
  for (unsigned int i = 0; i < hashLen; i++) {
    out.push_back(digits[hash[i] >> 4]);
    out.push_back(digits[hash[i] & 0x0f]);
  }
  return out;
}

bool isSha256Hex(const std::string &str) {
  if (str.size() != 64) {
    return false;
  }
  for (char c : str) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

bool isValidUtf8(const std::string &str) {
  try {
    nlohmann::json(str).dump();
  } catch (const nlohmann::json::type_error &) {
    return false;
  }
  return true;
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + e.what());
  }

  return doc;
}

Roe<std::string> readFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return Error(1, "Cannot open file: " + path);
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  if (file.bad()) {
    return Error(2, "Failed to read file: " + path);
  }
  return oss.str();
}

Roe<void> writeFileAtomic(const std::string &path, const std::string &content) {
  std::filesystem::path target(path);
  std::filesystem::path parentDir = target.parent_path();
  std::error_code ec;
  if (!parentDir.empty() && !std::filesystem::exists(parentDir, ec)) {
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + path + ": " +
                          ec.message());
    }
  }

  std::string tmpPath = path + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(2, "Failed to open file for writing: " + tmpPath);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file.good()) {
      return Error(3, "Failed to write file: " + tmpPath);
    }
  }

  std::filesystem::rename(tmpPath, target, ec);
  if (ec) {
    std::string reason = ec.message();
    std::filesystem::remove(tmpPath, ec);
    return Error(4, "Failed to replace " + path + ": " + reason);
  }
  return {};
}

} // namespace utl
} // namespace lfs
