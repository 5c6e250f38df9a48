#pragma once

#include "../lib/ResultOrError.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lfs {

/**
 * Process configuration, read from a JSON file.
 * Every key is optional; missing keys keep the defaults below.
 */
struct Config {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_FILE = 1;  // Missing or unreadable file
  constexpr static int32_t E_PARSE = 2; // Not valid JSON
  constexpr static int32_t E_TYPE = 3;  // Key has the wrong JSON type
  constexpr static int32_t E_VALUE = 4; // Key is out of range

  struct Store {
    std::string type{ "ipfs" }; // ipfs | dir | memory
    std::string dir{ "./chunks" };
    std::string host{ "127.0.0.1" };
    uint16_t port{ 5001 };
    uint32_t connectTimeoutMs{ 2000 };
    uint32_t readTimeoutMs{ 10000 };
    uint32_t writeTimeoutMs{ 10000 };
    uint32_t retries{ 3 }; // total attempts, 1 disables retrying
    uint32_t retryDelayMs{ 200 };
    bool required{ true };
  };

  uint64_t chunkSize{ 1024 };
  uint32_t difficulty{ 3 };
  uint64_t maxNonce{ 1000000 };
  std::string ledgerPath{ "./blockchain.json" };
  std::string logFile{ "./logs.txt" }; // empty disables the log file
  std::string logLevel{ "INFO" };
  Store store;

  static Roe<Config> fromJson(const nlohmann::json &j);
  static Roe<Config> load(const std::string &path);
};

} // namespace lfs
