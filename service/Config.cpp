#include "Config.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <limits>

namespace lfs {

namespace {

template <typename T>
Config::Roe<void> readUnsigned(const nlohmann::json &j, const char *key, T &out) {
  if (!j.contains(key)) {
    return {};
  }
  const auto &value = j[key];
  if (!value.is_number_unsigned()) {
    return Config::Error(Config::E_TYPE, std::string("'") + key +
                                             "' must be a non-negative integer");
  }
  uint64_t raw = value.get<uint64_t>();
  if (raw > std::numeric_limits<T>::max()) {
    return Config::Error(Config::E_VALUE, std::string("'") + key + "' is too large");
  }
  out = static_cast<T>(raw);
  return {};
}

Config::Roe<void> readString(const nlohmann::json &j, const char *key, std::string &out) {
  if (!j.contains(key)) {
    return {};
  }
  if (!j[key].is_string()) {
    return Config::Error(Config::E_TYPE, std::string("'") + key + "' must be a string");
  }
  out = j[key].get<std::string>();
  return {};
}

Config::Roe<void> readBool(const nlohmann::json &j, const char *key, bool &out) {
  if (!j.contains(key)) {
    return {};
  }
  if (!j[key].is_boolean()) {
    return Config::Error(Config::E_TYPE, std::string("'") + key + "' must be a boolean");
  }
  out = j[key].get<bool>();
  return {};
}

Config::Roe<void> readStore(const nlohmann::json &j, Config::Store &store) {
  if (!j.is_object()) {
    return Config::Error(Config::E_TYPE, "'store' must be an object");
  }
  Config::Roe<void> results[] = {
      readString(j, "type", store.type),
      readString(j, "dir", store.dir),
      readString(j, "host", store.host),
      readUnsigned(j, "port", store.port),
      readUnsigned(j, "connectTimeoutMs", store.connectTimeoutMs),
      readUnsigned(j, "readTimeoutMs", store.readTimeoutMs),
      readUnsigned(j, "writeTimeoutMs", store.writeTimeoutMs),
      readUnsigned(j, "retries", store.retries),
      readUnsigned(j, "retryDelayMs", store.retryDelayMs),
      readBool(j, "required", store.required),
  };
  for (const auto &result : results) {
    if (!result) {
      return result;
    }
  }

  if (store.type != "ipfs" && store.type != "dir" && store.type != "memory") {
    return Config::Error(Config::E_VALUE, "Unknown store type: " + store.type);
  }
  if (store.type == "ipfs" && store.port == 0) {
    return Config::Error(Config::E_VALUE, "'port' must be in 1-65535");
  }
  if (store.type == "dir" && store.dir.empty()) {
    return Config::Error(Config::E_VALUE, "'dir' must not be empty");
  }
  if (store.retries == 0) {
    return Config::Error(Config::E_VALUE, "'retries' must be at least 1");
  }
  return {};
}

} // namespace

Config::Roe<Config> Config::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_TYPE, "Configuration must be a JSON object");
  }

  Config config;
  Roe<void> results[] = {
      readUnsigned(j, "chunkSize", config.chunkSize),
      readUnsigned(j, "difficulty", config.difficulty),
      readUnsigned(j, "maxNonce", config.maxNonce),
      readString(j, "ledgerPath", config.ledgerPath),
      readString(j, "logFile", config.logFile),
      readString(j, "logLevel", config.logLevel),
  };
  for (const auto &result : results) {
    if (!result) {
      return result.error();
    }
  }
  if (j.contains("store")) {
    auto result = readStore(j["store"], config.store);
    if (!result) {
      return result.error();
    }
  }

  if (config.chunkSize == 0) {
    return Error(E_VALUE, "'chunkSize' must be positive");
  }
  if (config.difficulty > 64) {
    return Error(E_VALUE, "'difficulty' must be 64 or less");
  }
  if (config.maxNonce == 0) {
    return Error(E_VALUE, "'maxNonce' must be positive");
  }
  if (config.ledgerPath.empty()) {
    return Error(E_VALUE, "'ledgerPath' must not be empty");
  }
  logging::Level level;
  if (!logging::parseLevel(config.logLevel, level)) {
    return Error(E_VALUE, "Unknown log level: " + config.logLevel);
  }
  return config;
}

Config::Roe<Config> Config::load(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    int32_t code = jsonResult.error().code == 3 ? E_PARSE : E_FILE;
    return Error(code, jsonResult.error().message);
  }
  return fromJson(jsonResult.value());
}

} // namespace lfs
