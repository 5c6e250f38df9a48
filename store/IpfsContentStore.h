#pragma once

#include "../interface/ContentStore.hpp"
#include "../lib/Module.h"

#include <cstdint>
#include <string>

namespace lfs {

/**
 * Content store talking to an IPFS daemon over its HTTP API.
 * Each call opens its own client, so the store can be shared between threads.
 */
class IpfsContentStore : public Module, public iii::ContentStore {
public:
  struct Config {
    std::string host{ "127.0.0.1" };
    uint16_t port{ 5001 };
    uint32_t connectTimeoutMs{ 2000 };
    uint32_t readTimeoutMs{ 10000 };
    uint32_t writeTimeoutMs{ 10000 };
  };

  IpfsContentStore();
  explicit IpfsContentStore(const Config &config);
  ~IpfsContentStore() override = default;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  /**
   * POST /api/v0/add with the data as multipart field "file"
   * @return The CID from the "Hash" field of the response
   */
  Roe<std::string> put(const std::string &data) override;

  /**
   * POST /api/v0/cat?arg=<cid>
   */
  Roe<std::string> get(const std::string &address) override;

  // POST /api/v0/version answers 200
  bool isAvailable() override;

private:
  Config config_;
};

} // namespace lfs
