#pragma once

#include "../interface/ContentStore.hpp"
#include "../lib/Module.h"

#include <cstdint>
#include <functional>
#include <string>

namespace lfs {

/**
 * Decorator that retries transient failures of another store.
 * Attempt n (1-based) waits n * delayMs before attempt n + 1.
 * E_NOT_FOUND and E_PROTOCOL are returned at once.
 */
class RetryingContentStore : public Module, public iii::ContentStore {
public:
  struct Config {
    uint32_t maxAttempts{ 3 };
    uint32_t delayMs{ 200 };
  };

  RetryingContentStore(iii::ContentStore &inner, const Config &config);
  ~RetryingContentStore() override = default;

  Roe<std::string> put(const std::string &data) override;
  Roe<std::string> get(const std::string &address) override;
  bool isAvailable() override { return inner_.isAvailable(); }

  const Config &getConfig() const { return config_; }

private:
  Roe<std::string> withRetry(const std::string &what,
                             const std::function<Roe<std::string>()> &call);

  iii::ContentStore &inner_;
  Config config_;
};

} // namespace lfs
