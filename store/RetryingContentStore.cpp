#include "RetryingContentStore.h"

#include <chrono>
#include <thread>

namespace lfs {

RetryingContentStore::RetryingContentStore(iii::ContentStore &inner,
                                           const Config &config)
    : Module("store.retry"), inner_(inner), config_(config) {
  if (config_.maxAttempts == 0) {
    config_.maxAttempts = 1;
  }
}

RetryingContentStore::Roe<std::string>
RetryingContentStore::withRetry(const std::string &what,
                                const std::function<Roe<std::string>()> &call) {
  for (uint32_t attempt = 1;; ++attempt) {
    auto result = call();
    if (result || !isTransient(result.error().code) ||
        attempt >= config_.maxAttempts) {
      if (!result && attempt > 1) {
        log().error << what << " failed after " << attempt
                    << " attempts: " << result.error().message;
      }
      return result;
    }
    log().warning << what << " attempt " << attempt << "/" << config_.maxAttempts
                  << " failed: " << result.error().message;
    std::this_thread::sleep_for(
        std::chrono::milliseconds(static_cast<uint64_t>(config_.delayMs) * attempt));
  }
}

RetryingContentStore::Roe<std::string> RetryingContentStore::put(const std::string &data) {
  return withRetry("put", [&]() { return inner_.put(data); });
}

RetryingContentStore::Roe<std::string> RetryingContentStore::get(const std::string &address) {
  return withRetry("get " + address, [&]() { return inner_.get(address); });
}

} // namespace lfs
