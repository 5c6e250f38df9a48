#pragma once

#include "../interface/ContentStore.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace lfs {

/**
 * In-process content store keyed by the SHA-256 hex of the content.
 * Stands in for a real backend in tests and offline runs.
 */
class MemoryContentStore : public iii::ContentStore {
public:
  MemoryContentStore() = default;
  ~MemoryContentStore() override = default;

  Roe<std::string> put(const std::string &data) override;
  Roe<std::string> get(const std::string &address) override;
  bool isAvailable() override { return true; }

  size_t getCount() const;

private:
  std::unordered_map<std::string, std::string> blobs_;
  mutable std::mutex mutex_;
};

} // namespace lfs
