#include "MemoryContentStore.h"
#include "../lib/Utilities.h"

namespace lfs {

MemoryContentStore::Roe<std::string> MemoryContentStore::put(const std::string &data) {
  std::string address = utl::sha256(data);
  std::lock_guard<std::mutex> lock(mutex_);
  blobs_.emplace(address, data);
  return address;
}

MemoryContentStore::Roe<std::string> MemoryContentStore::get(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blobs_.find(address);
  if (it == blobs_.end()) {
    return Error(E_NOT_FOUND, "No content at " + address);
  }
  return it->second;
}

size_t MemoryContentStore::getCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blobs_.size();
}

} // namespace lfs
