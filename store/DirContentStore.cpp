#include "DirContentStore.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace lfs {

DirContentStore::DirContentStore() : Module("store.dir") {}

DirContentStore::Roe<void> DirContentStore::init(const Config &config) {
  config_ = config;
  std::error_code ec;
  std::filesystem::create_directories(config_.root, ec);
  if (ec) {
    return Error(E_IO, "Failed to create store directory " + config_.root + ": " +
                           ec.message());
  }
  log().info << "Content directory: " << config_.root;
  return {};
}

std::string DirContentStore::getBlobPath(const std::string &address) const {
  std::filesystem::path path(config_.root);
  path /= address.substr(0, 2);
  path /= address;
  return path.string();
}

bool DirContentStore::isAvailable() {
  std::error_code ec;
  return std::filesystem::is_directory(config_.root, ec);
}

DirContentStore::Roe<std::string> DirContentStore::put(const std::string &data) {
  std::string address = utl::sha256(data);
  std::string path = getBlobPath(address);

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    log().debug << "Chunk " << address << " already stored";
    return address;
  }

  auto result = utl::writeFileAtomic(path, data);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  log().debug << "Uploaded chunk " << address << " (" << data.size() << " bytes)";
  return address;
}

DirContentStore::Roe<std::string> DirContentStore::get(const std::string &address) {
  if (!utl::isSha256Hex(address)) {
    return Error(E_NOT_FOUND, "Not a content address: " + address);
  }
  std::string path = getBlobPath(address);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Error(E_NOT_FOUND, "No content at " + address);
  }

  auto result = utl::readFile(path);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  log().debug << "Downloaded chunk " << address;
  return result.value();
}

} // namespace lfs
