#pragma once

#include "../interface/ContentStore.hpp"
#include "../lib/Module.h"

#include <mutex>
#include <string>

namespace lfs {

/**
 * Content store backed by a local directory.
 *
 * Blobs live at <root>/<first two hex chars>/<sha256 hex>. Identical
 * content is stored once; a second put returns the existing address.
 */
class DirContentStore : public Module, public iii::ContentStore {
public:
  struct Config {
    std::string root{ "./chunks" };
  };

  DirContentStore();
  ~DirContentStore() override = default;

  /**
   * Create the root directory if needed
   * @return E_IO if the directory cannot be created
   */
  Roe<void> init(const Config &config);

  Roe<std::string> put(const std::string &data) override;
  Roe<std::string> get(const std::string &address) override;
  bool isAvailable() override;

  std::string getBlobPath(const std::string &address) const;

private:
  Config config_;
  std::mutex mutex_;
};

} // namespace lfs
