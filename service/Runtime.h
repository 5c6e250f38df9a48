#pragma once

#include "Config.h"
#include "FileSystemAdapter.h"
#include "IntegrityService.h"
#include "../interface/ContentStore.hpp"
#include "../ledger/HashChain.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <memory>

namespace lfs {

/**
 * Runtime - owns the store stack, the chain and the services built on them
 *
 * Construction order is store, HashChain, IntegrityService,
 * FileSystemAdapter. The destructor writes the chain out if the last
 * save failed.
 */
class Runtime : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STORE = 1;   // Store could not be set up or reached
  constexpr static int32_t E_CHAIN = 2;   // Chain initialization failed
  constexpr static int32_t E_SERVICE = 3; // Service initialization failed
  constexpr static int32_t E_STATE = 4;   // init() called twice
  constexpr static int32_t E_LOGGING = 5; // Log file could not be opened

  /**
   * Apply logLevel and logFile to the root logger
   * @param debug Force DEBUG regardless of logLevel
   */
  static Roe<void> configureLogging(const lfs::Config &config, bool debug);

  Runtime();
  ~Runtime() override;

  Roe<void> init(const lfs::Config &config);

  bool isInitialized() const { return pAdapter_ != nullptr; }

  const lfs::Config &getConfig() const { return config_; }
  iii::ContentStore &getStore() { return *pStore_; }
  HashChain &getChain() { return *pChain_; }
  IntegrityService &getService() { return *pService_; }
  FileSystemAdapter &getAdapter() { return *pAdapter_; }

private:
  Roe<void> initStore();

  lfs::Config config_;
  std::unique_ptr<iii::ContentStore> pBackend_;
  std::unique_ptr<iii::ContentStore> pRetrying_;
  iii::ContentStore *pStore_{ nullptr };
  std::unique_ptr<HashChain> pChain_;
  std::unique_ptr<IntegrityService> pService_;
  std::unique_ptr<FileSystemAdapter> pAdapter_;
};

} // namespace lfs
