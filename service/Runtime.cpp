#include "Runtime.h"
#include "../store/DirContentStore.h"
#include "../store/IpfsContentStore.h"
#include "../store/MemoryContentStore.h"
#include "../store/RetryingContentStore.h"

#include <stdexcept>

namespace lfs {

Runtime::Runtime() : Module("runtime") {}

Runtime::~Runtime() {
  if (pChain_ && pChain_->hasUnsavedChanges()) {
    auto result = pChain_->save();
    if (!result) {
      log().error << "Final ledger flush failed: " << result.error().message;
    }
  }
}

Runtime::Roe<void> Runtime::configureLogging(const lfs::Config &config, bool debug) {
  auto root = logging::getRootLogger();
  logging::Level level = logging::Level::INFO;
  if (!logging::parseLevel(config.logLevel, level)) {
    return Error(E_LOGGING, "Unknown log level: " + config.logLevel);
  }
  root.setLevel(debug ? logging::Level::DEBUG : level);

  if (!config.logFile.empty()) {
    try {
      root.addFileHandler(config.logFile);
    } catch (const std::runtime_error &e) {
      return Error(E_LOGGING, e.what());
    }
  }
  return {};
}

Runtime::Roe<void> Runtime::initStore() {
  const auto &storeConfig = config_.store;

  if (storeConfig.type == "memory") {
    pBackend_ = std::make_unique<MemoryContentStore>();
  } else if (storeConfig.type == "dir") {
    auto pDir = std::make_unique<DirContentStore>();
    DirContentStore::Config dirConfig;
    dirConfig.root = storeConfig.dir;
    auto result = pDir->init(dirConfig);
    if (!result) {
      return Error(E_STORE, result.error().message);
    }
    pBackend_ = std::move(pDir);
  } else if (storeConfig.type == "ipfs") {
    IpfsContentStore::Config ipfsConfig;
    ipfsConfig.host = storeConfig.host;
    ipfsConfig.port = storeConfig.port;
    ipfsConfig.connectTimeoutMs = storeConfig.connectTimeoutMs;
    ipfsConfig.readTimeoutMs = storeConfig.readTimeoutMs;
    ipfsConfig.writeTimeoutMs = storeConfig.writeTimeoutMs;
    auto pIpfs = std::make_unique<IpfsContentStore>(ipfsConfig);
    if (!pIpfs->isAvailable()) {
      if (storeConfig.required) {
        return Error(E_STORE, "IPFS daemon unreachable at " + storeConfig.host + ":" +
                                  std::to_string(storeConfig.port));
      }
      log().warning << "IPFS daemon unreachable at " << storeConfig.host << ":"
                    << storeConfig.port << ", store calls will fail until it is up";
    } else {
      log().info << "Connected to IPFS at " << storeConfig.host << ":" << storeConfig.port;
    }
    pBackend_ = std::move(pIpfs);
  } else {
    return Error(E_STORE, "Unknown store type: " + storeConfig.type);
  }

  pStore_ = pBackend_.get();
  if (storeConfig.retries > 1) {
    RetryingContentStore::Config retryConfig;
    retryConfig.maxAttempts = storeConfig.retries;
    retryConfig.delayMs = storeConfig.retryDelayMs;
    pRetrying_ = std::make_unique<RetryingContentStore>(*pBackend_, retryConfig);
    pStore_ = pRetrying_.get();
  }
  return {};
}

Runtime::Roe<void> Runtime::init(const lfs::Config &config) {
  if (pChain_) {
    return Error(E_STATE, "Runtime already initialized");
  }
  config_ = config;

  auto storeResult = initStore();
  if (!storeResult) {
    return storeResult;
  }

  pChain_ = std::make_unique<HashChain>();
  HashChain::Config chainConfig;
  chainConfig.ledgerPath = config_.ledgerPath;
  chainConfig.difficulty = config_.difficulty;
  chainConfig.maxNonce = config_.maxNonce;
  auto chainResult = pChain_->init(chainConfig);
  if (!chainResult) {
    return Error(E_CHAIN, chainResult.error().message);
  }

  pService_ = std::make_unique<IntegrityService>(*pChain_, *pStore_);
  IntegrityService::Config serviceConfig;
  serviceConfig.chunkSize = config_.chunkSize;
  auto serviceResult = pService_->init(serviceConfig);
  if (!serviceResult) {
    return Error(E_SERVICE, serviceResult.error().message);
  }

  pAdapter_ = std::make_unique<FileSystemAdapter>(*pService_);
  log().info << "Mounted ledger " << config_.ledgerPath << " over " << config_.store.type
             << " store";
  return {};
}

} // namespace lfs
