#include "HashChain.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <unordered_set>

namespace lfs {

const std::string &HashChain::zeroHash() {
  static const std::string zeros(64, '0');
  return zeros;
}

HashChain::HashChain() : Module("ledger.chain") {}

HashChain::Roe<void> HashChain::init(const Config &config) {
  if (config.maxNonce == 0) {
    return Error(E_CONFIG, "maxNonce must be positive");
  }
  if (config.difficulty > 64) {
    return Error(E_CONFIG, "difficulty exceeds hash length: " +
                               std::to_string(config.difficulty));
  }
  if (config.ledgerPath.empty()) {
    return Error(E_CONFIG, "ledgerPath is empty");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  config_ = config;
  chain_.clear();
  weakSeals_ = 0;
  dirty_ = false;

  loadLocked();
  if (chain_.empty()) {
    createGenesisBlock();
    auto result = saveLocked();
    if (!result) {
      log().error << "Failed to persist genesis block: " << result.error().message;
    }
  }
  log().info << "Chain ready with " << chain_.size() << " blocks (difficulty "
             << config_.difficulty << ")";
  return {};
}

void HashChain::createGenesisBlock() {
  Block genesis;
  genesis.index = 0;
  genesis.timestamp = utl::isoTimestampNow();
  genesis.filename = Block::GENESIS_FILENAME;
  genesis.chunkSize = 0;
  genesis.chunkHash = zeroHash();
  genesis.contentAddress = "";
  genesis.previousHash = zeroHash();
  genesis.nonce = 0;
  genesis.hash = genesis.calculateHash();
  chain_.push_back(genesis);
  log().info << "Genesis block created: " << genesis.hash;
}

void HashChain::loadLocked() {
  std::error_code ec;
  if (!std::filesystem::exists(config_.ledgerPath, ec)) {
    log().info << "No ledger at " << config_.ledgerPath << ", starting a new chain";
    return;
  }

  auto docResult = utl::loadJsonFile(config_.ledgerPath);
  if (!docResult) {
    log().error << "Failed to load ledger, starting over: " << docResult.error().message;
    return;
  }

  const nlohmann::json &doc = docResult.value();
  std::vector<Block> loaded;
  try {
    const auto &jChain = doc.at("chain");
    if (!jChain.is_array()) {
      log().error << "Ledger 'chain' is not an array, starting over";
      return;
    }
    for (const auto &jBlock : jChain) {
      loaded.push_back(Block::fromJson(jBlock));
    }
    if (doc.contains("length") && doc["length"].is_number_unsigned() &&
        doc["length"].get<uint64_t>() != loaded.size()) {
      log().warning << "Ledger length field says " << doc["length"].get<uint64_t>()
                    << " but " << loaded.size() << " blocks were read";
    }
  } catch (const nlohmann::json::exception &e) {
    log().error << "Malformed ledger " << config_.ledgerPath
                << ", starting over: " << e.what();
    return;
  }

  chain_ = std::move(loaded);
  for (const auto &block : chain_) {
    if (!block.isGenesis() && !ProofOfWork::meetsDifficulty(block.hash, config_.difficulty)) {
      ++weakSeals_;
    }
  }
  log().info << "Loaded " << chain_.size() << " blocks from " << config_.ledgerPath;
}

HashChain::Roe<void> HashChain::saveLocked() {
  nlohmann::json jChain = nlohmann::json::array();
  for (const auto &block : chain_) {
    jChain.push_back(block.toJson());
  }
  nlohmann::json doc;
  doc["chain"] = jChain;
  doc["length"] = chain_.size();

  std::string content;
  try {
    content = doc.dump(2);
  } catch (const nlohmann::json::exception &e) {
    dirty_ = true;
    return Error(E_PERSIST, std::string("Cannot serialize ledger: ") + e.what());
  }

  auto result = utl::writeFileAtomic(config_.ledgerPath, content);
  if (!result) {
    dirty_ = true;
    return Error(E_PERSIST, result.error().message);
  }
  dirty_ = false;
  return {};
}

HashChain::Roe<void> HashChain::save() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return saveLocked();
}

bool HashChain::hasUnsavedChanges() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return dirty_;
}

std::string HashChain::computeHash(const Block &block) { return block.calculateHash(); }

HashChain::Roe<uint64_t> HashChain::mine(Block &block, uint32_t difficulty,
                                         uint64_t maxNonce,
                                         const std::atomic<bool> *pStop) {
  ProofOfWork::Config powConfig;
  powConfig.difficulty = difficulty;
  powConfig.maxNonce = maxNonce;
  auto result = ProofOfWork(powConfig).mine(block, pStop);
  if (result) {
    return result.value();
  }
  switch (result.error().code) {
  case ProofOfWork::E_EXHAUSTED:
    return Error(E_MINING_EXHAUSTED, result.error().message);
  case ProofOfWork::E_CANCELLED:
    return Error(E_MINING_CANCELLED, result.error().message);
  default:
    return Error(E_CONFIG, result.error().message);
  }
}

HashChain::Roe<Block> HashChain::append(const std::string &filename,
                                        uint64_t chunkSize,
                                        const std::string &chunkHash,
                                        const std::string &address) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  stopMining_.store(false);

  if (chain_.empty()) {
    return Error(E_EMPTY, "Chain is not initialized");
  }
  if (!utl::isValidUtf8(filename)) {
    return Error(E_FILENAME, "Filename is not valid UTF-8");
  }

  Block block;
  block.index = chain_.size();
  block.timestamp = utl::isoTimestampNow();
  block.filename = filename;
  block.chunkSize = chunkSize;
  block.chunkHash = chunkHash;
  block.contentAddress = address;
  block.previousHash = chain_.back().hash;

  auto mined = mine(block, config_.difficulty, config_.maxNonce, &stopMining_);
  if (!mined) {
    if (mined.error().code != E_MINING_EXHAUSTED) {
      log().warning << "Block " << block.index << " not appended: "
                    << mined.error().message;
      return mined.error();
    }
    ++weakSeals_;
    log().error << "Max nonce reached for block " << block.index
                << ", appending weak seal: " << mined.error().message;
  } else {
    log().debug << "Proof of work for block " << block.index << ": nonce "
                << block.nonce << " hash " << block.hash;
  }

  chain_.push_back(block);
  log().info << "Added block " << block.index << " for " << filename << " ("
             << chunkSize << " bytes)";

  auto saved = saveLocked();
  if (!saved) {
    log().error << "Block " << block.index
                << " kept in memory, ledger not written: " << saved.error().message;
  }
  return block;
}

void HashChain::cancelMining() { stopMining_.store(true); }

HashChain::ValidationReport HashChain::validateBlocks(const std::vector<Block> &blocks,
                                                      uint32_t difficulty) {
  ValidationReport report;
  if (blocks.empty()) {
    report.code = E_EMPTY;
    report.reason = "Chain is empty";
    return report;
  }

  const Block &genesis = blocks.front();
  if (!genesis.isGenesis()) {
    report.code = E_GENESIS;
    report.reason = "Block 0 is not a genesis block";
    return report;
  }
  if (genesis.previousHash != zeroHash()) {
    report.code = E_GENESIS;
    report.reason = "Genesis previous hash is not all zeros";
    return report;
  }
  if (genesis.hash != genesis.calculateHash()) {
    report.code = E_BLOCK_HASH;
    report.reason = "Genesis hash does not match its content";
    return report;
  }

  for (size_t i = 1; i < blocks.size(); ++i) {
    const Block &current = blocks[i];
    const Block &previous = blocks[i - 1];
    report.failedIndex = i;

    if (current.index != i) {
      report.code = E_BLOCK_INDEX;
      report.reason = "Block at position " + std::to_string(i) + " has index " +
                      std::to_string(current.index);
      return report;
    }
    if (current.hash != current.calculateHash()) {
      report.code = E_BLOCK_HASH;
      report.reason = "Block " + std::to_string(i) + " hash does not match its content";
      return report;
    }
    if (current.previousHash != previous.hash) {
      report.code = E_CHAIN_LINKAGE;
      report.reason = "Block " + std::to_string(i) +
                      " previous hash does not match block " + std::to_string(i - 1);
      return report;
    }
    if (!ProofOfWork::meetsDifficulty(current.hash, difficulty)) {
      report.code = E_PROOF_OF_WORK;
      report.reason = "Block " + std::to_string(i) + " lacks " +
                      std::to_string(difficulty) + " leading zeros";
      return report;
    }
  }

  report.valid = true;
  report.failedIndex = 0;
  return report;
}

HashChain::ValidationReport HashChain::validate() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto report = validateBlocks(chain_, config_.difficulty);
  if (report.valid) {
    log().debug << "Chain of " << chain_.size() << " blocks is valid";
  } else {
    log().warning << "Chain invalid at block " << report.failedIndex << ": "
                  << report.reason;
  }
  return report;
}

std::vector<Block> HashChain::blocksForFile(const std::string &filename) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Block> blocks;
  for (const auto &block : chain_) {
    if (block.filename == filename && !block.isGenesis()) {
      blocks.push_back(block);
    }
  }
  // chain_ is index-ordered already
  return blocks;
}

std::vector<uint64_t> HashChain::findTampered(const std::vector<Block> &blocks) {
  std::vector<uint64_t> tampered;
  for (const auto &block : blocks) {
    if (block.hash != block.calculateHash()) {
      tampered.push_back(block.index);
    }
  }
  return tampered;
}

std::vector<uint64_t> HashChain::detectTampering(const std::string &filename) const {
  auto tampered = findTampered(blocksForFile(filename));
  if (!tampered.empty()) {
    log().warning << "Tamper detected in " << filename << ": " << tampered.size()
                  << " block(s), first at index " << tampered.front();
  }
  return tampered;
}

std::vector<std::string> HashChain::getFileNames() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  std::unordered_set<std::string> seen;
  for (const auto &block : chain_) {
    if (block.isGenesis()) {
      continue;
    }
    if (seen.insert(block.filename).second) {
      names.push_back(block.filename);
    }
  }
  return names;
}

size_t HashChain::getSize() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_.size();
}

HashChain::Roe<Block> HashChain::getBlock(uint64_t index) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return Error(E_NOT_FOUND, "No block at index " + std::to_string(index));
  }
  return chain_[index];
}

HashChain::Roe<Block> HashChain::getLatestBlock() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (chain_.empty()) {
    return Error(E_EMPTY, "Chain is empty");
  }
  return chain_.back();
}

std::vector<Block> HashChain::getBlocks() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chain_;
}

HashChain::Info HashChain::getInfo() const {
  Info info;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    info.totalBlocks = chain_.size();
    info.latestHash = chain_.empty() ? std::string() : chain_.back().hash;
  }
  info.valid = validate().valid;
  info.files = getFileNames();
  return info;
}

bool HashChain::isSealed(const Block &block) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ProofOfWork::meetsDifficulty(block.hash, config_.difficulty);
}

uint64_t HashChain::getWeakSealCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return weakSeals_;
}

} // namespace lfs
