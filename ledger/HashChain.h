#pragma once

#include "Block.h"
#include "ProofOfWork.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lfs {

/**
 * HashChain - append-only ledger of chunk Blocks
 *
 * Owns block hashing, proof-of-work sealing, chain validation and per-file
 * tamper detection. The whole chain is rewritten to the ledger file after
 * every append.
 *
 * Thread safety: append/save/init take the chain lock exclusively (mining
 * and persistence included); every query takes it shared and returns
 * copies, so readers never see a chain mid-mutation.
 */
class HashChain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Sealing errors (1-9)
  constexpr static int32_t E_MINING_EXHAUSTED = 1; // No valid nonce below maxNonce
  constexpr static int32_t E_MINING_CANCELLED = 2; // Search stopped by cancelMining()
  // Persistence errors (10-19)
  constexpr static int32_t E_PERSIST = 10; // Ledger file could not be written
  // Validation errors (20-29)
  constexpr static int32_t E_CHAIN_LINKAGE = 20; // previousHash does not match
  constexpr static int32_t E_BLOCK_HASH = 21;    // Stored hash differs from recomputation
  constexpr static int32_t E_PROOF_OF_WORK = 22; // Hash lacks the difficulty prefix
  constexpr static int32_t E_BLOCK_INDEX = 23;   // Index gap or duplicate
  constexpr static int32_t E_GENESIS = 24;       // Malformed genesis block
  constexpr static int32_t E_EMPTY = 25;         // Chain has no blocks
  // Other errors (30-39)
  constexpr static int32_t E_NOT_FOUND = 30; // No block at index
  constexpr static int32_t E_CONFIG = 31;    // Invalid configuration
  constexpr static int32_t E_FILENAME = 32;  // Filename is not valid UTF-8

  struct Config {
    std::string ledgerPath{ "./blockchain.json" };
    uint32_t difficulty{ 3 };
    uint64_t maxNonce{ 1000000 };
  };

  struct ValidationReport {
    bool valid{ false };
    uint64_t failedIndex{ 0 }; // meaningful only when !valid
    int32_t code{ 0 };
    std::string reason;
  };

  struct Info {
    uint64_t totalBlocks{ 0 };
    std::string latestHash;
    bool valid{ false };
    std::vector<std::string> files;
  };

  // previousHash of the genesis block
  static const std::string &zeroHash();

  HashChain();
  ~HashChain() override = default;

  /**
   * Load the ledger file and create the genesis block if nothing was loaded.
   * A missing file starts a new chain. An unreadable file is logged and
   * discarded, and the chain restarts from genesis.
   * @return error only for an invalid configuration
   */
  Roe<void> init(const Config &config);

  const Config &getConfig() const { return config_; }

  static std::string computeHash(const Block &block);

  /**
   * Search a nonce for block under the given difficulty.
   * @see ProofOfWork::mine
   */
  static Roe<uint64_t> mine(Block &block, uint32_t difficulty, uint64_t maxNonce,
                            const std::atomic<bool> *pStop = nullptr);

  /**
   * Build, mine, append and persist a block for one chunk.
   *
   * Mining exhaustion does not fail the append: the block is stored with
   * nonce 0 (weak seal) and validate() will reject it afterwards.
   * A persistence failure is logged and leaves the block in memory.
   * @return The appended block, E_MINING_CANCELLED or E_FILENAME (nothing appended)
   */
  Roe<Block> append(const std::string &filename, uint64_t chunkSize,
                    const std::string &chunkHash, const std::string &address);

  /**
   * Stop the proof-of-work search of the append currently in flight.
   * Appends that start later are not affected.
   */
  void cancelMining();

  ValidationReport validate() const;

  /**
   * Validate an arbitrary block sequence with the same rules as validate()
   */
  static ValidationReport validateBlocks(const std::vector<Block> &blocks,
                                         uint32_t difficulty);

  // All blocks for filename ordered by index, genesis excluded
  std::vector<Block> blocksForFile(const std::string &filename) const;

  // Indices of filename's blocks whose stored hash no longer matches
  std::vector<uint64_t> detectTampering(const std::string &filename) const;
  static std::vector<uint64_t> findTampered(const std::vector<Block> &blocks);

  // Distinct non-genesis filenames in first-appended order
  std::vector<std::string> getFileNames() const;

  size_t getSize() const;
  Roe<Block> getBlock(uint64_t index) const;
  Roe<Block> getLatestBlock() const;
  std::vector<Block> getBlocks() const;
  Info getInfo() const;

  bool isSealed(const Block &block) const;
  uint64_t getWeakSealCount() const;

  // True when the in-memory chain holds appends the ledger file lacks
  bool hasUnsavedChanges() const;

  /**
   * Rewrite the ledger file with the full chain
   */
  Roe<void> save();

private:
  void createGenesisBlock();
  void loadLocked();
  Roe<void> saveLocked();

  Config config_;
  std::vector<Block> chain_;
  uint64_t weakSeals_{ 0 };
  bool dirty_{ false };
  std::atomic<bool> stopMining_{ false };
  mutable std::shared_mutex mutex_;
};

} // namespace lfs
