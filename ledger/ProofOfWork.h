#pragma once

#include "Block.h"
#include "../lib/ResultOrError.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace lfs {

/**
 * Brute-force nonce search.
 *
 * The search is bounded by maxNonce and polls an optional stop flag, so a
 * caller can always cancel it from another thread.
 */
class ProofOfWork {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EXHAUSTED = 1; // No nonce below maxNonce satisfies difficulty
  constexpr static int32_t E_CANCELLED = 2; // Stop flag was raised during the search
  constexpr static int32_t E_CONFIG = 3;    // Invalid difficulty or maxNonce

  // Number of iterations between two polls of the stop flag
  constexpr static uint64_t CANCEL_POLL_INTERVAL = 1024;

  struct Config {
    uint32_t difficulty{ 3 };
    uint64_t maxNonce{ 1000000 };
  };

  ProofOfWork() = default;
  explicit ProofOfWork(const Config &config) : config_(config) {}

  const Config &getConfig() const { return config_; }

  /**
   * Check that hash starts with difficulty '0' characters
   */
  static bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

  /**
   * Search nonce in [0, maxNonce). On success block.nonce and block.hash hold
   * the winning values. On E_EXHAUSTED the block is left with nonce 0 and the
   * matching hash, ready to be appended with a weak seal.
   * @param block Block to mine; all fields except nonce and hash are inputs
   * @param pStop Optional stop flag polled every CANCEL_POLL_INTERVAL tries
   * @return Winning nonce, or error
   */
  Roe<uint64_t> mine(Block &block, const std::atomic<bool> *pStop = nullptr) const;

private:
  Config config_;
};

} // namespace lfs
