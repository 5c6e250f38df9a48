#include "ProofOfWork.h"

namespace lfs {

bool ProofOfWork::meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (hash.size() < difficulty) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

ProofOfWork::Roe<uint64_t> ProofOfWork::mine(Block &block,
                                             const std::atomic<bool> *pStop) const {
  if (config_.maxNonce == 0) {
    return Error(E_CONFIG, "maxNonce must be positive");
  }
  if (config_.difficulty > 64) {
    return Error(E_CONFIG, "difficulty exceeds hash length: " +
                               std::to_string(config_.difficulty));
  }

  for (uint64_t nonce = 0; nonce < config_.maxNonce; ++nonce) {
    if (pStop && nonce % CANCEL_POLL_INTERVAL == 0 && pStop->load()) {
      return Error(E_CANCELLED,
                   "Mining cancelled after " + std::to_string(nonce) + " tries");
    }
    block.nonce = nonce;
    block.hash = block.calculateHash();
    if (meetsDifficulty(block.hash, config_.difficulty)) {
      return nonce;
    }
  }

  block.nonce = 0;
  block.hash = block.calculateHash();
  return Error(E_EXHAUSTED, "No valid nonce below " +
                                std::to_string(config_.maxNonce) +
                                " for difficulty " +
                                std::to_string(config_.difficulty));
}

} // namespace lfs
