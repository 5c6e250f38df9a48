#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lfs {

/**
 * One ledger entry: metadata for one chunk of one file, plus the
 * chain-linkage and proof-of-work fields.
 *
 * Persisted field names (file_size, chunk_hash, ipfs_hash, previous_hash)
 * are kept stable so existing ledger files load unchanged.
 */
struct Block {
  static constexpr const char *GENESIS_FILENAME = "GENESIS";

  uint64_t index{ 0 };
  std::string timestamp;
  std::string filename;
  uint64_t chunkSize{ 0 };
  std::string chunkHash;
  std::string contentAddress;
  std::string previousHash;
  uint64_t nonce{ 0 };
  std::string hash;

  /**
   * Concatenation of every field except hash, in fixed order:
   * index, timestamp, filename, chunkSize, chunkHash, contentAddress,
   * previousHash, nonce. Integers are decimal, no separators.
   */
  std::string canonicalString() const;

  /**
   * SHA-256 hex of canonicalString()
   */
  std::string calculateHash() const;

  bool isGenesis() const { return index == 0 && filename == GENESIS_FILENAME; }

  nlohmann::json toJson() const;

  /**
   * @throws nlohmann::json::exception on missing or mistyped fields
   */
  static Block fromJson(const nlohmann::json &j);

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }
};

} // namespace lfs
