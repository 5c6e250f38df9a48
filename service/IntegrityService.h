#pragma once

#include "../interface/ContentStore.hpp"
#include "../ledger/HashChain.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace lfs {

/**
 * IntegrityService - file-level write and verified read over the ledger
 *
 * A write splits the data into chunks, uploads every chunk to the content
 * store and appends one block per chunk. A read refuses to return anything
 * unless every block of the file is intact and every fetched chunk matches
 * its recorded hash.
 *
 * A file is the concatenation of all blocks ever appended under its name,
 * in ascending index order. Writing a name again appends to that sequence;
 * earlier blocks are never superseded.
 */
class IntegrityService : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;

    // Blocks appended by the failing write before it stopped
    uint64_t blocksAppended{ 0 };
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STORE_FAILURE = 1;       // Chunk upload failed
  constexpr static int32_t E_FETCH_FAILURE = 2;       // Chunk download failed
  constexpr static int32_t E_HASH_MISMATCH = 3;       // Fetched chunk differs from ledger
  constexpr static int32_t E_INTEGRITY_VIOLATION = 4; // Block hash no longer matches
  constexpr static int32_t E_CHAIN_LINKAGE = 5;       // Chain failed validation
  constexpr static int32_t E_NOT_FOUND = 6;           // No blocks for file
  constexpr static int32_t E_NOT_SUPPORTED = 7;       // Operation not supported
  constexpr static int32_t E_MINING_EXHAUSTED = 8;    // Chain holds a weakly sealed block
  constexpr static int32_t E_PERMISSION_DENIED = 9;   // Update or delete of history
  constexpr static int32_t E_APPEND_FAILURE = 10;     // Chain refused the append
  constexpr static int32_t E_CONFIG = 11;             // Invalid configuration
  constexpr static int32_t E_INVALID_NAME = 12;       // Filename is not valid UTF-8

  struct Config {
    uint64_t chunkSize{ 1024 };
  };

  struct WriteResult {
    uint64_t bytesWritten{ 0 };
    uint64_t chunkCount{ 0 };
    uint64_t firstIndex{ 0 };
    uint64_t lastIndex{ 0 };
    uint64_t weakSeals{ 0 };
  };

  // verifyChain() result; code is one of the E_* codes above when !valid
  struct ChainReport {
    bool valid{ false };
    uint64_t failedIndex{ 0 };
    int32_t code{ 0 };
    std::string reason;
  };

  struct ChunkFailure {
    uint64_t index{ 0 };
    int32_t code{ 0 };
    std::string reason;
  };

  struct FileReport {
    bool found{ false };
    uint64_t chunkCount{ 0 };
    uint64_t verifiedChunks{ 0 };
    uint64_t totalSize{ 0 };
    std::vector<uint64_t> tamperedIndices;
    std::vector<ChunkFailure> failures;

    bool isIntact() const { return found && verifiedChunks == chunkCount; }
  };

  struct FileInfo {
    std::string name;
    uint64_t size{ 0 };
    uint64_t chunkCount{ 0 };
  };

  struct ChainInfo {
    uint64_t totalBlocks{ 0 };
    std::string latestHash;
    bool valid{ false };
    uint64_t fileCount{ 0 };
  };

  IntegrityService(HashChain &chain, iii::ContentStore &store);
  ~IntegrityService() override = default;

  Roe<void> init(const Config &config);
  const Config &getConfig() const { return config_; }

  /**
   * Chunk, upload and append data under filename.
   *
   * Only offset 0 is supported; any other offset fails with E_NOT_SUPPORTED
   * before the store is touched, as does a filename that is not UTF-8
   * (E_INVALID_NAME).
   * Not transactional: blocks appended before a failure stay in the chain,
   * and the returned error reports how many there were.
   */
  Roe<WriteResult> writeFile(const std::string &filename, const std::string &data,
                             uint64_t offset = 0);

  /**
   * Rebuild filename from the store and return [offset, offset + size).
   * The slice is shorter when it runs past the end of the file.
   * Any tampered block, fetch failure or hash mismatch fails the whole read.
   */
  Roe<std::string> readFile(const std::string &filename, uint64_t offset,
                            uint64_t size);

  /**
   * Validate the whole chain. A broken link or structure maps to
   * E_CHAIN_LINKAGE, a block whose hash no longer matches to
   * E_INTEGRITY_VIOLATION and a weak seal to E_MINING_EXHAUSTED.
   */
  ChainReport verifyChain() const;

  /**
   * Check every chunk of filename and collect all failures
   */
  FileReport verifyFile(const std::string &filename);

  // Files sorted by name
  std::vector<FileInfo> listFiles() const;
  Roe<FileInfo> statFile(const std::string &filename) const;
  ChainInfo getChainInfo() const;

  // History is immutable: both always fail with E_PERMISSION_DENIED
  Roe<void> truncateFile(const std::string &filename);
  Roe<void> deleteFile(const std::string &filename);

private:
  HashChain &chain_;
  iii::ContentStore &store_;
  Config config_;
  std::mutex writeMutex_;
};

} // namespace lfs
