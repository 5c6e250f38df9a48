#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lfs {

/**
 * Fixed-size chunking of a byte buffer. No padding, no compression.
 */
class ChunkCodec {
public:
  /**
   * Split data into chunks of chunkSize bytes; the last one may be shorter.
   * Empty data gives no chunks.
   * @throws std::invalid_argument if chunkSize is 0
   */
  static std::vector<std::string> split(const std::string &data, size_t chunkSize);

  static std::string join(const std::vector<std::string> &chunks);
};

} // namespace lfs
