#include "ChunkCodec.h"

#include <stdexcept>

namespace lfs {

std::vector<std::string> ChunkCodec::split(const std::string &data, size_t chunkSize) {
  if (chunkSize == 0) {
    throw std::invalid_argument("Chunk size must be positive");
  }
  std::vector<std::string> chunks;
  chunks.reserve((data.size() + chunkSize - 1) / chunkSize);
  for (size_t offset = 0; offset < data.size(); offset += chunkSize) {
    chunks.push_back(data.substr(offset, chunkSize));
  }
  return chunks;
}

std::string ChunkCodec::join(const std::vector<std::string> &chunks) {
  size_t total = 0;
  for (const auto &chunk : chunks) {
    total += chunk.size();
  }
  std::string out;
  out.reserve(total);
  for (const auto &chunk : chunks) {
    out += chunk;
  }
  return out;
}

} // namespace lfs
