#include "Block.h"
#include "../lib/Utilities.h"

namespace lfs {

std::string Block::canonicalString() const {
  std::string s;
  s.reserve(timestamp.size() + filename.size() + chunkHash.size() +
            contentAddress.size() + previousHash.size() + 64);
  s += std::to_string(index);
  s += timestamp;
  s += filename;
  s += std::to_string(chunkSize);
  s += chunkHash;
  s += contentAddress;
  s += previousHash;
  s += std::to_string(nonce);
  return s;
}

std::string Block::calculateHash() const { return utl::sha256(canonicalString()); }

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["filename"] = filename;
  j["file_size"] = chunkSize;
  j["chunk_hash"] = chunkHash;
  j["ipfs_hash"] = contentAddress;
  j["previous_hash"] = previousHash;
  j["nonce"] = nonce;
  j["hash"] = hash;
  return j;
}

Block Block::fromJson(const nlohmann::json &j) {
  Block block;
  block.index = j.at("index").get<uint64_t>();
  block.timestamp = j.at("timestamp").get<std::string>();
  block.filename = j.at("filename").get<std::string>();
  block.chunkSize = j.at("file_size").get<uint64_t>();
  block.chunkHash = j.at("chunk_hash").get<std::string>();
  block.contentAddress = j.at("ipfs_hash").get<std::string>();
  block.previousHash = j.at("previous_hash").get<std::string>();
  block.nonce = j.value("nonce", static_cast<uint64_t>(0));
  block.hash = j.value("hash", std::string());
  return block;
}

bool Block::operator==(const Block &other) const {
  return index == other.index && timestamp == other.timestamp &&
         filename == other.filename && chunkSize == other.chunkSize &&
         chunkHash == other.chunkHash &&
         contentAddress == other.contentAddress &&
         previousHash == other.previousHash && nonce == other.nonce &&
         hash == other.hash;
}

} // namespace lfs
