#include "IntegrityService.h"
#include "ChunkCodec.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <unordered_set>

namespace lfs {

IntegrityService::IntegrityService(HashChain &chain, iii::ContentStore &store)
    : Module("service.integrity"), chain_(chain), store_(store) {}

IntegrityService::Roe<void> IntegrityService::init(const Config &config) {
  if (config.chunkSize == 0) {
    return Error(E_CONFIG, "chunkSize must be positive");
  }
  config_ = config;
  return {};
}

IntegrityService::Roe<IntegrityService::WriteResult>
IntegrityService::writeFile(const std::string &filename, const std::string &data,
                            uint64_t offset) {
  if (offset != 0) {
    log().warning << "Write to " << filename << " at offset " << offset << " not supported";
    return Error(E_NOT_SUPPORTED, "Writes at a non-zero offset are not supported");
  }
  if (!utl::isValidUtf8(filename)) {
    log().warning << "Refused write to a filename that is not valid UTF-8";
    return Error(E_INVALID_NAME, "Filename is not valid UTF-8");
  }

  std::lock_guard<std::mutex> lock(writeMutex_);

  auto chunks = ChunkCodec::split(data, config_.chunkSize);
  log().info << "Write " << filename << ": " << data.size() << " bytes in "
             << chunks.size() << " chunks";

  WriteResult result;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const std::string &chunk = chunks[i];
    std::string chunkHash = utl::sha256(chunk);

    auto stored = store_.put(chunk);
    if (!stored) {
      Error err(E_STORE_FAILURE, "Chunk " + std::to_string(i) + " of " + filename +
                                     " not stored: " + stored.error().message);
      err.blocksAppended = result.chunkCount;
      log().error << err.message << " (" << result.chunkCount << " blocks already appended)";
      return err;
    }

    auto appended = chain_.append(filename, chunk.size(), chunkHash, stored.value());
    if (!appended) {
      Error err(E_APPEND_FAILURE, "Chunk " + std::to_string(i) + " of " + filename +
                                      " not appended: " + appended.error().message);
      err.blocksAppended = result.chunkCount;
      log().error << err.message << " (" << result.chunkCount << " blocks already appended)";
      return err;
    }

    const Block &block = appended.value();
    if (result.chunkCount == 0) {
      result.firstIndex = block.index;
    }
    result.lastIndex = block.index;
    result.chunkCount++;
    result.bytesWritten += chunk.size();
    if (!chain_.isSealed(block)) {
      result.weakSeals++;
      log().warning << "Block " << block.index << " of " << filename
                    << " carries a weak seal";
    }
  }

  log().info << "Wrote " << filename << ": " << result.bytesWritten << " bytes, blocks "
             << result.firstIndex << ".." << result.lastIndex;
  return result;
}

IntegrityService::Roe<std::string> IntegrityService::readFile(const std::string &filename,
                                                              uint64_t offset,
                                                              uint64_t size) {
  auto blocks = chain_.blocksForFile(filename);
  if (blocks.empty()) {
    return Error(E_NOT_FOUND, "File not found: " + filename);
  }

  auto tampered = HashChain::findTampered(blocks);
  if (!tampered.empty()) {
    log().warning << "Tamper detected in " << filename << ": " << tampered.size()
                  << " block(s), first at index " << tampered.front();
    return Error(E_INTEGRITY_VIOLATION, "Tampered block " + std::to_string(tampered.front()) +
                                            " in " + filename);
  }

  std::vector<std::string> chunks;
  chunks.reserve(blocks.size());
  for (const auto &block : blocks) {
    auto fetched = store_.get(block.contentAddress);
    if (!fetched) {
      log().error << "Fetch of block " << block.index << " failed: "
                  << fetched.error().message;
      return Error(E_FETCH_FAILURE, "Cannot fetch block " + std::to_string(block.index) +
                                        " of " + filename + ": " + fetched.error().message);
    }
    if (utl::sha256(fetched.value()) != block.chunkHash) {
      log().error << "Chunk of block " << block.index << " does not match its hash";
      return Error(E_HASH_MISMATCH, "Chunk of block " + std::to_string(block.index) +
                                        " in " + filename + " is corrupted");
    }
    chunks.push_back(std::move(fetched.value()));
  }

  std::string content = ChunkCodec::join(chunks);
  log().info << "Read " << filename << ": " << content.size() << " bytes from "
             << blocks.size() << " chunks";

  if (offset >= content.size()) {
    return std::string();
  }
  return content.substr(offset, size);
}

IntegrityService::ChainReport IntegrityService::verifyChain() const {
  auto validation = chain_.validate();
  ChainReport report;
  report.valid = validation.valid;
  report.failedIndex = validation.failedIndex;
  report.reason = validation.reason;
  if (!validation.valid) {
    switch (validation.code) {
    case HashChain::E_BLOCK_HASH:
      report.code = E_INTEGRITY_VIOLATION;
      break;
    case HashChain::E_PROOF_OF_WORK:
      report.code = E_MINING_EXHAUSTED;
      break;
    default:
      report.code = E_CHAIN_LINKAGE;
      break;
    }
  }
  log().info << "Chain verification: " << (report.valid ? "valid" : "INVALID");
  return report;
}

IntegrityService::FileReport IntegrityService::verifyFile(const std::string &filename) {
  FileReport report;
  auto blocks = chain_.blocksForFile(filename);
  if (blocks.empty()) {
    return report;
  }

  report.found = true;
  report.chunkCount = blocks.size();
  report.tamperedIndices = HashChain::findTampered(blocks);
  if (!report.tamperedIndices.empty()) {
    log().warning << "Tamper detected in " << filename << ": "
                  << report.tamperedIndices.size() << " block(s)";
  }
  std::unordered_set<uint64_t> tampered(report.tamperedIndices.begin(),
                                        report.tamperedIndices.end());

  for (const auto &block : blocks) {
    report.totalSize += block.chunkSize;

    if (tampered.count(block.index) > 0) {
      report.failures.push_back(
          { block.index, E_INTEGRITY_VIOLATION, "block hash does not match its content" });
      continue;
    }
    auto fetched = store_.get(block.contentAddress);
    if (!fetched) {
      report.failures.push_back({ block.index, E_FETCH_FAILURE, fetched.error().message });
      continue;
    }
    if (utl::sha256(fetched.value()) != block.chunkHash) {
      report.failures.push_back(
          { block.index, E_HASH_MISMATCH, "chunk does not match recorded hash" });
      continue;
    }
    report.verifiedChunks++;
  }

  log().info << "Verify " << filename << ": " << report.verifiedChunks << "/"
             << report.chunkCount << " chunks verified";
  return report;
}

std::vector<IntegrityService::FileInfo> IntegrityService::listFiles() const {
  std::vector<FileInfo> files;
  for (const auto &name : chain_.getFileNames()) {
    auto info = statFile(name);
    if (info) {
      files.push_back(info.value());
    }
  }
  std::sort(files.begin(), files.end(),
            [](const FileInfo &a, const FileInfo &b) { return a.name < b.name; });
  return files;
}

IntegrityService::Roe<IntegrityService::FileInfo>
IntegrityService::statFile(const std::string &filename) const {
  auto blocks = chain_.blocksForFile(filename);
  if (blocks.empty()) {
    return Error(E_NOT_FOUND, "File not found: " + filename);
  }
  FileInfo info;
  info.name = filename;
  info.chunkCount = blocks.size();
  for (const auto &block : blocks) {
    info.size += block.chunkSize;
  }
  return info;
}

IntegrityService::ChainInfo IntegrityService::getChainInfo() const {
  auto chainInfo = chain_.getInfo();
  ChainInfo info;
  info.totalBlocks = chainInfo.totalBlocks;
  info.latestHash = chainInfo.latestHash;
  info.valid = chainInfo.valid;
  info.fileCount = chainInfo.files.size();
  return info;
}

IntegrityService::Roe<void> IntegrityService::truncateFile(const std::string &filename) {
  log().warning << "Refused truncate of " << filename;
  return Error(E_PERMISSION_DENIED, "Ledger history is immutable: cannot truncate " + filename);
}

IntegrityService::Roe<void> IntegrityService::deleteFile(const std::string &filename) {
  log().warning << "Refused delete of " << filename;
  return Error(E_PERMISSION_DENIED, "Ledger history is immutable: cannot delete " + filename);
}

} // namespace lfs
