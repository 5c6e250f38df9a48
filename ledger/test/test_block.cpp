#include "Block.h"
#include <gtest/gtest.h>

namespace {

lfs::Block makeSampleBlock() {
  lfs::Block block;
  block.index = 1;
  block.timestamp = "2024-05-01T12:30:45.123456";
  block.filename = "f";
  block.chunkSize = 4;
  block.chunkHash = "0ebdc3317b75839f643387d783535adc360ca01f33c75f7c1e7373adcd675c0b";
  block.contentAddress = "QmAddr";
  block.previousHash = std::string(64, '0');
  block.nonce = 7;
  return block;
}

} // namespace

TEST(BlockTest, CanonicalStringConcatenatesFieldsInOrder) {
  auto block = makeSampleBlock();
  std::string expected = "1" + block.timestamp + "f" + "4" + block.chunkHash + "QmAddr" +
                         std::string(64, '0') + "7";
  EXPECT_EQ(block.canonicalString(), expected);
}

TEST(BlockTest, HashMatchesKnownVector) {
  auto block = makeSampleBlock();
  EXPECT_EQ(block.calculateHash(),
            "26121a9b3d1b915ccc765e4623a8f556eb8c7e5d29b273fab72eec59ad859cde");
}

TEST(BlockTest, HashIgnoresStoredHashField) {
  auto block = makeSampleBlock();
  std::string before = block.calculateHash();
  block.hash = "anything";
  EXPECT_EQ(block.calculateHash(), before);
}

TEST(BlockTest, EveryFieldAffectsHash) {
  auto base = makeSampleBlock();
  std::string baseHash = base.calculateHash();

  auto b = base;
  b.index = 2;
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.timestamp += "0";
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.filename = "g";
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.chunkSize = 5;
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.chunkHash[0] = '1';
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.contentAddress = "QmOther";
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.previousHash[63] = '1';
  EXPECT_NE(b.calculateHash(), baseHash);
  b = base;
  b.nonce = 8;
  EXPECT_NE(b.calculateHash(), baseHash);
}

TEST(BlockTest, JsonUsesLedgerFieldNames) {
  auto block = makeSampleBlock();
  block.hash = block.calculateHash();
  auto j = block.toJson();

  EXPECT_EQ(j["index"].get<uint64_t>(), 1u);
  EXPECT_EQ(j["timestamp"].get<std::string>(), block.timestamp);
  EXPECT_EQ(j["filename"].get<std::string>(), "f");
  EXPECT_EQ(j["file_size"].get<uint64_t>(), 4u);
  EXPECT_EQ(j["chunk_hash"].get<std::string>(), block.chunkHash);
  EXPECT_EQ(j["ipfs_hash"].get<std::string>(), "QmAddr");
  EXPECT_EQ(j["previous_hash"].get<std::string>(), block.previousHash);
  EXPECT_EQ(j["nonce"].get<uint64_t>(), 7u);
  EXPECT_EQ(j["hash"].get<std::string>(), block.hash);

  EXPECT_EQ(lfs::Block::fromJson(j), block);
}

TEST(BlockTest, FromJsonRejectsMissingField) {
  auto j = makeSampleBlock().toJson();
  j.erase("chunk_hash");
  EXPECT_THROW(lfs::Block::fromJson(j), nlohmann::json::exception);
}

TEST(BlockTest, FromJsonRejectsWrongType) {
  auto j = makeSampleBlock().toJson();
  j["index"] = "one";
  EXPECT_THROW(lfs::Block::fromJson(j), nlohmann::json::exception);
}

TEST(BlockTest, GenesisDetection) {
  lfs::Block genesis;
  genesis.index = 0;
  genesis.filename = lfs::Block::GENESIS_FILENAME;
  EXPECT_TRUE(genesis.isGenesis());

  auto block = makeSampleBlock();
  EXPECT_FALSE(block.isGenesis());
}
