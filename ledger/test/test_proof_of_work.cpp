#include "ProofOfWork.h"
#include <gtest/gtest.h>

#include <atomic>

namespace {

lfs::Block makeUnminedBlock() {
  lfs::Block block;
  block.index = 1;
  block.timestamp = "2024-05-01T12:30:45.123456";
  block.filename = "f";
  block.chunkSize = 4;
  block.chunkHash = "0ebdc3317b75839f643387d783535adc360ca01f33c75f7c1e7373adcd675c0b";
  block.contentAddress = "QmAddr";
  block.previousHash = std::string(64, '0');
  return block;
}

lfs::ProofOfWork makePow(uint32_t difficulty, uint64_t maxNonce) {
  lfs::ProofOfWork::Config config;
  config.difficulty = difficulty;
  config.maxNonce = maxNonce;
  return lfs::ProofOfWork(config);
}

} // namespace

TEST(ProofOfWorkTest, MeetsDifficulty) {
  EXPECT_TRUE(lfs::ProofOfWork::meetsDifficulty("00ab", 2));
  EXPECT_FALSE(lfs::ProofOfWork::meetsDifficulty("0a0b", 2));
  EXPECT_TRUE(lfs::ProofOfWork::meetsDifficulty("abc", 0));
  EXPECT_FALSE(lfs::ProofOfWork::meetsDifficulty("00", 3));
}

TEST(ProofOfWorkTest, FindsKnownNonce) {
  auto block = makeUnminedBlock();
  auto result = makePow(2, 1000).mine(block);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value(), 2u);
  EXPECT_EQ(block.nonce, 2u);
  EXPECT_EQ(block.hash, "007d43a9693b32e9f2e1927c95d61305ef61265a3b99ba90a7649c91339bdafd");
  EXPECT_EQ(block.hash, block.calculateHash());
}

TEST(ProofOfWorkTest, ZeroDifficultyAcceptsFirstNonce) {
  auto block = makeUnminedBlock();
  auto result = makePow(0, 10).mine(block);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value(), 0u);
}

TEST(ProofOfWorkTest, MiningIsDeterministic) {
  auto first = makeUnminedBlock();
  auto second = makeUnminedBlock();
  second.nonce = 12345;
  second.hash = "stale";

  auto pow = makePow(3, 1000000);
  auto r1 = pow.mine(first);
  auto r2 = pow.mine(second);
  ASSERT_TRUE(r1.isOk());
  ASSERT_TRUE(r2.isOk());
  EXPECT_EQ(r1.value(), r2.value());
  EXPECT_EQ(first.hash, second.hash);
  EXPECT_TRUE(lfs::ProofOfWork::meetsDifficulty(first.hash, 3));
}

TEST(ProofOfWorkTest, ExhaustionLeavesWeakSeal) {
  auto block = makeUnminedBlock();
  // nonce 2 is the first to satisfy difficulty 2
  auto result = makePow(2, 2).mine(block);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, lfs::ProofOfWork::E_EXHAUSTED);
  EXPECT_EQ(block.nonce, 0u);
  EXPECT_EQ(block.hash, block.calculateHash());
  EXPECT_FALSE(lfs::ProofOfWork::meetsDifficulty(block.hash, 2));
}

TEST(ProofOfWorkTest, RaisedStopFlagCancels) {
  auto block = makeUnminedBlock();
  std::atomic<bool> stop{ true };
  auto result = makePow(64, 1000000).mine(block, &stop);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, lfs::ProofOfWork::E_CANCELLED);
}

TEST(ProofOfWorkTest, RejectsInvalidConfig) {
  auto block = makeUnminedBlock();
  auto zeroNonce = makePow(1, 0).mine(block);
  ASSERT_TRUE(zeroNonce.isError());
  EXPECT_EQ(zeroNonce.error().code, lfs::ProofOfWork::E_CONFIG);

  auto tooHard = makePow(65, 10).mine(block);
  ASSERT_TRUE(tooHard.isError());
  EXPECT_EQ(tooHard.error().code, lfs::ProofOfWork::E_CONFIG);
}
