#include "DirContentStore.h"
#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

class DirContentStoreTest : public ::testing::Test {
protected:
  std::filesystem::path testDir;
  lfs::DirContentStore::Config config;

  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() /
              ("lfs-dir-store-test-" + std::to_string(::getpid()) + "-" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(testDir);
    config.root = (testDir / "chunks").string();
  }

  void TearDown() override { std::filesystem::remove_all(testDir); }
};

TEST_F(DirContentStoreTest, InitCreatesRoot) {
  lfs::DirContentStore store;
  ASSERT_TRUE(store.init(config).isOk());
  EXPECT_TRUE(std::filesystem::is_directory(config.root));
  EXPECT_TRUE(store.isAvailable());
}

TEST_F(DirContentStoreTest, PutShardsByHashPrefix) {
  lfs::DirContentStore store;
  ASSERT_TRUE(store.init(config).isOk());

  auto address = store.put("hello world");
  ASSERT_TRUE(address.isOk());
  std::string hash = lfs::utl::sha256("hello world");
  EXPECT_EQ(address.value(), hash);

  auto expected = std::filesystem::path(config.root) / hash.substr(0, 2) / hash;
  EXPECT_EQ(store.getBlobPath(hash), expected.string());
  EXPECT_TRUE(std::filesystem::exists(expected));

  auto data = store.get(hash);
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), "hello world");
}

TEST_F(DirContentStoreTest, DeduplicatesAndSurvivesReopen) {
  std::string address;
  {
    lfs::DirContentStore store;
    ASSERT_TRUE(store.init(config).isOk());
    auto first = store.put(std::string("chunk\0data", 10));
    auto second = store.put(std::string("chunk\0data", 10));
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(second.isOk());
    EXPECT_EQ(first.value(), second.value());
    address = first.value();
  }

  size_t files = 0;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(config.root)) {
    if (entry.is_regular_file()) {
      files++;
    }
  }
  EXPECT_EQ(files, 1u);

  lfs::DirContentStore reopened;
  ASSERT_TRUE(reopened.init(config).isOk());
  auto data = reopened.get(address);
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), std::string("chunk\0data", 10));
}

TEST_F(DirContentStoreTest, MissingOrMalformedAddressIsNotFound) {
  lfs::DirContentStore store;
  ASSERT_TRUE(store.init(config).isOk());

  auto missing = store.get(std::string(64, 'a'));
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, lfs::iii::ContentStore::E_NOT_FOUND);

  auto traversal = store.get("../../etc/passwd");
  ASSERT_TRUE(traversal.isError());
  EXPECT_EQ(traversal.error().code, lfs::iii::ContentStore::E_NOT_FOUND);
}

TEST_F(DirContentStoreTest, ReturnsBytesAsStoredOnDisk) {
  lfs::DirContentStore store;
  ASSERT_TRUE(store.init(config).isOk());
  auto address = store.put("original");
  ASSERT_TRUE(address.isOk());

  std::ofstream(store.getBlobPath(address.value()), std::ios::trunc) << "corrupted";
  auto data = store.get(address.value());
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), "corrupted");
}

TEST_F(DirContentStoreTest, InitFailsWhenRootIsAFile) {
  std::filesystem::create_directories(testDir);
  std::ofstream((testDir / "file").string()) << "x";
  config.root = (testDir / "file" / "chunks").string();

  lfs::DirContentStore store;
  auto result = store.init(config);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, lfs::iii::ContentStore::E_IO);
  EXPECT_FALSE(store.isAvailable());
}
