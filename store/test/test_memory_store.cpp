#include "MemoryContentStore.h"
#include "Utilities.h"
#include <gtest/gtest.h>

TEST(MemoryContentStoreTest, PutReturnsContentHash) {
  lfs::MemoryContentStore store;
  auto address = store.put("hello world");
  ASSERT_TRUE(address.isOk());
  EXPECT_EQ(address.value(), lfs::utl::sha256("hello world"));

  auto data = store.get(address.value());
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), "hello world");
}

TEST(MemoryContentStoreTest, DeduplicatesIdenticalContent) {
  lfs::MemoryContentStore store;
  auto a = store.put("same");
  auto b = store.put("same");
  ASSERT_TRUE(a.isOk());
  ASSERT_TRUE(b.isOk());
  EXPECT_EQ(a.value(), b.value());
  EXPECT_EQ(store.getCount(), 1u);
}

TEST(MemoryContentStoreTest, MissingAddressIsNotFound) {
  lfs::MemoryContentStore store;
  auto result = store.get("nope");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, lfs::iii::ContentStore::E_NOT_FOUND);
  EXPECT_TRUE(store.isAvailable());
}

TEST(MemoryContentStoreTest, StoresBinaryAndEmptyContent) {
  lfs::MemoryContentStore store;
  std::string binary("\0\1\2\0", 4);
  auto address = store.put(binary);
  ASSERT_TRUE(address.isOk());
  EXPECT_EQ(store.get(address.value()).value(), binary);

  auto empty = store.put("");
  ASSERT_TRUE(empty.isOk());
  EXPECT_EQ(store.get(empty.value()).value(), "");
}
