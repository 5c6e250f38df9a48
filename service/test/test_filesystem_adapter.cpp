#include "FileSystemAdapter.h"
#include "MemoryContentStore.h"
#include <gtest/gtest.h>

#include <cerrno>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace {

class BrokenStore : public lfs::iii::ContentStore {
public:
  Roe<std::string> put(const std::string &) override {
    puts++;
    return Error(E_UNAVAILABLE, "down");
  }
  Roe<std::string> get(const std::string &address) override {
    return Error(E_UNAVAILABLE, "down " + address);
  }
  bool isAvailable() override { return false; }

  int puts{ 0 };
};

} // namespace

class FileSystemAdapterTest : public ::testing::Test {
protected:
  std::filesystem::path testDir;
  lfs::MemoryContentStore store;
  lfs::HashChain chain;
  std::unique_ptr<lfs::IntegrityService> pService;
  std::unique_ptr<lfs::FileSystemAdapter> pFs;

  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() /
              ("lfs-fs-adapter-test-" + std::to_string(::getpid()) + "-" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(testDir);
    std::filesystem::create_directories(testDir);

    lfs::HashChain::Config chainConfig;
    chainConfig.ledgerPath = (testDir / "blockchain.json").string();
    chainConfig.difficulty = 1;
    ASSERT_TRUE(chain.init(chainConfig).isOk());

    pService = std::make_unique<lfs::IntegrityService>(chain, store);
    lfs::IntegrityService::Config config;
    config.chunkSize = 4;
    ASSERT_TRUE(pService->init(config).isOk());
    pFs = std::make_unique<lfs::FileSystemAdapter>(*pService);
  }

  void TearDown() override {
    pFs.reset();
    pService.reset();
    std::filesystem::remove_all(testDir);
  }
};

TEST_F(FileSystemAdapterTest, RootIsADirectory) {
  auto attr = pFs->getattr("/");
  ASSERT_TRUE(attr.isOk());
  EXPECT_EQ(attr->mode, static_cast<uint32_t>(S_IFDIR | 0755));
  EXPECT_EQ(attr->nlink, 2u);
}

TEST_F(FileSystemAdapterTest, WriteThenGetattrAndRead) {
  auto written = pFs->write("/hello.txt", "hello world", 0);
  ASSERT_TRUE(written.isOk()) << written.error().message;
  EXPECT_EQ(written.value(), 11u);

  auto attr = pFs->getattr("/hello.txt");
  ASSERT_TRUE(attr.isOk());
  EXPECT_EQ(attr->mode, static_cast<uint32_t>(S_IFREG | 0644));
  EXPECT_EQ(attr->nlink, 1u);
  EXPECT_EQ(attr->size, 11u);

  auto data = pFs->read("/hello.txt", 5, 6);
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), "world");
}

TEST_F(FileSystemAdapterTest, MissingFileIsENOENT) {
  auto attr = pFs->getattr("/missing");
  ASSERT_TRUE(attr.isError());
  EXPECT_EQ(attr.error().code, ENOENT);

  auto data = pFs->read("/missing", 10, 0);
  ASSERT_TRUE(data.isError());
  EXPECT_EQ(data.error().code, ENOENT);

  auto nested = pFs->getattr("/dir/file");
  ASSERT_TRUE(nested.isError());
  EXPECT_EQ(nested.error().code, ENOENT);
}

TEST_F(FileSystemAdapterTest, ReaddirListsLedgerAndCreatedFiles) {
  ASSERT_TRUE(pFs->write("/b", "bbbb", 0).isOk());
  ASSERT_TRUE(pFs->write("/a", "aaaa", 0).isOk());
  ASSERT_TRUE(pFs->create("/c", 0644).isOk());
  ASSERT_TRUE(pFs->create("/a", 0644).isOk());

  auto entries = pFs->readdir("/");
  ASSERT_TRUE(entries.isOk());
  EXPECT_EQ(entries.value(), (std::vector<std::string>{ ".", "..", "a", "b", "c" }));

  auto notDir = pFs->readdir("/a");
  ASSERT_TRUE(notDir.isError());
  EXPECT_EQ(notDir.error().code, ENOTDIR);
  auto missing = pFs->readdir("/nope");
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, ENOENT);
}

TEST_F(FileSystemAdapterTest, CreatedFileIsEmptyUntilWritten) {
  ASSERT_TRUE(pFs->create("/new", 0644).isOk());
  auto attr = pFs->getattr("/new");
  ASSERT_TRUE(attr.isOk());
  EXPECT_EQ(attr->size, 0u);
  EXPECT_EQ(attr->mode, static_cast<uint32_t>(S_IFREG | 0644));

  auto data = pFs->read("/new", 10, 0);
  ASSERT_TRUE(data.isOk());
  EXPECT_EQ(data.value(), "");

  ASSERT_TRUE(pFs->write("/new", "content", 0).isOk());
  EXPECT_EQ(pFs->getattr("/new")->size, 7u);
}

TEST_F(FileSystemAdapterTest, OffsetWriteIsENOSYSAndTouchesNothing) {
  auto result = pFs->write("/f", "data", 4);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, ENOSYS);
  EXPECT_EQ(store.getCount(), 0u);
  EXPECT_EQ(chain.getSize(), 1u);
}

TEST_F(FileSystemAdapterTest, NonUtf8NameIsEINVAL) {
  auto result = pFs->write("/bad\xffname", "data", 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, EINVAL);
  EXPECT_EQ(store.getCount(), 0u);
  EXPECT_EQ(chain.getSize(), 1u);

  ASSERT_TRUE(pFs->write("/good", "data", 0).isOk());
  EXPECT_FALSE(chain.hasUnsavedChanges());
}

TEST_F(FileSystemAdapterTest, TruncateAndUnlinkAreEPERM) {
  ASSERT_TRUE(pFs->write("/f", "data", 0).isOk());

  auto truncated = pFs->truncate("/f", 0);
  ASSERT_TRUE(truncated.isError());
  EXPECT_EQ(truncated.error().code, EPERM);

  auto unlinked = pFs->unlink("/f");
  ASSERT_TRUE(unlinked.isError());
  EXPECT_EQ(unlinked.error().code, EPERM);

  EXPECT_EQ(pFs->read("/f", 4, 0).value(), "data");
}

TEST_F(FileSystemAdapterTest, MetadataChangesAreAccepted) {
  ASSERT_TRUE(pFs->write("/f", "data", 0).isOk());
  EXPECT_TRUE(pFs->chmod("/f", 0600).isOk());
  EXPECT_TRUE(pFs->chown("/f", 1000, 1000).isOk());
  EXPECT_TRUE(pFs->utimens("/f").isOk());
  EXPECT_EQ(pFs->getattr("/f")->mode, static_cast<uint32_t>(S_IFREG | 0644));
}

TEST_F(FileSystemAdapterTest, DirectoryOperationsOnRoot) {
  auto read = pFs->read("/", 10, 0);
  ASSERT_TRUE(read.isError());
  EXPECT_EQ(read.error().code, EISDIR);

  auto created = pFs->create("/", 0755);
  ASSERT_TRUE(created.isError());
  EXPECT_EQ(created.error().code, EEXIST);
}

TEST_F(FileSystemAdapterTest, UnreachableStoreReadIsEIO) {
  ASSERT_TRUE(pFs->write("/f", "hello world", 0).isOk());

  BrokenStore broken;
  lfs::IntegrityService service(chain, broken);
  ASSERT_TRUE(service.init(lfs::IntegrityService::Config()).isOk());
  lfs::FileSystemAdapter fs(service);

  auto read = fs.read("/f", 11, 0);
  ASSERT_TRUE(read.isError());
  EXPECT_EQ(read.error().code, EIO);
}

TEST_F(FileSystemAdapterTest, StoreFailureOnWriteIsEIO) {
  BrokenStore broken;
  lfs::IntegrityService service(chain, broken);
  ASSERT_TRUE(service.init(lfs::IntegrityService::Config()).isOk());
  lfs::FileSystemAdapter fs(service);

  auto result = fs.write("/f", "data", 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, EIO);
  EXPECT_EQ(broken.puts, 1);
}
