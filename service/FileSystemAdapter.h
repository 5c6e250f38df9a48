#pragma once

#include "IntegrityService.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace lfs {

/**
 * Path-based filesystem surface over IntegrityService, shaped for a
 * mount-protocol binding. The namespace is flat: "/" and "/<name>".
 *
 * Every failure carries the errno value in Error::code.
 */
class FileSystemAdapter : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Attr {
    uint32_t mode{ 0 };
    uint64_t size{ 0 };
    uint32_t nlink{ 0 };
  };

  explicit FileSystemAdapter(IntegrityService &service);
  ~FileSystemAdapter() override = default;

  Roe<Attr> getattr(const std::string &path) const;

  // ".", ".." and every file name; only "/" can be listed
  Roe<std::vector<std::string>> readdir(const std::string &path) const;

  // Registers an empty file until its first write
  Roe<void> create(const std::string &path, uint32_t mode);

  Roe<std::string> read(const std::string &path, uint64_t size, uint64_t offset);

  /**
   * Write a whole file. Only offset 0 is supported (ENOSYS otherwise);
   * a name that is not valid UTF-8 is EINVAL.
   * @return Number of bytes written
   */
  Roe<uint64_t> write(const std::string &path, const std::string &data, uint64_t offset);

  Roe<void> truncate(const std::string &path, uint64_t length);
  Roe<void> unlink(const std::string &path);

  // Accepted without effect
  Roe<void> chmod(const std::string &path, uint32_t mode);
  Roe<void> chown(const std::string &path, uint32_t uid, uint32_t gid);
  Roe<void> utimens(const std::string &path);

private:
  static bool isRoot(const std::string &path) { return path == "/"; }
  static Roe<std::string> toFileName(const std::string &path);
  bool isCreated(const std::string &name) const;

  IntegrityService &service_;
  std::set<std::string> created_;
  mutable std::mutex mutex_;
};

} // namespace lfs
