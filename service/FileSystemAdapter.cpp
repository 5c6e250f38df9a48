#include "FileSystemAdapter.h"

#include <cerrno>
#include <sstream>
#include <sys/stat.h>

namespace lfs {

static std::string toOctal(uint32_t mode) {
  std::ostringstream oss;
  oss << '0' << std::oct << mode;
  return oss.str();
}

FileSystemAdapter::FileSystemAdapter(IntegrityService &service)
    : Module("service.fs"), service_(service) {}

FileSystemAdapter::Roe<std::string> FileSystemAdapter::toFileName(const std::string &path) {
  if (path.size() < 2 || path[0] != '/' || path.find('/', 1) != std::string::npos) {
    return Error(ENOENT, "No such file: " + path);
  }
  return path.substr(1);
}

bool FileSystemAdapter::isCreated(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return created_.count(name) > 0;
}

FileSystemAdapter::Roe<FileSystemAdapter::Attr>
FileSystemAdapter::getattr(const std::string &path) const {
  Attr attr;
  if (isRoot(path)) {
    attr.mode = S_IFDIR | 0755;
    attr.nlink = 2;
    return attr;
  }

  auto name = toFileName(path);
  if (!name) {
    return name.error();
  }
  auto info = service_.statFile(name.value());
  if (info) {
    attr.size = info.value().size;
  } else if (!isCreated(name.value())) {
    return Error(ENOENT, "No such file: " + path);
  }
  attr.mode = S_IFREG | 0644;
  attr.nlink = 1;
  return attr;
}

FileSystemAdapter::Roe<std::vector<std::string>>
FileSystemAdapter::readdir(const std::string &path) const {
  if (!isRoot(path)) {
    if (getattr(path)) {
      return Error(ENOTDIR, "Not a directory: " + path);
    }
    return Error(ENOENT, "No such directory: " + path);
  }

  std::set<std::string> names;
  for (const auto &file : service_.listFiles()) {
    names.insert(file.name);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    names.insert(created_.begin(), created_.end());
  }

  std::vector<std::string> entries{ ".", ".." };
  entries.insert(entries.end(), names.begin(), names.end());
  return entries;
}

FileSystemAdapter::Roe<void> FileSystemAdapter::create(const std::string &path,
                                                       uint32_t mode) {
  if (isRoot(path)) {
    return Error(EEXIST, "Cannot create the root directory");
  }
  auto name = toFileName(path);
  if (!name) {
    return name.error();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  created_.insert(name.value());
  log().debug << "Created " << path << " (mode " << toOctal(mode) << ")";
  return {};
}

FileSystemAdapter::Roe<std::string> FileSystemAdapter::read(const std::string &path,
                                                            uint64_t size,
                                                            uint64_t offset) {
  if (isRoot(path)) {
    return Error(EISDIR, "Is a directory: " + path);
  }
  auto name = toFileName(path);
  if (!name) {
    return name.error();
  }

  auto result = service_.readFile(name.value(), offset, size);
  if (!result) {
    if (result.error().code == IntegrityService::E_NOT_FOUND) {
      if (isCreated(name.value())) {
        return std::string();
      }
      return Error(ENOENT, result.error().message);
    }
    log().error << "Read of " << path << " failed: " << result.error().message;
    return Error(EIO, result.error().message);
  }
  return result.value();
}

FileSystemAdapter::Roe<uint64_t> FileSystemAdapter::write(const std::string &path,
                                                          const std::string &data,
                                                          uint64_t offset) {
  if (isRoot(path)) {
    return Error(EISDIR, "Is a directory: " + path);
  }
  auto name = toFileName(path);
  if (!name) {
    return name.error();
  }

  auto result = service_.writeFile(name.value(), data, offset);
  if (!result) {
    switch (result.error().code) {
    case IntegrityService::E_NOT_SUPPORTED:
      return Error(ENOSYS, result.error().message);
    case IntegrityService::E_INVALID_NAME:
      return Error(EINVAL, result.error().message);
    default:
      log().error << "Write of " << path << " failed: " << result.error().message;
      return Error(EIO, result.error().message);
    }
  }
  return result.value().bytesWritten;
}

FileSystemAdapter::Roe<void> FileSystemAdapter::truncate(const std::string &path,
                                                         uint64_t length) {
  auto name = toFileName(path);
  auto result = service_.truncateFile(name ? name.value() : path);
  if (!result) {
    log().debug << "truncate " << path << " to " << length << " refused";
    return Error(EPERM, result.error().message);
  }
  return {};
}

FileSystemAdapter::Roe<void> FileSystemAdapter::unlink(const std::string &path) {
  auto name = toFileName(path);
  auto result = service_.deleteFile(name ? name.value() : path);
  if (!result) {
    return Error(EPERM, result.error().message);
  }
  return {};
}

FileSystemAdapter::Roe<void> FileSystemAdapter::chmod(const std::string &path,
                                                      uint32_t mode) {
  log().debug << "chmod " << path << " " << toOctal(mode) << " ignored";
  return {};
}

FileSystemAdapter::Roe<void> FileSystemAdapter::chown(const std::string &path,
                                                      uint32_t uid, uint32_t gid) {
  log().debug << "chown " << path << " " << uid << ":" << gid << " ignored";
  return {};
}

FileSystemAdapter::Roe<void> FileSystemAdapter::utimens(const std::string &path) {
  log().debug << "utimens " << path << " ignored";
  return {};
}

} // namespace lfs
