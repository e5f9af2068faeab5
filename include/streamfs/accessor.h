#pragma once

#include <sys/stat.h>

#include <cstdint>
#include <memory>
#include <string>

#include <streamfs/stream.h>

namespace streamfs {

// File metadata as reported by the backing store
struct Attrs {
  std::string name;
  uint64_t ino = 0;
  uint32_t mode = 0;
  uint32_t nlink = 1;
  uint32_t uid = 0;
  uint32_t gid = 0;
  int64_t size = 0;
  int64_t atime = 0;
  int64_t mtime = 0;
  int64_t ctime = 0;

  bool is_dir() const { return S_ISDIR(mode); }

  // Fills a struct stat for the FUSE layer
  void fill(struct stat* st) const;
};

// Access to the backing store. All operations throw RemoteError on failure.
class RemoteAccessor {
public:
  virtual ~RemoteAccessor() = default;

  virtual Attrs stat(const std::string& path) = 0;
  virtual std::unique_ptr<RemoteStreamReader> open_read(const std::string& path) = 0;
  virtual std::unique_ptr<RemoteStreamWriter> create(const std::string& path, bool overwrite) = 0;
  virtual void chmod(const std::string& path, uint32_t mode) = 0;
  virtual void chown(const std::string& path, const std::string& user,
                     const std::string& group) = 0;
};

}  // namespace streamfs
