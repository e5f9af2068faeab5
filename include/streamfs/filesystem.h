#pragma once

#include <streamfs/accessor.h>
#include <streamfs/buffered_reader.h>
#include <streamfs/clock.h>
#include <streamfs/retry_policy.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace streamfs {

class File;
class FileHandle;

struct MountOptions {
  ReaderOptions reader;
  RetryOptions retry;
  // How long cached file attributes stay valid
  Duration attr_ttl = std::chrono::seconds(60);
  // Where write handles keep their staging files
  std::string staging_dir = "/tmp";
};

/**
 * State of one mount: the backing store and the policies applied to it,
 * the inode table, one File object per known path and the table of open
 * handles addressed by the numbers handed to FUSE.
 */
class FileSystem {
public:
  static constexpr uint64_t ROOT_INO = 1;

  FileSystem(std::shared_ptr<RemoteAccessor> accessor, Clock& clock, MountOptions options = {});
  ~FileSystem();

  RemoteAccessor& accessor() { return *accessor_; }
  Clock& clock() { return clock_; }
  RetryPolicy& retry() { return retry_; }
  const MountOptions& options() const { return options_; }

  // Path of an inode; throws RemoteError(ENOENT) for unknown inodes
  std::string path_for_ino(uint64_t ino) const;
  uint64_t ino_for_path(const std::string& path);

  // Resolves name inside the parent directory, assigning an inode on success
  Attrs lookup(uint64_t parent, const std::string& name);
  Attrs getattr(uint64_t ino);

  // File object of a regular file, created on first use
  std::shared_ptr<File> file(uint64_t ino);
  std::shared_ptr<File> file(const std::string& path);
  // Registers a file that does not exist on the backing store yet
  std::shared_ptr<File> create_file(uint64_t parent, const std::string& name, uint32_t mode);

  uint64_t add_open_handle(std::shared_ptr<FileHandle> handle);
  std::shared_ptr<FileHandle> open_handle(uint64_t fh) const;
  std::shared_ptr<FileHandle> take_open_handle(uint64_t fh);

  static std::string join(const std::string& parent, const std::string& name);

private:
  std::shared_ptr<File> find_file(const std::string& path);
  std::shared_ptr<File> make_file(const std::string& path, Attrs attrs);

  std::shared_ptr<RemoteAccessor> accessor_;
  Clock& clock_;
  MountOptions options_;
  RetryPolicy retry_;

  mutable std::shared_mutex inode_mutex_;
  std::unordered_map<uint64_t, std::string> ino_to_path_;
  std::unordered_map<std::string, uint64_t> path_to_ino_;
  std::atomic<uint64_t> next_ino_{ROOT_INO + 1};

  std::mutex files_mutex_;
  std::unordered_map<std::string, std::shared_ptr<File>> files_;

  mutable std::shared_mutex handles_mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<FileHandle>> open_handles_;
  std::atomic<uint64_t> next_fh_{1};
};

}  // namespace streamfs
