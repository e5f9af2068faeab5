#pragma once

#include <streamfs/accessor.h>
#include <streamfs/clock.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace streamfs {

class FileHandle;
class FileSystem;
class BufferedReader;
class FileWriter;

struct SetAttrRequest {
  std::optional<uint32_t> mode;
  std::optional<uint32_t> uid;
  std::optional<uint32_t> gid;
};

// A regular file of the backing store: cached attributes plus the set of
// handles currently open on it.
class File : public std::enable_shared_from_this<File> {
public:
  File(FileSystem& fs, std::string path, Attrs attrs);

  const std::string& path() const { return path_; }
  FileSystem& filesystem() const { return fs_; }

  // Cached attributes, refreshed from the backing store once expired
  Attrs attr();
  // Forces the next attr() to go to the backing store
  void invalidate();

  // Creates a handle for the given open(2) flags and registers it
  std::shared_ptr<FileHandle> open(int flags);

  std::unique_ptr<BufferedReader> open_reader();
  std::unique_ptr<FileWriter> open_writer(bool new_file);

  void add_handle(std::shared_ptr<FileHandle> handle);
  void remove_handle(const FileHandle* handle);
  std::vector<std::shared_ptr<FileHandle>> active_handles() const;

  // fsync on every open handle; returns after all were tried and rethrows
  // the last failure
  void fsync_all();

  // Applies mode and ownership changes independently. The cache is updated
  // only for changes the backing store accepted; the first failure is thrown
  // once both were attempted, without undoing the other change.
  Attrs set_attr(const SetAttrRequest& req);

private:
  FileSystem& fs_;
  std::string path_;

  std::mutex attrs_mutex_;
  Attrs attrs_;
  TimePoint expires_;

  mutable std::mutex handles_mutex_;
  std::vector<std::shared_ptr<FileHandle>> handles_;
};

}  // namespace streamfs
