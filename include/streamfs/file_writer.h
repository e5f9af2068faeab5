#pragma once

#include <streamfs/accessor.h>
#include <streamfs/retry_policy.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace streamfs {

/**
 * Write path of a handle. Random-offset writes go to a local staging file
 * (created unlinked in staging_dir); flush() uploads the whole staging file
 * to the backing store in one sequential pass.
 */
class FileWriter {
public:
  // When new_file is false the current content of path is copied into the
  // staging file first, so partial overwrites keep the rest of the file.
  FileWriter(RemoteAccessor& accessor, RetryPolicy& retry, std::string path,
             const std::string& staging_dir, bool new_file);
  ~FileWriter();

  FileWriter(const FileWriter&) = delete;
  FileWriter& operator=(const FileWriter&) = delete;

  size_t write(int64_t offset, const char* data, size_t size);

  // Uploads the staging file if anything changed since the last upload.
  // Returns true when an upload happened.
  bool flush();

  // Flushes and drops the staging file; later calls are no-ops
  void close();

  bool dirty() const { return dirty_; }
  int64_t size() const { return size_; }

private:
  void download();
  void upload();

  RemoteAccessor& accessor_;
  RetryPolicy& retry_;
  std::string path_;
  int fd_ = -1;
  int64_t size_ = 0;
  bool dirty_ = false;
};

}  // namespace streamfs
