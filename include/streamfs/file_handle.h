#pragma once

#include <streamfs/buffered_reader.h>
#include <streamfs/file_writer.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace streamfs {

class File;

enum class HandleMode { NotOpened, ReadOnly, WriteOnly, ReadWrite, Closed };

const char* to_string(HandleMode mode);

// One open session on a file. Every operation runs under the handle's own
// mutex, so reads, writes, flushes and release never interleave for a handle.
class FileHandle {
public:
  explicit FileHandle(std::shared_ptr<File> file);
  ~FileHandle();

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  // Both are idempotent
  void enable_read();
  void enable_write(bool new_file);

  std::vector<char> read(int64_t offset, size_t size);
  size_t write(int64_t offset, const char* data, size_t size);
  void flush();
  void fsync();

  // Closes reader and writer (each at most once), invalidates the file's
  // cached attributes and unregisters from the file. Safe to call twice.
  void release();

  HandleMode mode() const;
  File& file() const { return *file_; }

private:
  void enable_read_locked();
  void enable_write_locked(bool new_file);
  void flush_locked();

  std::shared_ptr<File> file_;
  HandleMode mode_ = HandleMode::NotOpened;
  std::unique_ptr<BufferedReader> reader_;
  std::unique_ptr<FileWriter> writer_;
  mutable std::mutex mutex_;
};

}  // namespace streamfs
