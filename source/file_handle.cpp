#include <streamfs/file.h>
#include <streamfs/file_handle.h>
#include <streamfs/log.h>

#include <errno.h>

namespace streamfs {

const char* to_string(HandleMode mode) {
  switch (mode) {
    case HandleMode::NotOpened:
      return "not-opened";
    case HandleMode::ReadOnly:
      return "read-only";
    case HandleMode::WriteOnly:
      return "write-only";
    case HandleMode::ReadWrite:
      return "read-write";
    case HandleMode::Closed:
      return "closed";
  }
  return "unknown";
}

FileHandle::FileHandle(std::shared_ptr<File> file) : file_(std::move(file)) {}

FileHandle::~FileHandle() = default;

HandleMode FileHandle::mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mode_;
}

void FileHandle::enable_read() {
  std::lock_guard<std::mutex> lock(mutex_);
  enable_read_locked();
}

void FileHandle::enable_write(bool new_file) {
  std::lock_guard<std::mutex> lock(mutex_);
  enable_write_locked(new_file);
}

void FileHandle::enable_read_locked() {
  switch (mode_) {
    case HandleMode::ReadOnly:
    case HandleMode::ReadWrite:
      // Dropped after an upload, or a reopen failed
      if (!reader_) reader_ = file_->open_reader();
      return;
    case HandleMode::Closed:
      throw RemoteError(EBADF, file_->path() + ": handle is released");
    case HandleMode::NotOpened:
      reader_ = file_->open_reader();
      mode_ = HandleMode::ReadOnly;
      return;
    case HandleMode::WriteOnly:
      reader_ = file_->open_reader();
      mode_ = HandleMode::ReadWrite;
      return;
  }
}

void FileHandle::enable_write_locked(bool new_file) {
  switch (mode_) {
    case HandleMode::WriteOnly:
    case HandleMode::ReadWrite:
      return;
    case HandleMode::Closed:
      throw RemoteError(EBADF, file_->path() + ": handle is released");
    case HandleMode::NotOpened:
      writer_ = file_->open_writer(new_file);
      mode_ = HandleMode::WriteOnly;
      return;
    case HandleMode::ReadOnly:
      writer_ = file_->open_writer(new_file);
      mode_ = HandleMode::ReadWrite;
      return;
  }
}

std::vector<char> FileHandle::read(int64_t offset, size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mode_ == HandleMode::WriteOnly) {
    log::warning("[{}] reading file opened for write @{}", file_->path(), offset);
  }
  enable_read_locked();
  return reader_->read(offset, size);
}

size_t FileHandle::write(int64_t offset, const char* data, size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  enable_write_locked(false);
  return writer_->write(offset, data, size);
}

void FileHandle::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  flush_locked();
}

void FileHandle::fsync() {
  std::lock_guard<std::mutex> lock(mutex_);
  flush_locked();
}

void FileHandle::flush_locked() {
  if (!writer_) return;
  if (!writer_->flush()) return;
  file_->invalidate();
  if (reader_) {
    // Retained bytes predate the upload; the next read reopens
    auto reader = std::move(reader_);
    try {
      reader->close();
    } catch (const std::exception& e) {
      log::warning("[{}] closing stale reader: {}", file_->path(), e.what());
    }
  }
}

void FileHandle::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mode_ == HandleMode::Closed) return;

  if (reader_) {
    auto reader = std::move(reader_);
    try {
      reader->close();
      log::info("[{}] Close/Read: ok", file_->path());
    } catch (const std::exception& e) {
      log::error("[{}] Close/Read: {}", file_->path(), e.what());
    }
  }
  if (writer_) {
    auto writer = std::move(writer_);
    try {
      writer->close();
      log::info("[{}] Close/Write: ok", file_->path());
    } catch (const std::exception& e) {
      log::error("[{}] Close/Write: {}", file_->path(), e.what());
    }
  }
  mode_ = HandleMode::Closed;

  file_->invalidate();
  file_->remove_handle(this);
}

}  // namespace streamfs
