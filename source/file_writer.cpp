#include <streamfs/file_writer.h>
#include <streamfs/log.h>

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <vector>

namespace streamfs {

static constexpr size_t TRANSFER_CHUNK = 1024 * 1024;

FileWriter::FileWriter(RemoteAccessor& accessor, RetryPolicy& retry, std::string path,
                       const std::string& staging_dir, bool new_file)
    : accessor_(accessor), retry_(retry), path_(std::move(path)) {
  std::string tmpl = staging_dir + "/streamfs-staging-XXXXXX";
  std::vector<char> name(tmpl.begin(), tmpl.end());
  name.push_back('\0');

  fd_ = ::mkstemp(name.data());
  if (fd_ == -1) {
    throw make_errno_error(errno, "staging file in " + staging_dir);
  }
  // Only the descriptor keeps the staging file alive
  ::unlink(name.data());

  if (new_file) {
    // Even an empty new file has to reach the backing store
    dirty_ = true;
    return;
  }

  try {
    download();
  } catch (const std::exception&) {
    ::close(fd_);
    fd_ = -1;
    throw;
  }
}

FileWriter::~FileWriter() {
  if (fd_ == -1) return;
  try {
    close();
  } catch (const std::exception& e) {
    log::error("[{}] dropping unsaved writes: {}", path_, e.what());
  }
}

void FileWriter::download() {
  std::unique_ptr<RemoteStreamReader> reader;
  try {
    reader = retry_.run("open " + path_, [&]() { return accessor_.open_read(path_); });
  } catch (const RemoteError& e) {
    if (e.err() == ENOENT) return;
    throw;
  }

  std::vector<char> buf(TRANSFER_CHUNK);
  int64_t offset = 0;
  while (true) {
    ReadResult result = retry_.run("read " + path_, [&]() {
      return reader->read(buf.data(), buf.size());
    });
    if (result.bytes > 0) {
      ssize_t res = ::pwrite(fd_, buf.data(), result.bytes, offset);
      if (res < 0 || static_cast<size_t>(res) != result.bytes) {
        int err = res < 0 ? errno : EIO;
        reader->close();
        throw make_errno_error(err, "staging " + path_);
      }
      offset += static_cast<int64_t>(result.bytes);
    }
    if (result.eof || result.bytes == 0) break;
  }
  reader->close();
  size_ = offset;
}

size_t FileWriter::write(int64_t offset, const char* data, size_t size) {
  if (fd_ == -1) {
    throw RemoteError(EBADF, path_ + ": write on a closed writer");
  }
  size_t done = 0;
  while (done < size) {
    ssize_t res = ::pwrite(fd_, data + done, size - done, offset + static_cast<int64_t>(done));
    if (res < 0) {
      if (errno == EINTR) continue;
      throw make_errno_error(errno, "staging " + path_);
    }
    done += static_cast<size_t>(res);
  }
  if (size > 0) {
    dirty_ = true;
    size_ = std::max(size_, offset + static_cast<int64_t>(size));
  }
  return done;
}

bool FileWriter::flush() {
  if (fd_ == -1 || !dirty_) return false;
  retry_.run("upload " + path_, [&]() { upload(); });
  dirty_ = false;
  log::debug("[{}] uploaded {} bytes", path_, size_);
  return true;
}

void FileWriter::upload() {
  auto writer = accessor_.create(path_, true);
  std::vector<char> buf(TRANSFER_CHUNK);
  int64_t offset = 0;
  while (offset < size_) {
    ssize_t res = ::pread(fd_, buf.data(), buf.size(), offset);
    if (res < 0) {
      if (errno == EINTR) continue;
      throw make_errno_error(errno, "staging " + path_);
    }
    if (res == 0) break;
    writer->write(buf.data(), static_cast<size_t>(res));
    offset += res;
  }
  writer->close();
}

void FileWriter::close() {
  if (fd_ == -1) return;
  try {
    flush();
  } catch (const std::exception&) {
    ::close(fd_);
    fd_ = -1;
    throw;
  }
  ::close(fd_);
  fd_ = -1;
}

}  // namespace streamfs
