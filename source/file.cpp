#include <streamfs/buffered_reader.h>
#include <streamfs/file.h>
#include <streamfs/file_handle.h>
#include <streamfs/file_writer.h>
#include <streamfs/filesystem.h>
#include <streamfs/log.h>

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <exception>

namespace streamfs {

// Names handed to the backing store for chown; ids without a passwd/group
// entry are passed as decimal strings
static std::string user_name(uint32_t uid) {
  struct passwd pwd;
  struct passwd* result = nullptr;
  std::vector<char> buf(16384);
  if (getpwuid_r(uid, &pwd, buf.data(), buf.size(), &result) == 0 && result) {
    return result->pw_name;
  }
  return std::to_string(uid);
}

static std::string group_name(uint32_t gid) {
  struct group grp;
  struct group* result = nullptr;
  std::vector<char> buf(16384);
  if (getgrgid_r(gid, &grp, buf.data(), buf.size(), &result) == 0 && result) {
    return result->gr_name;
  }
  return std::to_string(gid);
}

File::File(FileSystem& fs, std::string path, Attrs attrs)
    : fs_(fs),
      path_(std::move(path)),
      attrs_(std::move(attrs)),
      expires_(fs.clock().now() + fs.options().attr_ttl) {}

Attrs File::attr() {
  std::lock_guard<std::mutex> lock(attrs_mutex_);
  TimePoint now = fs_.clock().now();
  if (now >= expires_) {
    Attrs fresh = fs_.accessor().stat(path_);
    fresh.ino = attrs_.ino;
    attrs_ = std::move(fresh);
    expires_ = now + fs_.options().attr_ttl;
  }
  return attrs_;
}

void File::invalidate() {
  std::lock_guard<std::mutex> lock(attrs_mutex_);
  expires_ = fs_.clock().now() - std::chrono::seconds(1);
}

std::shared_ptr<FileHandle> File::open(int flags) {
  log::info("[{}] open flags={:#o}", path_, flags);
  auto handle = std::make_shared<FileHandle>(shared_from_this());

  int access = flags & O_ACCMODE;
  if (access == O_RDONLY || access == O_RDWR) {
    handle->enable_read();
  }

  // Write-only opens start a new file unless appending. Read-write opens
  // enable writing lazily on the first write, unless they truncate.
  bool append = (flags & O_APPEND) == O_APPEND;
  if (access == O_WRONLY) {
    handle->enable_write(!append);
  } else if (access == O_RDWR && (flags & O_TRUNC) && !append) {
    handle->enable_write(true);
  }

  add_handle(handle);
  return handle;
}

std::unique_ptr<BufferedReader> File::open_reader() {
  auto& retry = fs_.retry();
  auto stream = retry.run("open " + path_, [&]() { return fs_.accessor().open_read(path_); });
  return std::make_unique<BufferedReader>(std::move(stream), retry, path_, fs_.options().reader);
}

std::unique_ptr<FileWriter> File::open_writer(bool new_file) {
  return std::make_unique<FileWriter>(fs_.accessor(), fs_.retry(), path_,
                                      fs_.options().staging_dir, new_file);
}

void File::add_handle(std::shared_ptr<FileHandle> handle) {
  std::lock_guard<std::mutex> lock(handles_mutex_);
  handles_.push_back(std::move(handle));
}

void File::remove_handle(const FileHandle* handle) {
  std::lock_guard<std::mutex> lock(handles_mutex_);
  for (auto it = handles_.begin(); it != handles_.end(); ++it) {
    if (it->get() == handle) {
      handles_.erase(it);
      break;
    }
  }
}

std::vector<std::shared_ptr<FileHandle>> File::active_handles() const {
  std::lock_guard<std::mutex> lock(handles_mutex_);
  return handles_;
}

void File::fsync_all() {
  auto handles = active_handles();
  log::info("Dispatching fsync request to {} open handles", handles.size());

  std::exception_ptr last_error;
  for (auto& handle : handles) {
    try {
      handle->fsync();
    } catch (const std::exception& e) {
      log::error("[{}] fsync failed: {}", path_, e.what());
      last_error = std::current_exception();
    }
  }
  if (last_error) {
    std::rethrow_exception(last_error);
  }
}

Attrs File::set_attr(const SetAttrRequest& req) {
  std::lock_guard<std::mutex> lock(attrs_mutex_);
  std::exception_ptr first_error;

  if (req.mode && (*req.mode & 07777) != (attrs_.mode & 07777)) {
    uint32_t mode = *req.mode & 07777;
    log::info("Chmod [{}] to [{:o}]", path_, mode);
    try {
      fs_.accessor().chmod(path_, mode);
      attrs_.mode = (attrs_.mode & S_IFMT) | mode;
    } catch (const std::exception& e) {
      log::error("Chmod failed with error: {}", e.what());
      first_error = std::current_exception();
    }
  }

  uint32_t uid = req.uid.value_or(attrs_.uid);
  uint32_t gid = req.gid.value_or(attrs_.gid);
  if (uid != attrs_.uid || gid != attrs_.gid) {
    std::string user = user_name(uid);
    std::string group = group_name(gid);
    log::info("Chown [{}] to [{}:{}]", path_, user, group);
    try {
      fs_.accessor().chown(path_, user, group);
      attrs_.uid = uid;
      attrs_.gid = gid;
    } catch (const std::exception& e) {
      log::error("Chown failed with error: {}", e.what());
      if (!first_error) first_error = std::current_exception();
    }
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
  return attrs_;
}

}  // namespace streamfs
