#include <streamfs/errors.h>
#include <streamfs/local_accessor.h>

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <vector>

namespace streamfs {

namespace {

class LocalStreamReader final : public RemoteStreamReader {
  int fd;
  std::string path;

public:
  LocalStreamReader(int _fd, std::string _path) : fd(_fd), path(std::move(_path)) {}

  ~LocalStreamReader() override {
    if (fd != -1) ::close(fd);
  }

  ReadResult read(char* buf, size_t size) override {
    ssize_t res = ::read(fd, buf, size);
    if (res < 0) {
      throw make_errno_error(errno, "read " + path);
    }
    ReadResult result;
    result.bytes = static_cast<size_t>(res);
    result.eof = res == 0;
    return result;
  }

  void seek(int64_t offset) override {
    if (::lseek(fd, offset, SEEK_SET) == -1) {
      throw make_errno_error(errno, "seek " + path);
    }
  }

  void close() override {
    if (fd == -1) return;
    int res = ::close(fd);
    fd = -1;
    if (res == -1) {
      throw make_errno_error(errno, "close " + path);
    }
  }
};

class LocalStreamWriter final : public RemoteStreamWriter {
  int fd;
  std::string path;

public:
  LocalStreamWriter(int _fd, std::string _path) : fd(_fd), path(std::move(_path)) {}

  ~LocalStreamWriter() override {
    if (fd != -1) ::close(fd);
  }

  void write(const char* buf, size_t size) override {
    size_t done = 0;
    while (done < size) {
      ssize_t res = ::write(fd, buf + done, size - done);
      if (res < 0) {
        if (errno == EINTR) continue;
        throw make_errno_error(errno, "write " + path);
      }
      done += static_cast<size_t>(res);
    }
  }

  void close() override {
    if (fd == -1) return;
    int res = ::close(fd);
    fd = -1;
    if (res == -1) {
      throw make_errno_error(errno, "close " + path);
    }
  }
};

uid_t lookup_uid(const std::string& user) {
  struct passwd pwd;
  struct passwd* result = nullptr;
  std::vector<char> buf(16384);
  if (getpwnam_r(user.c_str(), &pwd, buf.data(), buf.size(), &result) == 0 && result) {
    return result->pw_uid;
  }
  char* end = nullptr;
  unsigned long id = std::strtoul(user.c_str(), &end, 10);
  if (user.empty() || *end != '\0') {
    throw RemoteError(EINVAL, "unknown user " + user);
  }
  return static_cast<uid_t>(id);
}

gid_t lookup_gid(const std::string& group) {
  struct group grp;
  struct group* result = nullptr;
  std::vector<char> buf(16384);
  if (getgrnam_r(group.c_str(), &grp, buf.data(), buf.size(), &result) == 0 && result) {
    return result->gr_gid;
  }
  char* end = nullptr;
  unsigned long id = std::strtoul(group.c_str(), &end, 10);
  if (group.empty() || *end != '\0') {
    throw RemoteError(EINVAL, "unknown group " + group);
  }
  return static_cast<gid_t>(id);
}

}  // namespace

LocalAccessor::LocalAccessor(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  canonical_root_ = std::filesystem::weakly_canonical(std::filesystem::absolute(root_), ec);
  if (ec) {
    throw make_errno_error(ec.value(), "store root " + root_);
  }
}

std::string LocalAccessor::resolve(const std::string& path) const {
  std::filesystem::path relative = std::filesystem::path(path).relative_path().lexically_normal();
  for (const auto& part : relative) {
    if (part == "..") {
      throw RemoteError(EACCES, path + " escapes the store root");
    }
  }

  // Symlinks inside the store may still point outside of it
  std::error_code ec;
  std::filesystem::path full = std::filesystem::weakly_canonical(canonical_root_ / relative, ec);
  if (ec) {
    throw make_errno_error(ec.value(), "resolve " + path);
  }
  std::filesystem::path inside = full.lexically_relative(canonical_root_);
  if (inside.empty() || *inside.begin() == "..") {
    throw RemoteError(EACCES, path + " escapes the store root");
  }
  return full.string();
}

Attrs LocalAccessor::stat(const std::string& path) {
  struct stat st;
  std::string full = resolve(path);
  if (::lstat(full.c_str(), &st) == -1) {
    throw make_errno_error(errno, "stat " + path);
  }

  Attrs attrs;
  attrs.name = std::filesystem::path(path).filename().string();
  attrs.ino = st.st_ino;
  attrs.mode = st.st_mode;
  attrs.nlink = st.st_nlink;
  attrs.uid = st.st_uid;
  attrs.gid = st.st_gid;
  attrs.size = st.st_size;
  attrs.atime = st.st_atime;
  attrs.mtime = st.st_mtime;
  attrs.ctime = st.st_ctime;
  return attrs;
}

std::unique_ptr<RemoteStreamReader> LocalAccessor::open_read(const std::string& path) {
  int fd = ::open(resolve(path).c_str(), O_RDONLY | O_NOFOLLOW);
  if (fd == -1) {
    throw make_errno_error(errno, "open " + path);
  }
  return std::make_unique<LocalStreamReader>(fd, path);
}

std::unique_ptr<RemoteStreamWriter> LocalAccessor::create(const std::string& path,
                                                           bool overwrite) {
  int flags = O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | (overwrite ? 0 : O_EXCL);
  int fd = ::open(resolve(path).c_str(), flags, 0644);
  if (fd == -1) {
    throw make_errno_error(errno, "create " + path);
  }
  return std::make_unique<LocalStreamWriter>(fd, path);
}

void LocalAccessor::chmod(const std::string& path, uint32_t mode) {
  if (::chmod(resolve(path).c_str(), mode) == -1) {
    throw make_errno_error(errno, "chmod " + path);
  }
}

void LocalAccessor::chown(const std::string& path, const std::string& user,
                          const std::string& group) {
  uid_t uid = lookup_uid(user);
  gid_t gid = lookup_gid(group);
  if (::lchown(resolve(path).c_str(), uid, gid) == -1) {
    throw make_errno_error(errno, "chown " + path);
  }
}

}  // namespace streamfs
