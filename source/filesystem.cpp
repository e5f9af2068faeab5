#include <streamfs/file.h>
#include <streamfs/file_handle.h>
#include <streamfs/filesystem.h>
#include <streamfs/log.h>

#include <errno.h>
#include <unistd.h>

#include <mutex>
#include <vector>

namespace streamfs {

FileSystem::FileSystem(std::shared_ptr<RemoteAccessor> accessor, Clock& clock,
                       MountOptions options)
    : accessor_(std::move(accessor)),
      clock_(clock),
      options_(std::move(options)),
      retry_(clock, options_.retry) {
  ino_to_path_[ROOT_INO] = "/";
  path_to_ino_["/"] = ROOT_INO;
}

// Handles left open at unmount are released, uploading their pending writes
FileSystem::~FileSystem() {
  std::vector<std::shared_ptr<File>> files;
  {
    std::lock_guard<std::mutex> lock(files_mutex_);
    for (auto& entry : files_) {
      files.push_back(entry.second);
    }
  }
  for (auto& file : files) {
    for (auto& handle : file->active_handles()) {
      try {
        handle->release();
      } catch (const std::exception& e) {
        log::error("[{}] release at unmount: {}", file->path(), e.what());
      }
    }
  }
}

std::string FileSystem::join(const std::string& parent, const std::string& name) {
  if (parent.empty() || parent == "/") return "/" + name;
  return parent + "/" + name;
}

std::string FileSystem::path_for_ino(uint64_t ino) const {
  std::shared_lock lock(inode_mutex_);
  auto it = ino_to_path_.find(ino);
  if (it == ino_to_path_.end()) {
    throw RemoteError(ENOENT, "unknown inode " + std::to_string(ino));
  }
  return it->second;
}

uint64_t FileSystem::ino_for_path(const std::string& path) {
  {
    std::shared_lock lock(inode_mutex_);
    auto it = path_to_ino_.find(path);
    if (it != path_to_ino_.end()) return it->second;
  }
  std::unique_lock lock(inode_mutex_);
  auto it = path_to_ino_.find(path);
  if (it != path_to_ino_.end()) return it->second;

  uint64_t ino = next_ino_++;
  ino_to_path_[ino] = path;
  path_to_ino_[path] = ino;
  return ino;
}

Attrs FileSystem::lookup(uint64_t parent, const std::string& name) {
  std::string path = join(path_for_ino(parent), name);

  if (auto known = find_file(path)) {
    return known->attr();
  }

  Attrs attrs = accessor_->stat(path);
  attrs.ino = ino_for_path(path);
  if (!attrs.is_dir()) {
    make_file(path, attrs);
  }
  return attrs;
}

Attrs FileSystem::getattr(uint64_t ino) {
  std::string path = path_for_ino(ino);
  if (auto known = find_file(path)) {
    return known->attr();
  }
  Attrs attrs = accessor_->stat(path);
  attrs.ino = ino;
  return attrs;
}

std::shared_ptr<File> FileSystem::file(uint64_t ino) { return file(path_for_ino(ino)); }

std::shared_ptr<File> FileSystem::find_file(const std::string& path) {
  std::lock_guard<std::mutex> lock(files_mutex_);
  auto it = files_.find(path);
  return it == files_.end() ? nullptr : it->second;
}

std::shared_ptr<File> FileSystem::file(const std::string& path) {
  if (auto known = find_file(path)) {
    return known;
  }
  Attrs attrs = accessor_->stat(path);
  if (attrs.is_dir()) {
    throw RemoteError(EISDIR, path + " is a directory");
  }
  attrs.ino = ino_for_path(path);
  return make_file(path, attrs);
}

std::shared_ptr<File> FileSystem::create_file(uint64_t parent, const std::string& name,
                                              uint32_t mode) {
  std::string path = join(path_for_ino(parent), name);
  Attrs attrs;
  attrs.name = name;
  attrs.mode = S_IFREG | (mode & 07777);
  attrs.ino = ino_for_path(path);
  attrs.uid = geteuid();
  attrs.gid = getegid();
  auto file = make_file(path, attrs);
  // Nothing was uploaded yet; let the first attr() ask the store
  file->invalidate();
  return file;
}

std::shared_ptr<File> FileSystem::make_file(const std::string& path, Attrs attrs) {
  std::lock_guard<std::mutex> lock(files_mutex_);
  auto it = files_.find(path);
  if (it != files_.end()) return it->second;
  auto file = std::make_shared<File>(*this, path, std::move(attrs));
  files_[path] = file;
  return file;
}

uint64_t FileSystem::add_open_handle(std::shared_ptr<FileHandle> handle) {
  uint64_t fh = next_fh_++;
  std::unique_lock lock(handles_mutex_);
  open_handles_[fh] = std::move(handle);
  return fh;
}

std::shared_ptr<FileHandle> FileSystem::open_handle(uint64_t fh) const {
  std::shared_lock lock(handles_mutex_);
  auto it = open_handles_.find(fh);
  if (it == open_handles_.end()) {
    throw RemoteError(EBADF, "unknown file handle " + std::to_string(fh));
  }
  return it->second;
}

std::shared_ptr<FileHandle> FileSystem::take_open_handle(uint64_t fh) {
  std::unique_lock lock(handles_mutex_);
  auto it = open_handles_.find(fh);
  if (it == open_handles_.end()) return nullptr;
  auto handle = std::move(it->second);
  open_handles_.erase(it);
  return handle;
}

}  // namespace streamfs
