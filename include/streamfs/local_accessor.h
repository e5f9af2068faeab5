#pragma once

#include <streamfs/accessor.h>

#include <filesystem>
#include <string>

namespace streamfs {

// Backing store over a local directory tree; paths are relative to root
class LocalAccessor final : public RemoteAccessor {
public:
  explicit LocalAccessor(std::string root);

  Attrs stat(const std::string& path) override;
  std::unique_ptr<RemoteStreamReader> open_read(const std::string& path) override;
  std::unique_ptr<RemoteStreamWriter> create(const std::string& path, bool overwrite) override;
  void chmod(const std::string& path, uint32_t mode) override;
  void chown(const std::string& path, const std::string& user, const std::string& group) override;

  const std::string& root() const { return root_; }

private:
  std::string resolve(const std::string& path) const;

  std::string root_;
  // root_ with symlinks resolved; every resolved path must stay below it
  std::filesystem::path canonical_root_;
};

}  // namespace streamfs
