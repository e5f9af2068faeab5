#pragma once

#include <streamfs/filesystem.h>

#include <memory>
#include <string>
#include <vector>

namespace streamfs {

// Mounts fs at mountpoint with libfuse's low-level API and serves requests
// on the multi-threaded session loop until unmounted. Returns 0 on a clean
// unmount.
int start_fs(char* executable, char* mountpoint, const std::vector<std::string>& options,
             std::shared_ptr<FileSystem> fs);

}  // namespace streamfs
