#include <streamfs/accessor.h>

#include <string.h>

namespace streamfs {

void Attrs::fill(struct stat* st) const {
  memset(st, 0, sizeof(*st));
  st->st_ino = ino;
  st->st_mode = mode;
  st->st_nlink = nlink;
  st->st_uid = uid;
  st->st_gid = gid;
  st->st_size = size;
  st->st_atime = atime;
  st->st_mtime = mtime;
  st->st_ctime = ctime;
  st->st_blksize = 4096;
  st->st_blocks = (size + 511) / 512;
}

}  // namespace streamfs
