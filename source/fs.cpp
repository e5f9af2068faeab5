#define FUSE_USE_VERSION 29
#define _FILE_OFFSET_BITS 64

#include <fcntl.h>
#include <fuse_lowlevel.h>
#include <streamfs/errors.h>
#include <streamfs/file.h>
#include <streamfs/file_handle.h>
#include <streamfs/fs.h>
#include <streamfs/log.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <iostream>

using namespace streamfs;

static std::shared_ptr<FileSystem> g_fs;

static double attr_timeout() {
  return std::chrono::duration<double>(g_fs->options().attr_ttl).count();
}

static void reply_error(fuse_req_t req, const char *operation, const std::exception &e) {
  int err = error_code(e);
  if (err == ENOENT) {
    streamfs::log::debug("{} error: {}", operation, e.what());
  } else {
    streamfs::log::error("{} error: {}", operation, e.what());
  }
  fuse_reply_err(req, err);
}

static void fill_entry(struct fuse_entry_param *e, const Attrs &attrs) {
  memset(e, 0, sizeof(*e));
  e->ino = attrs.ino;
  e->attr_timeout = attr_timeout();
  e->entry_timeout = attr_timeout();
  attrs.fill(&e->attr);
}

static void streamfs_ll_init(void *userdata, struct fuse_conn_info *conn) {
  (void)userdata;

  // Request async reads for better pipelining (kernel issues multiple reads concurrently)
  if (conn->capable & FUSE_CAP_ASYNC_READ) {
    conn->want |= FUSE_CAP_ASYNC_READ;
  }

  // Enable big writes (single writes larger than 4KB)
  if (conn->capable & FUSE_CAP_BIG_WRITES) {
    conn->want |= FUSE_CAP_BIG_WRITES;
  }

  // O_TRUNC arrives with open() instead of a separate truncate, which the
  // write path cannot serve
  if (conn->capable & FUSE_CAP_ATOMIC_O_TRUNC) {
    conn->want |= FUSE_CAP_ATOMIC_O_TRUNC;
  }

  conn->max_background = 256;
  conn->congestion_threshold = 200;
}

static void streamfs_ll_lookup(fuse_req_t req, fuse_ino_t parent, const char *name) {
  try {
    struct fuse_entry_param e;
    fill_entry(&e, g_fs->lookup(parent, name));
    fuse_reply_entry(req, &e);
  } catch (const std::exception &ex) {
    reply_error(req, "lookup", ex);
  }
}

static void streamfs_ll_getattr(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
  (void)fi;
  try {
    struct stat attr;
    g_fs->getattr(ino).fill(&attr);
    fuse_reply_attr(req, &attr, attr_timeout());
  } catch (const std::exception &e) {
    reply_error(req, "getattr", e);
  }
}

/**
 * @brief Only mode and ownership changes reach the backing store. Time
 * updates are accepted and ignored, size changes are refused.
 */
static void streamfs_ll_setattr(fuse_req_t req, fuse_ino_t ino, struct stat *attr, int to_set,
                                struct fuse_file_info *fi) {
  (void)fi;
  if (to_set & FUSE_SET_ATTR_SIZE) {
    fuse_reply_err(req, EOPNOTSUPP);
    return;
  }

  try {
    SetAttrRequest request;
    if (to_set & FUSE_SET_ATTR_MODE) request.mode = attr->st_mode;
    if (to_set & FUSE_SET_ATTR_UID) request.uid = attr->st_uid;
    if (to_set & FUSE_SET_ATTR_GID) request.gid = attr->st_gid;

    auto file = g_fs->file(ino);
    Attrs updated = (request.mode || request.uid || request.gid) ? file->set_attr(request)
                                                                   : file->attr();
    struct stat st;
    updated.fill(&st);
    fuse_reply_attr(req, &st, attr_timeout());
  } catch (const std::exception &e) {
    reply_error(req, "setattr", e);
  }
}

static void streamfs_ll_open(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
  try {
    auto file = g_fs->file(ino);
    auto handle = file->open(fi->flags);
    fi->fh = g_fs->add_open_handle(handle);

    if (fuse_reply_open(req, fi) != 0) {
      // The open was interrupted; the kernel will never release this handle
      g_fs->take_open_handle(fi->fh);
      handle->release();
    }
  } catch (const std::exception &e) {
    reply_error(req, "open", e);
  }
}

static void streamfs_ll_create(fuse_req_t req, fuse_ino_t parent, const char *name,
                               mode_t mode, struct fuse_file_info *fi) {
  try {
    auto file = g_fs->create_file(parent, name, mode);
    auto handle = file->open(O_WRONLY | (fi->flags & O_APPEND));
    // Upload the empty file right away so it can be looked up
    handle->flush();
    fi->fh = g_fs->add_open_handle(handle);

    struct fuse_entry_param e;
    fill_entry(&e, file->attr());
    if (fuse_reply_create(req, &e, fi) != 0) {
      g_fs->take_open_handle(fi->fh);
      handle->release();
    }
  } catch (const std::exception &e) {
    reply_error(req, "create", e);
  }
}

static void streamfs_ll_read(fuse_req_t req, fuse_ino_t ino, size_t size, off_t off,
                             struct fuse_file_info *fi) {
  (void)ino;
  try {
    auto handle = g_fs->open_handle(fi->fh);
    std::vector<char> data = handle->read(off, size);
    fuse_reply_buf(req, data.data(), data.size());
  } catch (const std::exception &e) {
    reply_error(req, "read", e);
  }
}

static void streamfs_ll_write(fuse_req_t req, fuse_ino_t ino, const char *buf, size_t size,
                              off_t off, struct fuse_file_info *fi) {
  (void)ino;
  try {
    auto handle = g_fs->open_handle(fi->fh);
    fuse_reply_write(req, handle->write(off, buf, size));
  } catch (const std::exception &e) {
    reply_error(req, "write", e);
  }
}

static void streamfs_ll_flush(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
  (void)ino;
  try {
    g_fs->open_handle(fi->fh)->flush();
    fuse_reply_err(req, 0);
  } catch (const std::exception &e) {
    reply_error(req, "flush", e);
  }
}

// fsync is broadcast to every handle open on the file
static void streamfs_ll_fsync(fuse_req_t req, fuse_ino_t ino, int datasync,
                              struct fuse_file_info *fi) {
  (void)datasync;
  (void)fi;
  try {
    g_fs->file(ino)->fsync_all();
    fuse_reply_err(req, 0);
  } catch (const std::exception &e) {
    reply_error(req, "fsync", e);
  }
}

static void streamfs_ll_release(fuse_req_t req, fuse_ino_t ino, struct fuse_file_info *fi) {
  (void)ino;
  auto handle = g_fs->take_open_handle(fi->fh);
  if (handle) {
    handle->release();
  }
  fuse_reply_err(req, 0);
}

// clang-format off
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
static const struct fuse_lowlevel_ops streamfs_ll_oper = {
    .init = streamfs_ll_init,
    .lookup = streamfs_ll_lookup,
    .getattr = streamfs_ll_getattr,
    .setattr = streamfs_ll_setattr,
    .open = streamfs_ll_open,
    .read = streamfs_ll_read,
    .write = streamfs_ll_write,
    .flush = streamfs_ll_flush,
    .release = streamfs_ll_release,
    .fsync = streamfs_ll_fsync,
    .create = streamfs_ll_create,
};
#pragma GCC diagnostic pop
// clang-format on

int streamfs::start_fs(char *executable, char *mountpoint_arg,
                       const std::vector<std::string> &options, std::shared_ptr<FileSystem> fs) {
  g_fs = std::move(fs);

  char *argv[2] = {executable, mountpoint_arg};
  int err = -1;
  char *mountpoint;

  struct fuse_args args = FUSE_ARGS_INIT(2, argv);
  err = fuse_parse_cmdline(&args, &mountpoint, NULL, NULL);

  if (err == -1) {
    std::cout << "There was an issue parsing fuse options" << std::endl;
    return err;
  }

  for (const std::string &option : options) {
    fuse_opt_add_arg(&args, "-o");
    fuse_opt_add_arg(&args, option.c_str());
  }

  struct fuse_chan *ch = fuse_mount(mountpoint, &args);

  if (ch == NULL) {
    std::cout << "There was an error mounting the fuse endpoint" << std::endl;
    fuse_opt_free_args(&args);
    return -1;
  }

  struct fuse_session *se
      = fuse_lowlevel_new(&args, &streamfs_ll_oper, sizeof(streamfs_ll_oper), NULL);

  if (se != NULL) {
    if (fuse_set_signal_handlers(se) != -1) {
      std::cout << "Mounted the StreamFS endpoint." << std::endl;
      fuse_session_add_chan(se, ch);
      // Requests are dispatched concurrently; handles serialize themselves
      err = fuse_session_loop_mt(se);
      std::cout << "Unmounting StreamFS..." << std::endl;
      fuse_remove_signal_handlers(se);
      fuse_session_remove_chan(ch);
    }
    fuse_session_destroy(se);
  }

  fuse_unmount(mountpoint, ch);
  fuse_opt_free_args(&args);
  free(mountpoint);
  g_fs.reset();

  std::cout << "StreamFS unmounted." << std::endl;
  return err ? 1 : 0;
}
