#include <doctest/doctest.h>
#include <fcntl.h>
#include <streamfs/file.h>
#include <streamfs/file_handle.h>

#include "test_doubles.h"

using namespace streamfs;
using namespace streamfs::test;

TEST_CASE("File - attributes are cached until they expire") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello");
  auto file = mount.fs->file("/a.txt");
  CHECK(mount.accessor->stat_calls == 1);

  CHECK(file->attr().size == 5);
  mount.accessor->files["/a.txt"].size = 9;
  mount.clock.advance(std::chrono::seconds(30));
  CHECK(file->attr().size == 5);
  CHECK(mount.accessor->stat_calls == 1);

  mount.clock.advance(std::chrono::seconds(31));
  CHECK(file->attr().size == 9);
  CHECK(mount.accessor->stat_calls == 2);
  CHECK(file->attr().ino == mount.fs->ino_for_path("/a.txt"));
}

TEST_CASE("File - releasing a handle invalidates the attributes") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello");
  auto file = mount.fs->file("/a.txt");
  auto handle = file->open(O_RDONLY);
  file->attr();
  CHECK(mount.accessor->stat_calls == 1);

  handle->release();
  file->attr();
  CHECK(mount.accessor->stat_calls == 2);
}

TEST_CASE("File - active handle registry") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello");
  auto file = mount.fs->file("/a.txt");
  auto first = file->open(O_RDONLY);
  auto second = file->open(O_RDONLY);
  CHECK(file->active_handles().size() == 2);

  first->release();
  auto handles = file->active_handles();
  REQUIRE(handles.size() == 1);
  CHECK(handles[0] == second);

  second->release();
  CHECK(file->active_handles().empty());
}

TEST_CASE("File - fsync reaches every handle and reports the failure") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello");
  auto file = mount.fs->file("/a.txt");
  auto first = file->open(O_WRONLY);
  auto second = file->open(O_WRONLY);
  first->write(0, "one", 3);
  second->write(0, "two", 3);

  mount.accessor->create_failures = 1;
  try {
    file->fsync_all();
    FAIL("expected a RemoteError");
  } catch (const RemoteError& e) {
    CHECK(e.err() == EIO);
  }
  CHECK(mount.accessor->create_calls == 2);
  CHECK(mount.accessor->contents["/a.txt"] == "two");

  // The failed handle is still dirty
  file->fsync_all();
  CHECK(mount.accessor->create_calls == 3);
  CHECK(mount.accessor->contents["/a.txt"] == "one");

  first->release();
  second->release();
  CHECK(mount.accessor->create_calls == 3);
}

TEST_CASE("File - fsync without handles") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello");
  auto file = mount.fs->file("/a.txt");
  file->fsync_all();
  CHECK(mount.accessor->create_calls == 0);
}

TEST_CASE("File - set_attr applies mode and ownership independently") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello", 0644);
  auto file = mount.fs->file("/a.txt");

  SetAttrRequest req;
  req.mode = 0600;
  req.uid = 4242;
  req.gid = 4343;

  SUBCASE("ownership refused") {
    mount.accessor->chown_error = EPERM;
    try {
      file->set_attr(req);
      FAIL("expected a RemoteError");
    } catch (const RemoteError& e) {
      CHECK(e.err() == EPERM);
    }
    Attrs attrs = file->attr();
    CHECK(attrs.mode == (S_IFREG | 0600));
    CHECK(attrs.uid == 0);
    CHECK(attrs.gid == 0);
    CHECK(mount.accessor->chmods.size() == 1);
    CHECK(mount.accessor->chowns.size() == 1);
  }

  SUBCASE("mode refused") {
    mount.accessor->chmod_error = EACCES;
    try {
      file->set_attr(req);
      FAIL("expected a RemoteError");
    } catch (const RemoteError& e) {
      CHECK(e.err() == EACCES);
    }
    Attrs attrs = file->attr();
    CHECK(attrs.mode == (S_IFREG | 0644));
    CHECK(attrs.uid == 4242);
    CHECK(attrs.gid == 4343);
    CHECK(mount.accessor->chowns.size() == 1);
  }

  SUBCASE("both refused reports the mode failure") {
    mount.accessor->chmod_error = EACCES;
    mount.accessor->chown_error = EPERM;
    try {
      file->set_attr(req);
      FAIL("expected a RemoteError");
    } catch (const RemoteError& e) {
      CHECK(e.err() == EACCES);
    }
  }

  SUBCASE("both accepted") {
    Attrs attrs = file->set_attr(req);
    CHECK(attrs.mode == (S_IFREG | 0600));
    CHECK(attrs.uid == 4242);
    CHECK(attrs.gid == 4343);
  }
}

TEST_CASE("File - set_attr skips unchanged values") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "hello", 0644);
  auto file = mount.fs->file("/a.txt");

  SetAttrRequest req;
  req.mode = S_IFREG | 0644;
  req.uid = 0;
  file->set_attr(req);
  CHECK(mount.accessor->chmods.empty());
  CHECK(mount.accessor->chowns.empty());

  // Unset ids keep their current value
  SetAttrRequest group_only;
  group_only.gid = 0;
  file->set_attr(group_only);
  CHECK(mount.accessor->chowns.empty());
}
