#include <doctest/doctest.h>
#include <fcntl.h>
#include <streamfs/buffered_reader.h>
#include <streamfs/file.h>
#include <streamfs/file_handle.h>

#include <algorithm>
#include <random>

#include "test_doubles.h"

using namespace streamfs;
using namespace streamfs::test;

static std::shared_ptr<FileHandle> open_test_handle(TestMount& mount) {
  mount.accessor->add_file("/test.dat", "");
  return mount.fs->file("/test.dat")->open(O_RDONLY);
}

TEST_CASE("Read - empty file") {
  TestMount mount;
  auto stream = mount.script();
  stream->when_read_return("", true);
  auto handle = open_test_handle(mount);

  CHECK(handle->read(0, 1024).empty());
  CHECK(stream->seeks.empty());
}

TEST_CASE("Read - content split over several remote reads") {
  TestMount mount;
  auto stream = mount.script();
  stream->when_read_return("Hel");
  stream->when_read_return("lo");
  stream->when_read_return("World!");
  stream->when_read_return("", true);
  auto handle = open_test_handle(mount);

  CHECK(to_string(handle->read(0, 5)) == "Hello");
  CHECK(to_string(handle->read(5, 6)) == "World!");
  CHECK(to_string(handle->read(11, 1024)) == "");
  CHECK(stream->seeks.empty());

  // Known end of file: no more remote reads
  CHECK(handle->read(11, 1024).empty());
  CHECK(handle->read(4096, 1).empty());
  CHECK(stream->requested.size() == 4);
}

TEST_CASE("Read - reordered reads are served from the retained buffer") {
  TestMount mount;
  auto stream = mount.script();
  stream->when_read_return("He");
  stream->when_read_return("ll");
  stream->when_read_return("oWorld!");
  auto handle = open_test_handle(mount);

  CHECK(to_string(handle->read(0, 2)) == "He");
  CHECK(stream->seeks.empty());
  CHECK(to_string(handle->read(8, 3)) == "ld!");
  CHECK(stream->seeks.empty());
  CHECK(to_string(handle->read(2, 6)) == "lloWor");
  CHECK(stream->seeks.empty());
  CHECK(stream->steps.empty());
}

TEST_CASE("Read - large gaps seek, sequential continuation does not") {
  TestMount mount;
  auto stream = mount.script();
  stream->when_read_return("abc");
  stream->when_read_return("def");
  stream->when_read_return("ghijkl");
  auto handle = open_test_handle(mount);

  CHECK(to_string(handle->read(1000000, 3)) == "abc");
  CHECK(stream->seeks == std::vector<int64_t>{1000000});
  CHECK(to_string(handle->read(1000003, 3)) == "def");
  CHECK(stream->seeks == std::vector<int64_t>{1000000});
  CHECK(to_string(handle->read(2000000, 6)) == "ghijkl");
  CHECK(stream->seeks == std::vector<int64_t>{1000000, 2000000});
}

TEST_CASE("Read - release closes the remote reader exactly once") {
  TestMount mount;
  auto stream = mount.script();
  stream->when_read_return("data");
  auto handle = open_test_handle(mount);

  CHECK(to_string(handle->read(0, 4)) == "data");
  CHECK(stream->closes == 0);
  handle->release();
  CHECK(stream->closes == 1);
  handle->release();
  CHECK(stream->closes == 1);
  CHECK(handle->mode() == HandleMode::Closed);
}

static void random_reads(int64_t file_size, size_t max_read) {
  TestMount mount;
  auto generated = std::make_shared<GeneratedStream>();
  generated->size = file_size;
  mount.accessor->reader_factory = [generated](const std::string&) {
    return std::make_unique<GeneratedReader>(generated);
  };
  auto handle = open_test_handle(mount);

  std::mt19937_64 rand(1234);
  std::uniform_int_distribution<int64_t> offsets(0, file_size - 1);
  std::uniform_int_distribution<int64_t> past_end(file_size,
                                                  file_size + 4 * static_cast<int64_t>(max_read));
  std::uniform_int_distribution<size_t> sizes(1, max_read);

  for (int i = 0; i < 1000; ++i) {
    size_t size = sizes(rand);

    if (i % 50 == 49) {
      int64_t offset = past_end(rand);
      CHECK(handle->read(offset, size).empty());
      continue;
    }

    int64_t offset = offsets(rand);
    auto data = handle->read(offset, size);
    size_t expected = static_cast<size_t>(std::min<int64_t>(size, file_size - offset));
    REQUIRE(data.size() == expected);
    for (size_t j = 0; j < expected; ++j) {
      if (data[j] != byte_at(offset + static_cast<int64_t>(j))) {
        FAIL("byte mismatch at offset " << offset + static_cast<int64_t>(j));
      }
    }
    REQUIRE_FALSE(generated->closed);
  }

  // Reads crossing the end of the file come back short
  auto tail = handle->read(file_size - 3, max_read);
  REQUIRE(tail.size() == 3);
  CHECK(tail[2] == byte_at(file_size - 1));

  handle->release();
  CHECK(generated->closed);
}

TEST_CASE("Read - random access on a small file") { random_reads(512 * 1024, 4096); }

TEST_CASE("Read - random access on a multi-gigabyte file") {
  random_reads(5LL * 1024 * 1024 * 1024, 64 * 1024);
}

TEST_CASE("Read - reading the whole file after random reads") {
  TestMount mount;
  auto generated = std::make_shared<GeneratedStream>();
  generated->size = 300 * 1024;
  mount.accessor->reader_factory = [generated](const std::string&) {
    return std::make_unique<GeneratedReader>(generated);
  };
  auto handle = open_test_handle(mount);

  CHECK(handle->read(200 * 1024, 10).size() == 10);
  auto all = handle->read(0, 1024 * 1024);
  REQUIRE(all.size() == 300 * 1024);
  CHECK(all[12345] == byte_at(12345));
  CHECK(all.back() == byte_at(300 * 1024 - 1));
  CHECK(handle->read(300 * 1024, 1).empty());
}

TEST_CASE("BufferedReader - gap threshold") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  ReaderOptions options;
  options.seek_threshold = 16;
  options.chunk_size = 4;
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f", options);

  stream->when_read_return("0123");
  CHECK(to_string(reader.read(0, 2)) == "01");

  // 16 bytes ahead of the cursor: read through
  stream->when_read_return("456789abcdefghijkl");
  CHECK(to_string(reader.read(20, 2)) == "kl");
  CHECK(stream->seeks.empty());
  CHECK(reader.expected_pos() == 22);

  // 17 bytes ahead: seek
  stream->when_read_return("XY");
  CHECK(to_string(reader.read(39, 2)) == "XY");
  CHECK(stream->seeks == std::vector<int64_t>{39});
  CHECK(reader.buffer_start() == 39);
  CHECK(reader.expected_pos() == 41);
}

TEST_CASE("BufferedReader - requests at least one chunk per remote read") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  ReaderOptions options;
  options.chunk_size = 128;
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f", options);

  stream->when_read_return("a");
  CHECK(to_string(reader.read(0, 1)) == "a");
  REQUIRE(stream->requested.size() == 1);
  CHECK(stream->requested[0] == 128);
}

TEST_CASE("BufferedReader - trimming drops bytes behind the cursor") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  ReaderOptions options;
  options.chunk_size = 1;
  options.max_retained = 4;
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f", options);

  // Single requests never ask for more than the retained amount
  stream->when_read_return("0123");
  stream->when_read_return("4567");
  stream->when_read_return("89");
  CHECK(to_string(reader.read(0, 10)) == "0123456789");
  CHECK(stream->requested == std::vector<size_t>{4, 4, 2});
  CHECK(reader.buffer_start() == 6);
  CHECK(reader.buffered() == 4);
  CHECK(reader.expected_pos() == 10);

  // Still retained
  CHECK(to_string(reader.read(7, 2)) == "78");
  CHECK(stream->seeks.empty());

  // Trimmed away: only a seek can get back there
  stream->when_read_return("01");
  CHECK(to_string(reader.read(0, 2)) == "01");
  CHECK(stream->seeks == std::vector<int64_t>{0});
}

TEST_CASE("BufferedReader - transient read failures are retried after a resync") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");

  stream->when_read_return("He");
  stream->when_read_fail(ETIMEDOUT, true);
  stream->when_read_return("llo");
  CHECK(to_string(reader.read(0, 5)) == "Hello");
  CHECK(stream->seeks == std::vector<int64_t>{2});
  CHECK(clock.sleeps.size() == 1);
  CHECK(reader.expected_pos() == 5);
}

TEST_CASE("BufferedReader - permanent read failures propagate") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");

  stream->when_read_fail(EIO, false);
  try {
    reader.read(0, 5);
    FAIL("expected a RemoteError");
  } catch (const RemoteError& e) {
    CHECK(e.err() == EIO);
  }
  CHECK(clock.sleeps.empty());
  CHECK(reader.buffered() == 0);
  CHECK(reader.expected_pos() == 0);

  // The next read repositions the stream before reading again
  stream->when_read_return("abc");
  CHECK(to_string(reader.read(0, 3)) == "abc");
  CHECK(stream->seeks == std::vector<int64_t>{0});
}

TEST_CASE("BufferedReader - failed seek resynchronizes before reading on") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");

  stream->when_read_return("abcd");
  CHECK(to_string(reader.read(0, 4)) == "abcd");

  stream->seek_failures = 1;
  CHECK_THROWS_AS(reader.read(10000000, 4), RemoteError);
  CHECK(reader.expected_pos() == 4);

  // Retained bytes stay valid
  CHECK(to_string(reader.read(1, 3)) == "bcd");
  CHECK(stream->seeks == std::vector<int64_t>{10000000});

  // Reading on from the cursor first puts the stream back where it belongs
  stream->when_read_return("efgh");
  CHECK(to_string(reader.read(4, 4)) == "efgh");
  CHECK(stream->seeks == std::vector<int64_t>{10000000, 4});
}

TEST_CASE("BufferedReader - close") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  {
    BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");
    reader.close();
    reader.close();
    CHECK(reader.closed());
    CHECK_THROWS_AS(reader.read(0, 1), RemoteError);
  }
  CHECK(stream->closes == 1);

  // Destruction closes a reader that is still open
  {
    BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");
  }
  CHECK(stream->closes == 2);
}

TEST_CASE("BufferedReader - invalid requests") {
  FakeClock clock;
  RetryPolicy retry(clock);
  auto stream = std::make_shared<ScriptedStream>();
  BufferedReader reader(std::make_unique<ScriptedReader>(stream), retry, "/f");

  CHECK(reader.read(0, 0).empty());
  CHECK_THROWS_AS(reader.read(-1, 10), RemoteError);
  CHECK(stream->requested.empty());
}
