#include <doctest/doctest.h>
#include <fcntl.h>
#include <streamfs/file.h>
#include <streamfs/file_handle.h>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

#include "test_doubles.h"

using namespace streamfs;
using namespace streamfs::test;

TEST_CASE("Concurrency - reads on one handle never overlap") {
  TestMount mount;
  auto generated = std::make_shared<GeneratedStream>();
  generated->size = 8 * 1024 * 1024;
  mount.accessor->reader_factory = [generated](const std::string&) {
    return std::make_unique<GeneratedReader>(generated);
  };
  mount.accessor->add_file("/big.dat", "");
  auto handle = mount.fs->file("/big.dat")->open(O_RDONLY);

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937_64 rand(t);
      std::uniform_int_distribution<int64_t> offsets(0, generated->size - 4096);
      for (int i = 0; i < 200; ++i) {
        int64_t offset = offsets(rand);
        auto data = handle->read(offset, 4096);
        if (data.size() != 4096) {
          mismatches++;
          continue;
        }
        for (size_t j = 0; j < data.size(); ++j) {
          if (data[j] != byte_at(offset + static_cast<int64_t>(j))) {
            mismatches++;
            break;
          }
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  CHECK(mismatches == 0);
  CHECK(generated->overlaps == 0);
  handle->release();
  CHECK(generated->closed);
}

TEST_CASE("Concurrency - release while reads and writes are in flight") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", std::string(4096, 'a'));
  auto file = mount.fs->file("/a.txt");
  auto handle = file->open(O_RDWR);

  std::atomic<int> completed{0};
  std::atomic<int> writes{0};
  std::atomic<int> rejected{0};
  std::atomic<int> unexpected{0};
  std::atomic<int> wrong_data{0};

  auto run = [&](auto&& op) {
    try {
      op();
      completed++;
    } catch (const RemoteError& e) {
      if (e.err() == EBADF) {
        rejected++;
      } else {
        unexpected++;
      }
    } catch (const std::exception&) {
      unexpected++;
    }
  };

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      std::string data(64, static_cast<char>('w' + t));
      for (int i = 0; i < 100; ++i) {
        run([&]() {
          handle->write(i * 64 % 4096, data.data(), data.size());
          writes++;
        });
      }
    });
    threads.emplace_back([&]() {
      for (int i = 0; i < 100; ++i) {
        run([&]() {
          // Nothing is flushed before release, so reads see the remote content
          auto data = handle->read(0, 4096);
          if (data != std::vector<char>(4096, 'a')) wrong_data++;
        });
      }
    });
  }
  threads.emplace_back([&]() {
    while (writes == 0 || completed < 100) std::this_thread::yield();
    handle->release();
  });
  for (auto& thread : threads) thread.join();

  CHECK(unexpected == 0);
  CHECK(wrong_data == 0);
  CHECK(completed + rejected == 800);
  CHECK(handle->mode() == HandleMode::Closed);
  CHECK(file->active_handles().empty());
  // Only the release uploaded
  CHECK(mount.accessor->create_calls == 1);
}

TEST_CASE("Concurrency - fsync broadcast while handles come and go") {
  TestMount mount;
  mount.accessor->add_file("/a.txt", "");
  auto file = mount.fs->file("/a.txt");

  std::vector<std::string> written;
  std::vector<std::shared_ptr<FileHandle>> writers;
  for (int i = 0; i < 6; ++i) {
    written.push_back("handle " + std::to_string(i));
    writers.push_back(file->open(O_WRONLY));
    writers.back()->write(0, written.back().data(), written.back().size());
  }

  std::atomic<bool> releasing{true};
  std::atomic<int> failures{0};

  std::thread syncer([&]() {
    while (releasing) {
      try {
        file->fsync_all();
      } catch (const std::exception&) {
        failures++;
      }
    }
  });

  std::thread opener([&]() {
    for (int i = 0; i < 20; ++i) {
      auto reader = file->open(O_RDONLY);
      reader->read(0, 16);
      reader->release();
    }
  });

  std::thread releaser([&]() {
    for (auto& writer : writers) {
      std::this_thread::yield();
      writer->release();
    }
  });

  releaser.join();
  opener.join();
  releasing = false;
  syncer.join();

  CHECK(failures == 0);
  CHECK(file->active_handles().empty());
  bool known = false;
  for (const auto& data : written) {
    if (mount.accessor->contents["/a.txt"] == data) known = true;
  }
  CHECK(known);
}
