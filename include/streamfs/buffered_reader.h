#pragma once

#include <streamfs/retry_policy.h>
#include <streamfs/stream.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace streamfs {

struct ReaderOptions {
  // Forward gaps up to this many bytes are covered by reading through them,
  // larger ones (and any move backwards past the buffer) by an explicit seek
  int64_t seek_threshold = 256 * 1024;
  // Minimum number of bytes requested from the stream per read call
  size_t chunk_size = 64 * 1024;
  // Bytes kept behind the remote cursor once a request has been served
  size_t max_retained = 4 * 1024 * 1024;
};

/**
 * Random-access reads on top of a sequential remote stream.
 *
 * Keeps a run of bytes [buffer_start, expected_pos) that were read in order
 * since the last seek. Requests inside that run are served without remote
 * I/O; requests slightly ahead of the cursor are reached by reading forward;
 * everything else costs one seek. Not thread-safe: the owning FileHandle
 * serializes access.
 */
class BufferedReader {
public:
  BufferedReader(std::unique_ptr<RemoteStreamReader> stream, RetryPolicy& retry,
                 std::string path, ReaderOptions options = {});
  ~BufferedReader();

  BufferedReader(const BufferedReader&) = delete;
  BufferedReader& operator=(const BufferedReader&) = delete;

  // Returns up to size bytes starting at offset. Fewer bytes (possibly none)
  // are returned only when the end of the file is reached.
  std::vector<char> read(int64_t offset, size_t size);

  // Closes the remote stream; later calls are no-ops
  void close();

  int64_t buffer_start() const { return buffer_start_; }
  int64_t expected_pos() const { return expected_pos_; }
  size_t buffered() const { return buffer_.size(); }
  bool eof() const { return eof_; }
  bool closed() const { return !stream_; }

private:
  int64_t buffer_end() const { return buffer_start_ + static_cast<int64_t>(buffer_.size()); }

  void seek(int64_t offset);
  ReadResult read_chunk(char* buf, size_t size);
  // Reads from the stream until the buffer ends at or after target or the
  // stream is exhausted
  void fill_to(int64_t target);
  void trim();

  std::unique_ptr<RemoteStreamReader> stream_;
  RetryPolicy& retry_;
  std::string path_;
  ReaderOptions options_;

  std::vector<char> buffer_;
  int64_t buffer_start_ = 0;
  int64_t expected_pos_ = 0;
  bool eof_ = false;
  bool resync_ = false;
};

}  // namespace streamfs
