#pragma once

#include <cstddef>
#include <cstdint>

namespace streamfs {

struct ReadResult {
  size_t bytes = 0;
  bool eof = false;
};

// Sequential reader over one open file of the backing store. Short reads are
// normal; end of stream is reported through ReadResult::eof, never thrown.
// seek() repositions the cursor and is assumed to be expensive.
class RemoteStreamReader {
public:
  virtual ~RemoteStreamReader() = default;

  virtual ReadResult read(char* buf, size_t size) = 0;
  virtual void seek(int64_t offset) = 0;
  virtual void close() = 0;
};

// Sequential writer used to upload a complete file.
class RemoteStreamWriter {
public:
  virtual ~RemoteStreamWriter() = default;

  virtual void write(const char* buf, size_t size) = 0;
  virtual void close() = 0;
};

}  // namespace streamfs
