#include <streamfs/buffered_reader.h>
#include <streamfs/log.h>

#include <errno.h>

#include <algorithm>
#include <limits>

namespace streamfs {

BufferedReader::BufferedReader(std::unique_ptr<RemoteStreamReader> stream, RetryPolicy& retry,
                               std::string path, ReaderOptions options)
    : stream_(std::move(stream)), retry_(retry), path_(std::move(path)), options_(options) {
  if (options_.chunk_size == 0) options_.chunk_size = 1;
  if (options_.seek_threshold < 0) options_.seek_threshold = 0;
}

BufferedReader::~BufferedReader() {
  if (!stream_) return;
  try {
    close();
  } catch (const std::exception& e) {
    log::warning("[{}] closing reader failed: {}", path_, e.what());
  }
}

std::vector<char> BufferedReader::read(int64_t offset, size_t size) {
  if (!stream_) {
    throw RemoteError(EBADF, path_ + ": read on a closed reader");
  }
  if (offset < 0) {
    throw RemoteError(EINVAL, path_ + ": negative read offset");
  }

  std::vector<char> out;
  if (size == 0) {
    return out;
  }

  // Past the end of an exhausted stream: nothing left to return
  if (eof_ && offset >= buffer_end()) {
    return out;
  }

  // Behind the retained bytes the stream cannot go back without a seek.
  // Far ahead of the cursor a seek is cheaper than reading through the gap.
  if (offset < buffer_start_ || offset - expected_pos_ > options_.seek_threshold) {
    seek(offset);
  }

  int64_t room = std::numeric_limits<int64_t>::max() - offset;
  int64_t target = offset + static_cast<int64_t>(std::min<uint64_t>(size, room));

  fill_to(target);

  int64_t end = std::min(target, buffer_end());
  if (end > offset) {
    auto first = buffer_.begin() + (offset - buffer_start_);
    out.assign(first, first + (end - offset));
  }

  trim();
  return out;
}

void BufferedReader::close() {
  if (!stream_) return;
  auto stream = std::move(stream_);
  buffer_.clear();
  buffer_.shrink_to_fit();
  stream->close();
}

void BufferedReader::seek(int64_t offset) {
  log::debug("[{}] seek {} -> {}", path_, expected_pos_, offset);
  try {
    retry_.run("seek " + path_, [&]() { stream_->seek(offset); });
  } catch (const std::exception&) {
    // The remote cursor may have moved anyway
    resync_ = true;
    throw;
  }
  buffer_.clear();
  buffer_start_ = offset;
  expected_pos_ = offset;
  eof_ = false;
  resync_ = false;
}

ReadResult BufferedReader::read_chunk(char* buf, size_t size) {
  return retry_.run("read " + path_, [&]() {
    try {
      // A failed read may have moved the remote cursor by an unknown amount
      if (resync_) {
        stream_->seek(expected_pos_);
        resync_ = false;
      }
      return stream_->read(buf, size);
    } catch (const RemoteError&) {
      resync_ = true;
      throw;
    }
  });
}

void BufferedReader::fill_to(int64_t target) {
  while (!eof_ && buffer_end() < target) {
    uint64_t needed = static_cast<uint64_t>(target - buffer_end());
    size_t want = std::max(options_.chunk_size,
                           static_cast<size_t>(std::min<uint64_t>(needed, options_.max_retained)));

    size_t old_size = buffer_.size();
    buffer_.resize(old_size + want);

    ReadResult result;
    try {
      result = read_chunk(buffer_.data() + old_size, want);
    } catch (const std::exception&) {
      buffer_.resize(old_size);
      throw;
    }

    size_t got = std::min(result.bytes, want);
    buffer_.resize(old_size + got);
    expected_pos_ += static_cast<int64_t>(got);

    if (result.eof || got == 0) {
      eof_ = true;
    }
  }
}

void BufferedReader::trim() {
  if (buffer_.size() <= options_.max_retained) return;
  size_t drop = buffer_.size() - options_.max_retained;
  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(drop));
  buffer_start_ += static_cast<int64_t>(drop);
}

}  // namespace streamfs
