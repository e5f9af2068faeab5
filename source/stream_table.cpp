#include <streamfs/errors.h>
#include <streamfs/log.h>
#include <streamfs/stream_table.h>

#include <errno.h>

#include <vector>

namespace streamfs {

StreamTable::StreamTable(Clock& clock, Duration orphan_grace)
    : clock_(clock), orphan_grace_(orphan_grace) {}

StreamTable::~StreamTable() {
  for (auto& [fh, entry] : streams_) {
    close_entry(fh, entry);
  }
}

void StreamTable::close_entry(uint64_t fh, Entry& entry) {
  try {
    if (entry.reader) {
      entry.reader->close();
    } else if (entry.writer) {
      entry.writer->close();
    }
  } catch (const std::exception& e) {
    log::warning("[{}] closing stream {}: {}", entry.user, fh, e.what());
  }
}

void StreamTable::connect(const std::string& user) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[user]++;
}

void StreamTable::disconnect(const std::string& user) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user);
    if (it != connections_.end() && --it->second <= 0) {
      connections_.erase(it);
    }
  }
  expire();
}

uint64_t StreamTable::insert(Entry entry) {
  uint64_t fh;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    fh = next_fh_++;
    entry.last_used = clock_.now();
    streams_.emplace(fh, std::move(entry));
  }
  expire();
  return fh;
}

uint64_t StreamTable::add(const std::string& user, std::unique_ptr<RemoteStreamReader> reader) {
  Entry entry;
  entry.user = user;
  entry.reader = std::move(reader);
  return insert(std::move(entry));
}

uint64_t StreamTable::add(const std::string& user, std::unique_ptr<RemoteStreamWriter> writer) {
  Entry entry;
  entry.user = user;
  entry.writer = std::move(writer);
  return insert(std::move(entry));
}

StreamTable::Entry& StreamTable::find(uint64_t fh) {
  auto it = streams_.find(fh);
  if (it == streams_.end()) {
    throw RemoteError(EBADF, "unknown stream " + std::to_string(fh));
  }
  it->second.last_used = clock_.now();
  return it->second;
}

std::shared_ptr<RemoteStreamReader> StreamTable::reader(uint64_t fh) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& entry = find(fh);
  if (!entry.reader) {
    throw RemoteError(EBADF, "stream " + std::to_string(fh) + " is not open for reading");
  }
  return entry.reader;
}

std::shared_ptr<RemoteStreamWriter> StreamTable::writer(uint64_t fh) {
  std::lock_guard<std::mutex> lock(mutex_);
  Entry& entry = find(fh);
  if (!entry.writer) {
    throw RemoteError(EBADF, "stream " + std::to_string(fh) + " is not open for writing");
  }
  return entry.writer;
}

void StreamTable::close(uint64_t fh) {
  Entry entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(fh);
    if (it == streams_.end()) {
      throw RemoteError(EBADF, "unknown stream " + std::to_string(fh));
    }
    entry = std::move(it->second);
    streams_.erase(it);
  }
  if (entry.reader) {
    entry.reader->close();
  } else if (entry.writer) {
    entry.writer->close();
  }
}

size_t StreamTable::expire() {
  std::vector<std::pair<uint64_t, Entry>> expired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_.now();
    for (auto it = streams_.begin(); it != streams_.end();) {
      const Entry& entry = it->second;
      if (!connections_.count(entry.user) && now - entry.last_used >= orphan_grace_) {
        expired.emplace_back(it->first, std::move(it->second));
        it = streams_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& [fh, entry] : expired) {
    log::info("[{}] closing abandoned stream {}", entry.user, fh);
    close_entry(fh, entry);
  }
  return expired.size();
}

size_t StreamTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return streams_.size();
}

}  // namespace streamfs
