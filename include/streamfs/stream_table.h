#pragma once

#include <streamfs/clock.h>
#include <streamfs/stream.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace streamfs {

/**
 * Open streams of the RPC server, addressed by the ids handed to clients.
 * Ids are shared by all connections, so a client may use a stream from any
 * of its per-thread connections.
 *
 * Each stream belongs to the user that opened it. Once a user has no live
 * connection left, its streams are closed after staying unused for the
 * grace period, which covers clients that crashed or lost the network
 * without closing them.
 */
class StreamTable {
public:
  StreamTable(Clock& clock, Duration orphan_grace);
  ~StreamTable();

  StreamTable(const StreamTable&) = delete;
  StreamTable& operator=(const StreamTable&) = delete;

  void connect(const std::string& user);
  // Also expires streams that became orphaned
  void disconnect(const std::string& user);

  uint64_t add(const std::string& user, std::unique_ptr<RemoteStreamReader> reader);
  uint64_t add(const std::string& user, std::unique_ptr<RemoteStreamWriter> writer);

  // Throw RemoteError(EBADF) for unknown ids or ids of the other kind
  std::shared_ptr<RemoteStreamReader> reader(uint64_t fh);
  std::shared_ptr<RemoteStreamWriter> writer(uint64_t fh);

  // Removes the stream and closes it
  void close(uint64_t fh);

  // Closes orphaned streams idle for longer than the grace period and
  // returns how many were closed
  size_t expire();

  size_t size() const;

private:
  struct Entry {
    std::string user;
    std::shared_ptr<RemoteStreamReader> reader;
    std::shared_ptr<RemoteStreamWriter> writer;
    TimePoint last_used;
  };

  uint64_t insert(Entry entry);
  Entry& find(uint64_t fh);
  static void close_entry(uint64_t fh, Entry& entry);

  Clock& clock_;
  Duration orphan_grace_;

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, Entry> streams_;
  std::unordered_map<std::string, int> connections_;
  uint64_t next_fh_ = 1;
};

}  // namespace streamfs
