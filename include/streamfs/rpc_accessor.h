#pragma once

#include <streamfs/accessor.h>
#include <streamfs/errors.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/compat/tls.h>
#include <kj/debug.h>
#include <streamfs.capnp.h>

namespace streamfs {

// Timeout constants (milliseconds)
constexpr uint64_t CONNECTION_TIMEOUT_MS = 5000;  // 5 seconds for connection
constexpr uint64_t RPC_TIMEOUT_MS = 30000;        // 30 seconds for RPC calls

// Cap'n Proto refuses messages above its traversal limit; keep data
// transfers well below it
constexpr size_t MAX_TRANSFER_BYTES = 4 * 1024 * 1024;

struct ConnectionParams {
  std::string host = "127.0.0.1";
  uint16_t port = 3444;
  std::string user;
  std::string token;
  std::string cert;  // PEM contents of a trusted CA, empty for plain TCP
};

// Per-thread Cap'n Proto connection. FUSE runs requests on several threads
// and a kj event loop belongs to exactly one of them.
struct ThreadLocalRpc {
  std::unique_ptr<kj::AsyncIoContext> ioContext;
  kj::Own<kj::TlsContext> tls;
  kj::Own<kj::Network> network;
  kj::Own<kj::AsyncIoStream> connection;
  std::unique_ptr<capnp::TwoPartyClient> twoParty;
  std::optional<StreamFs::Client> client;
  bool initialized = false;

  kj::Timer& getTimer();
  void init(const ConnectionParams& params);
  // Drops a broken connection so the next call reconnects
  void reset();
};

// Helper for RPC calls with timeout
template <typename Promise>
auto waitWithTimeout(Promise&& promise, kj::Timer& timer, kj::WaitScope& waitScope)
    -> decltype(kj::fwd<Promise>(promise).wait(waitScope)) {
  using ResultType = decltype(kj::fwd<Promise>(promise).wait(waitScope));
  auto timeout = timer.afterDelay(RPC_TIMEOUT_MS * kj::MILLISECONDS).then([]() -> ResultType {
    kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "RPC timeout"));
  });
  return kj::fwd<Promise>(promise).exclusiveJoin(kj::mv(timeout)).wait(waitScope);
}

// Converts a Cap'n Proto failure into a RemoteError. Disconnects (timeouts
// included) and overloads are transient; disconnects and unexpected failures
// also drop the calling thread's connection so the next call reconnects.
RemoteError to_remote_error(const std::string& operation, const kj::Exception& e);

// RemoteAccessor talking to a `streamfs --server` instance
class RpcAccessor final : public RemoteAccessor {
public:
  explicit RpcAccessor(ConnectionParams params);

  // Connects and authenticates on the calling thread; throws RemoteError
  void connect();

  Attrs stat(const std::string& path) override;
  std::unique_ptr<RemoteStreamReader> open_read(const std::string& path) override;
  std::unique_ptr<RemoteStreamWriter> create(const std::string& path, bool overwrite) override;
  void chmod(const std::string& path, uint32_t mode) override;
  void chown(const std::string& path, const std::string& user, const std::string& group) override;

  ThreadLocalRpc& rpc();

private:
  ConnectionParams params_;
};

}  // namespace streamfs
