#include <streamfs/errors.h>
#include <streamfs/log.h>
#include <streamfs/rpc_accessor.h>

#include <errno.h>

#include <algorithm>
#include <cstring>

#include <capnp/message.h>
#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/compat/tls.h>

#include <streamfs.capnp.h>

namespace streamfs {

thread_local ThreadLocalRpc tl_rpc;

kj::Timer& ThreadLocalRpc::getTimer() { return ioContext->provider->getTimer(); }

void ThreadLocalRpc::reset() {
  client = std::nullopt;
  twoParty = nullptr;
  connection = nullptr;
  network = nullptr;
  tls = nullptr;
  ioContext = nullptr;
  initialized = false;
}

void ThreadLocalRpc::init(const ConnectionParams& params) {
  if (initialized) return;
  // Leftovers of a failed attempt hold this thread's event loop
  reset();

  ioContext = std::make_unique<kj::AsyncIoContext>(kj::setupAsyncIo());
  auto& timer = ioContext->provider->getTimer();

  kj::Own<kj::NetworkAddress> address;

  if (params.cert.length()) {
    kj::TlsContext::Options options;
    kj::TlsCertificate caCert(params.cert);
    options.trustedCertificates = kj::arrayPtr(&caCert, 1);

    tls = kj::heap<kj::TlsContext>(kj::mv(options));
    network = tls->wrapNetwork(ioContext->provider->getNetwork());

    // DNS resolution with timeout
    auto addressPromise = network->parseAddress(params.host, params.port);
    auto addressTimeout = timer.afterDelay(CONNECTION_TIMEOUT_MS * kj::MILLISECONDS)
        .then([]() -> kj::Own<kj::NetworkAddress> {
          kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "DNS resolution timed out"));
        });
    address = addressPromise.exclusiveJoin(kj::mv(addressTimeout)).wait(ioContext->waitScope);
  } else {
    auto addressPromise = ioContext->provider->getNetwork().parseAddress(params.host, params.port);
    auto addressTimeout = timer.afterDelay(CONNECTION_TIMEOUT_MS * kj::MILLISECONDS)
        .then([]() -> kj::Own<kj::NetworkAddress> {
          kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "DNS resolution timed out"));
        });
    address = addressPromise.exclusiveJoin(kj::mv(addressTimeout)).wait(ioContext->waitScope);
  }

  // TCP connection with timeout
  auto connectPromise = address->connect();
  auto connectTimeout = timer.afterDelay(CONNECTION_TIMEOUT_MS * kj::MILLISECONDS)
      .then([]() -> kj::Own<kj::AsyncIoStream> {
        kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "Connection timed out"));
      });
  connection = connectPromise.exclusiveJoin(kj::mv(connectTimeout)).wait(ioContext->waitScope);

  twoParty = std::make_unique<capnp::TwoPartyClient>(*connection);
  auto authClient = twoParty->bootstrap().castAs<StreamFsAuth>();
  auto request = authClient.authRequest();
  request.setUser(params.user);
  request.setToken(params.token);

  auto result = waitWithTimeout(request.send(), timer, ioContext->waitScope);

  if (!result.getAuthSuccess()) {
    reset();
    throw RemoteError(EACCES, "authentication failed for user " + params.user);
  }

  client = result.getStreamFs();
  initialized = true;
}

RemoteError to_remote_error(const std::string& operation, const kj::Exception& e) {
  std::string description = e.getDescription().cStr();
  switch (e.getType()) {
    case kj::Exception::Type::DISCONNECTED:
      tl_rpc.reset();
      return RemoteError(ECONNRESET, operation + ": " + description, true);
    case kj::Exception::Type::OVERLOADED:
      return RemoteError(EAGAIN, operation + ": " + description, true);
    case kj::Exception::Type::UNIMPLEMENTED:
      return RemoteError(ENOSYS, operation + ": " + description);
    default:
      tl_rpc.reset();
      return RemoteError(EIO, operation + ": " + description);
  }
}

namespace {

template <typename Response> void check(const Response& response, const std::string& operation) {
  if (response.getRes() < 0) {
    throw make_errno_error(response.getErrno(), operation);
  }
}

template <typename F> auto call(RpcAccessor& accessor, const std::string& operation, F&& fn)
    -> decltype(fn(accessor.rpc())) {
  try {
    return fn(accessor.rpc());
  } catch (const kj::Exception& e) {
    log::error("{} error: {}", operation, e.getDescription().cStr());
    throw to_remote_error(operation, e);
  }
}

class RpcStreamReader final : public RemoteStreamReader {
  RpcAccessor& accessor;
  uint64_t fh;
  std::string path;
  bool closed = false;

public:
  RpcStreamReader(RpcAccessor& _accessor, uint64_t _fh, std::string _path)
      : accessor(_accessor), fh(_fh), path(std::move(_path)) {}

  ~RpcStreamReader() override {
    if (closed) return;
    try {
      close();
    } catch (const std::exception& e) {
      log::warning("[{}] close: {}", path, e.what());
    }
  }

  ReadResult read(char* buf, size_t size) override {
    return call(accessor, "read " + path, [&](ThreadLocalRpc& rpc) {
      auto request = rpc.client->readRequest();
      request.setFh(fh);
      request.setSize(std::min(size, MAX_TRANSFER_BYTES));

      auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
      check(response, "read " + path);

      auto data = response.getBuf();
      ReadResult result;
      result.bytes = std::min(data.size(), size);
      std::memcpy(buf, data.begin(), result.bytes);
      result.eof = response.getEof();
      return result;
    });
  }

  void seek(int64_t offset) override {
    call(accessor, "seek " + path, [&](ThreadLocalRpc& rpc) {
      auto request = rpc.client->seekRequest();
      request.setFh(fh);
      request.setOff(offset);
      auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
      check(response, "seek " + path);
    });
  }

  void close() override {
    if (closed) return;
    closed = true;
    call(accessor, "close " + path, [&](ThreadLocalRpc& rpc) {
      auto request = rpc.client->closeRequest();
      request.setFh(fh);
      auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
      check(response, "close " + path);
    });
  }
};

class RpcStreamWriter final : public RemoteStreamWriter {
  RpcAccessor& accessor;
  uint64_t fh;
  std::string path;
  bool closed = false;

public:
  RpcStreamWriter(RpcAccessor& _accessor, uint64_t _fh, std::string _path)
      : accessor(_accessor), fh(_fh), path(std::move(_path)) {}

  ~RpcStreamWriter() override {
    if (closed) return;
    try {
      close();
    } catch (const std::exception& e) {
      log::warning("[{}] close: {}", path, e.what());
    }
  }

  void write(const char* buf, size_t size) override {
    size_t done = 0;
    while (done < size) {
      size_t chunk = std::min(size - done, MAX_TRANSFER_BYTES);
      call(accessor, "write " + path, [&](ThreadLocalRpc& rpc) {
        auto request = rpc.client->writeRequest();
        request.setFh(fh);
        request.setBuf(kj::arrayPtr(reinterpret_cast<const kj::byte*>(buf + done), chunk));
        auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
        check(response, "write " + path);
      });
      done += chunk;
    }
  }

  void close() override {
    if (closed) return;
    closed = true;
    call(accessor, "close " + path, [&](ThreadLocalRpc& rpc) {
      auto request = rpc.client->closeRequest();
      request.setFh(fh);
      auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
      check(response, "close " + path);
    });
  }
};

}  // namespace

RpcAccessor::RpcAccessor(ConnectionParams params) : params_(std::move(params)) {}

ThreadLocalRpc& RpcAccessor::rpc() {
  tl_rpc.init(params_);
  return tl_rpc;
}

void RpcAccessor::connect() {
  call(*this, "connect", [](ThreadLocalRpc&) {});
}

Attrs RpcAccessor::stat(const std::string& path) {
  return call(*this, "stat " + path, [&](ThreadLocalRpc& rpc) {
    auto request = rpc.client->statRequest();
    request.setPath(path);
    auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
    check(response, "stat " + path);

    auto attr = response.getAttr();
    Attrs attrs;
    attrs.name = attr.getName();
    attrs.ino = attr.getIno();
    attrs.mode = attr.getMode();
    attrs.nlink = attr.getNlink();
    attrs.uid = attr.getUid();
    attrs.gid = attr.getGid();
    attrs.size = attr.getSize();
    attrs.atime = attr.getAtime();
    attrs.mtime = attr.getMtime();
    attrs.ctime = attr.getCtime();
    return attrs;
  });
}

std::unique_ptr<RemoteStreamReader> RpcAccessor::open_read(const std::string& path) {
  uint64_t fh = call(*this, "open " + path, [&](ThreadLocalRpc& rpc) {
    auto request = rpc.client->openReadRequest();
    request.setPath(path);
    auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
    check(response, "open " + path);
    return response.getFh();
  });
  return std::make_unique<RpcStreamReader>(*this, fh, path);
}

std::unique_ptr<RemoteStreamWriter> RpcAccessor::create(const std::string& path, bool overwrite) {
  uint64_t fh = call(*this, "create " + path, [&](ThreadLocalRpc& rpc) {
    auto request = rpc.client->createRequest();
    request.setPath(path);
    request.setOverwrite(overwrite);
    auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
    check(response, "create " + path);
    return response.getFh();
  });
  return std::make_unique<RpcStreamWriter>(*this, fh, path);
}

void RpcAccessor::chmod(const std::string& path, uint32_t mode) {
  call(*this, "chmod " + path, [&](ThreadLocalRpc& rpc) {
    auto request = rpc.client->chmodRequest();
    request.setPath(path);
    request.setMode(mode);
    auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
    check(response, "chmod " + path);
  });
}

void RpcAccessor::chown(const std::string& path, const std::string& user,
                        const std::string& group) {
  call(*this, "chown " + path, [&](ThreadLocalRpc& rpc) {
    auto request = rpc.client->chownRequest();
    request.setPath(path);
    request.setUser(user);
    request.setGroup(group);
    auto response = waitWithTimeout(request.send(), rpc.getTimer(), rpc.ioContext->waitScope);
    check(response, "chown " + path);
  });
}

}  // namespace streamfs
