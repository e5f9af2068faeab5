#include <streamfs/errors.h>
#include <streamfs/local_accessor.h>
#include <streamfs/log.h>
#include <streamfs/rpc.h>
#include <streamfs/stream_table.h>

#include <errno.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <vector>

// Cap'n'Proto
#include <capnp/message.h>
#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async.h>
#include <kj/compat/tls.h>
#include <kj/debug.h>

#include <streamfs.capnp.h>

namespace streamfs {

static constexpr uint64_t STREAM_SWEEP_INTERVAL_S = 60;

// Runs fn and stores a failure in the response's res/errno fields
template <typename Response, typename F> void respond(Response response, F&& fn) {
  try {
    fn();
    response.setRes(0);
    response.setErrno(0);
  } catch (const RemoteError& e) {
    log::debug("request failed: {}", e.what());
    response.setRes(-1);
    response.setErrno(e.err());
  } catch (const std::exception& e) {
    log::error("request failed: {}", e.what());
    response.setRes(-1);
    response.setErrno(EIO);
  }
}

class StreamFsImpl final : public StreamFs::Server {
  std::string user;
  std::shared_ptr<RemoteAccessor> accessor;
  std::shared_ptr<StreamTable> streams;

public:
  StreamFsImpl(std::string _user, std::shared_ptr<RemoteAccessor> _accessor,
               std::shared_ptr<StreamTable> _streams)
      : user(std::move(_user)), accessor(std::move(_accessor)), streams(std::move(_streams)) {
    streams->connect(user);
  }

  ~StreamFsImpl() override { streams->disconnect(user); }

  kj::Promise<void> stat(StatContext context) override {
    std::string path = context.getParams().getPath();
    auto response = context.getResults();

    respond(response, [&]() {
      Attrs attrs = accessor->stat(path);
      Attr::Builder attr = response.initAttr();
      attr.setName(attrs.name);
      attr.setIno(attrs.ino);
      attr.setMode(attrs.mode);
      attr.setNlink(attrs.nlink);
      attr.setUid(attrs.uid);
      attr.setGid(attrs.gid);
      attr.setSize(attrs.size);
      attr.setAtime(attrs.atime);
      attr.setMtime(attrs.mtime);
      attr.setCtime(attrs.ctime);
    });
    return kj::READY_NOW;
  }

  kj::Promise<void> openRead(OpenReadContext context) override {
    std::string path = context.getParams().getPath();
    auto response = context.getResults();

    respond(response, [&]() {
      uint64_t fh = streams->add(user, accessor->open_read(path));
      log::debug("[{}] {} opened for read as {}", user, path, fh);
      response.setFh(fh);
    });
    return kj::READY_NOW;
  }

  kj::Promise<void> read(ReadContext context) override {
    auto params = context.getParams();
    auto response = context.getResults();
    uint64_t fh = params.getFh();
    size_t size = std::min<uint64_t>(params.getSize(), 4 * 1024 * 1024);

    try {
      auto reader = streams->reader(fh);

      thread_local std::vector<char> read_buffer;
      if (read_buffer.size() < size) {
        read_buffer.resize(size);
      }
      ReadResult result = reader->read(read_buffer.data(), size);

      response.setBuf(kj::arrayPtr(reinterpret_cast<const kj::byte*>(read_buffer.data()),
                                   result.bytes));
      response.setEof(result.eof);
      response.setRes(static_cast<int64_t>(result.bytes));
      response.setErrno(0);
    } catch (const RemoteError& e) {
      response.setRes(-1);
      response.setErrno(e.err());
    } catch (const std::exception& e) {
      log::error("read error: {}", e.what());
      response.setRes(-1);
      response.setErrno(EIO);
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> seek(SeekContext context) override {
    auto params = context.getParams();
    respond(context.getResults(), [&]() { streams->reader(params.getFh())->seek(params.getOff()); });
    return kj::READY_NOW;
  }

  kj::Promise<void> close(CloseContext context) override {
    uint64_t fh = context.getParams().getFh();
    respond(context.getResults(), [&]() { streams->close(fh); });
    return kj::READY_NOW;
  }

  kj::Promise<void> create(CreateContext context) override {
    auto params = context.getParams();
    std::string path = params.getPath();
    bool overwrite = params.getOverwrite();
    auto response = context.getResults();

    respond(response, [&]() {
      uint64_t fh = streams->add(user, accessor->create(path, overwrite));
      log::debug("[{}] {} created as {}", user, path, fh);
      response.setFh(fh);
    });
    return kj::READY_NOW;
  }

  kj::Promise<void> write(WriteContext context) override {
    auto params = context.getParams();
    auto response = context.getResults();
    auto buf = params.getBuf();

    respond(response, [&]() {
      streams->writer(params.getFh())
          ->write(reinterpret_cast<const char*>(buf.begin()), buf.size());
    });
    if (response.getRes() == 0) {
      response.setRes(static_cast<int64_t>(buf.size()));
    }
    return kj::READY_NOW;
  }

  kj::Promise<void> chmod(ChmodContext context) override {
    auto params = context.getParams();
    std::string path = params.getPath();
    uint32_t mode = params.getMode();
    respond(context.getResults(), [&]() { accessor->chmod(path, mode); });
    return kj::READY_NOW;
  }

  kj::Promise<void> chown(ChownContext context) override {
    auto params = context.getParams();
    std::string path = params.getPath();
    std::string owner = params.getUser();
    std::string group = params.getGroup();
    respond(context.getResults(), [&]() { accessor->chown(path, owner, group); });
    return kj::READY_NOW;
  }
};

class StreamFsAuthImpl final : public StreamFsAuth::Server {
  std::string token;
  std::shared_ptr<RemoteAccessor> accessor;
  std::shared_ptr<StreamTable> streams;

public:
  StreamFsAuthImpl(std::string _token, std::shared_ptr<RemoteAccessor> _accessor,
                   std::shared_ptr<StreamTable> _streams)
      : token(std::move(_token)), accessor(std::move(_accessor)), streams(std::move(_streams)) {}

  kj::Promise<void> auth(AuthContext context) override {
    auto params = context.getParams();

    auto userPtr = params.getUser();
    std::string user(userPtr.begin(), userPtr.end());

    auto tokenPtr = params.getToken();
    std::string given(tokenPtr.begin(), tokenPtr.end());

    bool isValid = token.empty() || given == token;
    auto res = context.getResults();

    res.setAuthSuccess(isValid);

    if (isValid) {
      log::info("[{}] authenticated", user);
      res.setStreamFs(kj::heap<StreamFsImpl>(user, accessor, streams));
    } else {
      log::warning("[{}] rejected: bad token", user);
    }

    return kj::READY_NOW;
  }
};

// Periodically closes streams left behind by clients that went away
static kj::Promise<void> expire_streams(kj::Timer& timer, StreamTable& streams) {
  return timer.afterDelay(STREAM_SWEEP_INTERVAL_S * kj::SECONDS).then([&timer, &streams]() {
    streams.expire();
    return expire_streams(timer, streams);
  });
}

static std::string read_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

int start_rpc_server(const RpcServerConfig& config) {
  if (not std::filesystem::is_directory(config.root)) {
    std::cerr << "ERROR: " << '"' << config.root << '"' << " is not a directory" << std::endl;
    return 1;
  }

  kj::_::Debug::setLogLevel(kj::_::Debug::Severity::ERROR);

  std::string key;
  std::string cert;
  try {
    key = config.key_file.length() ? read_file(config.key_file) : "";
    cert = config.cert_file.length() ? read_file(config.cert_file) : "";
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Starting StreamFS server on " << config.bind << ":" << config.port << "..."
            << std::endl;

  static SystemClock clock;
  auto accessor = std::make_shared<LocalAccessor>(config.root);
  auto streams = std::make_shared<StreamTable>(clock, config.stream_grace);

  auto ioContext = kj::setupAsyncIo();

  capnp::TwoPartyServer server(kj::heap<StreamFsAuthImpl>(config.token, accessor, streams));

  auto sweeper = expire_streams(ioContext.provider->getTimer(), *streams)
                     .eagerlyEvaluate([](kj::Exception&& e) {
                       log::error("stream expiry stopped: {}", e.getDescription().cStr());
                     });

  if (key.length() or cert.length()) {
    kj::TlsKeypair keypair{kj::TlsPrivateKey(key), kj::TlsCertificate(cert)};

    kj::TlsContext::Options options;
    options.defaultKeypair = keypair;
    options.useSystemTrustStore = false;
    options.acceptErrorHandler = [](kj::Exception&& e) {
      std::cerr << "TLS Error: " << e.getDescription().cStr() << std::endl;
    };

    kj::TlsContext tlsContext(kj::mv(options));

    auto network = tlsContext.wrapNetwork(ioContext.provider->getNetwork());
    auto address = network->parseAddress(config.bind, config.port).wait(ioContext.waitScope);
    auto listener = address->listen();
    auto listen_promise = server.listen(*listener);

    listen_promise.wait(ioContext.waitScope);
  } else {
    auto address = ioContext.provider->getNetwork()
                       .parseAddress(config.bind, config.port)
                       .wait(ioContext.waitScope);

    auto listener = address->listen();
    auto listen_promise = server.listen(*listener);

    listen_promise.wait(ioContext.waitScope);
  }

  return 0;
}

}  // namespace streamfs
