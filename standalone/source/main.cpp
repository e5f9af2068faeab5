#include <streamfs/filesystem.h>
#include <streamfs/fs.h>
#include <streamfs/local_accessor.h>
#include <streamfs/log.h>
#include <streamfs/rpc.h>
#include <streamfs/rpc_accessor.h>

#include <chrono>
#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#ifndef STREAMFS_VERSION
#  define STREAMFS_VERSION "0.0.0"
#endif

static std::string read_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

auto main(int argc, char** argv) -> int {
  cxxopts::Options options("StreamFS", "Random access mount for sequential stream stores");

  // clang-format off
  options.add_options()
    ("h,help", "Show help")
    ("v,version", "Print the current version number")
    ("s,server", "Run in server mode")
    ("c,client", "Run in client mode")
    ("l,local", "Mount a local directory directly")
    ("b,bind", "Bind IP address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
    ("H,host", "Server host address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
    ("p,port", "Server port", cxxopts::value<uint16_t>()->default_value("3444"))
    ("r,root", "Root directory of the store", cxxopts::value<std::string>()->default_value(""))
    ("u,user", "Username", cxxopts::value<std::string>()->default_value(""))
    ("t,token", "Authentication token", cxxopts::value<std::string>()->default_value(""))
    ("k,key", "TLS key", cxxopts::value<std::string>()->default_value(""))
    ("T,cert", "TLS cert", cxxopts::value<std::string>()->default_value(""))
    ("o,options", "Fuse mount options", cxxopts::value<std::vector<std::string>>())
    ("seek-threshold", "Forward gap in bytes read through instead of seeking", cxxopts::value<int64_t>()->default_value("262144"))
    ("chunk-size", "Minimum bytes per remote read", cxxopts::value<size_t>()->default_value("65536"))
    ("max-retained", "Bytes kept behind the remote cursor per handle", cxxopts::value<size_t>()->default_value("4194304"))
    ("retries", "Maximum attempts per remote operation", cxxopts::value<int>()->default_value("10"))
    ("retry-min-delay-ms", "First retry delay", cxxopts::value<int64_t>()->default_value("1000"))
    ("retry-max-delay-ms", "Maximum retry delay", cxxopts::value<int64_t>()->default_value("60000"))
    ("retry-time-limit", "Seconds after which an operation is no longer retried", cxxopts::value<int64_t>()->default_value("300"))
    ("attr-ttl", "Seconds file attributes stay cached", cxxopts::value<int64_t>()->default_value("60"))
    ("stream-grace", "Seconds the server keeps streams of disconnected clients", cxxopts::value<int64_t>()->default_value("300"))
    ("staging-dir", "Directory for write staging files", cxxopts::value<std::string>()->default_value("/tmp"))
    ("verbose", "Verbose logging")
    ("mountpoint", "Mount point for client or local mode", cxxopts::value<std::string>()->default_value(""));
  // clang-format on

  options.parse_positional({"mountpoint"});

  auto result = options.parse(argc, argv);

  if (result["help"].as<bool>()) {
    std::cout << options.help() << std::endl;
    return 0;
  }

  if (result["version"].as<bool>()) {
    std::cout << "StreamFS, version " << STREAMFS_VERSION << std::endl;
    return 0;
  }

  if (result["verbose"].as<bool>()) {
    streamfs::log::set_level(streamfs::log::Level::Debug);
  }

  std::string root = result["root"].as<std::string>();

  if (result["server"].as<bool>()) {
    if (root.empty()) {
      std::cerr << "Error: --server requires --root" << std::endl;
      return 1;
    }
    streamfs::RpcServerConfig config;
    config.bind = result["bind"].as<std::string>();
    config.port = result["port"].as<uint16_t>();
    config.root = root;
    config.token = result["token"].as<std::string>();
    config.key_file = result["key"].as<std::string>();
    config.cert_file = result["cert"].as<std::string>();
    config.stream_grace = std::chrono::seconds(result["stream-grace"].as<int64_t>());
    return streamfs::start_rpc_server(config);
  }

  bool run_client = result["client"].as<bool>();
  bool run_local = result["local"].as<bool>();

  if (!run_client && !run_local) {
    std::cout << options.help() << std::endl;
    return 1;
  }

  std::string mountpoint = result["mountpoint"].as<std::string>();
  if (mountpoint.empty()) {
    std::cerr << "Error: a mountpoint is required" << std::endl;
    return 1;
  }

  streamfs::MountOptions mount;
  mount.reader.seek_threshold = result["seek-threshold"].as<int64_t>();
  mount.reader.chunk_size = result["chunk-size"].as<size_t>();
  mount.reader.max_retained = result["max-retained"].as<size_t>();
  mount.retry.max_attempts = result["retries"].as<int>();
  mount.retry.min_delay = std::chrono::milliseconds(result["retry-min-delay-ms"].as<int64_t>());
  mount.retry.max_delay = std::chrono::milliseconds(result["retry-max-delay-ms"].as<int64_t>());
  mount.retry.time_limit = std::chrono::seconds(result["retry-time-limit"].as<int64_t>());
  mount.attr_ttl = std::chrono::seconds(result["attr-ttl"].as<int64_t>());
  mount.staging_dir = result["staging-dir"].as<std::string>();

  std::vector<std::string> fuse_options;
  if (result.count("options")) {
    fuse_options = result["options"].as<std::vector<std::string>>();
  }

  std::shared_ptr<streamfs::RemoteAccessor> accessor;

  if (run_local) {
    if (root.empty() || !std::filesystem::is_directory(root)) {
      std::cerr << "Error: --local requires an existing --root directory" << std::endl;
      return 1;
    }
    accessor = std::make_shared<streamfs::LocalAccessor>(root);
  } else {
    streamfs::ConnectionParams params;
    params.host = result["host"].as<std::string>();
    params.port = result["port"].as<uint16_t>();
    params.user = result["user"].as<std::string>();
    params.token = result["token"].as<std::string>();

    try {
      std::string cert_file = result["cert"].as<std::string>();
      params.cert = cert_file.length() ? read_file(cert_file) : "";

      auto rpc = std::make_shared<streamfs::RpcAccessor>(params);
      // Verify credentials on the main thread before mounting
      rpc->connect();
      std::cout << "Connected to the StreamFS server." << std::endl;
      accessor = rpc;
    } catch (const std::exception& e) {
      std::cout << "Connection failed: " << e.what() << std::endl;
      return 1;
    }
  }

  static streamfs::SystemClock clock;
  auto fs = std::make_shared<streamfs::FileSystem>(accessor, clock, mount);

  std::vector<char> mountpoint_arg(mountpoint.begin(), mountpoint.end());
  mountpoint_arg.push_back('\0');

  return streamfs::start_fs(argv[0], mountpoint_arg.data(), fuse_options, fs);
}
