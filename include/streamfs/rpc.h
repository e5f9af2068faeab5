#pragma once

#include <streamfs/clock.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace streamfs {

struct RpcServerConfig {
  std::string bind = "127.0.0.1";
  uint16_t port = 3444;
  std::string root;
  std::string token;
  std::string key_file;
  std::string cert_file;
  // How long streams of a user without live connections are kept
  Duration stream_grace = std::chrono::minutes(5);
};

// Serves the directory tree under config.root as a stream store. Blocks
// until the listener fails; returns non-zero on startup errors.
int start_rpc_server(const RpcServerConfig& config);

}  // namespace streamfs
