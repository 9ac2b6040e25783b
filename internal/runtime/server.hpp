#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace cashgraph::runtime::config {
class ServerConfig;
}

namespace cashgraph::runtime {

struct ServerOptions {
  std::string bind_address              = "0.0.0.0:50061";
  int64_t     shutdown_grace_ms         = 10'000;
  int         max_receive_message_bytes = 64 * 1024 * 1024;

  static ServerOptions FromProto(const config::ServerConfig& proto);
};

// Hosts the ledger RPC services. Stop() drains in-flight calls for up to
// shutdown_grace_ms before cancelling them.
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound; differs from the configured one for ":0".
  int bound_port() const {
    return bound_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace cashgraph::runtime
