#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace cashgraph::runtime {

ServerOptions ServerOptions::FromProto(const config::ServerConfig& proto) {
  ServerOptions options;
  if (!proto.bind_address().empty()) options.bind_address = proto.bind_address();
  if (proto.has_shutdown_grace()) options.shutdown_grace_ms = util::DurationFromProto(proto.shutdown_grace()).count();
  if (proto.max_receive_message_bytes() > 0) options.max_receive_message_bytes = static_cast<int>(proto.max_receive_message_bytes());
  return options;
}

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &bound_port_);
  builder.SetMaxReceiveMessageSize(options_.max_receive_message_bytes);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || bound_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("cannot listen on " + options_.bind_address);
  }

  CASHGRAPH_LOG_INFO("ledger rpc listening", {observability::StringField("bind_address", options_.bind_address),
                                              observability::IntField("port", bound_port_),
                                              observability::IntField("max_receive_message_bytes", options_.max_receive_message_bytes)});
}

void Server::Stop() {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::milliseconds(options_.shutdown_grace_ms));
  grpc_server_.reset();
  CASHGRAPH_LOG_INFO("ledger rpc stopped");
}

} // namespace cashgraph::runtime
