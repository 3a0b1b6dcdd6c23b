#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace recall::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);

  // the builder only borrows services; they stay owned here
  for (const auto& service : services_) builder.RegisterService(service.get());

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + bind_address_);
  }

  RECALL_LOG_DEBUG("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                             observability::IntField("port", selected_port_),
                                             observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown();
  grpc_server_.reset();
}

} // namespace recall::runtime
