#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace rvault::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  grpc::EnableDefaultHealthCheckService(true);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials(), &listening_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || listening_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("unable to bind gRPC listener on " + bind_address_);
  }

  RVAULT_LOG_INFO("gRPC server listening", {rvault::observability::StringField("bind_address", bind_address_),
                                            rvault::observability::IntField("port", listening_port_),
                                            rvault::observability::IntField("services",
                                                                            static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown();
  grpc_server_.reset();
  RVAULT_LOG_INFO("gRPC server stopped", {rvault::observability::IntField("port", listening_port_)});
}

} // namespace rvault::runtime
