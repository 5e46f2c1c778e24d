#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace rvault::runtime {

/*
  Owns the gRPC listener for the reader services.

  Start() throws std::runtime_error when the address cannot be bound. Stop()
  is idempotent and also runs on destruction.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from the configured one for ":0".
  int listening_port() const {
    return listening_port_;
  }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int listening_port_ = 0;
};

} // namespace rvault::runtime
