#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <memory>
#include <string>
#include <vector>

namespace atomicswap::runtime {

// Owns the coordinator's gRPC services and the listener serving them.
// Plaintext only; Stop() is idempotent and runs on destruction.
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error if the address cannot be bound.
  void Start();
  void Stop();

 private:
  const std::string                             bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               server_;
};

} // namespace atomicswap::runtime
