#include "server.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace atomicswap::runtime {
namespace {

// In-flight RPCs get this long to finish once Stop() is called.
constexpr auto kDrainTimeout = std::chrono::seconds(5);

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  int                   bound_port = 0;
  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port);
  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  server_ = builder.BuildAndStart();
  if (server_ == nullptr || bound_port == 0) {
    server_.reset();
    throw std::runtime_error("cannot listen on " + bind_address_);
  }
  ATOMICSWAP_LOG_INFO("grpc listening", {observability::StringField("address", bind_address_), observability::IntField("port", bound_port),
                                         observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop() {
  if (server_ == nullptr) {
    return;
  }
  server_->Shutdown(std::chrono::system_clock::now() + kDrainTimeout);
  server_.reset();
}

} // namespace atomicswap::runtime
