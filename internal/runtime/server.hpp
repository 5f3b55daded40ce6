#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace docbuild::runtime {

struct ServerOptions {
  std::string bind_address;
  // 0 keeps the gRPC defaults
  uint32_t max_message_bytes = 0;
};

/*
  Hosts the admin and query services. Owns the service adapters; they must
  outlive the grpc::Server, so Stop() shuts the server down first.
*/
class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the port cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Port actually bound; differs from bind_address for ":0".
  int BoundPort() const { return bound_port_; }

private:
  ServerOptions options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int bound_port_ = 0;
};

} // namespace docbuild::runtime
