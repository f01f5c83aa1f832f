#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

#include "speechly/conf/client_config.hpp"
#include "speechly/identity/identity_errors.hpp"
#include "speechly/identity/v1/identity.grpc.pb.h"
#include "speechly/util/logging.hpp"

namespace speechly {
namespace identity {

// Client for the Speechly Identity API.
class IIdentityClient {
public:
  virtual ~IIdentityClient() = default;

  // Performs a login against the API using the provided request.
  //
  // Throws InvalidApplicationException when the application is unknown,
  // AuthenticationException when access is denied and RpcError otherwise.
  virtual v1::LoginResponse login(const v1::LoginRequest &request) = 0;

  // Releases the underlying channel. Never throws; repeated calls are no-ops.
  virtual void close() = 0;
};

class GrpcIdentityClient : public IIdentityClient {
public:
  explicit GrpcIdentityClient(
      std::shared_ptr<grpc::ChannelInterface> channel,
      std::chrono::seconds shutdown_timeout = conf::kDefaultShutdownTimeout);
  ~GrpcIdentityClient() override;

  GrpcIdentityClient(const GrpcIdentityClient &) = delete;
  GrpcIdentityClient &operator=(const GrpcIdentityClient &) = delete;

  // Connects to `target`, e.g. "api.speechly.com", over TLS when `secure`.
  static std::unique_ptr<GrpcIdentityClient>
  for_target(const std::string &target, bool secure,
             std::chrono::seconds shutdown_timeout =
                 conf::kDefaultShutdownTimeout);

  v1::LoginResponse login(const v1::LoginRequest &request) override;

  // Waits up to the shutdown timeout for in-flight calls, cancels the ones
  // still running and drops the channel.
  void close() override;

  bool closed() const;

private:
  std::shared_ptr<grpc::ChannelInterface> channel_;
  std::unique_ptr<v1::Identity::StubInterface> stub_;
  std::chrono::seconds shutdown_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::unordered_set<grpc::ClientContext *> in_flight_;
  bool closed_{false};
  Logger lg_;
};

} // namespace identity
} // namespace speechly
