#pragma once

#include <grpcpp/server.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>
#include <grpcpp/support/channel_arguments.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

#include "speechly/identity/v1/identity.grpc.pb.h"

namespace testinfra {

namespace v1 = speechly::identity::v1;

// Identity service whose Login behavior is supplied by the test.
class FakeIdentityService final : public v1::Identity::Service {
public:
  using Handler = std::function<grpc::Status(
      grpc::ServerContext *, const v1::LoginRequest &, v1::LoginResponse *)>;

  explicit FakeIdentityService(Handler handler) : handler_(std::move(handler)) {}

  grpc::Status Login(grpc::ServerContext *context,
                     const v1::LoginRequest *request,
                     v1::LoginResponse *response) override {
    {
      std::scoped_lock lock(mutex_);
      received_.push_back(*request);
    }
    return handler_(context, *request, response);
  }

  std::vector<v1::LoginRequest> received() const {
    std::scoped_lock lock(mutex_);
    return received_;
  }

private:
  Handler handler_;
  mutable std::mutex mutex_;
  std::vector<v1::LoginRequest> received_;
};

// Server without listening ports; clients connect through InProcessChannel.
class IdentityTestServer {
public:
  explicit IdentityTestServer(FakeIdentityService::Handler handler)
      : service_(std::move(handler)) {
    grpc::ServerBuilder builder;
    builder.RegisterService(&service_);
    server_ = builder.BuildAndStart();
    if (!server_) {
      throw std::runtime_error("failed to start in-process identity server");
    }
  }

  ~IdentityTestServer() {
    server_->Shutdown(std::chrono::system_clock::now() +
                      std::chrono::seconds(5));
  }

  std::shared_ptr<grpc::Channel> channel() {
    grpc::ChannelArguments args;
    return server_->InProcessChannel(args);
  }

  FakeIdentityService &service() { return service_; }

private:
  FakeIdentityService service_;
  std::unique_ptr<grpc::Server> server_;
};

} // namespace testinfra
