#include "speechly/identity/identity_client.hpp"

#include <stdexcept>
#include <utility>

#include "speechly/grpc/channel_builder.hpp"

namespace speechly {
namespace identity {

namespace {

std::string message_or(const grpc::Status &status, const char *fallback) {
  if (status.error_message().empty()) {
    return fallback;
  }
  return status.error_message();
}

} // namespace

GrpcIdentityClient::GrpcIdentityClient(
    std::shared_ptr<grpc::ChannelInterface> channel,
    std::chrono::seconds shutdown_timeout)
    : channel_(std::move(channel)), shutdown_timeout_(shutdown_timeout) {
  if (!channel_) {
    throw std::invalid_argument("Channel cannot be null");
  }
  stub_ = v1::Identity::NewStub(channel_);
}

GrpcIdentityClient::~GrpcIdentityClient() { close(); }

std::unique_ptr<GrpcIdentityClient>
GrpcIdentityClient::for_target(const std::string &target, bool secure,
                               std::chrono::seconds shutdown_timeout) {
  return std::make_unique<GrpcIdentityClient>(
      grpcutil::build_channel(target, secure), shutdown_timeout);
}

v1::LoginResponse GrpcIdentityClient::login(const v1::LoginRequest &request) {
  grpc::ClientContext context;
  v1::Identity::StubInterface *stub = nullptr;
  {
    std::scoped_lock lock(mutex_);
    if (closed_) {
      throw RpcError(grpc::Status(grpc::StatusCode::UNAVAILABLE,
                                  "Channel shutdown invoked"));
    }
    stub = stub_.get();
    in_flight_.insert(&context);
  }

  v1::LoginResponse response;
  grpc::Status status = stub->Login(&context, request, &response);

  {
    std::scoped_lock lock(mutex_);
    in_flight_.erase(&context);
  }
  idle_cv_.notify_all();

  if (status.ok()) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Login succeeded for device " << request.device_id();
    return response;
  }

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Login failed with code " << static_cast<int>(status.error_code())
      << ": " << status.error_message();
  switch (status.error_code()) {
  case grpc::StatusCode::PERMISSION_DENIED:
    throw AuthenticationException(message_or(status, "Authentication failed"));
  case grpc::StatusCode::NOT_FOUND:
    throw InvalidApplicationException(message_or(status, "Invalid appId"));
  default:
    throw RpcError(std::move(status));
  }
}

void GrpcIdentityClient::close() {
  std::unique_lock lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  const bool drained = idle_cv_.wait_for(
      lock, shutdown_timeout_, [this] { return in_flight_.empty(); });
  if (!drained) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Identity channel did not terminate within "
        << shutdown_timeout_.count() << "s, cancelling " << in_flight_.size()
        << " in-flight call(s)";
    for (auto *context : in_flight_) {
      context->TryCancel();
    }
    // Cancelled calls complete promptly.
    idle_cv_.wait(lock, [this] { return in_flight_.empty(); });
  }

  stub_.reset();
  channel_.reset();
  BOOST_LOG_SEV(lg_, trivial::debug) << "Identity channel closed";
}

bool GrpcIdentityClient::closed() const {
  std::scoped_lock lock(mutex_);
  return closed_;
}

} // namespace identity
} // namespace speechly
