#pragma once

#include <grpcpp/support/status.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace speechly {
namespace identity {

// The API rejected the application id.
class InvalidApplicationException : public std::runtime_error {
public:
  explicit InvalidApplicationException(const std::string &message)
      : std::runtime_error(message) {}
};

// The API rejected the credentials or the authorization of the caller.
class AuthenticationException : public std::runtime_error {
public:
  explicit AuthenticationException(const std::string &message)
      : std::runtime_error(message) {}
};

// Any other failed call. Carries the status exactly as the stub returned it.
class RpcError : public std::runtime_error {
public:
  explicit RpcError(grpc::Status status)
      : std::runtime_error(describe(status)), status_(std::move(status)) {}

  const grpc::Status &status() const { return status_; }
  grpc::StatusCode code() const { return status_.error_code(); }

private:
  static std::string describe(const grpc::Status &status) {
    return "rpc failed with code " +
           std::to_string(static_cast<int>(status.error_code())) + ": " +
           status.error_message();
  }

  grpc::Status status_;
};

} // namespace identity
} // namespace speechly
