#pragma once

#include <grpcpp/channel.h>

#include <filesystem>
#include <memory>
#include <string>

namespace speechly {
namespace grpcutil {

inline constexpr const char kUserAgentPrefix[] = "speechly-client-cpp";

struct ChannelOptions {
  std::string target;
  bool secure{true};
  // PEM bundle replacing the default roots; ignored for plaintext channels.
  std::filesystem::path root_certs_file{};
};

// Builds a channel to `options.target` (e.g. "api.speechly.com") over TLS or
// plaintext. Throws std::invalid_argument for an empty target and
// std::runtime_error when root_certs_file cannot be read.
std::shared_ptr<grpc::Channel> build_channel(const ChannelOptions &options);

inline std::shared_ptr<grpc::Channel> build_channel(const std::string &target,
                                                    bool secure) {
  return build_channel(ChannelOptions{target, secure, {}});
}

} // namespace grpcutil
} // namespace speechly
