#include "speechly/grpc/channel_builder.hpp"

#include <fmt/format.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "speechly/util/logging.hpp"

namespace speechly {
namespace grpcutil {

namespace {

std::string read_pem_file(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        fmt::format("Unable to read root certificates: {}", path.string()));
  }
  return std::string((std::istreambuf_iterator<char>(ifs)),
                     std::istreambuf_iterator<char>());
}

} // namespace

std::shared_ptr<grpc::Channel> build_channel(const ChannelOptions &options) {
  if (options.target.empty()) {
    throw std::invalid_argument("channel target must not be empty");
  }

  std::shared_ptr<grpc::ChannelCredentials> credentials;
  if (options.secure) {
    grpc::SslCredentialsOptions ssl_options;
    if (!options.root_certs_file.empty()) {
      ssl_options.pem_root_certs = read_pem_file(options.root_certs_file);
    }
    credentials = grpc::SslCredentials(ssl_options);
  } else {
    credentials = grpc::InsecureChannelCredentials();
  }

  grpc::ChannelArguments args;
  args.SetUserAgentPrefix(kUserAgentPrefix);

  Logger lg;
  BOOST_LOG_SEV(lg, trivial::debug)
      << "Building " << (options.secure ? "TLS" : "plaintext")
      << " channel to " << options.target;
  return grpc::CreateCustomChannel(options.target, credentials, args);
}

} // namespace grpcutil
} // namespace speechly
