#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "speechly/cache/cache_service.hpp"
#include "speechly/cache/sqlite_cache_service.hpp"
#include "speechly/conf/client_config.hpp"
#include "speechly/device/device_id_provider.hpp"
#include "speechly/grpc/channel_builder.hpp"
#include "speechly/identity/identity_client.hpp"
#include "speechly/util/logging.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInvalidApplication = 2;
constexpr int kExitAuthentication = 3;
constexpr int kExitRpc = 4;

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// $SPEECHLY_CONFIG_DIR, then $XDG_CONFIG_HOME/speechly, then
// $HOME/.config/speechly.
fs::path resolve_default_config_dir() {
  if (auto dir = get_env_path("SPEECHLY_CONFIG_DIR"); !dir.empty()) {
    return dir;
  }
  if (auto xdg = get_env_path("XDG_CONFIG_HOME"); !xdg.empty()) {
    return xdg / "speechly";
  }
  if (auto home = get_env_path("HOME"); !home.empty()) {
    return home / ".config" / "speechly";
  }
  return fs::path("config");
}

std::unique_ptr<speechly::conf::IClientConfigProvider>
load_config(const fs::path &config_dir, bool required) {
  if (fs::exists(config_dir / "application.json")) {
    return std::make_unique<speechly::conf::ClientConfigProviderFile>(
        config_dir);
  }
  if (required) {
    throw std::runtime_error(fmt::format(
        "No application.json in config dir {}", config_dir.string()));
  }
  return std::make_unique<speechly::conf::ClientConfigProviderStatic>();
}

std::shared_ptr<speechly::cache::ICacheService>
make_cache_service(const fs::path &runtime_dir, speechly::Logger &lg) {
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "runtime_dir not configured, device id will not be persisted";
    return std::make_shared<speechly::cache::InMemoryCacheService>();
  }
  return std::make_shared<speechly::cache::SqliteCacheService>(
      runtime_dir / "state" / "device_cache.db");
}

} // namespace

int main(int argc, char *argv[]) {
  namespace identity = speechly::identity;

  po::options_description desc("speechly-login options");
  // clang-format off
  desc.add_options()
      ("help,h", "Print this help message")
      ("config-dir,c", po::value<std::string>(), "Directory holding application.json")
      ("runtime-dir", po::value<std::string>(), "Directory for persistent state")
      ("target", po::value<std::string>(), "Identity API endpoint, e.g. api.speechly.com")
      ("insecure", po::bool_switch()->default_value(false), "Use a plaintext connection")
      ("app-id", po::value<std::string>(), "Application id to log in to")
      ("config-id", po::value<std::string>(), "Model configuration id")
      ("project-id", po::value<std::string>(), "Project id; replaces the application scope")
      ("shutdown-timeout", po::value<long>(), "Seconds to wait for the channel to close")
      ("device-id", po::bool_switch()->default_value(false), "Print the device id and exit")
      ("verbose,v", po::value<std::string>(), "Log level: trace, debug, info, warning, error, fatal");
  // clang-format on

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << e.what() << "\n" << desc << std::endl;
    return kExitUsage;
  }
  if (vm.count("help")) {
    std::cout << desc << std::endl;
    return kExitOk;
  }

  std::unique_ptr<speechly::conf::IClientConfigProvider> config_provider;
  try {
    const bool explicit_dir = vm.count("config-dir") > 0;
    const fs::path config_dir =
        explicit_dir ? fs::path(vm["config-dir"].as<std::string>())
                     : resolve_default_config_dir();
    config_provider = load_config(config_dir, explicit_dir);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return kExitUsage;
  }

  auto &config = config_provider->get();
  auto &logging_config = config_provider->logging();
  if (vm.count("verbose")) {
    logging_config.level = vm["verbose"].as<std::string>();
  }
  if (vm.count("runtime-dir")) {
    config.runtime_dir = vm["runtime-dir"].as<std::string>();
  } else if (config.runtime_dir.empty()) {
    config.runtime_dir = get_env_path("SPEECHLY_RUNTIME_DIR");
  }
  if (vm.count("target")) {
    config.identity_target = vm["target"].as<std::string>();
  }
  if (vm["insecure"].as<bool>()) {
    config.secure = false;
  }
  if (vm.count("app-id")) {
    config.app_id = vm["app-id"].as<std::string>();
  }
  if (vm.count("config-id")) {
    config.config_id = vm["config-id"].as<std::string>();
  }
  if (vm.count("project-id")) {
    config.project_id = vm["project-id"].as<std::string>();
  }
  if (vm.count("shutdown-timeout")) {
    const long seconds = vm["shutdown-timeout"].as<long>();
    if (seconds < 0) {
      std::cerr << "--shutdown-timeout must not be negative" << std::endl;
      return kExitUsage;
    }
    config.shutdown_timeout = std::chrono::seconds(seconds);
  }

  speechly::init_logging(logging_config);
  speechly::Logger lg;

  speechly::device::CachingIdProvider device_id_provider(
      make_cache_service(config.runtime_dir, lg));
  const auto device_id =
      speechly::device::to_string(device_id_provider.get_device_id());
  if (vm["device-id"].as<bool>()) {
    std::cout << device_id << std::endl;
    return kExitOk;
  }

  if (config.app_id.empty() && config.project_id.empty()) {
    std::cerr << "Either --app-id or --project-id is required" << std::endl;
    return kExitUsage;
  }

  identity::v1::LoginRequest request;
  request.set_device_id(device_id);
  if (!config.project_id.empty()) {
    request.mutable_project()->set_project_id(config.project_id);
  } else {
    auto *application = request.mutable_application();
    application->set_app_id(config.app_id);
    if (!config.config_id.empty()) {
      application->set_config_id(config.config_id);
    }
  }

  std::unique_ptr<identity::GrpcIdentityClient> client;
  try {
    client = std::make_unique<identity::GrpcIdentityClient>(
        speechly::grpcutil::build_channel(speechly::grpcutil::ChannelOptions{
            config.identity_target, config.secure, config.root_certs_file}),
        config.shutdown_timeout);
  } catch (const std::exception &e) {
    std::cerr << "Unable to create identity channel: " << e.what()
              << std::endl;
    return kExitUsage;
  }

  BOOST_LOG_SEV(lg, trivial::info)
      << "Logging in to " << config.identity_target << " as device "
      << device_id;

  identity::v1::LoginResponse response;
  try {
    response = client->login(request);
  } catch (const identity::InvalidApplicationException &e) {
    std::cerr << "Invalid application: " << e.what() << std::endl;
    return kExitInvalidApplication;
  } catch (const identity::AuthenticationException &e) {
    std::cerr << "Authentication failed: " << e.what() << std::endl;
    return kExitAuthentication;
  } catch (const identity::RpcError &e) {
    std::cerr << e.what() << std::endl;
    return kExitRpc;
  }
  client->close();

  google::protobuf::util::JsonPrintOptions print_options;
  print_options.add_whitespace = true;
  print_options.preserve_proto_field_names = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(response, &json, print_options);
  if (!status.ok()) {
    std::cerr << "Failed to render login response: " << status.ToString()
              << std::endl;
    return kExitRpc;
  }
  std::cout << json << std::endl;
  return kExitOk;
}
