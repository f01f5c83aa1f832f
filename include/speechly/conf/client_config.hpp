#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace speechly {
namespace conf {

namespace fs = std::filesystem;
namespace json = boost::json;

inline constexpr const char kDefaultIdentityTarget[] = "api.speechly.com";
inline constexpr std::chrono::seconds kDefaultShutdownTimeout{5};

struct ClientConfig {
  std::string identity_target{kDefaultIdentityTarget};
  bool secure{true};
  std::chrono::seconds shutdown_timeout{kDefaultShutdownTimeout};
  std::string app_id{};
  std::string config_id{};
  std::string project_id{};
  fs::path runtime_dir{};
  // PEM bundle for the TLS channel; system roots when empty.
  fs::path root_certs_file{};

  friend ClientConfig tag_invoke(const json::value_to_tag<ClientConfig> &,
                                 const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("ClientConfig is not an object");
    }
    try {
      ClientConfig cc{};
      if (auto *p = jo_p->if_contains("identity_target"))
        cc.identity_target = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("secure"))
        cc.secure = p->as_bool();
      if (auto *p = jo_p->if_contains("shutdown_timeout_seconds"))
        cc.shutdown_timeout = std::chrono::seconds(p->to_number<std::int64_t>());
      if (auto *p = jo_p->if_contains("app_id"))
        cc.app_id = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("config_id"))
        cc.config_id = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("project_id"))
        cc.project_id = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("runtime_dir"))
        cc.runtime_dir = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("root_certs_file"))
        cc.root_certs_file = fs::path(p->as_string().c_str());
      if (cc.shutdown_timeout.count() < 0) {
        throw std::runtime_error("shutdown_timeout_seconds must not be negative");
      }
      return cc;
    } catch (const std::exception &e) {
      throw std::runtime_error(
          std::string("error in parsing ClientConfig: ") + e.what());
    }
  }
};

struct LoggingConfig {
  std::string level{"info"};
  fs::path log_dir{};
  std::string log_file{"speechly-login"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    const auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    try {
      LoggingConfig lc{};
      if (auto *p = jo_p->if_contains("level"))
        lc.level = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("log_dir"))
        lc.log_dir = fs::path(p->as_string().c_str());
      if (auto *p = jo_p->if_contains("log_file"))
        lc.log_file = p->as_string().c_str();
      if (auto *p = jo_p->if_contains("rotation_size"))
        lc.rotation_size = p->to_number<std::uint64_t>();
      return lc;
    } catch (const std::exception &e) {
      throw std::runtime_error(
          std::string("error in parsing LoggingConfig: ") + e.what());
    }
  }
};

class IClientConfigProvider {
public:
  virtual ~IClientConfigProvider() = default;

  virtual const ClientConfig &get() const = 0;
  virtual ClientConfig &get() = 0;
  virtual const LoggingConfig &logging() const = 0;
  virtual LoggingConfig &logging() = 0;
};

// Reads application.json, overlays application.override.json key by key and
// reads log_config.json. Only application.json is mandatory.
class ClientConfigProviderFile : public IClientConfigProvider {
public:
  explicit ClientConfigProviderFile(const fs::path &config_dir);

  const ClientConfig &get() const override { return config_; }
  ClientConfig &get() override { return config_; }
  const LoggingConfig &logging() const override { return logging_; }
  LoggingConfig &logging() override { return logging_; }

  const fs::path &config_dir() const { return config_dir_; }

private:
  fs::path config_dir_;
  ClientConfig config_;
  LoggingConfig logging_;
};

// Provider over in-memory values, used when no config directory exists.
class ClientConfigProviderStatic : public IClientConfigProvider {
public:
  ClientConfigProviderStatic() = default;
  ClientConfigProviderStatic(ClientConfig config, LoggingConfig logging)
      : config_(std::move(config)), logging_(std::move(logging)) {}

  const ClientConfig &get() const override { return config_; }
  ClientConfig &get() override { return config_; }
  const LoggingConfig &logging() const override { return logging_; }
  LoggingConfig &logging() override { return logging_; }

private:
  ClientConfig config_;
  LoggingConfig logging_;
};

} // namespace conf
} // namespace speechly
