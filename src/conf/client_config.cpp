#include "speechly/conf/client_config.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <optional>

namespace speechly {
namespace conf {

namespace {

std::optional<json::value> read_json_file(const fs::path &file) {
  if (!fs::exists(file)) {
    return std::nullopt;
  }
  std::ifstream ifs(file);
  if (!ifs) {
    throw std::runtime_error(
        fmt::format("Unable to open configuration file: {}", file.string()));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto jv = json::parse(content, ec);
  if (ec) {
    throw std::runtime_error(fmt::format("Malformed JSON in {}: {}",
                                         file.string(), ec.message()));
  }
  if (!jv.is_object()) {
    throw std::runtime_error(fmt::format(
        "Configuration file is not a JSON object: {}", file.string()));
  }
  return jv;
}

} // namespace

ClientConfigProviderFile::ClientConfigProviderFile(const fs::path &config_dir)
    : config_dir_(config_dir) {
  const auto application_file = config_dir_ / "application.json";
  auto application = read_json_file(application_file);
  if (!application) {
    throw std::runtime_error(fmt::format("Failed to load App config: {}",
                                         application_file.string()));
  }

  if (auto overrides = read_json_file(config_dir_ / "application.override.json")) {
    json::object &jo = application->as_object();
    for (const auto &[key, value] : overrides->as_object()) {
      jo[key] = value;
    }
  }

  try {
    config_ = json::value_to<ClientConfig>(*application);
  } catch (const std::exception &e) {
    throw std::runtime_error(
        fmt::format("{} ({})", e.what(), application_file.string()));
  }

  const auto log_file = config_dir_ / "log_config.json";
  if (auto log_config = read_json_file(log_file)) {
    try {
      logging_ = json::value_to<LoggingConfig>(*log_config);
    } catch (const std::exception &e) {
      throw std::runtime_error(
          fmt::format("{} ({})", e.what(), log_file.string()));
    }
  }
}

} // namespace conf
} // namespace speechly
