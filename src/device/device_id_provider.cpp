#include "speechly/device/device_id_provider.hpp"

#include <stdexcept>
#include <utility>

namespace speechly {
namespace device {

DeviceId RandomIdProvider::get_device_id() { return generator_(); }

CachingIdProvider::CachingIdProvider(
    std::shared_ptr<cache::ICacheService> cache_service,
    std::unique_ptr<IDeviceIdProvider> base_provider)
    : cache_service_(std::move(cache_service)),
      base_provider_(std::move(base_provider)) {
  if (!base_provider_) {
    throw std::invalid_argument("CachingIdProvider requires a base provider");
  }
}

DeviceId CachingIdProvider::get_device_id() {
  if (auto cached = load_from_cache()) {
    return *cached;
  }
  return store_and_return();
}

std::optional<DeviceId> CachingIdProvider::load_from_cache() {
  if (!cache_service_) {
    return std::nullopt;
  }

  std::optional<std::string> cached;
  try {
    cached = cache_service_->load_string(kDeviceIdCacheKey);
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Device id cache read failed: " << e.what();
    return std::nullopt;
  }
  if (!cached) {
    return std::nullopt;
  }

  auto id = parse_device_id(*cached);
  if (!id) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Ignoring malformed device id in cache: '" << *cached << "'";
  }
  return id;
}

DeviceId CachingIdProvider::store_and_return() {
  const DeviceId id = base_provider_->get_device_id();
  if (!cache_service_) {
    return id;
  }

  // A failed write is not retried; the next call generates a new id.
  try {
    if (!cache_service_->store_string(kDeviceIdCacheKey, to_string(id))) {
      BOOST_LOG_SEV(lg_, trivial::debug) << "Device id cache write failed";
    }
  } catch (const std::exception &e) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Device id cache write failed: " << e.what();
  }
  return id;
}

} // namespace device
} // namespace speechly
