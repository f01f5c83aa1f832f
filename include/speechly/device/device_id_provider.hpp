#pragma once

#include <boost/uuid/random_generator.hpp>

#include <memory>
#include <optional>

#include "speechly/cache/cache_service.hpp"
#include "speechly/device/device_id.hpp"
#include "speechly/util/logging.hpp"

namespace speechly {
namespace device {

inline constexpr const char kDeviceIdCacheKey[] = "speechly-device-id";

// Provides device identifiers to be consumed by the SLU API client.
class IDeviceIdProvider {
public:
  virtual ~IDeviceIdProvider() = default;

  // Must not throw.
  virtual DeviceId get_device_id() = 0;
};

// Returns a fresh random UUIDv4 on every call.
class RandomIdProvider : public IDeviceIdProvider {
public:
  DeviceId get_device_id() override;

private:
  boost::uuids::random_generator generator_;
};

// Stores the identifiers produced by a base provider in a persistent cache and
// hands back the cached one on later calls. A missing or corrupted entry is a
// cache miss; a failed write is ignored and the id regenerated next time.
class CachingIdProvider : public IDeviceIdProvider {
public:
  explicit CachingIdProvider(
      std::shared_ptr<cache::ICacheService> cache_service,
      std::unique_ptr<IDeviceIdProvider> base_provider =
          std::make_unique<RandomIdProvider>());

  DeviceId get_device_id() override;

private:
  std::optional<DeviceId> load_from_cache();
  DeviceId store_and_return();

  std::shared_ptr<cache::ICacheService> cache_service_;
  std::unique_ptr<IDeviceIdProvider> base_provider_;
  Logger lg_;
};

} // namespace device
} // namespace speechly
