#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "speechly/cache/cache_service.hpp"
#include "speechly/device/device_id.hpp"
#include "speechly/device/device_id_provider.hpp"

namespace {

using speechly::device::CachingIdProvider;
using speechly::device::DeviceId;
using speechly::device::IDeviceIdProvider;
using speechly::device::kDeviceIdCacheKey;
using speechly::device::RandomIdProvider;

constexpr const char kStoredId[] = "0f8fad5b-d9cb-469f-a165-70867728950e";
constexpr const char kBaseId[] = "7c9e6679-7425-40de-944b-e07fc1f90ae7";

class RecordingCacheService : public speechly::cache::ICacheService {
public:
  std::optional<std::string> load_string(const std::string &key) const override {
    ++loads;
    if (throw_on_load) {
      throw std::runtime_error("cache backend offline");
    }
    auto it = values.find(key);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool store_string(const std::string &key, const std::string &value) override {
    ++stores;
    if (throw_on_store) {
      throw std::runtime_error("cache backend offline");
    }
    if (fail_stores) {
      return false;
    }
    values[key] = value;
    return true;
  }

  std::map<std::string, std::string> values;
  mutable int loads{0};
  int stores{0};
  bool fail_stores{false};
  bool throw_on_load{false};
  bool throw_on_store{false};
};

class FixedIdProvider : public IDeviceIdProvider {
public:
  explicit FixedIdProvider(int *calls) : calls_(calls) {}

  DeviceId get_device_id() override {
    ++*calls_;
    return *speechly::device::parse_device_id(kBaseId);
  }

private:
  int *calls_;
};

} // namespace

TEST(RandomIdProviderTest, ReturnsVersion4Uuids) {
  RandomIdProvider provider;
  for (int i = 0; i < 16; ++i) {
    auto id = provider.get_device_id();
    EXPECT_TRUE(speechly::device::is_random_uuid(id))
        << speechly::device::to_string(id);
  }
}

TEST(RandomIdProviderTest, SuccessiveIdsDiffer) {
  RandomIdProvider provider;
  EXPECT_NE(provider.get_device_id(), provider.get_device_id());
}

TEST(CachingIdProviderTest, EmptyCacheStoresGeneratedId) {
  auto cache = std::make_shared<RecordingCacheService>();
  CachingIdProvider provider(cache);

  auto id = provider.get_device_id();

  EXPECT_TRUE(speechly::device::is_random_uuid(id));
  ASSERT_EQ(cache->values.count(kDeviceIdCacheKey), 1u);
  EXPECT_EQ(cache->values[kDeviceIdCacheKey], speechly::device::to_string(id));
}

TEST(CachingIdProviderTest, ReturnsCachedIdWithoutCallingBase) {
  auto cache = std::make_shared<RecordingCacheService>();
  cache->values[kDeviceIdCacheKey] = kStoredId;
  int base_calls = 0;
  CachingIdProvider provider(cache, std::make_unique<FixedIdProvider>(&base_calls));

  auto id = provider.get_device_id();

  EXPECT_EQ(speechly::device::to_string(id), kStoredId);
  EXPECT_EQ(base_calls, 0);
  EXPECT_EQ(cache->stores, 0);
}

TEST(CachingIdProviderTest, SecondCallReusesFirstId) {
  auto cache = std::make_shared<RecordingCacheService>();
  int base_calls = 0;
  CachingIdProvider provider(cache, std::make_unique<FixedIdProvider>(&base_calls));

  auto first = provider.get_device_id();
  auto second = provider.get_device_id();

  EXPECT_EQ(first, second);
  EXPECT_EQ(base_calls, 1);
}

TEST(CachingIdProviderTest, GarbageInCacheIsReplaced) {
  auto cache = std::make_shared<RecordingCacheService>();
  cache->values[kDeviceIdCacheKey] = "garbage";
  CachingIdProvider provider(cache);

  auto id = provider.get_device_id();

  EXPECT_TRUE(speechly::device::is_random_uuid(id));
  EXPECT_EQ(cache->values[kDeviceIdCacheKey], speechly::device::to_string(id));
}

TEST(CachingIdProviderTest, FailedStoreStillReturnsId) {
  auto cache = std::make_shared<RecordingCacheService>();
  cache->fail_stores = true;
  int base_calls = 0;
  CachingIdProvider provider(cache, std::make_unique<FixedIdProvider>(&base_calls));

  auto first = provider.get_device_id();
  auto second = provider.get_device_id();

  EXPECT_EQ(speechly::device::to_string(first), kBaseId);
  EXPECT_EQ(speechly::device::to_string(second), kBaseId);
  EXPECT_TRUE(cache->values.empty());
  // Nothing was written, so each call goes back to the base provider.
  EXPECT_EQ(base_calls, 2);
  EXPECT_EQ(cache->stores, 2);
}

TEST(CachingIdProviderTest, ThrowingCacheIsTreatedAsMiss) {
  auto cache = std::make_shared<RecordingCacheService>();
  cache->throw_on_load = true;
  cache->throw_on_store = true;
  int base_calls = 0;
  CachingIdProvider provider(cache, std::make_unique<FixedIdProvider>(&base_calls));

  DeviceId id{};
  EXPECT_NO_THROW(id = provider.get_device_id());
  EXPECT_EQ(speechly::device::to_string(id), kBaseId);
  EXPECT_EQ(base_calls, 1);
}

TEST(CachingIdProviderTest, WithoutCacheDelegatesToBase) {
  int base_calls = 0;
  CachingIdProvider provider(nullptr, std::make_unique<FixedIdProvider>(&base_calls));

  EXPECT_EQ(speechly::device::to_string(provider.get_device_id()), kBaseId);
  EXPECT_EQ(speechly::device::to_string(provider.get_device_id()), kBaseId);
  EXPECT_EQ(base_calls, 2);
}

TEST(CachingIdProviderTest, RejectsNullBaseProvider) {
  EXPECT_THROW(CachingIdProvider(std::make_shared<RecordingCacheService>(),
                                 nullptr),
               std::invalid_argument);
}

TEST(CachingIdProviderTest, WorksWithInMemoryCacheService) {
  auto cache = std::make_shared<speechly::cache::InMemoryCacheService>();
  CachingIdProvider first(cache);
  CachingIdProvider second(cache);

  EXPECT_EQ(first.get_device_id(), second.get_device_id());
}
