#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace speechly {
namespace cache {

// Key/value string persistence used by the SDK for small pieces of state.
class ICacheService {
public:
  virtual ~ICacheService() = default;

  // Returns the stored value, or empty when the key is absent or unreadable.
  virtual std::optional<std::string>
  load_string(const std::string &key) const = 0;

  // Returns false if the write did not happen.
  virtual bool store_string(const std::string &key,
                            const std::string &value) = 0;
};

class InMemoryCacheService : public ICacheService {
public:
  std::optional<std::string> load_string(const std::string &key) const override {
    std::scoped_lock lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool store_string(const std::string &key, const std::string &value) override {
    std::scoped_lock lock(mutex_);
    values_[key] = value;
    return true;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

} // namespace cache
} // namespace speechly
