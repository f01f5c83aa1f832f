#pragma once

#include <filesystem> // IWYU pragma: keep
#include <mutex>
#include <optional>
#include <string>

#include "speechly/cache/cache_service.hpp"
#include "speechly/util/logging.hpp"

struct sqlite3;

namespace speechly {
namespace cache {

// Cache service over a single kv_store table in a SQLite database. The
// database is opened lazily on first use; when it cannot be opened every load
// yields empty and every store returns false.
class SqliteCacheService : public ICacheService {
public:
  explicit SqliteCacheService(std::filesystem::path db_path);
  ~SqliteCacheService() override;

  SqliteCacheService(const SqliteCacheService &) = delete;
  SqliteCacheService &operator=(const SqliteCacheService &) = delete;

  std::optional<std::string> load_string(const std::string &key) const override;
  bool store_string(const std::string &key, const std::string &value) override;

  bool erase(const std::string &key);
  bool available() const;
  const std::filesystem::path &db_path() const { return db_path_; }

private:
  bool ensure_initialized() const;
  void close_db() const;

  std::optional<std::string> get_value(const std::string &key) const;
  std::optional<std::string> upsert_value(const std::string &key,
                                          const std::string &value) const;
  std::optional<std::string> erase_value(const std::string &key) const;

  std::filesystem::path db_path_;
  mutable std::mutex mutex_;
  mutable sqlite3 *db_{nullptr};
  mutable bool initialized_{false};
  mutable Logger lg_;
};

} // namespace cache
} // namespace speechly
