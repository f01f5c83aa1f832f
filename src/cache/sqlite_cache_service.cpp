#include "speechly/cache/sqlite_cache_service.hpp"

#include <sqlite3.h>

#include <system_error>
#include <utility>

namespace {
constexpr const char kCreateTableSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS kv_store (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kUpsertSql[] = R"SQL(
INSERT INTO kv_store(key, value, updated_at)
VALUES(?1, ?2, strftime('%s','now'))
ON CONFLICT(key) DO UPDATE SET
  value = excluded.value,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kDeleteSql[] = R"SQL(
DELETE FROM kv_store WHERE key = ?1;
)SQL";

constexpr const char kSelectSql[] = R"SQL(
SELECT value FROM kv_store WHERE key = ?1 LIMIT 1;
)SQL";
} // namespace

namespace speechly {
namespace cache {

SqliteCacheService::SqliteCacheService(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {}

SqliteCacheService::~SqliteCacheService() {
  std::scoped_lock lock(mutex_);
  close_db();
}

bool SqliteCacheService::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

std::optional<std::string>
SqliteCacheService::load_string(const std::string &key) const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::nullopt;
  }
  return get_value(key);
}

bool SqliteCacheService::store_string(const std::string &key,
                                      const std::string &value) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return false;
  }
  if (auto err = upsert_value(key, value)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Cache write failed: " << *err << " (" << db_path_.string() << ")";
    return false;
  }
  return true;
}

bool SqliteCacheService::erase(const std::string &key) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return false;
  }
  if (auto err = erase_value(key)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Cache erase failed: " << *err << " (" << db_path_.string() << ")";
    return false;
  }
  return true;
}

bool SqliteCacheService::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }
  initialized_ = true;

  if (db_path_.empty()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "SqliteCacheService disabled: database path not configured";
    return false;
  }

  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Failed to create cache directory '"
          << db_path_.parent_path().string() << "': " << ec.message();
      return false;
    }
  }

  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to open cache database '" << db_path_.string()
        << "': " << (db_ ? sqlite3_errmsg(db_) : "out of memory");
    close_db();
    return false;
  }

  sqlite3_busy_timeout(db_, 5000);
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to enable WAL mode: " << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  if (sqlite3_exec(db_, kCreateTableSql, nullptr, nullptr, &errmsg) !=
      SQLITE_OK) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to initialize kv_store table: "
        << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    close_db();
    return false;
  }

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Opened cache database " << db_path_.string();
  return true;
}

void SqliteCacheService::close_db() const {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::optional<std::string>
SqliteCacheService::get_value(const std::string &key) const {
  if (!db_) {
    return std::nullopt;
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectSql, -1, &stmt, nullptr) != SQLITE_OK) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to prepare select statement: " << sqlite3_errmsg(db_);
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<std::string> result;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    const unsigned char *text = sqlite3_column_text(stmt, 0);
    if (text) {
      result = reinterpret_cast<const char *>(text);
    }
  }
  sqlite3_finalize(stmt);
  return result;
}

std::optional<std::string>
SqliteCacheService::upsert_value(const std::string &key,
                                 const std::string &value) const {
  if (!db_) {
    return std::string{"Cache database unavailable"};
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare upsert statement"};
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to upsert value for key "} + key;
  }
  return std::nullopt;
}

std::optional<std::string>
SqliteCacheService::erase_value(const std::string &key) const {
  if (!db_) {
    return std::string{"Cache database unavailable"};
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kDeleteSql, -1, &stmt, nullptr) != SQLITE_OK) {
    return std::string{"Failed to prepare delete statement"};
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to delete key "} + key;
  }
  return std::nullopt;
}

} // namespace cache
} // namespace speechly
