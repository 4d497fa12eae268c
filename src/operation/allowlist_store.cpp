#include "opgate/operation/allowlist_store.hpp"

#include "opgate/common/fs.hpp"

#include <chrono>

namespace opgate::operation {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

SqliteAllowlistStore::SqliteAllowlistStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  if (const auto parent = db_path_.parent_path(); !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 2000);

  if (const auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
  }
}

SqliteAllowlistStore::~SqliteAllowlistStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteAllowlistStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS operation_settings (
  key TEXT PRIMARY KEY,
  environment TEXT NOT NULL DEFAULT '',
  updated_at INTEGER NOT NULL
);
)");
}

common::Result<std::string> SqliteAllowlistStore::load(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::string>::failure("allow-list database unavailable: " +
                                                open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  constexpr const char *sql = "SELECT environment FROM operation_settings WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::string>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  std::string blob;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    if (const auto *text = sqlite3_column_text(stmt, 0); text != nullptr) {
      blob = reinterpret_cast<const char *>(text);
    }
  } else if (rc != SQLITE_DONE) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return common::Result<std::string>::failure(message);
  }
  sqlite3_finalize(stmt);
  return common::Result<std::string>::success(std::move(blob));
}

common::Status SqliteAllowlistStore::save(const std::string &key, const std::string &blob) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("allow-list database unavailable: " + open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  constexpr const char *sql = R"(
INSERT INTO operation_settings (key, environment, updated_at) VALUES (?1, ?2, ?3)
ON CONFLICT(key) DO UPDATE SET environment = excluded.environment, updated_at = excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, blob.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, unix_now());

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<std::string> MemoryAllowlistStore::load(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = blobs_.find(key);
  return common::Result<std::string>::success(it == blobs_.end() ? std::string{} : it->second);
}

common::Status MemoryAllowlistStore::save(const std::string &key, const std::string &blob) {
  std::lock_guard<std::mutex> lock(mutex_);
  blobs_[key] = blob;
  return common::Status::success();
}

common::Result<std::shared_ptr<IAllowlistStore>>
create_allowlist_store(const config::AllowlistConfig &config) {
  using StoreResult = common::Result<std::shared_ptr<IAllowlistStore>>;
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "memory") {
    return StoreResult::success(std::make_shared<MemoryAllowlistStore>());
  }
  if (backend == "sqlite") {
    const std::string path = common::expand_path(config.db_path);
    if (path.empty()) {
      return StoreResult::failure("allowlist.db_path is empty", common::ErrorKind::Validation);
    }
    return StoreResult::success(std::make_shared<SqliteAllowlistStore>(path));
  }
  return StoreResult::failure("Unknown allow-list backend: " + config.backend,
                              common::ErrorKind::Validation);
}

} // namespace opgate::operation
