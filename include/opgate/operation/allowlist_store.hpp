#pragma once

#include "opgate/common/result.hpp"
#include "opgate/config/schema.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <unordered_map>

namespace opgate::operation {

/// Persists the KEY=VALUE settings blob that carries ALLOWED_DIRECTORIES.
class IAllowlistStore {
public:
  virtual ~IAllowlistStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Returns the stored blob, or an empty string when nothing was saved under `key`.
  [[nodiscard]] virtual common::Result<std::string> load(const std::string &key) = 0;
  [[nodiscard]] virtual common::Status save(const std::string &key, const std::string &blob) = 0;
};

class SqliteAllowlistStore final : public IAllowlistStore {
public:
  explicit SqliteAllowlistStore(std::filesystem::path db_path);
  ~SqliteAllowlistStore() override;
  SqliteAllowlistStore(const SqliteAllowlistStore &) = delete;
  SqliteAllowlistStore &operator=(const SqliteAllowlistStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Result<std::string> load(const std::string &key) override;
  [[nodiscard]] common::Status save(const std::string &key, const std::string &blob) override;

  [[nodiscard]] const std::filesystem::path &db_path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

class MemoryAllowlistStore final : public IAllowlistStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Result<std::string> load(const std::string &key) override;
  [[nodiscard]] common::Status save(const std::string &key, const std::string &blob) override;

private:
  std::mutex mutex_;
  std::unordered_map<std::string, std::string> blobs_;
};

[[nodiscard]] common::Result<std::shared_ptr<IAllowlistStore>>
create_allowlist_store(const config::AllowlistConfig &config);

} // namespace opgate::operation
