#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <sqlite3.h>

namespace tp::storage {

// Application state that is not user configuration (last loaded preset,
// window bookkeeping...). Kept in SQLite so a torn config write never takes
// it down with it.
class StateStore {
public:
  explicit StateStore(std::filesystem::path path);
  ~StateStore();

  StateStore(StateStore const &) = delete;
  StateStore &operator=(StateStore const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }
  std::filesystem::path const &path() const noexcept { return path_; }

  std::optional<std::string> get(std::string const &key) const;
  bool set(std::string const &key, std::string const &value);
  bool remove(std::string const &key);

private:
  bool ensure_schema();
  bool run_migrations();
  bool apply_migration_v1() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool execute(std::string const &sql) const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace tp::storage
