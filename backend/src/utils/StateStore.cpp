#include "utils/StateStore.hpp"

#include "utils/Log.hpp"

#include <filesystem>
#include <system_error>

namespace tp::storage
{

namespace
{
constexpr int kDatabaseBusyTimeoutMs = 5000;
} // namespace

StateStore::StateStore(std::filesystem::path path) : path_(std::move(path))
{
    if (path_.empty())
    {
        return;
    }
    auto parent = path_.parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        TP_LOG_ERROR("STATE: failed to open {}: {}", path_.string(),
                     sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

StateStore::~StateStore()
{
    for (auto &entry : stmt_cache_)
    {
        if (entry.second != nullptr)
        {
            sqlite3_finalize(entry.second);
        }
    }
    stmt_cache_.clear();
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool StateStore::ensure_schema()
{
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql) ||
        !execute("INSERT OR IGNORE INTO schema_version (id, version) "
                 "VALUES (1, 0);"))
    {
        return false;
    }
    return run_migrations();
}

bool StateStore::run_migrations()
{
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (StateStore::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &StateStore::apply_migration_v1},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!(this->*migration.apply)())
        {
            TP_LOG_ERROR("STATE: schema migration v{} failed",
                         migration.version);
            return false;
        }
        if (!set_schema_version(migration.version))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool StateStore::apply_migration_v1() const
{
    return execute("CREATE TABLE IF NOT EXISTS state ("
                   "key TEXT PRIMARY KEY,"
                   "value TEXT NOT NULL);");
}

std::optional<int> StateStore::schema_version() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *stmt =
        prepare_cached("SELECT version FROM schema_version WHERE id = 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    std::optional<int> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        result = sqlite3_column_int(stmt, 0);
    }
    sqlite3_reset(stmt);
    return result;
}

bool StateStore::set_schema_version(int version) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *stmt = prepare_cached(
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_int(stmt, 1, version);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool StateStore::execute(std::string const &sql) const
{
    if (!db_)
    {
        return false;
    }
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        if (err_msg != nullptr)
        {
            TP_LOG_ERROR("STATE: sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

// Callers hold mutex_.
sqlite3_stmt *StateStore::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        sqlite3_reset(it->second);
        sqlite3_clear_bindings(it->second);
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        TP_LOG_ERROR("STATE: sqlite prepare failed: {}", sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

std::optional<std::string> StateStore::get(std::string const &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *stmt = prepare_cached("SELECT value FROM state WHERE key = ? LIMIT 1;");
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        auto text =
            reinterpret_cast<char const *>(sqlite3_column_text(stmt, 0));
        if (text != nullptr)
        {
            value = std::string(text);
        }
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

bool StateStore::set(std::string const &key, std::string const &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *stmt =
        prepare_cached("INSERT OR REPLACE INTO state (key, value) VALUES (?, ?);");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

bool StateStore::remove(std::string const &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto *stmt = prepare_cached("DELETE FROM state WHERE key = ?;");
    if (stmt == nullptr)
    {
        return false;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return rc == SQLITE_DONE;
}

} // namespace tp::storage
