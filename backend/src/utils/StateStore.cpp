#include "utils/StateStore.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace kc::storage
{

std::string serialize_string_list(std::vector<std::string> const &values)
{
    kc::json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return "[]";
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    yyjson_mut_doc_set_root(native, root);
    for (auto const &value : values)
    {
        yyjson_mut_arr_add_strcpy(native, root, value.c_str());
    }
    return doc.write("[]");
}

std::vector<std::string> deserialize_string_list(std::string const &payload)
{
    std::vector<std::string> result;
    if (payload.empty())
    {
        return result;
    }
    auto doc = kc::json::Document::parse(payload);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_arr(root))
    {
        return result;
    }
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        if (yyjson_is_str(entry))
        {
            result.emplace_back(yyjson_get_str(entry));
        }
    }
    return result;
}

namespace
{

constexpr int kDatabaseBusyTimeoutMs = 5000;

// Resets and clears a cached statement when the owning scope ends.
struct StatementReset
{
    sqlite3_stmt *stmt;
    ~StatementReset()
    {
        if (stmt != nullptr)
        {
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
    }
};

void bind_text(sqlite3_stmt *stmt, int index, std::string const &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt *stmt, int index,
                        std::optional<std::string> const &value)
{
    if (value)
    {
        bind_text(stmt, index, *value);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_int64(sqlite3_stmt *stmt, int index,
                         std::optional<std::int64_t> const &value)
{
    if (value)
    {
        sqlite3_bind_int64(stmt, index, *value);
    }
    else
    {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_text(sqlite3_stmt *stmt, int index)
{
    auto *text = reinterpret_cast<char const *>(sqlite3_column_text(stmt, index));
    return text != nullptr ? std::string(text) : std::string{};
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return column_text(stmt, index);
}

std::optional<std::int64_t> column_optional_int64(sqlite3_stmt *stmt,
                                                  int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
    {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

} // namespace

Database::Database(std::filesystem::path path) : path_(std::move(path))
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
        if (ec)
        {
            KC_LOG_WARN("persistence: cannot create {}: {}", parent.string(),
                        ec.message());
        }
    }
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK)
    {
        KC_LOG_ERROR("persistence: failed to open sqlite database {}: {}",
                     path_.string(), sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    char *err_msg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                      &err_msg);
    if (rc != SQLITE_OK && err_msg != nullptr)
    {
        KC_LOG_WARN("persistence: failed to enable WAL journal mode: {}",
                    err_msg);
    }
    if (err_msg != nullptr)
    {
        sqlite3_free(err_msg);
    }
    sqlite3_busy_timeout(db_, kDatabaseBusyTimeoutMs);
    if (!ensure_schema())
    {
        KC_LOG_ERROR("persistence: schema setup failed for {}",
                     path_.string());
        for (auto &entry : stmt_cache_)
        {
            sqlite3_finalize(entry.second);
        }
        stmt_cache_.clear();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Database::~Database()
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

bool Database::ensure_schema()
{
    if (!db_)
    {
        return false;
    }
    constexpr char const *kSchemaVersionSql =
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "version INTEGER NOT NULL);";
    if (!execute(kSchemaVersionSql))
    {
        return false;
    }
    return run_migrations();
}

bool Database::execute(std::string const &sql) const
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
            KC_LOG_WARN("persistence: sqlite error: {}", err_msg);
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

bool Database::run_migrations()
{
    if (!ensure_schema_version_row())
    {
        return false;
    }
    auto current = schema_version().value_or(0);
    struct Migration
    {
        int version;
        bool (Database::*apply)() const;
    };
    static constexpr Migration kMigrations[] = {
        {1, &Database::apply_migration_v1},
        {2, &Database::apply_migration_v2},
    };
    for (auto const &migration : kMigrations)
    {
        if (current >= migration.version)
        {
            continue;
        }
        if (!execute("BEGIN TRANSACTION;"))
        {
            return false;
        }
        if (!(this->*migration.apply)() ||
            !set_schema_version(migration.version))
        {
            KC_LOG_ERROR("persistence: schema migration v{} failed",
                         migration.version);
            execute("ROLLBACK;");
            return false;
        }
        if (!execute("COMMIT;"))
        {
            return false;
        }
        current = migration.version;
    }
    return true;
}

bool Database::ensure_schema_version_row() const
{
    constexpr char const *sql =
        "INSERT OR IGNORE INTO schema_version (id, version) VALUES (1, 0);";
    return execute(sql);
}

std::optional<int> Database::schema_version() const
{
    constexpr char const *sql =
        "SELECT version FROM schema_version WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset{stmt};
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        return static_cast<int>(sqlite3_column_int(stmt, 0));
    }
    return std::nullopt;
}

bool Database::set_schema_version(int version) const
{
    constexpr char const *sql =
        "INSERT OR REPLACE INTO schema_version (id, version) VALUES (1, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int(stmt, 1, version);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::apply_migration_v1() const
{
    constexpr char const *kSettingsSql = "CREATE TABLE IF NOT EXISTS settings ("
                                         "key TEXT PRIMARY KEY,"
                                         "value TEXT NOT NULL);";
    constexpr char const *kCatalogSql =
        "CREATE TABLE IF NOT EXISTS catalog_entries ("
        "user_id TEXT NOT NULL,"
        "item_id TEXT NOT NULL,"
        "title TEXT NOT NULL,"
        "artwork_url TEXT,"
        "duration_ticks INTEGER NOT NULL DEFAULT 0,"
        "library_id TEXT,"
        "series_name TEXT,"
        "season_index INTEGER NOT NULL DEFAULT 0,"
        "episode_index INTEGER NOT NULL DEFAULT 0,"
        "added_at INTEGER NOT NULL DEFAULT 0,"
        "remote_modified_at INTEGER NOT NULL DEFAULT 0,"
        "resume_position_ms INTEGER NOT NULL DEFAULT 0,"
        "priority_override INTEGER,"
        "watched INTEGER NOT NULL DEFAULT 0,"
        "last_watched_at INTEGER,"
        "local_file_path TEXT,"
        "download_progress REAL NOT NULL DEFAULT 0,"
        "file_size INTEGER NOT NULL DEFAULT 0,"
        "checksum TEXT,"
        "local_modified_at INTEGER NOT NULL DEFAULT 0,"
        "missing_passes INTEGER NOT NULL DEFAULT 0,"
        "PRIMARY KEY (user_id, item_id));";
    constexpr char const *kTasksSql =
        "CREATE TABLE IF NOT EXISTS download_tasks ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "user_id TEXT NOT NULL,"
        "item_id TEXT NOT NULL,"
        "status INTEGER NOT NULL,"
        "terminal INTEGER NOT NULL DEFAULT 0,"
        "priority_rank INTEGER NOT NULL DEFAULT 0,"
        "expected_bytes INTEGER NOT NULL DEFAULT 0,"
        "bytes_transferred INTEGER NOT NULL DEFAULT 0,"
        "total_bytes INTEGER NOT NULL DEFAULT 0,"
        "retry_count INTEGER NOT NULL DEFAULT 0,"
        "last_error TEXT,"
        "next_attempt_at INTEGER NOT NULL DEFAULT 0,"
        "remote_modified_at INTEGER NOT NULL DEFAULT 0,"
        "updated_at INTEGER NOT NULL DEFAULT 0);";
    constexpr char const *kScreenTimeSql =
        "CREATE TABLE IF NOT EXISTS screen_time ("
        "id INTEGER PRIMARY KEY CHECK(id = 1),"
        "used_seconds INTEGER NOT NULL,"
        "daily_limit_minutes INTEGER NOT NULL,"
        "enabled INTEGER NOT NULL,"
        "last_reset_date TEXT NOT NULL,"
        "extension_minutes INTEGER NOT NULL);";
    return execute(kSettingsSql) && execute(kCatalogSql) &&
           execute(kTasksSql) && execute(kScreenTimeSql);
}

bool Database::apply_migration_v2() const
{
    constexpr char const *kTaskIndexSql =
        "CREATE INDEX IF NOT EXISTS download_tasks_by_item "
        "ON download_tasks (user_id, item_id);";
    constexpr char const *kTaskResolvedIndexSql =
        "CREATE INDEX IF NOT EXISTS download_tasks_by_update "
        "ON download_tasks (status, updated_at);";
    return execute(kTaskIndexSql) && execute(kTaskResolvedIndexSql);
}

sqlite3_stmt *Database::prepare_cached(std::string const &sql) const
{
    if (!db_)
    {
        return nullptr;
    }
    auto it = stmt_cache_.find(sql);
    if (it != stmt_cache_.end())
    {
        if (it->second != nullptr)
        {
            sqlite3_reset(it->second);
            sqlite3_clear_bindings(it->second);
        }
        return it->second;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        KC_LOG_WARN("persistence: sqlite prepare failed: {}",
                    sqlite3_errmsg(db_));
        return nullptr;
    }
    stmt_cache_.emplace(sql, stmt);
    return stmt;
}

bool Database::begin_transaction() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return execute("BEGIN TRANSACTION;");
}

bool Database::commit_transaction() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return execute("COMMIT;");
}

bool Database::rollback_transaction() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return execute("ROLLBACK;");
}

std::optional<std::string> Database::get_setting(std::string const &key) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "SELECT value FROM settings WHERE key = ? LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, key);
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        return column_optional_text(stmt, 0);
    }
    return std::nullopt;
}

bool Database::set_setting(std::string const &key, std::string const &value)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "INSERT OR REPLACE INTO settings (key, value) VALUES (?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, key);
    bind_text(stmt, 2, value);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::remove_setting(std::string const &key)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql = "DELETE FROM settings WHERE key = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, key);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

std::vector<PersistedEntry>
Database::load_entries(std::string const &user_id) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<PersistedEntry> result;
    constexpr char const *sql =
        "SELECT item_id, title, artwork_url, duration_ticks, library_id, "
        "series_name, season_index, episode_index, added_at, "
        "remote_modified_at, resume_position_ms, priority_override, watched, "
        "last_watched_at, local_file_path, download_progress, file_size, "
        "checksum, local_modified_at, missing_passes "
        "FROM catalog_entries WHERE user_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, user_id);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        PersistedEntry entry;
        entry.user_id = user_id;
        entry.item_id = column_text(stmt, 0);
        entry.title = column_text(stmt, 1);
        entry.artwork_url = column_text(stmt, 2);
        entry.duration_ticks = sqlite3_column_int64(stmt, 3);
        entry.library_id = column_text(stmt, 4);
        entry.series_name = column_text(stmt, 5);
        entry.season_index = sqlite3_column_int(stmt, 6);
        entry.episode_index = sqlite3_column_int(stmt, 7);
        entry.added_at = sqlite3_column_int64(stmt, 8);
        entry.remote_modified_at = sqlite3_column_int64(stmt, 9);
        entry.resume_position_ms = sqlite3_column_int64(stmt, 10);
        if (auto priority = column_optional_int64(stmt, 11))
        {
            entry.priority_override = static_cast<int>(*priority);
        }
        entry.watched = sqlite3_column_int(stmt, 12) != 0;
        entry.last_watched_at = column_optional_int64(stmt, 13);
        entry.local_file_path = column_optional_text(stmt, 14);
        entry.download_progress = sqlite3_column_double(stmt, 15);
        entry.file_size =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 16));
        entry.checksum = column_text(stmt, 17);
        entry.local_modified_at = sqlite3_column_int64(stmt, 18);
        entry.missing_passes = sqlite3_column_int(stmt, 19);
        if (!entry.item_id.empty())
        {
            result.push_back(std::move(entry));
        }
    }
    return result;
}

bool Database::upsert_entry_metadata(PersistedEntry const &entry)
{
    std::lock_guard<std::mutex> guard(mutex_);
    // Only server-owned columns are touched on conflict; local-only fields
    // keep whatever their writers stored.
    constexpr char const *sql =
        "INSERT INTO catalog_entries (user_id, item_id, title, artwork_url, "
        "duration_ticks, library_id, series_name, season_index, "
        "episode_index, added_at, remote_modified_at, missing_passes) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0) "
        "ON CONFLICT(user_id, item_id) DO UPDATE SET "
        "title = excluded.title, artwork_url = excluded.artwork_url, "
        "duration_ticks = excluded.duration_ticks, "
        "library_id = excluded.library_id, "
        "series_name = excluded.series_name, "
        "season_index = excluded.season_index, "
        "episode_index = excluded.episode_index, "
        "added_at = excluded.added_at, "
        "remote_modified_at = excluded.remote_modified_at, "
        "missing_passes = 0;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, entry.user_id);
    bind_text(stmt, 2, entry.item_id);
    bind_text(stmt, 3, entry.title);
    bind_text(stmt, 4, entry.artwork_url);
    sqlite3_bind_int64(stmt, 5, entry.duration_ticks);
    bind_text(stmt, 6, entry.library_id);
    bind_text(stmt, 7, entry.series_name);
    sqlite3_bind_int(stmt, 8, entry.season_index);
    sqlite3_bind_int(stmt, 9, entry.episode_index);
    sqlite3_bind_int64(stmt, 10, entry.added_at);
    sqlite3_bind_int64(stmt, 11, entry.remote_modified_at);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::update_download_fields(PersistedEntry const &entry)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE catalog_entries SET local_file_path = ?, "
        "download_progress = ?, file_size = ?, checksum = ?, "
        "local_modified_at = ? WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_optional_text(stmt, 1, entry.local_file_path);
    sqlite3_bind_double(stmt, 2, entry.download_progress);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(entry.file_size));
    bind_text(stmt, 4, entry.checksum);
    sqlite3_bind_int64(stmt, 5, entry.local_modified_at);
    bind_text(stmt, 6, entry.user_id);
    bind_text(stmt, 7, entry.item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::update_playback_fields(PersistedEntry const &entry)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE catalog_entries SET watched = ?, last_watched_at = ?, "
        "resume_position_ms = ? WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int(stmt, 1, entry.watched ? 1 : 0);
    bind_optional_int64(stmt, 2, entry.last_watched_at);
    sqlite3_bind_int64(stmt, 3, entry.resume_position_ms);
    bind_text(stmt, 4, entry.user_id);
    bind_text(stmt, 5, entry.item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::update_resume_position(std::string const &user_id,
                                      std::string const &item_id,
                                      std::int64_t position_ms)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE catalog_entries SET resume_position_ms = ? "
        "WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int64(stmt, 1, position_ms);
    bind_text(stmt, 2, user_id);
    bind_text(stmt, 3, item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::update_missing_passes(std::string const &user_id,
                                     std::string const &item_id, int passes)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE catalog_entries SET missing_passes = ? "
        "WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int(stmt, 1, passes);
    bind_text(stmt, 2, user_id);
    bind_text(stmt, 3, item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::update_priority_override(std::string const &user_id,
                                        std::string const &item_id,
                                        std::optional<int> priority)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE catalog_entries SET priority_override = ? "
        "WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    if (priority)
    {
        sqlite3_bind_int(stmt, 1, *priority);
    }
    else
    {
        sqlite3_bind_null(stmt, 1);
    }
    bind_text(stmt, 2, user_id);
    bind_text(stmt, 3, item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::delete_entry(std::string const &user_id,
                            std::string const &item_id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "DELETE FROM catalog_entries WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, user_id);
    bind_text(stmt, 2, item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

std::vector<PersistedTask>
Database::load_tasks(std::string const &user_id) const
{
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<PersistedTask> result;
    constexpr char const *sql =
        "SELECT id, item_id, status, terminal, priority_rank, expected_bytes, "
        "bytes_transferred, total_bytes, retry_count, last_error, "
        "next_attempt_at, remote_modified_at, updated_at "
        "FROM download_tasks WHERE user_id = ? ORDER BY id;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return result;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, user_id);
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        PersistedTask task;
        task.user_id = user_id;
        task.id = sqlite3_column_int64(stmt, 0);
        task.item_id = column_text(stmt, 1);
        task.status = sqlite3_column_int(stmt, 2);
        task.terminal = sqlite3_column_int(stmt, 3) != 0;
        task.priority_rank = sqlite3_column_int(stmt, 4);
        task.expected_bytes =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 5));
        task.bytes_transferred =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 6));
        task.total_bytes =
            static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 7));
        task.retry_count = sqlite3_column_int(stmt, 8);
        task.last_error = column_text(stmt, 9);
        task.next_attempt_at = sqlite3_column_int64(stmt, 10);
        task.remote_modified_at = sqlite3_column_int64(stmt, 11);
        task.updated_at = sqlite3_column_int64(stmt, 12);
        result.push_back(std::move(task));
    }
    return result;
}

std::optional<std::int64_t> Database::insert_task(PersistedTask const &task)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "INSERT INTO download_tasks (user_id, item_id, status, terminal, "
        "priority_rank, expected_bytes, bytes_transferred, total_bytes, "
        "retry_count, last_error, next_attempt_at, remote_modified_at, "
        "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, task.user_id);
    bind_text(stmt, 2, task.item_id);
    sqlite3_bind_int(stmt, 3, task.status);
    sqlite3_bind_int(stmt, 4, task.terminal ? 1 : 0);
    sqlite3_bind_int(stmt, 5, task.priority_rank);
    sqlite3_bind_int64(stmt, 6,
                       static_cast<sqlite3_int64>(task.expected_bytes));
    sqlite3_bind_int64(stmt, 7,
                       static_cast<sqlite3_int64>(task.bytes_transferred));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(task.total_bytes));
    sqlite3_bind_int(stmt, 9, task.retry_count);
    bind_text(stmt, 10, task.last_error);
    sqlite3_bind_int64(stmt, 11, task.next_attempt_at);
    sqlite3_bind_int64(stmt, 12, task.remote_modified_at);
    sqlite3_bind_int64(stmt, 13, task.updated_at);
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool Database::update_task(PersistedTask const &task)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "UPDATE download_tasks SET status = ?, terminal = ?, "
        "priority_rank = ?, expected_bytes = ?, bytes_transferred = ?, "
        "total_bytes = ?, retry_count = ?, last_error = ?, "
        "next_attempt_at = ?, remote_modified_at = ?, updated_at = ? "
        "WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int(stmt, 1, task.status);
    sqlite3_bind_int(stmt, 2, task.terminal ? 1 : 0);
    sqlite3_bind_int(stmt, 3, task.priority_rank);
    sqlite3_bind_int64(stmt, 4,
                       static_cast<sqlite3_int64>(task.expected_bytes));
    sqlite3_bind_int64(stmt, 5,
                       static_cast<sqlite3_int64>(task.bytes_transferred));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(task.total_bytes));
    sqlite3_bind_int(stmt, 7, task.retry_count);
    bind_text(stmt, 8, task.last_error);
    sqlite3_bind_int64(stmt, 9, task.next_attempt_at);
    sqlite3_bind_int64(stmt, 10, task.remote_modified_at);
    sqlite3_bind_int64(stmt, 11, task.updated_at);
    sqlite3_bind_int64(stmt, 12, task.id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::delete_task(std::int64_t id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql = "DELETE FROM download_tasks WHERE id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int64(stmt, 1, id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::delete_tasks_for_item(std::string const &user_id,
                                     std::string const &item_id)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "DELETE FROM download_tasks WHERE user_id = ? AND item_id = ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    bind_text(stmt, 1, user_id);
    bind_text(stmt, 2, item_id);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

bool Database::delete_resolved_tasks_before(std::int64_t timestamp)
{
    std::lock_guard<std::mutex> guard(mutex_);
    // Status 2 is "completed"; terminal failures are resolved as well.
    constexpr char const *sql =
        "DELETE FROM download_tasks WHERE (status = 2 OR terminal = 1) "
        "AND updated_at < ?;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int64(stmt, 1, timestamp);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

std::optional<PersistedScreenTime> Database::load_screen_time() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "SELECT used_seconds, daily_limit_minutes, enabled, last_reset_date, "
        "extension_minutes FROM screen_time WHERE id = 1 LIMIT 1;";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return std::nullopt;
    }
    StatementReset reset{stmt};
    if (sqlite3_step(stmt) != SQLITE_ROW)
    {
        return std::nullopt;
    }
    PersistedScreenTime state;
    state.used_seconds = sqlite3_column_int64(stmt, 0);
    state.daily_limit_minutes = sqlite3_column_int(stmt, 1);
    state.enabled = sqlite3_column_int(stmt, 2) != 0;
    state.last_reset_date = column_text(stmt, 3);
    state.extension_minutes = sqlite3_column_int(stmt, 4);
    return state;
}

bool Database::save_screen_time(PersistedScreenTime const &state)
{
    std::lock_guard<std::mutex> guard(mutex_);
    constexpr char const *sql =
        "INSERT OR REPLACE INTO screen_time (id, used_seconds, "
        "daily_limit_minutes, enabled, last_reset_date, extension_minutes) "
        "VALUES (1, ?, ?, ?, ?, ?);";
    auto *stmt = prepare_cached(sql);
    if (stmt == nullptr)
    {
        return false;
    }
    StatementReset reset{stmt};
    sqlite3_bind_int64(stmt, 1, state.used_seconds);
    sqlite3_bind_int(stmt, 2, state.daily_limit_minutes);
    sqlite3_bind_int(stmt, 3, state.enabled ? 1 : 0);
    bind_text(stmt, 4, state.last_reset_date);
    sqlite3_bind_int(stmt, 5, state.extension_minutes);
    return sqlite3_step(stmt) == SQLITE_DONE;
}

} // namespace kc::storage
