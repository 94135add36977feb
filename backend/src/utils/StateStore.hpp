#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace kc::storage {

struct PersistedEntry {
  std::string user_id;
  std::string item_id;
  std::string title;
  std::string artwork_url;
  std::int64_t duration_ticks = 0;
  std::string library_id;
  std::string series_name;
  int season_index = 0;
  int episode_index = 0;
  std::int64_t added_at = 0;
  std::int64_t remote_modified_at = 0;
  std::int64_t resume_position_ms = 0;
  std::optional<int> priority_override;
  bool watched = false;
  std::optional<std::int64_t> last_watched_at;
  std::optional<std::string> local_file_path;
  double download_progress = 0.0;
  std::uint64_t file_size = 0;
  std::string checksum;
  std::int64_t local_modified_at = 0;
  int missing_passes = 0;
};

struct PersistedTask {
  std::int64_t id = 0;
  std::string user_id;
  std::string item_id;
  int status = 0;
  bool terminal = false;
  int priority_rank = 0;
  std::uint64_t expected_bytes = 0;
  std::uint64_t bytes_transferred = 0;
  std::uint64_t total_bytes = 0;
  int retry_count = 0;
  std::string last_error;
  std::int64_t next_attempt_at = 0;
  std::int64_t remote_modified_at = 0;
  std::int64_t updated_at = 0;
};

struct PersistedScreenTime {
  std::int64_t used_seconds = 0;
  int daily_limit_minutes = 60;
  bool enabled = true;
  std::string last_reset_date;
  int extension_minutes = 0;
};

std::string serialize_string_list(std::vector<std::string> const &values);
std::vector<std::string> deserialize_string_list(std::string const &payload);

// All public members serialize on an internal mutex so the statement cache
// can be shared between the engine thread and the persistence worker.
class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }

  std::optional<std::string> get_setting(std::string const &key) const;
  bool set_setting(std::string const &key, std::string const &value);
  bool remove_setting(std::string const &key);
  bool begin_transaction() const;
  bool commit_transaction() const;
  bool rollback_transaction() const;

  std::vector<PersistedEntry> load_entries(std::string const &user_id) const;
  bool upsert_entry_metadata(PersistedEntry const &entry);
  bool update_download_fields(PersistedEntry const &entry);
  bool update_playback_fields(PersistedEntry const &entry);
  bool update_resume_position(std::string const &user_id,
                              std::string const &item_id,
                              std::int64_t position_ms);
  bool update_missing_passes(std::string const &user_id,
                             std::string const &item_id, int passes);
  bool update_priority_override(std::string const &user_id,
                                std::string const &item_id,
                                std::optional<int> priority);
  bool delete_entry(std::string const &user_id, std::string const &item_id);

  std::vector<PersistedTask> load_tasks(std::string const &user_id) const;
  std::optional<std::int64_t> insert_task(PersistedTask const &task);
  bool update_task(PersistedTask const &task);
  bool delete_task(std::int64_t id);
  bool delete_tasks_for_item(std::string const &user_id,
                             std::string const &item_id);
  bool delete_resolved_tasks_before(std::int64_t timestamp);

  std::optional<PersistedScreenTime> load_screen_time() const;
  bool save_screen_time(PersistedScreenTime const &state);

private:
  bool ensure_schema();
  bool execute(std::string const &sql) const;
  bool run_migrations();
  bool ensure_schema_version_row() const;
  std::optional<int> schema_version() const;
  bool set_schema_version(int version) const;
  bool apply_migration_v1() const;
  bool apply_migration_v2() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace kc::storage
