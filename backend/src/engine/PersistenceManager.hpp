#pragma once

#include "engine/Core.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kc::storage
{
class Database;
}

namespace kc::engine
{
class AsyncTaskService;

namespace setting_keys
{
inline constexpr char kLastSyncAt[] = "lastSyncAt";
inline constexpr char kActiveUserId[] = "activeUserId";
inline constexpr char kAccessToken[] = "accessToken";
inline constexpr char kServerId[] = "serverId";
inline constexpr char kPendingManualSync[] = "pendingManualSync";
inline constexpr char kPinFailedAttempts[] = "pinFailedAttempts";
inline constexpr char kPinLockoutUntil[] = "pinLockoutUntil";
inline constexpr char kAccessScheduleEnabled[] = "accessScheduleEnabled";
inline constexpr char kAccessScheduleStart[] = "accessScheduleStart";
inline constexpr char kAccessScheduleEnd[] = "accessScheduleEnd";
inline constexpr char kAccessScheduleDays[] = "accessScheduleDays";
} // namespace setting_keys

class PersistenceManager
{
  public:
    // Optional task service may be provided to offload blocking DB writes.
    explicit PersistenceManager(std::filesystem::path path,
                                AsyncTaskService *task_service = nullptr);
    ~PersistenceManager();

    PersistenceManager(PersistenceManager const &) = delete;
    PersistenceManager &operator=(PersistenceManager const &) = delete;

    bool is_valid() const noexcept;

    // Catalog rows are scoped per authenticated user; switching users
    // reloads the cache with that user's rows only.
    void set_active_user(std::string user_id);
    std::string active_user() const;

    // Read Access (Thread-safe)
    std::vector<CatalogEntry> catalog() const;
    std::optional<CatalogEntry> entry(std::string const &item_id) const;

    // Sync writer: server-owned metadata. Local-only fields are untouched.
    void upsert_metadata(CatalogEntry const &entry);
    void set_missing_passes(std::string const &item_id, int passes);
    std::optional<CatalogEntry> remove_entry(std::string const &item_id);

    // Download writer.
    void update_download_fields(std::string const &item_id,
                                std::optional<std::string> local_file_path,
                                double progress, std::uint64_t file_size,
                                std::string checksum,
                                std::int64_t local_modified_at);

    // Playback writer.
    void update_playback_fields(std::string const &item_id, bool watched,
                                std::optional<std::int64_t> last_watched_at,
                                std::int64_t resume_position_ms);
    void update_resume_position(std::string const &item_id,
                                std::int64_t resume_position_ms);

    void set_priority_override(std::string const &item_id,
                               std::optional<int> priority);

    // Download task log for the active user.
    std::vector<DownloadTask> load_tasks() const;
    std::optional<std::int64_t> insert_task(DownloadTask const &task);
    void update_task(DownloadTask const &task);
    void delete_task(std::int64_t id);
    void prune_resolved_tasks(std::int64_t older_than);

    std::optional<ScreenTimeState> load_screen_time() const;
    void persist_screen_time(ScreenTimeState const &state);

    std::optional<std::string> get_setting(std::string const &key) const;
    void set_setting(std::string const &key, std::string value);
    void remove_setting(std::string const &key);

    bool persist_settings(CoreSettings const &settings);
    CoreSettings load_settings(CoreSettings defaults) const;

    // Waits for offloaded writes to land.
    void flush();

  private:
    using WriteOp = std::function<bool(storage::Database &)>;
    void write(std::string label, WriteOp op);
    bool persist_settings_impl(std::shared_ptr<storage::Database> db,
                               CoreSettings const &settings);

    std::shared_ptr<storage::Database> database_;
    // Not owning pointer to AsyncTaskService used to offload DB writes.
    AsyncTaskService *task_service_ = nullptr;

    // In-Memory State Cache
    mutable std::shared_mutex cache_mutex_;
    std::string user_id_;
    std::unordered_map<std::string, CatalogEntry> entries_;
    std::int64_t next_local_task_id_ = 1;
};

} // namespace kc::engine
