#include "engine/PersistenceManager.hpp"
#include "engine/AsyncTaskService.hpp"

#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <string_view>
#include <system_error>

namespace
{

kc::engine::CatalogEntry from_persisted(kc::storage::PersistedEntry const &row)
{
    kc::engine::CatalogEntry entry;
    entry.item_id = row.item_id;
    entry.title = row.title;
    entry.artwork_url = row.artwork_url;
    entry.duration_ticks = row.duration_ticks;
    entry.library_id = row.library_id;
    entry.series_name = row.series_name;
    entry.season_index = row.season_index;
    entry.episode_index = row.episode_index;
    entry.added_at = row.added_at;
    entry.remote_modified_at = row.remote_modified_at;
    entry.resume_position_ms = row.resume_position_ms;
    entry.priority_override = row.priority_override;
    entry.watched = row.watched;
    entry.last_watched_at = row.last_watched_at;
    entry.local_file_path = row.local_file_path;
    entry.download_progress = row.download_progress;
    entry.file_size = row.file_size;
    entry.checksum = row.checksum;
    entry.local_modified_at = row.local_modified_at;
    entry.missing_passes = row.missing_passes;
    return entry;
}

kc::storage::PersistedEntry to_persisted(std::string const &user_id,
                                         kc::engine::CatalogEntry const &entry)
{
    kc::storage::PersistedEntry row;
    row.user_id = user_id;
    row.item_id = entry.item_id;
    row.title = entry.title;
    row.artwork_url = entry.artwork_url;
    row.duration_ticks = entry.duration_ticks;
    row.library_id = entry.library_id;
    row.series_name = entry.series_name;
    row.season_index = entry.season_index;
    row.episode_index = entry.episode_index;
    row.added_at = entry.added_at;
    row.remote_modified_at = entry.remote_modified_at;
    row.resume_position_ms = entry.resume_position_ms;
    row.priority_override = entry.priority_override;
    row.watched = entry.watched;
    row.last_watched_at = entry.last_watched_at;
    row.local_file_path = entry.local_file_path;
    row.download_progress = entry.download_progress;
    row.file_size = entry.file_size;
    row.checksum = entry.checksum;
    row.local_modified_at = entry.local_modified_at;
    row.missing_passes = entry.missing_passes;
    return row;
}

kc::storage::PersistedTask to_persisted(std::string const &user_id,
                                        kc::engine::DownloadTask const &task)
{
    kc::storage::PersistedTask row;
    row.id = task.id;
    row.user_id = user_id;
    row.item_id = task.item_id;
    row.status = static_cast<int>(task.status);
    row.terminal = task.terminal;
    row.priority_rank = task.priority_rank;
    row.expected_bytes = task.expected_bytes;
    row.bytes_transferred = task.bytes_transferred;
    row.total_bytes = task.total_bytes;
    row.retry_count = task.retry_count;
    row.last_error = task.last_error;
    row.next_attempt_at = task.next_attempt_at;
    row.remote_modified_at = task.remote_modified_at;
    row.updated_at = task.updated_at;
    return row;
}

template <typename T> std::optional<T> parse_number(std::string_view text)
{
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

namespace kc::engine
{

PersistenceManager::PersistenceManager(std::filesystem::path path,
                                       AsyncTaskService *task_service)
    : database_(std::make_shared<storage::Database>(std::move(path))),
      task_service_(task_service)
{
    if (!database_->is_valid())
    {
        KC_LOG_WARN("persistence: database unavailable, running with an "
                    "in-memory cache only");
    }
}

PersistenceManager::~PersistenceManager()
{
    flush();
}

bool PersistenceManager::is_valid() const noexcept
{
    return database_ != nullptr && database_->is_valid();
}

void PersistenceManager::write(std::string label, WriteOp op)
{
    auto db = database_;
    if (!db || !db->is_valid())
    {
        return;
    }
    if (task_service_ != nullptr && task_service_->is_running())
    {
        KC_LOG_DEBUG("persistence: enqueue {} offload=1", label);
        bool queued = task_service_->submit(
            [db, op, label]
            {
                if (!op(*db))
                {
                    KC_LOG_WARN("persistence: {} failed", label);
                }
            });
        if (queued)
        {
            return;
        }
    }
    if (!op(*db))
    {
        KC_LOG_WARN("persistence: {} failed", label);
    }
}

void PersistenceManager::flush()
{
    if (task_service_ != nullptr && task_service_->is_running())
    {
        task_service_->wait_idle();
    }
}

void PersistenceManager::set_active_user(std::string user_id)
{
    std::vector<storage::PersistedEntry> rows;
    if (is_valid())
    {
        flush();
        rows = database_->load_entries(user_id);
    }
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    user_id_ = std::move(user_id);
    entries_.clear();
    for (auto const &row : rows)
    {
        entries_.emplace(row.item_id, from_persisted(row));
    }
    KC_LOG_INFO("persistence: loaded {} catalog entries for active user",
                entries_.size());
}

std::string PersistenceManager::active_user() const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return user_id_;
}

std::vector<CatalogEntry> PersistenceManager::catalog() const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    std::vector<CatalogEntry> result;
    result.reserve(entries_.size());
    for (auto const &[id, entry] : entries_)
    {
        result.push_back(entry);
    }
    // Stable presentation order: newest first, then by id.
    std::sort(result.begin(), result.end(),
              [](CatalogEntry const &a, CatalogEntry const &b)
              {
                  if (a.added_at != b.added_at)
                      return a.added_at > b.added_at;
                  return a.item_id < b.item_id;
              });
    return result;
}

std::optional<CatalogEntry>
PersistenceManager::entry(std::string const &item_id) const
{
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void PersistenceManager::upsert_metadata(CatalogEntry const &incoming)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto &slot = entries_[incoming.item_id];
    bool const is_new = slot.item_id.empty();
    if (is_new)
    {
        slot = CatalogEntry{};
        slot.item_id = incoming.item_id;
    }
    slot.title = incoming.title;
    slot.artwork_url = incoming.artwork_url;
    slot.duration_ticks = incoming.duration_ticks;
    slot.library_id = incoming.library_id;
    slot.series_name = incoming.series_name;
    slot.season_index = incoming.season_index;
    slot.episode_index = incoming.episode_index;
    slot.added_at = incoming.added_at;
    slot.remote_modified_at = incoming.remote_modified_at;
    slot.missing_passes = 0;
    write(std::format("upsert {}", incoming.item_id),
          [row = to_persisted(user_id_, slot)](storage::Database &db)
          { return db.upsert_entry_metadata(row); });
}

void PersistenceManager::set_missing_passes(std::string const &item_id,
                                            int passes)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end() || it->second.missing_passes == passes)
    {
        return;
    }
    it->second.missing_passes = passes;
    write(std::format("missing-passes {}", item_id),
          [user = user_id_, item_id, passes](storage::Database &db)
          { return db.update_missing_passes(user, item_id, passes); });
}

std::optional<CatalogEntry>
PersistenceManager::remove_entry(std::string const &item_id)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end())
    {
        return std::nullopt;
    }
    auto removed = std::move(it->second);
    entries_.erase(it);
    write(std::format("remove {}", item_id),
          [user = user_id_, item_id](storage::Database &db)
          {
              return db.delete_entry(user, item_id) &&
                     db.delete_tasks_for_item(user, item_id);
          });
    return removed;
}

void PersistenceManager::update_download_fields(
    std::string const &item_id, std::optional<std::string> local_file_path,
    double progress, std::uint64_t file_size, std::string checksum,
    std::int64_t local_modified_at)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end())
    {
        return;
    }
    auto &entry = it->second;
    entry.local_file_path = std::move(local_file_path);
    entry.download_progress = std::clamp(progress, 0.0, 1.0);
    entry.file_size = file_size;
    entry.checksum = std::move(checksum);
    entry.local_modified_at = local_modified_at;
    write(std::format("download-fields {}", item_id),
          [row = to_persisted(user_id_, entry)](storage::Database &db)
          { return db.update_download_fields(row); });
}

void PersistenceManager::update_playback_fields(
    std::string const &item_id, bool watched,
    std::optional<std::int64_t> last_watched_at,
    std::int64_t resume_position_ms)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end())
    {
        return;
    }
    auto &entry = it->second;
    entry.watched = watched;
    entry.last_watched_at = last_watched_at;
    entry.resume_position_ms = std::max<std::int64_t>(0, resume_position_ms);
    write(std::format("playback-fields {}", item_id),
          [row = to_persisted(user_id_, entry)](storage::Database &db)
          { return db.update_playback_fields(row); });
}

void PersistenceManager::update_resume_position(std::string const &item_id,
                                                std::int64_t resume_position_ms)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end() ||
        it->second.resume_position_ms == resume_position_ms)
    {
        return;
    }
    it->second.resume_position_ms = std::max<std::int64_t>(0, resume_position_ms);
    write(std::format("resume {}", item_id),
          [user = user_id_, item_id,
           position = it->second.resume_position_ms](storage::Database &db)
          { return db.update_resume_position(user, item_id, position); });
}

void PersistenceManager::set_priority_override(std::string const &item_id,
                                               std::optional<int> priority)
{
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = entries_.find(item_id);
    if (it == entries_.end())
    {
        return;
    }
    it->second.priority_override = priority;
    write(std::format("priority {}", item_id),
          [user = user_id_, item_id, priority](storage::Database &db)
          { return db.update_priority_override(user, item_id, priority); });
}

std::vector<DownloadTask> PersistenceManager::load_tasks() const
{
    std::vector<DownloadTask> result;
    if (!is_valid())
    {
        return result;
    }
    auto user = active_user();
    for (auto const &row : database_->load_tasks(user))
    {
        if (row.status < static_cast<int>(DownloadStatus::Queued) ||
            row.status > static_cast<int>(DownloadStatus::Failed))
        {
            KC_LOG_ERROR("persistence: task {} has corrupt status {}, "
                         "skipping",
                         row.id, row.status);
            continue;
        }
        DownloadTask task;
        task.id = row.id;
        task.item_id = row.item_id;
        task.status = static_cast<DownloadStatus>(row.status);
        task.terminal = row.terminal;
        task.priority_rank = row.priority_rank;
        task.expected_bytes = row.expected_bytes;
        task.bytes_transferred = row.bytes_transferred;
        task.total_bytes = row.total_bytes;
        task.retry_count = row.retry_count;
        task.last_error = row.last_error;
        task.next_attempt_at = row.next_attempt_at;
        task.remote_modified_at = row.remote_modified_at;
        task.updated_at = row.updated_at;
        result.push_back(std::move(task));
    }
    return result;
}

std::optional<std::int64_t>
PersistenceManager::insert_task(DownloadTask const &task)
{
    // Synchronous: the caller needs the row id.
    if (!is_valid())
    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        return next_local_task_id_++;
    }
    flush();
    auto id = database_->insert_task(to_persisted(active_user(), task));
    if (!id)
    {
        KC_LOG_WARN("persistence: insert task for {} failed", task.item_id);
    }
    return id;
}

void PersistenceManager::update_task(DownloadTask const &task)
{
    write(std::format("task {}", task.id),
          [row = to_persisted(active_user(), task)](storage::Database &db)
          { return db.update_task(row); });
}

void PersistenceManager::delete_task(std::int64_t id)
{
    write(std::format("delete-task {}", id),
          [id](storage::Database &db) { return db.delete_task(id); });
}

void PersistenceManager::prune_resolved_tasks(std::int64_t older_than)
{
    write("prune-tasks", [older_than](storage::Database &db)
          { return db.delete_resolved_tasks_before(older_than); });
}

std::optional<ScreenTimeState> PersistenceManager::load_screen_time() const
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    auto row = database_->load_screen_time();
    if (!row)
    {
        return std::nullopt;
    }
    ScreenTimeState state;
    state.used_seconds = std::max<std::int64_t>(0, row->used_seconds);
    state.daily_limit_minutes = row->daily_limit_minutes;
    state.enabled = row->enabled;
    state.last_reset_date = row->last_reset_date;
    state.extension_minutes = std::max(0, row->extension_minutes);
    return state;
}

void PersistenceManager::persist_screen_time(ScreenTimeState const &state)
{
    storage::PersistedScreenTime row;
    row.used_seconds = state.used_seconds;
    row.daily_limit_minutes = state.daily_limit_minutes;
    row.enabled = state.enabled;
    row.last_reset_date = state.last_reset_date;
    row.extension_minutes = state.extension_minutes;
    write("screen-time",
          [row](storage::Database &db) { return db.save_screen_time(row); });
}

std::optional<std::string>
PersistenceManager::get_setting(std::string const &key) const
{
    if (!is_valid())
    {
        return std::nullopt;
    }
    return database_->get_setting(key);
}

void PersistenceManager::set_setting(std::string const &key, std::string value)
{
    write(std::format("setting {}", key),
          [key, value = std::move(value)](storage::Database &db)
          { return db.set_setting(key, value); });
}

void PersistenceManager::remove_setting(std::string const &key)
{
    write(std::format("remove-setting {}", key),
          [key](storage::Database &db) { return db.remove_setting(key); });
}

bool PersistenceManager::persist_settings(CoreSettings const &settings)
{
    auto db = database_;
    if (!db || !db->is_valid())
    {
        return false;
    }
    if (task_service_ != nullptr && task_service_->is_running())
    {
        KC_LOG_DEBUG("persistence: enqueue settings offload=1");
        task_service_->submit([this, db, s = settings]
                              { persist_settings_impl(db, s); });
        return true;
    }
    return persist_settings_impl(db, settings);
}

bool PersistenceManager::persist_settings_impl(
    std::shared_ptr<storage::Database> db, CoreSettings const &s)
{
    if (!db || !db->is_valid())
        return false;
    if (!db->begin_transaction())
        return false;

    bool success = true;
    auto set_bool = [&](char const *key, bool value)
    { success = success && db->set_setting(key, value ? "1" : "0"); };
    auto set_int = [&](char const *key, std::int64_t value)
    { success = success && db->set_setting(key, std::to_string(value)); };
    auto set_string = [&](char const *key, std::string const &value)
    { success = success && db->set_setting(key, value); };

    set_string("serverUrl", s.server_url);
    set_string("deviceId", s.device_id);
    set_string("pinnedPublicKey", s.pinned_public_key);
    set_string("enabledLibraries",
               storage::serialize_string_list(s.enabled_libraries));
    set_int("storageLimitBytes", static_cast<std::int64_t>(s.storage_limit_bytes));
    set_int("storageFloorBytes", static_cast<std::int64_t>(s.storage_floor_bytes));
    set_int("targetWindowMinMinutes", s.target_window_min_minutes);
    set_int("targetWindowMaxMinutes", s.target_window_max_minutes);
    set_int("batteryThresholdPercent", s.battery_threshold_percent);
    set_int("maxDownloadRetries", s.max_download_retries);
    set_int("syncIntervalHours", s.sync_interval_hours);
    set_bool("autoplayEnabled", s.autoplay_enabled);
    set_int("autoplayCountdownSeconds", s.autoplay_countdown_seconds);
    if (!success)
    {
        db->rollback_transaction();
        KC_LOG_WARN("persistence: settings write failed, rolled back");
        return false;
    }
    return db->commit_transaction();
}

CoreSettings PersistenceManager::load_settings(CoreSettings s) const
{
    if (!is_valid())
    {
        return s;
    }
    auto read_string = [&](char const *key, std::string &target)
    {
        if (auto value = database_->get_setting(key))
            target = *value;
    };
    auto read_int = [&](char const *key, int &target)
    {
        if (auto value = database_->get_setting(key))
            if (auto parsed = parse_number<int>(*value))
                target = *parsed;
    };
    auto read_u64 = [&](char const *key, std::uint64_t &target)
    {
        if (auto value = database_->get_setting(key))
            if (auto parsed = parse_number<std::uint64_t>(*value))
                target = *parsed;
    };
    auto read_bool = [&](char const *key, bool &target)
    {
        if (auto value = database_->get_setting(key))
            target = *value == "1";
    };

    read_string("serverUrl", s.server_url);
    read_string("deviceId", s.device_id);
    read_string("pinnedPublicKey", s.pinned_public_key);
    if (auto libraries = database_->get_setting("enabledLibraries"))
    {
        s.enabled_libraries = storage::deserialize_string_list(*libraries);
    }
    read_u64("storageLimitBytes", s.storage_limit_bytes);
    read_u64("storageFloorBytes", s.storage_floor_bytes);
    read_int("targetWindowMinMinutes", s.target_window_min_minutes);
    read_int("targetWindowMaxMinutes", s.target_window_max_minutes);
    read_int("batteryThresholdPercent", s.battery_threshold_percent);
    read_int("maxDownloadRetries", s.max_download_retries);
    read_int("syncIntervalHours", s.sync_interval_hours);
    read_bool("autoplayEnabled", s.autoplay_enabled);
    read_int("autoplayCountdownSeconds", s.autoplay_countdown_seconds);
    return s;
}

} // namespace kc::engine
