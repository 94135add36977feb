#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kc::utils
{
class Clock;
}

namespace kc::remote
{
class MediaServerClient;
}

namespace kc::engine
{

class ConnectivityProbe;
class PowerProbe;
class MediaPlayer;
class PinVerifier;

// Media server durations are expressed in 100ns ticks.
inline constexpr std::int64_t kTicksPerMillisecond = 10'000;
inline constexpr std::int64_t kTicksPerSecond = 10'000'000;

enum class NetworkState
{
    None = 0,
    Metered = 1,
    Unmetered = 2,
};

std::string_view to_string(NetworkState state) noexcept;

struct CoreSettings
{
    std::filesystem::path data_dir;
    std::filesystem::path state_path;
    std::filesystem::path download_dir;
    unsigned idle_sleep_ms = 500;
    std::string server_url;
    std::string device_name{"KidCache"};
    std::string device_id;
    std::string pinned_public_key;
    std::vector<std::string> enabled_libraries;
    std::uint64_t storage_limit_bytes = 8ull * 1024 * 1024 * 1024;
    std::uint64_t storage_floor_bytes = 1ull * 1024 * 1024 * 1024;
    int target_window_min_minutes = 60;
    int target_window_max_minutes = 120;
    int max_admissions_per_pass = 10;
    int battery_threshold_percent = 30;
    int max_download_retries = 5;
    int retry_base_seconds = 30;
    int retry_cap_seconds = 30 * 60;
    int network_timeout_seconds = 20;
    int connect_timeout_seconds = 10;
    int sync_interval_hours = 24;
    bool autoplay_enabled = true;
    int autoplay_countdown_seconds = 5;
    int screen_time_check_seconds = 30;
    int connectivity_debounce_ms = 2000;
    int pin_max_attempts = 5;
    int pin_lockout_minutes = 5;
};

struct CatalogEntry
{
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

    // Written only by playback.
    bool watched = false;
    std::optional<std::int64_t> last_watched_at;

    // Written only by the download orchestrator (and eviction it triggers).
    std::optional<std::string> local_file_path;
    double download_progress = 0.0;
    std::uint64_t file_size = 0;
    std::string checksum;
    std::int64_t local_modified_at = 0;

    // Consecutive sync passes the item was absent from its library listing.
    int missing_passes = 0;

    std::int64_t duration_ms() const noexcept
    {
        return duration_ticks / kTicksPerMillisecond;
    }
    bool is_downloaded() const noexcept
    {
        return local_file_path.has_value();
    }
};

struct CatalogItemView
{
    CatalogEntry entry;
    bool downloaded = false;
};

enum class DownloadStatus
{
    Queued = 0,
    Active = 1,
    Completed = 2,
    Failed = 3,
};

std::string_view to_string(DownloadStatus status) noexcept;

struct DownloadTask
{
    std::int64_t id = 0;
    std::string item_id;
    DownloadStatus status = DownloadStatus::Queued;
    bool terminal = false;
    int priority_rank = 0;
    std::uint64_t expected_bytes = 0;
    std::uint64_t bytes_transferred = 0;
    std::uint64_t total_bytes = 0;
    int retry_count = 0;
    std::string last_error;
    // Unix milliseconds before which a retry must not start.
    std::int64_t next_attempt_at = 0;
    std::int64_t remote_modified_at = 0;
    std::int64_t updated_at = 0;

    bool is_live() const noexcept
    {
        return status == DownloadStatus::Queued ||
               status == DownloadStatus::Active;
    }
};

struct DownloadStatusSnapshot
{
    std::vector<DownloadTask> tasks;
    std::optional<std::string> active_item;
    double active_progress = 0.0;
    bool storage_blocked = false;
    bool reconnect_required = false;
};

struct ScreenTimeState
{
    std::int64_t used_seconds = 0;
    int daily_limit_minutes = 60;
    bool enabled = true;
    std::string last_reset_date;
    int extension_minutes = 0;

    int used_minutes() const noexcept
    {
        return static_cast<int>(used_seconds / 60);
    }
};

// Hours in which playback may start or continue. Minutes count from local
// midnight and both ends are inclusive; an end at or before the start wraps
// past midnight. Only the weekday the window opens on is checked.
struct AccessSchedule
{
    bool enabled = false;
    int start_minute = 7 * 60;
    int end_minute = 20 * 60;
    // Bit 0 is Monday.
    std::uint8_t allowed_days = 0x7F;

    bool allows(int weekday, int minute_of_day) const noexcept;
};

struct ScreenTimeSnapshot
{
    ScreenTimeState state;
    int remaining_minutes = 0;
    bool limit_reached = false;
    AccessSchedule schedule;
    bool outside_schedule = false;
};

enum class SyncStatus
{
    Completed,
    Offline,
    AuthRequired,
    Failed,
    Cancelled,
};

std::string_view to_string(SyncStatus status) noexcept;

struct SyncResult
{
    SyncStatus status = SyncStatus::Completed;
    std::vector<std::string> added;
    std::vector<std::string> updated;
    std::vector<std::string> removed;
    // Files that belonged to removed entries; the orchestrator deletes them.
    std::vector<std::filesystem::path> removed_files;
    std::string message;

    bool empty_delta() const noexcept
    {
        return added.empty() && updated.empty() && removed.empty();
    }
};

struct SyncStatusSnapshot
{
    bool in_progress = false;
    bool pending_manual = false;
    std::optional<std::int64_t> last_sync_at;
    std::optional<SyncResult> last_result;
};

enum class SourceMode
{
    Streaming,
    Local,
};

enum class PlaybackState
{
    Idle,
    Loading,
    Playing,
    Buffering,
    Paused,
    Ended,
    Error,
    TimeLimitReached,
    OutsideSchedule,
};

std::string_view to_string(PlaybackState state) noexcept;

enum class PlaybackError
{
    None,
    NotAvailableOffline,
    StreamInterrupted,
    StreamFailed,
};

struct PlaybackSource
{
    SourceMode mode = SourceMode::Streaming;
    // File path for local playback, URL for streaming.
    std::string location;
};

struct PlaybackSession
{
    std::optional<CatalogEntry> entry;
    PlaybackState state = PlaybackState::Idle;
    SourceMode source_mode = SourceMode::Streaming;
    std::int64_t position_ms = 0;
    std::int64_t duration_ms = 0;
    bool buffering = false;
    std::optional<int> autoplay_countdown_seconds;
    std::optional<std::string> pending_next_id;
    PlaybackError error = PlaybackError::None;
    std::uint64_t load_generation = 0;
};

enum class GateDecision
{
    Granted,
    WrongPin,
    LockedOut,
};

enum class ConnectStatus
{
    Connected,
    UntrustedCertificate,
    InvalidCredentials,
    Unreachable,
};

struct ConnectOutcome
{
    ConnectStatus status = ConnectStatus::Unreachable;
    // Public key pin awaiting parent confirmation when untrusted.
    std::string fingerprint;
    std::string message;
};

// Collaborators are injectable; missing ones are replaced by the Linux
// implementations (sysfs probes, libcurl client, system clock).
struct CoreDependencies
{
    CoreDependencies();
    ~CoreDependencies();
    CoreDependencies(CoreDependencies &&) noexcept;
    CoreDependencies &operator=(CoreDependencies &&) noexcept;

    std::shared_ptr<remote::MediaServerClient> server;
    std::unique_ptr<ConnectivityProbe> connectivity;
    std::unique_ptr<PowerProbe> power;
    std::shared_ptr<MediaPlayer> player;
    std::shared_ptr<PinVerifier> pin_verifier;
    std::shared_ptr<utils::Clock> clock;
};

class Core
{
  public:
    using PlaybackListener = std::function<void(PlaybackSession const &)>;

    Core(CoreSettings settings, CoreDependencies dependencies);
    ~Core();
    static std::unique_ptr<Core> create(CoreSettings settings,
                                        CoreDependencies dependencies);

    void run();
    void stop() noexcept;
    bool is_running() const noexcept;

    CoreSettings settings() const;
    NetworkState network_state() const;

    std::vector<CatalogItemView> catalog() const;
    PlaybackSession playback_session() const;
    void subscribe_playback(PlaybackListener listener);
    ScreenTimeSnapshot screen_time() const;
    SyncStatusSnapshot sync_status() const;
    DownloadStatusSnapshot download_status() const;

    ConnectOutcome connect(std::string server_url, std::string username,
                           std::string password);
    GateDecision trust_server_certificate(std::string const &pin,
                                          std::string fingerprint);

    bool select_video(std::string const &item_id,
                      std::vector<std::string> context = {});
    void pause();
    void resume();
    void skip();
    void retry();
    void user_interaction();
    void on_player_ready(std::int64_t duration_ms);
    void on_player_buffering(bool buffering);
    void on_player_position(std::int64_t position_ms);
    void on_player_ended();
    void on_player_error(std::string message);

    std::shared_future<SyncResult> manual_sync();
    GateDecision set_storage_limit(std::string const &pin, std::uint64_t bytes);
    GateDecision set_screen_time_limit(std::string const &pin, int minutes);
    GateDecision set_screen_time_enabled(std::string const &pin, bool enabled);
    GateDecision set_access_schedule(std::string const &pin,
                                     AccessSchedule const &schedule);
    GateDecision set_autoplay(std::string const &pin, bool enabled);
    GateDecision grant_extension(std::string const &pin, int minutes);
    GateDecision set_priority_override(std::string const &pin,
                                       std::string const &item_id,
                                       std::optional<int> priority);

    // Backgrounding cancels a running manual sync unless the scheduled-sync
    // conditions hold; the request stays pending. Scheduled passes keep
    // running and may start while backgrounded.
    void on_app_backgrounded();
    void on_app_foregrounded();

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kc::engine
