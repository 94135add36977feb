#pragma once

#include "engine/Core.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
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

class AsyncTaskService;
class ConfigurationService;
class EventBus;
class MediaPlayer;
class PersistenceManager;
class ScreenTimeGovernor;
class StorageGovernor;
struct ConnectivityChangedEvent;

// Session controller for the one video on screen. Player commands and
// listener callbacks are issued after the state lock is released, so a
// renderer may call back into the manager synchronously. Each batch of
// effects is numbered under the state lock and applied in that order.
class PlaybackContinuityManager
{
  public:
    using Listener = std::function<void(PlaybackSession const &)>;
    using NetworkStateProvider = std::function<NetworkState()>;
    using SteadyTime = std::chrono::steady_clock::time_point;

    static constexpr double kWatchedFraction = 0.90;
    static constexpr double kResumeCutoffFraction = 0.95;
    static constexpr std::chrono::seconds kResumeSaveInterval{10};

    struct Collaborators
    {
        PersistenceManager *persistence = nullptr;
        ScreenTimeGovernor *screen_time = nullptr;
        StorageGovernor *storage = nullptr;
        ConfigurationService *config = nullptr;
        EventBus *bus = nullptr;
        AsyncTaskService *reporter = nullptr;
        std::shared_ptr<MediaPlayer> player;
        std::shared_ptr<remote::MediaServerClient> server;
        std::shared_ptr<utils::Clock> clock;
        NetworkStateProvider network_state;
    };

    explicit PlaybackContinuityManager(Collaborators collaborators);

    void subscribe(Listener listener);
    PlaybackSession session() const;

    // Starts a new session. `context` is the ordered browsing list used for
    // autoplay; empty derives the next item from the catalog.
    bool select_video(std::string const &item_id,
                      std::vector<std::string> context = {});
    void pause();
    void resume();
    void skip();
    void retry();
    void stop();
    void user_interaction();

    void on_player_ready(std::int64_t duration_ms);
    void on_player_buffering(bool buffering);
    void on_player_position(std::int64_t position_ms);
    void on_player_ended();
    void on_player_error(std::string const &message);
    void on_connectivity_changed(ConnectivityChangedEvent const &event);

    // Drives the autoplay countdown, screen-time accrual, periodic resume
    // saves, the limit check and the access schedule.
    void tick(SteadyTime now);

  private:
    struct Effects
    {
        std::vector<std::function<void(MediaPlayer &)>> player;
        std::vector<std::function<void()>> deferred;
        bool notify = false;
        // Zero until stamped by EffectsLock.
        std::uint64_t sequence = 0;

        bool empty() const noexcept
        {
            return player.empty() && deferred.empty() && !notify;
        }
    };

    // Holds the state lock and numbers the batch it produced on release.
    class EffectsLock
    {
      public:
        EffectsLock(PlaybackContinuityManager &owner, Effects &fx);
        ~EffectsLock();
        EffectsLock(EffectsLock const &) = delete;
        EffectsLock &operator=(EffectsLock const &) = delete;

      private:
        PlaybackContinuityManager &owner_;
        Effects &fx_;
        std::unique_lock<std::mutex> lock_;
        int exceptions_;
    };

    void apply(Effects &effects);
    void run_effects(Effects &effects);
    void finish_batch(std::uint64_t sequence, bool nested);

    void begin_session_locked(CatalogEntry entry, Effects &fx);
    void begin_load_locked(Effects &fx, std::int64_t start_ms);
    std::optional<PlaybackSource> local_source_locked(CatalogEntry const &entry);
    std::optional<PlaybackSource> stream_source_locked(CatalogEntry const &entry);
    void finish_current_locked(Effects &fx, bool reached_end);
    void clear_session_locked();
    void save_position_locked();
    void report_played_locked(Effects &fx);
    std::optional<CatalogEntry> next_entry_locked() const;
    std::optional<PlaybackState> restriction_locked() const;
    void enter_restricted_locked(Effects &fx, PlaybackState reason);
    bool is_active_locked() const noexcept;
    void start_accrual_locked();
    void accrue_locked(SteadyTime now);

    Collaborators c_;

    // Effect batches run one at a time in sequence order. A batch issued
    // by a callback inside a running batch runs inline on that thread.
    std::mutex apply_mutex_;
    std::condition_variable apply_cv_;
    std::uint64_t next_apply_ = 1;
    std::vector<std::uint64_t> finished_early_;
    std::thread::id applying_thread_;

    mutable std::mutex mutex_;
    std::uint64_t issued_batches_ = 0;
    PlaybackSession session_;
    std::vector<std::string> context_;
    std::vector<Listener> listeners_;
    bool resume_applied_ = false;
    std::optional<SteadyTime> countdown_deadline_;
    std::optional<SteadyTime> accrual_since_;
    std::int64_t accrued_ms_ = 0;
    SteadyTime last_save_{};
    SteadyTime last_limit_check_{};
};

} // namespace kc::engine
