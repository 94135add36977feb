#include "engine/Core.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/CatalogSynchronizer.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/DownloadOrchestrator.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/MediaPlayer.hpp"
#include "engine/NetworkMonitor.hpp"
#include "engine/ParentalGate.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/PlaybackContinuityManager.hpp"
#include "engine/PowerMonitor.hpp"
#include "engine/SchedulerService.hpp"
#include "engine/ScreenTimeGovernor.hpp"
#include "engine/StorageGovernor.hpp"
#include "remote/JellyfinClient.hpp"
#include "utils/Clock.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Version.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <system_error>
#include <vector>

namespace kc::engine
{

std::string_view to_string(NetworkState state) noexcept
{
    switch (state)
    {
    case NetworkState::None:
        return "none";
    case NetworkState::Metered:
        return "metered";
    case NetworkState::Unmetered:
        return "unmetered";
    }
    return "unknown";
}

std::string_view to_string(DownloadStatus status) noexcept
{
    switch (status)
    {
    case DownloadStatus::Queued:
        return "queued";
    case DownloadStatus::Active:
        return "active";
    case DownloadStatus::Completed:
        return "completed";
    case DownloadStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::string_view to_string(SyncStatus status) noexcept
{
    switch (status)
    {
    case SyncStatus::Completed:
        return "completed";
    case SyncStatus::Offline:
        return "offline";
    case SyncStatus::AuthRequired:
        return "auth-required";
    case SyncStatus::Failed:
        return "failed";
    case SyncStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(PlaybackState state) noexcept
{
    switch (state)
    {
    case PlaybackState::Idle:
        return "idle";
    case PlaybackState::Loading:
        return "loading";
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Buffering:
        return "buffering";
    case PlaybackState::Paused:
        return "paused";
    case PlaybackState::Ended:
        return "ended";
    case PlaybackState::Error:
        return "error";
    case PlaybackState::TimeLimitReached:
        return "time-limit-reached";
    case PlaybackState::OutsideSchedule:
        return "outside-schedule";
    }
    return "unknown";
}

bool AccessSchedule::allows(int weekday, int minute_of_day) const noexcept
{
    if (!enabled)
        return true;
    if (weekday < 0 || weekday > 6 || (allowed_days & (1u << weekday)) == 0)
        return false;
    if (end_minute > start_minute)
        return minute_of_day >= start_minute && minute_of_day <= end_minute;
    return minute_of_day >= start_minute || minute_of_day <= end_minute;
}

namespace
{
constexpr auto kShutdownTimeout = std::chrono::seconds(10);
constexpr auto kNetworkPollInterval = std::chrono::milliseconds(500);

std::string generate_device_id()
{
    std::random_device rd;
    std::uniform_int_distribution<int> dist(0, 15);
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i)
    {
        id.push_back(kHex[dist(rd)]);
    }
    return id;
}

void ensure_directory(std::filesystem::path const &dir)
{
    if (dir.empty())
        return;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        KC_LOG_WARN("failed to create {}: {}", dir.string(), ec.message());
    }
}
} // namespace

enum class EngineState
{
    Running,
    ShuttingDown,
    Stopped
};

struct Core::Impl
{
    // Infrastructure
    std::shared_ptr<utils::Clock> clock;
    AsyncTaskService persistence_worker{"persistence"};
    AsyncTaskService sync_worker{"sync"};
    AsyncTaskService download_worker{"downloads"};
    AsyncTaskService reporting_worker{"reporting"};
    std::unique_ptr<EventBus> event_bus;
    std::unique_ptr<SchedulerService> scheduler_service;

    // Services
    std::unique_ptr<PersistenceManager> persistence;
    std::unique_ptr<ConfigurationService> config_service;
    std::unique_ptr<NetworkMonitor> network_monitor;
    std::unique_ptr<PowerProbe> power_probe;
    std::mutex power_mutex;
    std::shared_ptr<remote::MediaServerClient> server;
    std::unique_ptr<ScreenTimeGovernor> screen_time;
    std::unique_ptr<StorageGovernor> storage;
    std::unique_ptr<CatalogSynchronizer> synchronizer;
    std::unique_ptr<DownloadOrchestrator> downloads;
    std::unique_ptr<PlaybackContinuityManager> playback;
    std::unique_ptr<ParentalGate> gate;
    std::vector<EventBus::SubscriptionId> subscriptions;

    // State
    std::atomic<EngineState> state{EngineState::Running};
    std::atomic_bool shutdown_requested{false};
    std::atomic_bool backgrounded{false};
    std::atomic_bool pump_pending{false};
    // Mirrors the persisted flag; the write itself lands asynchronously.
    std::atomic_bool pending_sync{false};
    std::chrono::steady_clock::time_point shutdown_start;
    std::mutex wake_mutex;
    std::condition_variable wake_cv;
    CoreSettings settings_;

    Impl(CoreSettings settings, CoreDependencies deps)
        : clock(std::move(deps.clock)), settings_(std::move(settings))
    {
        if (!clock)
            clock = std::make_shared<utils::SystemClock>();
        if (settings_.data_dir.empty())
            settings_.data_dir = utils::data_root();
        if (settings_.state_path.empty())
            settings_.state_path = settings_.data_dir / "kidcache.db";
        if (settings_.download_dir.empty())
            settings_.download_dir = settings_.data_dir / "downloads";
        ensure_directory(settings_.data_dir);
        ensure_directory(settings_.download_dir);

        persistence_worker.start();
        sync_worker.start();
        download_worker.start();
        reporting_worker.start();
        event_bus = std::make_unique<EventBus>();
        persistence = std::make_unique<PersistenceManager>(
            settings_.state_path, &persistence_worker);

        // Persisted parent settings win over the defaults; paths always come
        // from this process.
        auto loaded = persistence->load_settings(settings_);
        loaded.data_dir = settings_.data_dir;
        loaded.state_path = settings_.state_path;
        loaded.download_dir = settings_.download_dir;
        bool const new_device = loaded.device_id.empty();
        if (new_device)
            loaded.device_id = generate_device_id();
        config_service = std::make_unique<ConfigurationService>(
            persistence.get(), event_bus.get(), loaded);
        if (new_device)
            config_service->persist_now();
        // Libraries passed by the caller replace the stored selection.
        if (!settings_.enabled_libraries.empty())
            config_service->set_enabled_libraries(settings_.enabled_libraries);
        auto const config = config_service->get();
        pending_sync.store(
            persistence->get_setting(setting_keys::kPendingManualSync)
                .value_or("") == "1");

        std::unique_ptr<ConnectivityProbe> connectivity =
            std::move(deps.connectivity);
        if (!connectivity)
            connectivity = std::make_unique<SysfsConnectivityProbe>();
        network_monitor = std::make_unique<NetworkMonitor>(
            std::move(connectivity), event_bus.get(),
            std::chrono::milliseconds(config.connectivity_debounce_ms));
        network_monitor->poll(std::chrono::steady_clock::now());
        power_probe = std::move(deps.power);
        if (!power_probe)
            power_probe = std::make_unique<SysfsPowerProbe>();

        if (deps.server)
        {
            server = std::move(deps.server);
        }
        else
        {
            remote::JellyfinClient::Identity identity;
            identity.device = config.device_name;
            identity.device_id = config.device_id;
            identity.version = version::kSemanticVersion;
            remote::HttpClient::Options options;
            options.connect_timeout =
                std::chrono::seconds(config.connect_timeout_seconds);
            options.timeout =
                std::chrono::seconds(config.network_timeout_seconds);
            options.user_agent = version::kUserAgentVersion;
            server = std::make_shared<remote::JellyfinClient>(
                std::move(identity), std::move(options));
        }
        restore_session(config);

        auto network_state = [this]
        { return network_monitor->current_state(); };
        auto power_state = [this] { return power_status(); };

        screen_time = std::make_unique<ScreenTimeGovernor>(persistence.get(),
                                                           clock);
        screen_time->load();

        storage = std::make_unique<StorageGovernor>(persistence.get(),
                                                    config_service.get());
        if (auto repaired = storage->repair_cache(); repaired > 0)
        {
            KC_LOG_INFO("storage: repaired {} cache entries at start",
                        repaired);
        }

        synchronizer = std::make_unique<CatalogSynchronizer>(
            persistence.get(), server, clock, event_bus.get(), network_state);

        downloads = std::make_unique<DownloadOrchestrator>(
            persistence.get(), storage.get(), config_service.get(), server,
            clock, event_bus.get(), network_state, power_state);
        downloads->load();

        PlaybackContinuityManager::Collaborators collaborators;
        collaborators.persistence = persistence.get();
        collaborators.screen_time = screen_time.get();
        collaborators.storage = storage.get();
        collaborators.config = config_service.get();
        collaborators.bus = event_bus.get();
        collaborators.reporter = &reporting_worker;
        collaborators.player = std::move(deps.player);
        collaborators.server = server;
        collaborators.clock = clock;
        collaborators.network_state = network_state;
        playback = std::make_unique<PlaybackContinuityManager>(
            std::move(collaborators));
        playback->subscribe(
            [this](PlaybackSession const &session)
            {
                std::vector<std::string> on_screen;
                if (session.entry && session.state != PlaybackState::Idle)
                    on_screen.push_back(session.entry->item_id);
                downloads->set_protected_items(std::move(on_screen));
            });

        gate = std::make_unique<ParentalGate>(
            std::move(deps.pin_verifier), persistence.get(), clock,
            config.pin_max_attempts, config.pin_lockout_minutes);
        gate->load();

        // Each consumer drains its own mailbox.
        subscriptions.push_back(
            event_bus->subscribe_queued<ConnectivityChangedEvent>(
                [this](ConnectivityChangedEvent const &event)
                { downloads->on_connectivity_changed(event); },
                "download-connectivity"));
        subscriptions.push_back(
            event_bus->subscribe_queued<ConnectivityChangedEvent>(
                [this](ConnectivityChangedEvent const &event)
                { playback->on_connectivity_changed(event); },
                "playback-connectivity"));
        subscriptions.push_back(
            event_bus->subscribe_queued<ConnectivityChangedEvent>(
                [this](ConnectivityChangedEvent const &event)
                {
                    if (event.current == NetworkState::None)
                        return;
                    maybe_sync();
                    schedule_pump();
                },
                "sync-connectivity"));
        subscriptions.push_back(event_bus->subscribe<CatalogSyncedEvent>(
            [this](CatalogSyncedEvent const &event)
            { on_catalog_synced(event.result); }));
        subscriptions.push_back(event_bus->subscribe<StorageBlockedEvent>(
            [](StorageBlockedEvent const &event)
            {
                KC_LOG_WARN("storage: downloads paused, {} bytes needed with "
                            "{} in use",
                            event.requested_bytes, event.consumed_bytes);
            }));

        scheduler_service = std::make_unique<SchedulerService>();

        // Playback: countdown, screen-time accrual and the limit check.
        scheduler_service->schedule(std::chrono::seconds(1),
                                    [this]()
                                    {
                                        if (playback)
                                            playback->tick(
                                                clock->steady_now());
                                    });

        // Config: "Flush settings every 500ms if dirty"
        scheduler_service->schedule(std::chrono::milliseconds(500),
                                    [this]()
                                    {
                                        if (config_service)
                                            config_service->persist_if_dirty();
                                    });

        // Sync eligibility is re-evaluated every minute.
        scheduler_service->schedule(std::chrono::minutes(1),
                                    [this]() { maybe_sync(); });

        // Downloads: admit and run the next transfer on the download worker.
        scheduler_service->schedule(std::chrono::seconds(5),
                                    [this]() { schedule_pump(); });

        // Housekeeping: resolved task log and the daily screen-time reset.
        scheduler_service->schedule(
            std::chrono::hours(1),
            [this]()
            {
                if (downloads)
                    downloads->prune_resolved(
                        utils::to_unix_millis(clock->now()));
                if (screen_time)
                    screen_time->reset_if_new_day();
            });

        network_monitor->start(kNetworkPollInterval);
        KC_LOG_INFO("engine started (data {}, network {})",
                    settings_.data_dir.string(),
                    to_string(network_monitor->current_state()));
    }

    ~Impl()
    {
        if (network_monitor)
            network_monitor->stop();
        if (synchronizer)
            synchronizer->cancel();
        if (downloads)
            downloads->shutdown();
        for (auto id : subscriptions)
            event_bus->unsubscribe(id);
        subscriptions.clear();
        sync_worker.stop();
        download_worker.stop();
        reporting_worker.stop();
        if (config_service)
            config_service->persist_now();
        if (persistence)
            persistence->flush();
        persistence_worker.stop();
    }

    // Offline boot: only local state is touched here.
    void restore_session(CoreSettings const &config)
    {
        if (config.server_url.empty())
            return;
        server->set_endpoint(config.server_url, config.pinned_public_key);
        auto token = persistence->get_setting(setting_keys::kAccessToken);
        auto user = persistence->get_setting(setting_keys::kActiveUserId);
        if (!token || token->empty() || !user || user->empty())
            return;
        remote::AuthSession session;
        session.token = std::move(*token);
        session.user_id = *user;
        session.server_id =
            persistence->get_setting(setting_keys::kServerId).value_or("");
        server->restore_session(std::move(session));
        persistence->set_active_user(*user);
        KC_LOG_INFO("restored session for user {}", *user);
    }

    std::optional<PowerStatus> power_status()
    {
        std::lock_guard<std::mutex> lock(power_mutex);
        return power_probe ? power_probe->probe() : std::nullopt;
    }

    bool pending_manual_sync() const
    {
        return pending_sync.load();
    }

    void set_pending_manual_sync(bool pending)
    {
        if (pending_sync.exchange(pending) == pending)
            return;
        if (pending)
            persistence->set_setting(setting_keys::kPendingManualSync, "1");
        else
            persistence->remove_setting(setting_keys::kPendingManualSync);
    }

    std::shared_future<SyncResult> start_sync()
    {
        return synchronizer->begin(config_service->get().enabled_libraries,
                                   &sync_worker);
    }

    // Scheduled passes need an unmetered link on external power, whether
    // the app is in front or not.
    bool background_sync_allowed()
    {
        return network_monitor->current_state() == NetworkState::Unmetered &&
               power_is_connected(power_status());
    }

    void maybe_sync()
    {
        if (state.load() != EngineState::Running)
            return;
        if (synchronizer->in_progress() || !server->session())
            return;
        if (network_monitor->current_state() == NetworkState::None)
            return;
        bool const allowed = background_sync_allowed();
        if (pending_manual_sync())
        {
            // In the background a deferred request waits for the same
            // window as a scheduled pass.
            if (backgrounded.load() && !allowed)
                return;
            KC_LOG_INFO("sync: resuming deferred manual sync");
            start_sync();
            return;
        }
        if (!allowed)
            return;
        auto const config = config_service->get();
        if (synchronizer->is_due(std::chrono::hours(config.sync_interval_hours)))
        {
            KC_LOG_INFO("sync: scheduled pass starting{}",
                        backgrounded.load() ? " in background" : "");
            start_sync();
        }
    }

    void on_catalog_synced(SyncResult const &result)
    {
        downloads->on_catalog_synced(result);
        switch (result.status)
        {
        case SyncStatus::Offline:
        case SyncStatus::Cancelled:
            // Re-run on the next eligible window.
            break;
        case SyncStatus::AuthRequired:
            KC_LOG_WARN("sync: server requires sign-in again");
            set_pending_manual_sync(false);
            break;
        case SyncStatus::Completed:
        case SyncStatus::Failed:
            set_pending_manual_sync(false);
            schedule_pump();
            break;
        }
    }

    void schedule_pump()
    {
        if (state.load() != EngineState::Running)
            return;
        bool expected = false;
        if (!pump_pending.compare_exchange_strong(expected, true))
            return;
        if (!download_worker.submit([this] { run_pump(); }))
            pump_pending.store(false);
    }

    void run_pump()
    {
        auto outcome = PumpOutcome::Idle;
        try
        {
            downloads->admit();
            outcome = downloads->pump();
        }
        catch (std::exception const &ex)
        {
            KC_LOG_ERROR("download: pump failed: {}", ex.what());
        }
        pump_pending.store(false);
        KC_LOG_DEBUG("download: pump finished: {}", to_string(outcome));
        if (outcome == PumpOutcome::Completed ||
            outcome == PumpOutcome::IntegrityFailed ||
            outcome == PumpOutcome::FailedTerminal)
        {
            schedule_pump();
        }
    }

    void adopt_session(remote::AuthSession const &session)
    {
        persistence->set_setting(setting_keys::kAccessToken, session.token);
        persistence->set_setting(setting_keys::kServerId, session.server_id);
        if (persistence->active_user() != session.user_id)
        {
            downloads->shutdown();
            persistence->set_setting(setting_keys::kActiveUserId,
                                     session.user_id);
            persistence->set_active_user(session.user_id);
            downloads->load();
            // First pass for this user runs on any connection.
            set_pending_manual_sync(true);
        }
        downloads->on_reauthenticated();
        maybe_sync();
        schedule_pump();
    }

    ConnectOutcome connect(std::string url, std::string const &username,
                           std::string const &password)
    {
        ConnectOutcome outcome;
        while (!url.empty() && url.back() == '/')
            url.pop_back();
        if (!url.starts_with("https://"))
        {
            outcome.status = ConnectStatus::Unreachable;
            outcome.message = "only https:// servers are supported";
            return outcome;
        }
        // A different server drops any previously confirmed key.
        config_service->set_server(url);
        auto pin = config_service->get().pinned_public_key;

        auto probe = server->probe_certificate(url);
        if (!probe.error.ok())
        {
            outcome.status = ConnectStatus::Unreachable;
            outcome.message = probe.error.message;
            return outcome;
        }
        if (!probe.trusted_by_system && probe.public_key_pin != pin)
        {
            KC_LOG_WARN("connect: server certificate needs confirmation");
            outcome.status = ConnectStatus::UntrustedCertificate;
            outcome.fingerprint = probe.public_key_pin;
            return outcome;
        }
        if (probe.trusted_by_system && probe.public_key_pin != pin)
            pin.clear();

        server->set_endpoint(url, pin);
        auto auth = server->authenticate(username, password);
        if (!auth.error.ok())
        {
            outcome.message = auth.error.message;
            switch (auth.error.kind)
            {
            case remote::RemoteErrorKind::AuthExpired:
                outcome.status = ConnectStatus::InvalidCredentials;
                break;
            case remote::RemoteErrorKind::Untrusted:
                outcome.status = ConnectStatus::UntrustedCertificate;
                outcome.fingerprint = probe.public_key_pin;
                break;
            default:
                outcome.status = ConnectStatus::Unreachable;
                break;
            }
            KC_LOG_WARN("connect: sign-in failed: {}", outcome.message);
            return outcome;
        }
        adopt_session(auth.session);
        outcome.status = ConnectStatus::Connected;
        return outcome;
    }

    std::vector<CatalogItemView> catalog() const
    {
        bool const offline =
            network_monitor->current_state() == NetworkState::None;
        std::vector<CatalogItemView> views;
        for (auto &entry : persistence->catalog())
        {
            bool const downloaded = entry.is_downloaded();
            if (offline && !downloaded)
                continue;
            views.push_back(CatalogItemView{std::move(entry), downloaded});
        }
        return views;
    }

    void wake()
    {
        {
            std::lock_guard<std::mutex> lock(wake_mutex);
        }
        wake_cv.notify_all();
    }

    void run()
    {
        while (state.load() != EngineState::Stopped)
        {
            auto now = std::chrono::steady_clock::now();

            if (state.load() == EngineState::Running)
            {
                if (shutdown_requested.load())
                {
                    KC_LOG_INFO("engine shutting down");
                    state.store(EngineState::ShuttingDown);
                    shutdown_start = now;
                    synchronizer->cancel();
                    downloads->shutdown();
                    playback->stop();
                }
            }
            else if (state.load() == EngineState::ShuttingDown)
            {
                bool const drained = download_worker.pending() == 0 &&
                                     !synchronizer->in_progress();
                if (drained || now - shutdown_start > kShutdownTimeout)
                {
                    if (config_service)
                        config_service->persist_now();
                    persistence->flush();
                    state.store(EngineState::Stopped);
                    break;
                }
            }

            if (state.load() == EngineState::Running && scheduler_service)
                scheduler_service->tick(now);

            auto sched_wait =
                scheduler_service
                    ? scheduler_service->time_until_next_task(now)
                    : std::chrono::milliseconds(settings_.idle_sleep_ms);
            auto wait_limit = std::min<long long>(
                static_cast<long long>(settings_.idle_sleep_ms),
                static_cast<long long>(sched_wait.count()));
            auto wait_ms =
                static_cast<unsigned>(std::max<long long>(1, wait_limit));
            std::unique_lock<std::mutex> lock(wake_mutex);
            wake_cv.wait_for(lock, std::chrono::milliseconds(wait_ms),
                             [this]
                             {
                                 return shutdown_requested.load() &&
                                        state.load() == EngineState::Running;
                             });
        }
        KC_LOG_INFO("engine stopped");
    }
};

CoreDependencies::CoreDependencies() = default;
CoreDependencies::~CoreDependencies() = default;
CoreDependencies::CoreDependencies(CoreDependencies &&) noexcept = default;
CoreDependencies &
CoreDependencies::operator=(CoreDependencies &&) noexcept = default;

// --- Proxy Methods ---

Core::~Core() = default;
Core::Core(CoreSettings s, CoreDependencies d)
    : impl_(std::make_unique<Impl>(std::move(s), std::move(d)))
{
}
std::unique_ptr<Core> Core::create(CoreSettings s, CoreDependencies d)
{
    return std::make_unique<Core>(std::move(s), std::move(d));
}

void Core::run()
{
    if (impl_)
        impl_->run();
}
void Core::stop() noexcept
{
    if (!impl_)
        return;
    impl_->shutdown_requested = true;
    impl_->wake();
}
bool Core::is_running() const noexcept
{
    return impl_ && impl_->state.load() != EngineState::Stopped;
}

CoreSettings Core::settings() const
{
    return impl_->config_service->get();
}
NetworkState Core::network_state() const
{
    return impl_->network_monitor->current_state();
}

std::vector<CatalogItemView> Core::catalog() const
{
    return impl_->catalog();
}
PlaybackSession Core::playback_session() const
{
    return impl_->playback->session();
}
void Core::subscribe_playback(PlaybackListener listener)
{
    impl_->playback->subscribe(std::move(listener));
}
ScreenTimeSnapshot Core::screen_time() const
{
    return impl_->screen_time->snapshot();
}
SyncStatusSnapshot Core::sync_status() const
{
    SyncStatusSnapshot snapshot;
    snapshot.in_progress = impl_->synchronizer->in_progress();
    snapshot.pending_manual = impl_->pending_manual_sync();
    snapshot.last_sync_at = impl_->synchronizer->last_sync_at();
    snapshot.last_result = impl_->synchronizer->last_result();
    return snapshot;
}
DownloadStatusSnapshot Core::download_status() const
{
    return impl_->downloads->snapshot();
}

ConnectOutcome Core::connect(std::string server_url, std::string username,
                             std::string password)
{
    return impl_->connect(std::move(server_url), username, password);
}
GateDecision Core::trust_server_certificate(std::string const &pin,
                                            std::string fingerprint)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision != GateDecision::Granted)
        return decision;
    KC_LOG_INFO("connect: server key confirmed by parent");
    impl_->config_service->set_pinned_public_key(fingerprint);
    impl_->server->set_endpoint(impl_->config_service->get().server_url,
                                std::move(fingerprint));
    return decision;
}

bool Core::select_video(std::string const &item_id,
                        std::vector<std::string> context)
{
    return impl_->playback->select_video(item_id, std::move(context));
}
void Core::pause()
{
    impl_->playback->pause();
}
void Core::resume()
{
    impl_->playback->resume();
}
void Core::skip()
{
    impl_->playback->skip();
}
void Core::retry()
{
    impl_->playback->retry();
}
void Core::user_interaction()
{
    impl_->playback->user_interaction();
}
void Core::on_player_ready(std::int64_t duration_ms)
{
    impl_->playback->on_player_ready(duration_ms);
}
void Core::on_player_buffering(bool buffering)
{
    impl_->playback->on_player_buffering(buffering);
}
void Core::on_player_position(std::int64_t position_ms)
{
    impl_->playback->on_player_position(position_ms);
}
void Core::on_player_ended()
{
    impl_->playback->on_player_ended();
}
void Core::on_player_error(std::string message)
{
    impl_->playback->on_player_error(message);
}

std::shared_future<SyncResult> Core::manual_sync()
{
    // Kept until the pass completes so an interrupted request survives
    // backgrounding and restarts.
    impl_->set_pending_manual_sync(true);
    return impl_->start_sync();
}

GateDecision Core::set_storage_limit(std::string const &pin,
                                     std::uint64_t bytes)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision == GateDecision::Granted)
    {
        impl_->config_service->set_storage_limit(bytes);
        impl_->schedule_pump();
    }
    return decision;
}
GateDecision Core::set_screen_time_limit(std::string const &pin, int minutes)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision == GateDecision::Granted)
        impl_->screen_time->set_daily_limit(minutes);
    return decision;
}
GateDecision Core::set_screen_time_enabled(std::string const &pin,
                                           bool enabled)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision != GateDecision::Granted)
        return decision;
    impl_->screen_time->set_enabled(enabled);
    if (impl_->playback->session().state == PlaybackState::TimeLimitReached)
        impl_->playback->resume();
    return decision;
}
GateDecision Core::set_autoplay(std::string const &pin, bool enabled)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision == GateDecision::Granted)
        impl_->config_service->set_autoplay(enabled, std::nullopt);
    return decision;
}
GateDecision Core::grant_extension(std::string const &pin, int minutes)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision != GateDecision::Granted)
        return decision;
    impl_->screen_time->grant_extension(minutes);
    if (impl_->playback->session().state == PlaybackState::TimeLimitReached)
        impl_->playback->resume();
    return decision;
}
GateDecision Core::set_access_schedule(std::string const &pin,
                                       AccessSchedule const &schedule)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision != GateDecision::Granted)
        return decision;
    impl_->screen_time->set_access_schedule(schedule);
    // A widened window lets a blocked session carry on; a narrowed one is
    // enforced by the next playback tick.
    if (impl_->playback->session().state == PlaybackState::OutsideSchedule)
        impl_->playback->resume();
    return decision;
}
GateDecision Core::set_priority_override(std::string const &pin,
                                         std::string const &item_id,
                                         std::optional<int> priority)
{
    auto decision = impl_->gate->authorize(pin);
    if (decision == GateDecision::Granted)
    {
        impl_->persistence->set_priority_override(item_id, priority);
        impl_->schedule_pump();
    }
    return decision;
}

void Core::on_app_backgrounded()
{
    impl_->backgrounded = true;
    // Only a manual pass yields to backgrounding; its pending flag is still
    // set and brings it back in the next eligible window.
    if (impl_->synchronizer->in_progress() && impl_->pending_manual_sync() &&
        !impl_->background_sync_allowed())
    {
        KC_LOG_INFO("sync: app backgrounded, deferring manual pass");
        impl_->synchronizer->cancel();
        return;
    }
    impl_->maybe_sync();
}
void Core::on_app_foregrounded()
{
    impl_->backgrounded = false;
    impl_->maybe_sync();
}

} // namespace kc::engine
