#pragma once

#include "engine/Core.hpp"
#include "engine/PowerMonitor.hpp"
#include "remote/MediaServerClient.hpp"
#include "utils/Cancellation.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kc::utils
{
class Clock;
}

namespace kc::engine
{

class ConfigurationService;
class EventBus;
class PersistenceManager;
class StorageGovernor;
struct ConnectivityChangedEvent;

enum class PumpOutcome
{
    Idle,
    Busy,
    WaitingForNetwork,
    WaitingForPower,
    BackingOff,
    StorageBlocked,
    ReconnectRequired,
    Completed,
    Retrying,
    Requeued,
    FailedTerminal,
    IntegrityFailed,
};

std::string_view to_string(PumpOutcome outcome) noexcept;

// Builds the download queue from the catalog and runs it one transfer at a
// time. pump() blocks for the length of a transfer and belongs on the
// background worker.
class DownloadOrchestrator
{
  public:
    using NetworkStateProvider = std::function<NetworkState()>;
    using PowerProvider = std::function<std::optional<PowerStatus>()>;

    static constexpr std::uint64_t kEstimatedBytesPerMinute = 2ull << 20;
    static constexpr double kProgressPersistStep = 0.05;
    static constexpr std::int64_t kResolvedLogRetentionMs = 24ll * 3600 * 1000;

    DownloadOrchestrator(PersistenceManager *persistence,
                         StorageGovernor *storage, ConfigurationService *config,
                         std::shared_ptr<remote::MediaServerClient> server,
                         std::shared_ptr<utils::Clock> clock, EventBus *bus,
                         NetworkStateProvider network_state,
                         PowerProvider power);

    // Reloads the task log; a task left active by a crash is queued again.
    void load();

    // Admits the highest-priority unwatched entries into the queue until
    // the target window is filled. Returns the number admitted.
    std::size_t admit();

    // Starts the next eligible task if the start conditions hold and runs it
    // to a resolution.
    PumpOutcome pump();

    void on_connectivity_changed(ConnectivityChangedEvent const &event);
    // Drops tasks and files of entries the sync removed.
    void on_catalog_synced(SyncResult const &result);
    // Credentials were renewed; queued work may run again.
    void on_reauthenticated();

    // Item ids that eviction must never touch (the video on screen).
    void set_protected_items(std::vector<std::string> items);

    // Cancels a running transfer without consuming a retry.
    void shutdown();
    void prune_resolved(std::int64_t now_ms);

    DownloadStatusSnapshot snapshot() const;
    std::size_t active_count() const;

  private:
    enum class CancelReason
    {
        None,
        Network,
        Shutdown,
        Removed,
    };

    struct TransferOutcome
    {
        remote::RemoteErrorKind error = remote::RemoteErrorKind::None;
        std::string message;
        std::uint64_t bytes = 0;
        std::optional<std::uint64_t> total_size;
        std::optional<std::string> expected_sha256;
    };

    static bool is_pending(DownloadTask const &task) noexcept;
    std::uint64_t estimate_bytes(CatalogEntry const &entry) const;
    std::int64_t backoff_ms(int retry_count) const;
    std::filesystem::path partial_path(std::string const &item_id) const;
    std::filesystem::path final_path(std::string const &item_id) const;

    std::optional<DownloadTask> next_eligible(std::int64_t now_ms,
                                              bool &backing_off);
    DownloadTask *find_task(std::int64_t id);
    void store_task(DownloadTask const &task);
    void erase_task(std::int64_t id);
    void refresh_partial_bytes();

    TransferOutcome transfer(DownloadTask &task);
    PumpOutcome resolve(DownloadTask task, TransferOutcome const &outcome);
    PumpOutcome complete(DownloadTask task, TransferOutcome const &outcome);
    PumpOutcome fail(DownloadTask task, std::string message, bool terminal);
    bool requeue_fresh(DownloadTask const &old_task);

    PersistenceManager *persistence_;
    StorageGovernor *storage_;
    ConfigurationService *config_;
    std::shared_ptr<remote::MediaServerClient> server_;
    std::shared_ptr<utils::Clock> clock_;
    EventBus *bus_;
    NetworkStateProvider network_state_;
    PowerProvider power_;

    // Held for the whole length of a transfer; at most one is ever active.
    std::mutex transfer_mutex_;

    mutable std::mutex mutex_;
    std::vector<DownloadTask> tasks_;
    std::optional<std::string> active_item_;
    double active_progress_ = 0.0;
    utils::CancellationSource active_cancel_;
    CancelReason cancel_reason_ = CancelReason::None;
    bool storage_blocked_ = false;
    bool reconnect_required_ = false;
    std::vector<std::string> protected_items_;
};

} // namespace kc::engine
