#pragma once

#include "engine/Core.hpp"
#include "utils/Cancellation.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kc::utils
{
class Clock;
}

namespace kc::remote
{
class MediaServerClient;
struct RemoteItem;
} // namespace kc::remote

namespace kc::engine
{

class AsyncTaskService;
class EventBus;
class PersistenceManager;

// Reconciles the local catalog with the server listing. Only one pass runs
// at a time; callers arriving during a pass share its result.
class CatalogSynchronizer
{
  public:
    using NetworkStateProvider = std::function<NetworkState()>;

    // An item must be missing from this many consecutive successful
    // listings of its library before it is removed.
    static constexpr int kRemovalPasses = 2;
    static constexpr int kPageSize = 100;

    CatalogSynchronizer(PersistenceManager *persistence,
                        std::shared_ptr<remote::MediaServerClient> server,
                        std::shared_ptr<utils::Clock> clock, EventBus *bus,
                        NetworkStateProvider network_state);

    // Starts a pass on `worker` (inline when null or stopped), or joins the
    // pass already running. An empty list syncs every library of the user.
    std::shared_future<SyncResult> begin(std::vector<std::string> library_ids,
                                         AsyncTaskService *worker = nullptr);
    SyncResult sync(std::vector<std::string> const &library_ids);

    // Aborts the running pass; it resolves as Cancelled with nothing applied.
    void cancel();

    bool in_progress() const;
    std::optional<SyncResult> last_result() const;
    std::optional<std::int64_t> last_sync_at() const;
    bool is_due(std::chrono::hours interval) const;

  private:
    SyncResult run_pass(std::vector<std::string> const &library_ids,
                        utils::CancellationToken const &cancel);
    void finish(SyncResult const &result);
    CatalogEntry to_entry(remote::RemoteItem const &item,
                          std::string const &library_id) const;

    PersistenceManager *persistence_;
    std::shared_ptr<remote::MediaServerClient> server_;
    std::shared_ptr<utils::Clock> clock_;
    EventBus *bus_;
    NetworkStateProvider network_state_;

    mutable std::mutex mutex_;
    std::optional<std::shared_future<SyncResult>> current_;
    utils::CancellationSource cancel_source_;
    std::optional<SyncResult> last_result_;
    std::optional<std::int64_t> last_sync_at_;
};

} // namespace kc::engine
