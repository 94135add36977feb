#include "engine/CatalogSynchronizer.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"

#include "remote/MediaServerClient.hpp"
#include "utils/Clock.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <unordered_map>
#include <unordered_set>

namespace kc::engine
{

namespace
{

struct LibraryListing
{
    std::string library_id;
    std::vector<remote::RemoteItem> items;
};

} // namespace

CatalogSynchronizer::CatalogSynchronizer(
    PersistenceManager *persistence,
    std::shared_ptr<remote::MediaServerClient> server,
    std::shared_ptr<utils::Clock> clock, EventBus *bus,
    NetworkStateProvider network_state)
    : persistence_(persistence), server_(std::move(server)),
      clock_(std::move(clock)), bus_(bus),
      network_state_(std::move(network_state))
{
    if (auto stored = persistence_->get_setting(setting_keys::kLastSyncAt))
    {
        std::int64_t value = 0;
        auto const *end = stored->data() + stored->size();
        if (auto [ptr, ec] = std::from_chars(stored->data(), end, value);
            ec == std::errc{} && ptr == end)
        {
            last_sync_at_ = value;
        }
    }
}

std::shared_future<SyncResult>
CatalogSynchronizer::begin(std::vector<std::string> library_ids,
                           AsyncTaskService *worker)
{
    auto promise = std::make_shared<std::promise<SyncResult>>();
    std::shared_future<SyncResult> future;
    utils::CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_)
        {
            KC_LOG_DEBUG("sync: pass already running, joining it");
            return *current_;
        }
        future = promise->get_future().share();
        current_ = future;
        cancel_source_ = utils::CancellationSource{};
        token = cancel_source_.token();
    }

    auto job = [this, promise, libraries = std::move(library_ids), token]
    {
        SyncResult result;
        try
        {
            result = run_pass(libraries, token);
        }
        catch (std::exception const &ex)
        {
            KC_LOG_ERROR("sync: pass aborted: {}", ex.what());
            result.status = SyncStatus::Failed;
            result.message = ex.what();
        }
        finish(result);
        promise->set_value(std::move(result));
    };

    if (worker == nullptr || !worker->submit(job))
    {
        job();
    }
    return future;
}

SyncResult CatalogSynchronizer::sync(std::vector<std::string> const &library_ids)
{
    return begin(library_ids).get();
}

void CatalogSynchronizer::cancel()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_)
    {
        cancel_source_.cancel();
    }
}

bool CatalogSynchronizer::in_progress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

std::optional<SyncResult> CatalogSynchronizer::last_result() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_result_;
}

std::optional<std::int64_t> CatalogSynchronizer::last_sync_at() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sync_at_;
}

bool CatalogSynchronizer::is_due(std::chrono::hours interval) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_sync_at_)
    {
        return true;
    }
    auto const now = utils::to_unix_seconds(clock_->now());
    auto const elapsed = now - *last_sync_at_;
    // A clock set backwards also makes the next pass due.
    return elapsed < 0 ||
           elapsed >= std::chrono::duration_cast<std::chrono::seconds>(interval)
                          .count();
}

void CatalogSynchronizer::finish(SyncResult const &result)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_.reset();
        last_result_ = result;
        if (result.status == SyncStatus::Completed)
        {
            last_sync_at_ = utils::to_unix_seconds(clock_->now());
            persistence_->set_setting(setting_keys::kLastSyncAt,
                                      std::to_string(*last_sync_at_));
        }
    }
    KC_LOG_INFO("sync: {} added={} updated={} removed={}",
                to_string(result.status), result.added.size(),
                result.updated.size(), result.removed.size());
    if (bus_)
    {
        bus_->publish(CatalogSyncedEvent{result});
    }
}

CatalogEntry CatalogSynchronizer::to_entry(remote::RemoteItem const &item,
                                           std::string const &library_id) const
{
    CatalogEntry entry;
    entry.item_id = item.id;
    entry.title = item.title;
    entry.artwork_url = item.artwork_url;
    entry.duration_ticks = item.duration_ticks;
    entry.library_id = item.library_id.empty() ? library_id : item.library_id;
    entry.series_name = item.series_name;
    entry.season_index = item.season_index;
    entry.episode_index = item.episode_index;
    entry.added_at = item.added_at;
    entry.remote_modified_at = item.modified_at;
    return entry;
}

SyncResult
CatalogSynchronizer::run_pass(std::vector<std::string> const &library_ids,
                              utils::CancellationToken const &cancel)
{
    SyncResult result;
    if (network_state_ && network_state_() == NetworkState::None)
    {
        result.status = SyncStatus::Offline;
        return result;
    }
    if (!server_ || !server_->session())
    {
        result.status = SyncStatus::AuthRequired;
        result.message = "not signed in";
        return result;
    }

    // An empty library id lists everything the user can see.
    auto const requested = library_ids.empty()
                               ? std::vector<std::string>{std::string{}}
                               : library_ids;

    std::vector<LibraryListing> listings;
    std::vector<std::string> failed;
    for (auto const &library : requested)
    {
        LibraryListing listing{library, {}};
        bool ok = true;
        int start = 0;
        for (;;)
        {
            if (cancel.is_cancelled())
            {
                result.status = SyncStatus::Cancelled;
                return result;
            }
            auto page = server_->list_items(library, start, kPageSize, cancel);
            if (!page.error.ok())
            {
                switch (page.error.kind)
                {
                case remote::RemoteErrorKind::Cancelled:
                    result.status = SyncStatus::Cancelled;
                    return result;
                case remote::RemoteErrorKind::AuthExpired:
                    result.status = SyncStatus::AuthRequired;
                    result.message = page.error.message;
                    return result;
                default:
                    KC_LOG_WARN("sync: library '{}' listing failed: {}",
                                library, page.error.message);
                    ok = false;
                    break;
                }
                break;
            }
            auto const received = static_cast<int>(page.items.size());
            for (auto &item : page.items)
            {
                listing.items.push_back(std::move(item));
            }
            start += received;
            if (received == 0 || start >= page.total_count)
            {
                break;
            }
        }
        if (ok)
        {
            listings.push_back(std::move(listing));
        }
        else
        {
            failed.push_back(library);
        }
    }

    if (listings.empty())
    {
        result.status = SyncStatus::Failed;
        result.message = "no library could be listed";
        return result;
    }
    if (cancel.is_cancelled())
    {
        result.status = SyncStatus::Cancelled;
        return result;
    }

    std::unordered_map<std::string, CatalogEntry> local;
    for (auto &entry : persistence_->catalog())
    {
        local.emplace(entry.item_id, std::move(entry));
    }

    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> listed_ok;
    bool whole_listing = false;
    for (auto const &listing : listings)
    {
        listed_ok.insert(listing.library_id);
        whole_listing = whole_listing || listing.library_id.empty();
        for (auto const &item : listing.items)
        {
            if (item.id.empty() || !seen.insert(item.id).second)
            {
                continue;
            }
            auto it = local.find(item.id);
            if (it == local.end())
            {
                persistence_->upsert_metadata(to_entry(item, listing.library_id));
                result.added.push_back(item.id);
            }
            else if (item.modified_at > it->second.remote_modified_at)
            {
                persistence_->upsert_metadata(to_entry(item, listing.library_id));
                result.updated.push_back(item.id);
            }
            else if (it->second.missing_passes != 0)
            {
                persistence_->set_missing_passes(item.id, 0);
            }

            // Server-reported progress wins; zero means "not started" there
            // and never overwrites local history.
            if (item.resume_position_ticks && *item.resume_position_ticks > 0)
            {
                auto const resume_ms =
                    *item.resume_position_ticks / kTicksPerMillisecond;
                if (it == local.end() ||
                    it->second.resume_position_ms != resume_ms)
                {
                    persistence_->update_resume_position(item.id, resume_ms);
                }
            }
        }
    }

    std::unordered_set<std::string> const requested_set(requested.begin(),
                                                        requested.end());
    for (auto const &[id, entry] : local)
    {
        if (seen.contains(id))
        {
            continue;
        }
        bool const library_listed =
            whole_listing || listed_ok.contains(entry.library_id);
        bool const library_disabled = !whole_listing &&
                                      !requested_set.contains(entry.library_id);
        if (!library_listed && !library_disabled)
        {
            // Its library failed this pass; absence proves nothing.
            continue;
        }
        int const passes = entry.missing_passes + 1;
        if (passes < kRemovalPasses)
        {
            persistence_->set_missing_passes(id, passes);
            continue;
        }
        if (auto removed = persistence_->remove_entry(id))
        {
            if (removed->local_file_path)
            {
                result.removed_files.emplace_back(*removed->local_file_path);
            }
            result.removed.push_back(id);
        }
    }

    std::sort(result.added.begin(), result.added.end());
    std::sort(result.updated.begin(), result.updated.end());
    std::sort(result.removed.begin(), result.removed.end());
    if (!failed.empty())
    {
        result.message = std::to_string(failed.size()) +
                         " library listing(s) failed and were skipped";
    }
    result.status = SyncStatus::Completed;
    return result;
}

} // namespace kc::engine
