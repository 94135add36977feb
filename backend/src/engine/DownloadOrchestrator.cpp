#include "engine/DownloadOrchestrator.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/StorageGovernor.hpp"

#include "utils/Clock.hpp"
#include "utils/Crypto.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace kc::engine
{

namespace
{

// Parent override first, then newest first.
bool higher_priority(CatalogEntry const &a, CatalogEntry const &b)
{
    auto const lowest = std::numeric_limits<int>::min();
    auto const pa = a.priority_override.value_or(lowest);
    auto const pb = b.priority_override.value_or(lowest);
    if (pa != pb)
        return pa > pb;
    if (a.added_at != b.added_at)
        return a.added_at > b.added_at;
    return a.item_id < b.item_id;
}

bool equals_ignore_case(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

void remove_quietly(std::filesystem::path const &path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        KC_LOG_WARN("download: could not delete {}: {}", path.string(),
                    ec.message());
    }
}

} // namespace

std::string_view to_string(PumpOutcome outcome) noexcept
{
    switch (outcome)
    {
    case PumpOutcome::Idle:
        return "idle";
    case PumpOutcome::Busy:
        return "busy";
    case PumpOutcome::WaitingForNetwork:
        return "waiting-for-network";
    case PumpOutcome::WaitingForPower:
        return "waiting-for-power";
    case PumpOutcome::BackingOff:
        return "backing-off";
    case PumpOutcome::StorageBlocked:
        return "storage-blocked";
    case PumpOutcome::ReconnectRequired:
        return "reconnect-required";
    case PumpOutcome::Completed:
        return "completed";
    case PumpOutcome::Retrying:
        return "retrying";
    case PumpOutcome::Requeued:
        return "requeued";
    case PumpOutcome::FailedTerminal:
        return "failed";
    case PumpOutcome::IntegrityFailed:
        return "integrity-failed";
    }
    return "unknown";
}

DownloadOrchestrator::DownloadOrchestrator(
    PersistenceManager *persistence, StorageGovernor *storage,
    ConfigurationService *config,
    std::shared_ptr<remote::MediaServerClient> server,
    std::shared_ptr<utils::Clock> clock, EventBus *bus,
    NetworkStateProvider network_state, PowerProvider power)
    : persistence_(persistence), storage_(storage), config_(config),
      server_(std::move(server)), clock_(std::move(clock)), bus_(bus),
      network_state_(std::move(network_state)), power_(std::move(power))
{
}

bool DownloadOrchestrator::is_pending(DownloadTask const &task) noexcept
{
    return task.is_live() ||
           (task.status == DownloadStatus::Failed && !task.terminal);
}

std::uint64_t
DownloadOrchestrator::estimate_bytes(CatalogEntry const &entry) const
{
    auto const minutes = std::max<std::int64_t>(
        1, (entry.duration_ms() + 59'999) / 60'000);
    return static_cast<std::uint64_t>(minutes) * kEstimatedBytesPerMinute;
}

std::int64_t DownloadOrchestrator::backoff_ms(int retry_count) const
{
    auto const settings = config_->get();
    std::int64_t delay = std::max(1, settings.retry_base_seconds);
    for (int i = 1; i < retry_count && delay < settings.retry_cap_seconds; ++i)
    {
        delay *= 2;
    }
    return std::min<std::int64_t>(delay, settings.retry_cap_seconds) * 1000;
}

std::filesystem::path
DownloadOrchestrator::partial_path(std::string const &item_id) const
{
    return config_->get().download_dir / (item_id + ".part");
}

std::filesystem::path
DownloadOrchestrator::final_path(std::string const &item_id) const
{
    return config_->get().download_dir / (item_id + ".mp4");
}

void DownloadOrchestrator::load()
{
    auto tasks = persistence_->load_tasks();
    auto const total = tasks.size();
    auto const now = utils::to_unix_millis(clock_->now());
    std::unordered_set<std::string> pending_items;
    for (auto &task : tasks)
    {
        if (task.status == DownloadStatus::Active)
        {
            task.status = DownloadStatus::Queued;
            task.updated_at = now;
            persistence_->update_task(task);
        }
        if (is_pending(task))
        {
            pending_items.insert(task.item_id);
        }
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_ = std::move(tasks);
    }

    std::error_code ec;
    auto const dir = config_->get().download_dir;
    if (!dir.empty() && std::filesystem::is_directory(dir, ec))
    {
        for (auto const &file : std::filesystem::directory_iterator(dir, ec))
        {
            auto const &path = file.path();
            if (path.extension() == ".part" &&
                !pending_items.contains(path.stem().string()))
            {
                remove_quietly(path);
            }
        }
    }
    refresh_partial_bytes();
    KC_LOG_INFO("download: loaded {} tasks ({} pending)", total,
                pending_items.size());
}

std::size_t DownloadOrchestrator::admit()
{
    auto const settings = config_->get();
    auto entries = persistence_->catalog();
    auto const now = utils::to_unix_millis(clock_->now());

    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<std::string> pending;
    std::unordered_map<std::string, std::int64_t> terminal_revision;
    for (auto const &task : tasks_)
    {
        if (is_pending(task))
        {
            pending.insert(task.item_id);
        }
        else if (task.terminal)
        {
            auto &revision = terminal_revision[task.item_id];
            revision = std::max(revision, task.remote_modified_at);
        }
    }

    std::int64_t window_ms = 0;
    bool window_empty = true;
    std::vector<CatalogEntry> candidates;
    for (auto &entry : entries)
    {
        if (entry.watched)
        {
            continue;
        }
        if (entry.is_downloaded() || pending.contains(entry.item_id))
        {
            window_ms += entry.duration_ms();
            window_empty = false;
            continue;
        }
        auto failed = terminal_revision.find(entry.item_id);
        if (failed != terminal_revision.end() &&
            failed->second >= entry.remote_modified_at)
        {
            continue;
        }
        candidates.push_back(std::move(entry));
    }
    std::sort(candidates.begin(), candidates.end(), higher_priority);

    auto const window_min =
        static_cast<std::int64_t>(settings.target_window_min_minutes) * 60'000;
    auto const window_max =
        static_cast<std::int64_t>(settings.target_window_max_minutes) * 60'000;
    std::size_t admitted = 0;
    int rank = 0;
    for (auto const &entry : candidates)
    {
        ++rank;
        if (admitted >= static_cast<std::size_t>(settings.max_admissions_per_pass) ||
            window_ms >= window_min)
        {
            break;
        }
        auto const duration = entry.duration_ms();
        bool const fits = window_ms + duration <= window_max;
        // A single long film still gets downloaded when nothing else is.
        bool const lone = window_empty && admitted == 0;
        if (!fits && !lone)
        {
            continue;
        }
        DownloadTask task;
        task.item_id = entry.item_id;
        task.status = DownloadStatus::Queued;
        task.priority_rank = rank;
        task.expected_bytes = estimate_bytes(entry);
        task.remote_modified_at = entry.remote_modified_at;
        task.updated_at = now;
        auto id = persistence_->insert_task(task);
        if (!id)
        {
            continue;
        }
        task.id = *id;
        tasks_.push_back(std::move(task));
        window_ms += duration;
        window_empty = false;
        ++admitted;
        KC_LOG_INFO("download: admitted {} '{}'", entry.item_id, entry.title);
    }
    if (admitted > 0)
    {
        KC_LOG_INFO("download: admission pass queued {} (window {} min)",
                    admitted, window_ms / 60'000);
    }
    return admitted;
}

std::optional<DownloadTask>
DownloadOrchestrator::next_eligible(std::int64_t now_ms, bool &backing_off)
{
    std::unordered_map<std::string, CatalogEntry> entries;
    for (auto &entry : persistence_->catalog())
    {
        entries.emplace(entry.item_id, std::move(entry));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::int64_t> orphaned;
    DownloadTask const *best = nullptr;
    CatalogEntry const *best_entry = nullptr;
    backing_off = false;
    for (auto const &task : tasks_)
    {
        if (!is_pending(task))
        {
            continue;
        }
        auto it = entries.find(task.item_id);
        if (it == entries.end())
        {
            orphaned.push_back(task.id);
            continue;
        }
        if (task.next_attempt_at > now_ms)
        {
            backing_off = true;
            continue;
        }
        if (best == nullptr || higher_priority(it->second, *best_entry))
        {
            best = &task;
            best_entry = &it->second;
        }
    }
    std::optional<DownloadTask> result;
    if (best != nullptr)
    {
        result = *best;
    }
    for (auto id : orphaned)
    {
        auto task = find_task(id);
        KC_LOG_INFO("download: dropping task {} for removed entry {}", id,
                    task->item_id);
        remove_quietly(partial_path(task->item_id));
        persistence_->delete_task(id);
        std::erase_if(tasks_, [id](DownloadTask const &t) { return t.id == id; });
    }
    return result;
}

DownloadTask *DownloadOrchestrator::find_task(std::int64_t id)
{
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [id](DownloadTask const &t) { return t.id == id; });
    return it == tasks_.end() ? nullptr : &*it;
}

void DownloadOrchestrator::store_task(DownloadTask const &task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto *slot = find_task(task.id))
        {
            *slot = task;
        }
        else
        {
            tasks_.push_back(task);
        }
    }
    persistence_->update_task(task);
}

void DownloadOrchestrator::erase_task(std::int64_t id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(tasks_, [id](DownloadTask const &t) { return t.id == id; });
    }
    persistence_->delete_task(id);
}

void DownloadOrchestrator::refresh_partial_bytes()
{
    std::uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto const &task : tasks_)
        {
            if (is_pending(task))
            {
                total += task.bytes_transferred;
            }
        }
    }
    storage_->set_partial_bytes(total);
}

PumpOutcome DownloadOrchestrator::pump()
{
    std::unique_lock<std::mutex> transfer_lock(transfer_mutex_,
                                               std::try_to_lock);
    if (!transfer_lock.owns_lock())
    {
        return PumpOutcome::Busy;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reconnect_required_)
        {
            return PumpOutcome::ReconnectRequired;
        }
    }
    if (!network_state_ || network_state_() != NetworkState::Unmetered)
    {
        return PumpOutcome::WaitingForNetwork;
    }
    auto const settings = config_->get();
    auto const power = power_ ? power_() : std::nullopt;
    if (!power_allows_background_work(power, settings.battery_threshold_percent))
    {
        return PumpOutcome::WaitingForPower;
    }

    auto const now = utils::to_unix_millis(clock_->now());
    bool backing_off = false;
    auto next = next_eligible(now, backing_off);
    if (!next)
    {
        return backing_off ? PumpOutcome::BackingOff : PumpOutcome::Idle;
    }
    auto task = std::move(*next);

    if (auto entry = persistence_->entry(task.item_id);
        entry && entry->is_downloaded())
    {
        task.status = DownloadStatus::Completed;
        task.updated_at = now;
        store_task(task);
        return PumpOutcome::Completed;
    }

    auto const needed = task.expected_bytes > task.bytes_transferred
                            ? task.expected_bytes - task.bytes_transferred
                            : 0;
    if (!storage_->has_headroom(needed))
    {
        std::vector<std::string> keep;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            keep = protected_items_;
        }
        auto eviction = storage_->evict_to_free(needed, keep);
        if (eviction.blocked)
        {
            bool first_in_window = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                first_in_window = !storage_blocked_;
                storage_blocked_ = true;
            }
            if (first_in_window && bus_)
            {
                bus_->publish(StorageBlockedEvent{needed,
                                                  storage_->consumed_bytes()});
            }
            return PumpOutcome::StorageBlocked;
        }
    }

    task.status = DownloadStatus::Active;
    task.last_error.clear();
    task.updated_at = now;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        storage_blocked_ = false;
        active_item_ = task.item_id;
        active_progress_ = task.total_bytes > 0
                               ? static_cast<double>(task.bytes_transferred) /
                                     static_cast<double>(task.total_bytes)
                               : 0.0;
        active_cancel_ = utils::CancellationSource{};
        cancel_reason_ = CancelReason::None;
    }
    store_task(task);

    // The link may have dropped between the gate and the cancel source.
    if (network_state_() != NetworkState::Unmetered)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_reason_ = CancelReason::Network;
        active_cancel_.cancel();
    }

    KC_LOG_INFO("download: starting {} at offset {}", task.item_id,
                task.bytes_transferred);
    auto outcome = transfer(task);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_item_.reset();
        active_progress_ = 0.0;
    }
    auto result = resolve(std::move(task), outcome);
    refresh_partial_bytes();
    return result;
}

DownloadOrchestrator::TransferOutcome
DownloadOrchestrator::transfer(DownloadTask &task)
{
    TransferOutcome outcome;
    auto const part = partial_path(task.item_id);
    std::error_code ec;
    std::filesystem::create_directories(part.parent_path(), ec);

    std::uint64_t offset = 0;
    if (std::filesystem::is_regular_file(part, ec))
    {
        offset = std::filesystem::file_size(part, ec);
        if (ec)
        {
            offset = 0;
        }
    }
    if (task.total_bytes > 0 && offset > task.total_bytes)
    {
        KC_LOG_WARN("download: partial file for {} is larger than the item, "
                    "restarting",
                    task.item_id);
        remove_quietly(part);
        offset = 0;
    }
    task.bytes_transferred = offset;

    // Every byte landed before the last attempt ended; only verification is
    // left.
    if (task.total_bytes > 0 && offset == task.total_bytes)
    {
        KC_LOG_INFO("download: {} already complete on disk", task.item_id);
        outcome.bytes = offset;
        outcome.total_size = task.total_bytes;
        return outcome;
    }

    std::ofstream out(part, std::ios::binary | std::ios::app);
    if (!out)
    {
        outcome.error = remote::RemoteErrorKind::Transient;
        outcome.message = "cannot open " + part.string();
        return outcome;
    }

    utils::CancellationToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = active_cancel_.token();
    }

    double last_persisted = 0.0;
    bool write_failed = false;
    auto progress_of = [&task]
    {
        return task.total_bytes > 0
                   ? std::min(1.0, static_cast<double>(task.bytes_transferred) /
                                       static_cast<double>(task.total_bytes))
                   : 0.0;
    };

    remote::DownloadRequest request;
    request.item_id = task.item_id;
    request.offset = offset;
    request.cancel = token;
    request.on_start = [&](remote::DownloadStart const &start)
    {
        if (offset > 0 && !start.range_honoured)
        {
            KC_LOG_INFO("download: server ignored range for {}, restarting "
                        "from zero",
                        task.item_id);
            out.close();
            out.open(part, std::ios::binary | std::ios::trunc);
            task.bytes_transferred = 0;
            offset = 0;
        }
        if (start.total_size)
        {
            task.total_bytes = *start.total_size;
            task.expected_bytes = *start.total_size;
        }
        last_persisted = progress_of();
    };
    request.on_data = [&](std::span<char const> chunk)
    {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out)
        {
            write_failed = true;
            return false;
        }
        task.bytes_transferred += chunk.size();
        auto const progress = progress_of();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_progress_ = progress;
            if (auto *slot = find_task(task.id))
            {
                slot->bytes_transferred = task.bytes_transferred;
                slot->total_bytes = task.total_bytes;
            }
        }
        if (progress - last_persisted >= kProgressPersistStep)
        {
            last_persisted = progress;
            out.flush();
            persistence_->update_task(task);
            persistence_->update_download_fields(task.item_id, std::nullopt,
                                                 progress, 0, {}, 0);
            refresh_partial_bytes();
        }
        return !token.is_cancelled();
    };

    auto result = server_->download(request);
    out.close();

    if (result.error.kind == remote::RemoteErrorKind::RangeNotSatisfiable)
    {
        if (offset > 0 && result.total_size && offset == *result.total_size)
        {
            task.total_bytes = *result.total_size;
            task.expected_bytes = *result.total_size;
            outcome.bytes = offset;
            outcome.total_size = result.total_size;
            return outcome;
        }
        KC_LOG_WARN("download: server rejected offset {} for {}, restarting "
                    "from zero",
                    offset, task.item_id);
        remove_quietly(part);
        task.bytes_transferred = 0;
        outcome.error = remote::RemoteErrorKind::Transient;
        outcome.message = "resume offset rejected";
        return outcome;
    }

    outcome.error = result.error.kind;
    outcome.message = result.error.message;
    outcome.bytes = task.bytes_transferred;
    outcome.total_size =
        result.total_size ? result.total_size
                          : (task.total_bytes > 0
                                 ? std::optional<std::uint64_t>(task.total_bytes)
                                 : std::nullopt);
    outcome.expected_sha256 = result.sha256;
    if (write_failed)
    {
        outcome.error = remote::RemoteErrorKind::Transient;
        outcome.message = "write to " + part.string() + " failed";
    }
    else if (outcome.error == remote::RemoteErrorKind::None &&
             token.is_cancelled())
    {
        outcome.error = remote::RemoteErrorKind::Cancelled;
    }
    return outcome;
}

PumpOutcome DownloadOrchestrator::resolve(DownloadTask task,
                                          TransferOutcome const &outcome)
{
    using remote::RemoteErrorKind;
    switch (outcome.error)
    {
    case RemoteErrorKind::None:
        return complete(std::move(task), outcome);
    case RemoteErrorKind::Cancelled:
    {
        CancelReason reason = CancelReason::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reason = cancel_reason_;
        }
        if (reason == CancelReason::Shutdown)
        {
            task.status = DownloadStatus::Queued;
            task.updated_at = utils::to_unix_millis(clock_->now());
            store_task(task);
            return PumpOutcome::Requeued;
        }
        if (reason == CancelReason::Removed)
        {
            remove_quietly(partial_path(task.item_id));
            erase_task(task.id);
            return PumpOutcome::Idle;
        }
        return fail(std::move(task), "connection lost", false);
    }
    case RemoteErrorKind::AuthExpired:
    {
        task.status = DownloadStatus::Queued;
        task.updated_at = utils::to_unix_millis(clock_->now());
        store_task(task);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reconnect_required_ = true;
        }
        KC_LOG_WARN("download: credentials rejected, pausing until reconnect");
        if (bus_)
        {
            bus_->publish(ReconnectRequiredEvent{outcome.message});
        }
        return PumpOutcome::ReconnectRequired;
    }
    case RemoteErrorKind::NotFound:
        return fail(std::move(task), outcome.message, true);
    default:
        return fail(std::move(task), outcome.message, false);
    }
}

PumpOutcome DownloadOrchestrator::complete(DownloadTask task,
                                           TransferOutcome const &outcome)
{
    auto const part = partial_path(task.item_id);
    std::error_code ec;
    auto const size = std::filesystem::file_size(part, ec);
    if (ec)
    {
        return fail(std::move(task), "partial file vanished", false);
    }
    auto digest = crypto::sha256_file_hex(part);
    if (!digest)
    {
        return fail(std::move(task), "could not hash downloaded file", false);
    }

    bool const size_ok = !outcome.total_size || size == *outcome.total_size;
    bool const checksum_ok = !outcome.expected_sha256 ||
                             equals_ignore_case(*digest, *outcome.expected_sha256);
    if (!size_ok || !checksum_ok)
    {
        KC_LOG_WARN("download: integrity check failed for {} (size {} of {}, "
                    "checksum {})",
                    task.item_id, size, outcome.total_size.value_or(0),
                    checksum_ok ? "ok" : "mismatch");
        remove_quietly(part);
        erase_task(task.id);
        requeue_fresh(task);
        return PumpOutcome::IntegrityFailed;
    }

    if (!persistence_->entry(task.item_id))
    {
        remove_quietly(part);
        erase_task(task.id);
        return PumpOutcome::Idle;
    }

    auto const target = final_path(task.item_id);
    std::filesystem::rename(part, target, ec);
    if (ec)
    {
        return fail(std::move(task), "rename failed: " + ec.message(), false);
    }

    auto const now = utils::to_unix_millis(clock_->now());
    persistence_->update_download_fields(task.item_id, target.string(), 1.0,
                                         size, *digest, now);
    task.status = DownloadStatus::Completed;
    task.terminal = false;
    task.bytes_transferred = size;
    task.total_bytes = size;
    task.updated_at = now;
    store_task(task);
    KC_LOG_INFO("download: completed {} ({} bytes)", task.item_id, size);
    if (bus_)
    {
        bus_->publish(DownloadCompletedEvent{task.item_id, size});
    }
    return PumpOutcome::Completed;
}

PumpOutcome DownloadOrchestrator::fail(DownloadTask task, std::string message,
                                       bool terminal)
{
    auto const now = utils::to_unix_millis(clock_->now());
    auto const max_retries = config_->get().max_download_retries;
    task.last_error = std::move(message);
    task.updated_at = now;
    task.status = DownloadStatus::Failed;
    if (!terminal)
    {
        ++task.retry_count;
    }
    if (terminal || task.retry_count > max_retries)
    {
        task.terminal = true;
        task.bytes_transferred = 0;
        remove_quietly(partial_path(task.item_id));
        store_task(task);
        persistence_->update_download_fields(task.item_id, std::nullopt, 0.0, 0,
                                             {}, 0);
        KC_LOG_WARN("download: {} failed permanently after {} retries: {}",
                    task.item_id, task.retry_count, task.last_error);
        if (bus_)
        {
            bus_->publish(DownloadFailedEvent{task.item_id, task.last_error});
        }
        return PumpOutcome::FailedTerminal;
    }
    task.terminal = false;
    task.next_attempt_at = now + backoff_ms(task.retry_count);
    store_task(task);
    KC_LOG_INFO("download: {} failed ({}), retry {} in {} s", task.item_id,
                task.last_error, task.retry_count,
                (task.next_attempt_at - now) / 1000);
    return PumpOutcome::Retrying;
}

bool DownloadOrchestrator::requeue_fresh(DownloadTask const &old_task)
{
    DownloadTask fresh;
    fresh.item_id = old_task.item_id;
    fresh.status = DownloadStatus::Queued;
    fresh.priority_rank = old_task.priority_rank;
    fresh.expected_bytes = old_task.expected_bytes;
    fresh.remote_modified_at = old_task.remote_modified_at;
    auto const now = utils::to_unix_millis(clock_->now());
    fresh.updated_at = now;
    fresh.next_attempt_at = now + backoff_ms(1);
    auto id = persistence_->insert_task(fresh);
    if (!id)
    {
        return false;
    }
    fresh.id = *id;
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(fresh));
    return true;
}

void DownloadOrchestrator::on_connectivity_changed(
    ConnectivityChangedEvent const &event)
{
    if (event.current == NetworkState::Unmetered)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_item_)
    {
        KC_LOG_INFO("download: network now {}, interrupting {}",
                    to_string(event.current), *active_item_);
        cancel_reason_ = CancelReason::Network;
        active_cancel_.cancel();
    }
}

void DownloadOrchestrator::on_catalog_synced(SyncResult const &result)
{
    if (result.removed.empty())
    {
        return;
    }
    std::unordered_set<std::string> const removed(result.removed.begin(),
                                                  result.removed.end());
    std::vector<std::int64_t> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_item_ && removed.contains(*active_item_))
        {
            cancel_reason_ = CancelReason::Removed;
            active_cancel_.cancel();
        }
        for (auto const &task : tasks_)
        {
            bool const active = active_item_ && *active_item_ == task.item_id;
            if (removed.contains(task.item_id) && !active)
            {
                dropped.push_back(task.id);
            }
        }
        std::erase_if(tasks_,
                      [&](DownloadTask const &t)
                      {
                          return std::find(dropped.begin(), dropped.end(),
                                           t.id) != dropped.end();
                      });
    }
    for (auto const &item : result.removed)
    {
        remove_quietly(partial_path(item));
    }
    for (auto const &file : result.removed_files)
    {
        remove_quietly(file);
    }
    refresh_partial_bytes();
    KC_LOG_INFO("download: cleaned up {} removed entries ({} files, {} tasks)",
                result.removed.size(), result.removed_files.size(),
                dropped.size());
}

void DownloadOrchestrator::on_reauthenticated()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_required_ = false;
}

void DownloadOrchestrator::set_protected_items(std::vector<std::string> items)
{
    std::lock_guard<std::mutex> lock(mutex_);
    protected_items_ = std::move(items);
}

void DownloadOrchestrator::shutdown()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_item_)
    {
        cancel_reason_ = CancelReason::Shutdown;
        active_cancel_.cancel();
    }
}

void DownloadOrchestrator::prune_resolved(std::int64_t now_ms)
{
    auto const cutoff = now_ms - kResolvedLogRetentionMs;
    std::size_t pruned = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pruned = std::erase_if(tasks_,
                               [cutoff](DownloadTask const &t)
                               {
                                   bool const resolved =
                                       t.status == DownloadStatus::Completed ||
                                       t.terminal;
                                   return resolved && t.updated_at < cutoff;
                               });
    }
    persistence_->prune_resolved_tasks(cutoff);
    if (pruned > 0)
    {
        KC_LOG_DEBUG("download: pruned {} resolved tasks", pruned);
    }
}

DownloadStatusSnapshot DownloadOrchestrator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    DownloadStatusSnapshot snap;
    snap.tasks = tasks_;
    snap.active_item = active_item_;
    snap.active_progress = active_progress_;
    snap.storage_blocked = storage_blocked_;
    snap.reconnect_required = reconnect_required_;
    return snap;
}

std::size_t DownloadOrchestrator::active_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(tasks_.begin(), tasks_.end(),
                      [](DownloadTask const &t)
                      { return t.status == DownloadStatus::Active; }));
}

} // namespace kc::engine
