#include "engine/PlaybackContinuityManager.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/MediaPlayer.hpp"
#include "engine/PersistenceManager.hpp"
#include "engine/ScreenTimeGovernor.hpp"
#include "engine/StorageGovernor.hpp"

#include "remote/MediaServerClient.hpp"
#include "utils/Clock.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <exception>
#include <tuple>

namespace kc::engine
{

PlaybackContinuityManager::PlaybackContinuityManager(Collaborators collaborators)
    : c_(std::move(collaborators))
{
}

void PlaybackContinuityManager::subscribe(Listener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

PlaybackSession PlaybackContinuityManager::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

PlaybackContinuityManager::EffectsLock::EffectsLock(
    PlaybackContinuityManager &owner, Effects &fx)
    : owner_(owner), fx_(fx), lock_(owner.mutex_),
      exceptions_(std::uncaught_exceptions())
{
}

PlaybackContinuityManager::EffectsLock::~EffectsLock()
{
    // A block left by an exception never reaches apply(); numbering its
    // batch would stall every later one.
    if (!fx_.empty() && std::uncaught_exceptions() == exceptions_)
    {
        fx_.sequence = ++owner_.issued_batches_;
    }
}

void PlaybackContinuityManager::apply(Effects &fx)
{
    if (fx.sequence == 0)
    {
        return;
    }
    bool nested = false;
    {
        std::unique_lock<std::mutex> order(apply_mutex_);
        nested = applying_thread_ == std::this_thread::get_id();
        if (!nested)
        {
            apply_cv_.wait(order, [&] { return next_apply_ == fx.sequence; });
            applying_thread_ = std::this_thread::get_id();
        }
    }
    try
    {
        run_effects(fx);
    }
    catch (...)
    {
        finish_batch(fx.sequence, nested);
        throw;
    }
    finish_batch(fx.sequence, nested);
}

void PlaybackContinuityManager::run_effects(Effects &fx)
{
    if (c_.player)
    {
        for (auto &command : fx.player)
        {
            command(*c_.player);
        }
    }
    for (auto &job : fx.deferred)
    {
        job();
    }
    if (!fx.notify)
    {
        return;
    }
    PlaybackSession snapshot;
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = session_;
        listeners = listeners_;
    }
    for (auto const &listener : listeners)
    {
        listener(snapshot);
    }
}

void PlaybackContinuityManager::finish_batch(std::uint64_t sequence,
                                             bool nested)
{
    {
        std::lock_guard<std::mutex> order(apply_mutex_);
        if (nested)
        {
            // Runs ahead of its number; skipped when the turn comes.
            finished_early_.push_back(sequence);
            return;
        }
        applying_thread_ = std::thread::id{};
        ++next_apply_;
        for (auto it = std::find(finished_early_.begin(), finished_early_.end(),
                                 next_apply_);
             it != finished_early_.end();
             it = std::find(finished_early_.begin(), finished_early_.end(),
                            next_apply_))
        {
            finished_early_.erase(it);
            ++next_apply_;
        }
    }
    apply_cv_.notify_all();
}

bool PlaybackContinuityManager::is_active_locked() const noexcept
{
    switch (session_.state)
    {
    case PlaybackState::Loading:
    case PlaybackState::Playing:
    case PlaybackState::Buffering:
    case PlaybackState::Paused:
        return true;
    default:
        return false;
    }
}

void PlaybackContinuityManager::start_accrual_locked()
{
    accrual_since_ = c_.clock->steady_now();
}

void PlaybackContinuityManager::accrue_locked(SteadyTime now)
{
    if (!accrual_since_)
    {
        return;
    }
    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now - *accrual_since_)
                             .count();
    accrual_since_ = now;
    if (elapsed <= 0)
    {
        return;
    }
    accrued_ms_ += elapsed;
    auto const seconds = accrued_ms_ / 1000;
    if (seconds > 0 && c_.screen_time)
    {
        accrued_ms_ -= seconds * 1000;
        c_.screen_time->tick(seconds);
    }
}

std::optional<PlaybackSource>
PlaybackContinuityManager::local_source_locked(CatalogEntry const &entry)
{
    if (!entry.local_file_path)
    {
        return std::nullopt;
    }
    if (c_.storage && !c_.storage->verify_entry(entry))
    {
        KC_LOG_WARN("playback: local copy of {} failed verification",
                    entry.item_id);
        return std::nullopt;
    }
    return PlaybackSource{SourceMode::Local, *entry.local_file_path};
}

std::optional<PlaybackSource>
PlaybackContinuityManager::stream_source_locked(CatalogEntry const &entry)
{
    if (!c_.server || !c_.network_state ||
        c_.network_state() == NetworkState::None)
    {
        return std::nullopt;
    }
    return PlaybackSource{SourceMode::Streaming,
                          c_.server->stream_url(entry.item_id)};
}

void PlaybackContinuityManager::begin_session_locked(CatalogEntry entry,
                                                     Effects &fx)
{
    auto const generation = session_.load_generation + 1;
    session_ = PlaybackSession{};
    session_.entry = std::move(entry);
    session_.load_generation = generation;
    resume_applied_ = false;
    countdown_deadline_.reset();
    accrual_since_.reset();
    begin_load_locked(fx, 0);
}

void PlaybackContinuityManager::begin_load_locked(Effects &fx,
                                                  std::int64_t start_ms)
{
    fx.notify = true;
    auto &entry = *session_.entry;
    // Pick up a download that finished since the session was created.
    if (c_.persistence)
    {
        if (auto fresh = c_.persistence->entry(entry.item_id))
        {
            entry = std::move(*fresh);
        }
    }
    session_.error = PlaybackError::None;
    session_.buffering = false;
    session_.autoplay_countdown_seconds.reset();
    session_.pending_next_id.reset();

    if (auto reason = restriction_locked())
    {
        enter_restricted_locked(fx, *reason);
        return;
    }

    auto source = local_source_locked(entry);
    if (!source)
    {
        source = stream_source_locked(entry);
    }
    if (!source)
    {
        KC_LOG_INFO("playback: {} is not available offline", entry.item_id);
        session_.state = PlaybackState::Error;
        session_.error = PlaybackError::NotAvailableOffline;
        fx.player.push_back([](MediaPlayer &p) { p.stop(); });
        return;
    }

    session_.state = PlaybackState::Loading;
    session_.source_mode = source->mode;
    session_.position_ms = start_ms;
    if (session_.duration_ms == 0)
    {
        session_.duration_ms = entry.duration_ms();
    }
    KC_LOG_INFO("playback: loading {} from {}", entry.item_id,
                source->mode == SourceMode::Local ? "local file" : "stream");
    fx.player.push_back([src = *source, start_ms](MediaPlayer &p)
                        { p.open(src, start_ms); });
}

std::optional<PlaybackState> PlaybackContinuityManager::restriction_locked() const
{
    if (!c_.screen_time)
    {
        return std::nullopt;
    }
    if (c_.screen_time->is_limit_reached())
    {
        return PlaybackState::TimeLimitReached;
    }
    if (c_.screen_time->is_outside_schedule())
    {
        return PlaybackState::OutsideSchedule;
    }
    return std::nullopt;
}

void PlaybackContinuityManager::enter_restricted_locked(Effects &fx,
                                                        PlaybackState reason)
{
    if (session_.state == PlaybackState::Playing ||
        session_.state == PlaybackState::Buffering)
    {
        accrue_locked(c_.clock->steady_now());
        fx.player.push_back([](MediaPlayer &p) { p.pause(); });
    }
    accrual_since_.reset();
    save_position_locked();
    session_.state = reason;
    session_.autoplay_countdown_seconds.reset();
    countdown_deadline_.reset();
    fx.notify = true;
    if (reason == PlaybackState::OutsideSchedule)
    {
        KC_LOG_INFO("playback: outside the allowed viewing hours");
        if (c_.bus && c_.screen_time)
        {
            fx.deferred.push_back(
                [bus = c_.bus, schedule = c_.screen_time->access_schedule()]
                { bus->publish(OutsideScheduleEvent{schedule}); });
        }
        return;
    }
    KC_LOG_INFO("playback: screen time limit reached");
    if (c_.bus)
    {
        int used = 0;
        if (c_.screen_time)
        {
            used = c_.screen_time->state().used_minutes();
        }
        fx.deferred.push_back([bus = c_.bus, used]
                              { bus->publish(ScreenTimeLimitReachedEvent{used}); });
    }
}

bool PlaybackContinuityManager::select_video(std::string const &item_id,
                                             std::vector<std::string> context)
{
    auto entry = c_.persistence ? c_.persistence->entry(item_id) : std::nullopt;
    if (!entry)
    {
        KC_LOG_WARN("playback: unknown item {}", item_id);
        return false;
    }
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (session_.entry && is_active_locked())
        {
            finish_current_locked(fx, false);
        }
        context_ = std::move(context);
        begin_session_locked(std::move(*entry), fx);
    }
    apply(fx);
    return true;
}

void PlaybackContinuityManager::on_player_ready(std::int64_t duration_ms)
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (session_.state != PlaybackState::Loading || !session_.entry)
        {
            return;
        }
        if (duration_ms > 0)
        {
            session_.duration_ms = duration_ms;
        }
        auto const resume = session_.entry->resume_position_ms;
        if (!resume_applied_)
        {
            resume_applied_ = true;
            auto const cutoff = static_cast<std::int64_t>(
                static_cast<double>(session_.duration_ms) * kResumeCutoffFraction);
            if (resume > 0 && (session_.duration_ms == 0 || resume < cutoff))
            {
                session_.position_ms = resume;
                fx.player.push_back([resume](MediaPlayer &p) { p.seek(resume); });
                KC_LOG_DEBUG("playback: resuming {} at {} ms",
                             session_.entry->item_id, resume);
            }
        }
        session_.state = PlaybackState::Playing;
        last_save_ = c_.clock->steady_now();
        start_accrual_locked();
        fx.player.push_back([](MediaPlayer &p) { p.play(); });
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::on_player_buffering(bool buffering)
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        session_.buffering = buffering;
        if (buffering && session_.state == PlaybackState::Playing)
        {
            session_.state = PlaybackState::Buffering;
            fx.notify = true;
        }
        else if (!buffering && session_.state == PlaybackState::Buffering)
        {
            session_.state = PlaybackState::Playing;
            fx.notify = true;
        }
    }
    apply(fx);
}

void PlaybackContinuityManager::on_player_position(std::int64_t position_ms)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_active_locked() && position_ms >= 0)
    {
        session_.position_ms = position_ms;
    }
}

void PlaybackContinuityManager::on_player_ended()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry || !is_active_locked())
        {
            return;
        }
        session_.position_ms = std::max(session_.position_ms, session_.duration_ms);
        finish_current_locked(fx, true);
        session_.state = PlaybackState::Ended;
        fx.notify = true;

        auto const settings = c_.config ? c_.config->get() : CoreSettings{};
        auto next = next_entry_locked();
        if (next)
        {
            session_.pending_next_id = next->item_id;
        }
        if (next && settings.autoplay_enabled)
        {
            auto const seconds = std::max(0, settings.autoplay_countdown_seconds);
            session_.autoplay_countdown_seconds = seconds;
            countdown_deadline_ =
                c_.clock->steady_now() + std::chrono::seconds(seconds);
        }
    }
    apply(fx);
}

void PlaybackContinuityManager::on_player_error(std::string const &message)
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry || !is_active_locked())
        {
            return;
        }
        KC_LOG_WARN("playback: renderer error on {}: {}",
                    session_.entry->item_id, message);
        auto const position = session_.position_ms;
        std::optional<PlaybackSource> fallback;
        if (session_.source_mode == SourceMode::Streaming)
        {
            if (c_.persistence)
            {
                if (auto fresh = c_.persistence->entry(session_.entry->item_id))
                {
                    *session_.entry = std::move(*fresh);
                }
            }
            fallback = local_source_locked(*session_.entry);
        }
        else
        {
            fallback = stream_source_locked(*session_.entry);
        }
        if (fallback)
        {
            session_.source_mode = fallback->mode;
            fx.player.push_back([src = *fallback, position](MediaPlayer &p)
                                { p.switch_source(src, position); });
        }
        else
        {
            accrue_locked(c_.clock->steady_now());
            accrual_since_.reset();
            save_position_locked();
            session_.state = PlaybackState::Error;
            session_.error = PlaybackError::StreamFailed;
            fx.player.push_back([](MediaPlayer &p) { p.pause(); });
        }
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::on_connectivity_changed(
    ConnectivityChangedEvent const &event)
{
    if (event.current != NetworkState::None)
    {
        return;
    }
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry || !is_active_locked() ||
            session_.source_mode != SourceMode::Streaming)
        {
            return;
        }
        if (c_.persistence)
        {
            if (auto fresh = c_.persistence->entry(session_.entry->item_id))
            {
                *session_.entry = std::move(*fresh);
            }
        }
        auto const position = session_.position_ms;
        if (auto local = local_source_locked(*session_.entry))
        {
            // Same session, same clock; only the byte source changes.
            KC_LOG_INFO("playback: offline, switching {} to local copy",
                        session_.entry->item_id);
            session_.source_mode = SourceMode::Local;
            fx.player.push_back([src = *local, position](MediaPlayer &p)
                                { p.switch_source(src, position); });
        }
        else
        {
            KC_LOG_INFO("playback: offline while streaming {}",
                        session_.entry->item_id);
            accrue_locked(c_.clock->steady_now());
            accrual_since_.reset();
            save_position_locked();
            session_.state = PlaybackState::Error;
            session_.error = PlaybackError::StreamInterrupted;
            fx.player.push_back([](MediaPlayer &p) { p.pause(); });
        }
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::pause()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (session_.state != PlaybackState::Playing &&
            session_.state != PlaybackState::Buffering)
        {
            return;
        }
        accrue_locked(c_.clock->steady_now());
        accrual_since_.reset();
        session_.state = PlaybackState::Paused;
        save_position_locked();
        fx.player.push_back([](MediaPlayer &p) { p.pause(); });
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::resume()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        bool const paused = session_.state == PlaybackState::Paused;
        bool const limited = session_.state == PlaybackState::TimeLimitReached ||
                             session_.state == PlaybackState::OutsideSchedule;
        if (!session_.entry || (!paused && !limited))
        {
            return;
        }
        if (auto reason = restriction_locked())
        {
            if (paused || *reason != session_.state)
            {
                enter_restricted_locked(fx, *reason);
            }
        }
        else if (limited && !resume_applied_)
        {
            // Never got as far as loading.
            begin_load_locked(fx, session_.position_ms);
        }
        else
        {
            session_.state = PlaybackState::Playing;
            start_accrual_locked();
            last_save_ = c_.clock->steady_now();
            fx.player.push_back([](MediaPlayer &p) { p.play(); });
            fx.notify = true;
        }
    }
    apply(fx);
}

void PlaybackContinuityManager::skip()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry)
        {
            return;
        }
        auto next = next_entry_locked();
        if (is_active_locked())
        {
            finish_current_locked(fx, false);
        }
        if (!next)
        {
            fx.player.push_back([](MediaPlayer &p) { p.stop(); });
            clear_session_locked();
            fx.notify = true;
        }
        else
        {
            begin_session_locked(std::move(*next), fx);
        }
    }
    apply(fx);
}

void PlaybackContinuityManager::retry()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry || session_.state != PlaybackState::Error)
        {
            return;
        }
        // Same session: the resume seek has already been spent.
        begin_load_locked(fx, session_.position_ms);
    }
    apply(fx);
}

void PlaybackContinuityManager::stop()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!session_.entry)
        {
            return;
        }
        if (is_active_locked())
        {
            finish_current_locked(fx, false);
        }
        fx.player.push_back([](MediaPlayer &p) { p.stop(); });
        clear_session_locked();
        context_.clear();
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::user_interaction()
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (!countdown_deadline_)
        {
            return;
        }
        KC_LOG_DEBUG("playback: autoplay countdown cancelled");
        countdown_deadline_.reset();
        session_.autoplay_countdown_seconds.reset();
        fx.notify = true;
    }
    apply(fx);
}

void PlaybackContinuityManager::tick(SteadyTime now)
{
    Effects fx;
    {
        EffectsLock lock(*this, fx);
        if (countdown_deadline_)
        {
            if (now >= *countdown_deadline_)
            {
                countdown_deadline_.reset();
                std::optional<CatalogEntry> next;
                if (session_.pending_next_id && c_.persistence)
                {
                    next = c_.persistence->entry(*session_.pending_next_id);
                }
                if (next)
                {
                    KC_LOG_INFO("playback: autoplay advancing to {}",
                                next->item_id);
                    begin_session_locked(std::move(*next), fx);
                }
                else
                {
                    session_.autoplay_countdown_seconds.reset();
                    fx.notify = true;
                }
            }
            else
            {
                auto const remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(
                        *countdown_deadline_ - now)
                        .count();
                int const seconds = static_cast<int>((remaining + 999) / 1000);
                if (session_.autoplay_countdown_seconds != seconds)
                {
                    session_.autoplay_countdown_seconds = seconds;
                    fx.notify = true;
                }
            }
        }

        if (session_.state == PlaybackState::Playing ||
            session_.state == PlaybackState::Buffering)
        {
            accrue_locked(now);
            if (now - last_save_ >= kResumeSaveInterval)
            {
                last_save_ = now;
                save_position_locked();
            }
            auto const check_every = std::chrono::seconds(
                c_.config ? c_.config->get().screen_time_check_seconds : 30);
            if (now - last_limit_check_ >= check_every)
            {
                last_limit_check_ = now;
                if (auto reason = restriction_locked())
                {
                    enter_restricted_locked(fx, *reason);
                }
            }
        }
    }
    apply(fx);
}

void PlaybackContinuityManager::clear_session_locked()
{
    auto const generation = session_.load_generation;
    session_ = PlaybackSession{};
    session_.load_generation = generation;
    resume_applied_ = false;
    countdown_deadline_.reset();
    accrual_since_.reset();
}

void PlaybackContinuityManager::save_position_locked()
{
    // Before the first ready the position is meaningless and would clobber
    // the stored resume point.
    if (!session_.entry || !c_.persistence || !resume_applied_)
    {
        return;
    }
    c_.persistence->update_resume_position(session_.entry->item_id,
                                           session_.position_ms);
    session_.entry->resume_position_ms = session_.position_ms;
}

void PlaybackContinuityManager::report_played_locked(Effects &fx)
{
    if (!c_.server || !session_.entry || !resume_applied_)
    {
        return;
    }
    auto job = [server = c_.server, id = session_.entry->item_id,
                ticks = session_.position_ms * kTicksPerMillisecond]
    {
        auto error = server->report_played(id, ticks);
        if (!error.ok())
        {
            KC_LOG_DEBUG("playback: report for {} dropped: {}", id,
                         error.message);
        }
    };
    if (c_.reporter && c_.reporter->is_running())
    {
        fx.deferred.push_back([reporter = c_.reporter, job]
                              { reporter->submit(job); });
    }
    else
    {
        fx.deferred.push_back(job);
    }
}

void PlaybackContinuityManager::finish_current_locked(Effects &fx,
                                                     bool reached_end)
{
    accrue_locked(c_.clock->steady_now());
    accrual_since_.reset();
    auto &entry = *session_.entry;
    auto const duration = session_.duration_ms > 0 ? session_.duration_ms
                                                   : entry.duration_ms();
    bool const watched =
        duration > 0 && static_cast<double>(session_.position_ms) >=
                            static_cast<double>(duration) * kWatchedFraction;
    if (watched && c_.persistence)
    {
        auto const now = utils::to_unix_millis(c_.clock->now());
        c_.persistence->update_playback_fields(entry.item_id, true, now, 0);
        entry.watched = true;
        entry.last_watched_at = now;
        entry.resume_position_ms = 0;
    }
    else
    {
        save_position_locked();
    }
    report_played_locked(fx);
    if (!reached_end)
    {
        fx.player.push_back([](MediaPlayer &p) { p.stop(); });
    }
}

std::optional<CatalogEntry> PlaybackContinuityManager::next_entry_locked() const
{
    if (!session_.entry || !c_.persistence)
    {
        return std::nullopt;
    }
    auto const &current = *session_.entry;
    if (!context_.empty())
    {
        auto it = std::find(context_.begin(), context_.end(), current.item_id);
        if (it == context_.end())
        {
            return std::nullopt;
        }
        for (++it; it != context_.end(); ++it)
        {
            if (auto entry = c_.persistence->entry(*it))
            {
                return entry;
            }
        }
        return std::nullopt;
    }

    auto catalog = c_.persistence->catalog();
    if (!current.series_name.empty())
    {
        auto const key = std::make_tuple(current.season_index,
                                         current.episode_index);
        std::optional<CatalogEntry> best;
        for (auto &entry : catalog)
        {
            if (entry.series_name != current.series_name ||
                entry.item_id == current.item_id)
            {
                continue;
            }
            auto const candidate =
                std::make_tuple(entry.season_index, entry.episode_index);
            if (candidate <= key)
            {
                continue;
            }
            if (!best || candidate < std::make_tuple(best->season_index,
                                                     best->episode_index))
            {
                best = std::move(entry);
            }
        }
        if (best)
        {
            return best;
        }
    }

    auto it = std::find_if(catalog.begin(), catalog.end(),
                           [&](CatalogEntry const &e)
                           { return e.item_id == current.item_id; });
    if (it == catalog.end())
    {
        return std::nullopt;
    }
    for (++it; it != catalog.end(); ++it)
    {
        if (it->library_id == current.library_id)
        {
            return *it;
        }
    }
    return std::nullopt;
}

} // namespace kc::engine
