#include "engine/ScreenTimeGovernor.hpp"
#include "engine/PersistenceManager.hpp"

#include "utils/Clock.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <charconv>
#include <limits>
#include <string>
#include <system_error>

namespace kc::engine
{

namespace
{

std::optional<int> parse_int(std::optional<std::string> const &text)
{
    if (!text)
    {
        return std::nullopt;
    }
    int value = 0;
    auto const *end = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(text->data(), end, value);
    if (ec != std::errc{} || ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

int clamp_minute(int minute)
{
    return std::clamp(minute, 0, 24 * 60 - 1);
}

} // namespace

ScreenTimeGovernor::ScreenTimeGovernor(PersistenceManager *persistence,
                                       std::shared_ptr<utils::Clock> clock)
    : persistence_(persistence), clock_(std::move(clock))
{
}

void ScreenTimeGovernor::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (persistence_)
    {
        if (auto stored = persistence_->load_screen_time())
        {
            state_ = *stored;
        }
    }
    if (state_.last_reset_date.empty())
    {
        state_.last_reset_date = clock_->local_date();
        persist_locked();
    }
    if (persistence_)
    {
        using namespace setting_keys;
        schedule_.enabled =
            persistence_->get_setting(kAccessScheduleEnabled).value_or("") ==
            "1";
        if (auto start = parse_int(persistence_->get_setting(kAccessScheduleStart)))
        {
            schedule_.start_minute = clamp_minute(*start);
        }
        if (auto end = parse_int(persistence_->get_setting(kAccessScheduleEnd)))
        {
            schedule_.end_minute = clamp_minute(*end);
        }
        if (auto days = parse_int(persistence_->get_setting(kAccessScheduleDays)))
        {
            schedule_.allowed_days = static_cast<std::uint8_t>(*days & 0x7F);
        }
    }
    reset_locked();
    KC_LOG_INFO("screen-time: loaded used={}min limit={}min enabled={} "
                "schedule={}",
                state_.used_minutes(), state_.daily_limit_minutes,
                state_.enabled, schedule_.enabled);
}

void ScreenTimeGovernor::tick(std::int64_t seconds_watched)
{
    if (seconds_watched <= 0)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    bool const was_reached = limit_reached_locked();
    state_.used_seconds += seconds_watched;
    persist_locked();
    if (!was_reached && limit_reached_locked())
    {
        KC_LOG_INFO("screen-time: daily limit reached at {}min",
                    state_.used_minutes());
    }
}

int ScreenTimeGovernor::remaining_minutes()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    return remaining_locked();
}

bool ScreenTimeGovernor::is_limit_reached()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    return limit_reached_locked();
}

void ScreenTimeGovernor::grant_extension(int minutes)
{
    if (minutes <= 0)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    state_.extension_minutes += minutes;
    persist_locked();
    KC_LOG_INFO("screen-time: extension of {}min granted", minutes);
}

void ScreenTimeGovernor::set_daily_limit(int minutes)
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    state_.daily_limit_minutes = std::max(0, minutes);
    persist_locked();
}

void ScreenTimeGovernor::set_enabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    state_.enabled = enabled;
    persist_locked();
}

void ScreenTimeGovernor::set_access_schedule(AccessSchedule const &schedule)
{
    std::lock_guard<std::mutex> lock(mutex_);
    schedule_ = schedule;
    schedule_.start_minute = clamp_minute(schedule.start_minute);
    schedule_.end_minute = clamp_minute(schedule.end_minute);
    schedule_.allowed_days &= 0x7F;
    persist_schedule_locked();
    KC_LOG_INFO("screen-time: access schedule {} {:02}:{:02}-{:02}:{:02} "
                "days={:#04x}",
                schedule_.enabled ? "on" : "off", schedule_.start_minute / 60,
                schedule_.start_minute % 60, schedule_.end_minute / 60,
                schedule_.end_minute % 60, schedule_.allowed_days);
}

AccessSchedule ScreenTimeGovernor::access_schedule()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return schedule_;
}

bool ScreenTimeGovernor::is_outside_schedule()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outside_schedule_locked();
}

bool ScreenTimeGovernor::reset_if_new_day()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reset_locked();
}

ScreenTimeState ScreenTimeGovernor::state()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    return state_;
}

ScreenTimeSnapshot ScreenTimeGovernor::snapshot()
{
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked();
    ScreenTimeSnapshot snap;
    snap.state = state_;
    snap.remaining_minutes = remaining_locked();
    snap.limit_reached = limit_reached_locked();
    snap.schedule = schedule_;
    snap.outside_schedule = outside_schedule_locked();
    return snap;
}

bool ScreenTimeGovernor::reset_locked()
{
    auto today = clock_->local_date();
    // ISO dates compare lexicographically; a clock moved backwards never
    // triggers a second reset for the same day.
    if (today <= state_.last_reset_date)
    {
        return false;
    }
    KC_LOG_INFO("screen-time: new day {}, resetting {}min used", today,
                state_.used_minutes());
    state_.used_seconds = 0;
    state_.extension_minutes = 0;
    state_.last_reset_date = std::move(today);
    persist_locked();
    return true;
}

bool ScreenTimeGovernor::limit_reached_locked() const noexcept
{
    if (!state_.enabled)
    {
        return false;
    }
    return state_.used_minutes() >=
           state_.daily_limit_minutes + state_.extension_minutes;
}

int ScreenTimeGovernor::remaining_locked() const noexcept
{
    if (!state_.enabled)
    {
        return std::numeric_limits<int>::max();
    }
    return std::max(0, state_.daily_limit_minutes + state_.extension_minutes -
                           state_.used_minutes());
}

void ScreenTimeGovernor::persist_locked()
{
    if (persistence_)
    {
        persistence_->persist_screen_time(state_);
    }
}

void ScreenTimeGovernor::persist_schedule_locked()
{
    if (!persistence_)
    {
        return;
    }
    using namespace setting_keys;
    persistence_->set_setting(kAccessScheduleEnabled,
                              schedule_.enabled ? "1" : "0");
    persistence_->set_setting(kAccessScheduleStart,
                              std::to_string(schedule_.start_minute));
    persistence_->set_setting(kAccessScheduleEnd,
                              std::to_string(schedule_.end_minute));
    persistence_->set_setting(kAccessScheduleDays,
                              std::to_string(schedule_.allowed_days));
}

bool ScreenTimeGovernor::outside_schedule_locked() const
{
    auto const now = clock_->local_time();
    return !schedule_.allows(now.weekday, now.minute_of_day);
}

} // namespace kc::engine
