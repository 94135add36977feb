#pragma once

#include "engine/Core.hpp"

#include <cstdint>
#include <memory>
#include <mutex>

namespace kc::utils
{
class Clock;
}

namespace kc::engine
{

class PersistenceManager;

// Single owner of the daily screen-time budget. Every query first rolls the
// day over, so a session spanning midnight starts the new day at zero.
class ScreenTimeGovernor
{
  public:
    ScreenTimeGovernor(PersistenceManager *persistence,
                       std::shared_ptr<utils::Clock> clock);

    // Loads the persisted row; a missing row starts a fresh day.
    void load();

    void tick(std::int64_t seconds_watched);
    int remaining_minutes();
    bool is_limit_reached();
    void grant_extension(int minutes);
    void set_daily_limit(int minutes);
    void set_enabled(bool enabled);

    // The access window is a parent setting beside the budget; it never
    // rolls over with the day.
    void set_access_schedule(AccessSchedule const &schedule);
    AccessSchedule access_schedule();
    bool is_outside_schedule();

    // Returns true when a new day was started.
    bool reset_if_new_day();

    ScreenTimeState state();
    ScreenTimeSnapshot snapshot();

  private:
    bool reset_locked();
    bool limit_reached_locked() const noexcept;
    int remaining_locked() const noexcept;
    void persist_locked();
    void persist_schedule_locked();
    bool outside_schedule_locked() const;

    PersistenceManager *persistence_;
    std::shared_ptr<utils::Clock> clock_;
    std::mutex mutex_;
    ScreenTimeState state_;
    AccessSchedule schedule_;
};

} // namespace kc::engine
