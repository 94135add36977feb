#include "TestSupport.hpp"

#include "engine/PersistenceManager.hpp"
#include "engine/ScreenTimeGovernor.hpp"

#include <limits>
#include <memory>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;

struct ScreenTimeFixture
{
    explicit ScreenTimeFixture(std::string_view tag)
        : dir(tag), clock(std::make_shared<ManualClock>()),
          persistence(dir.path() / "state.db"), governor(&persistence, clock)
    {
        persistence.set_active_user("user-1");
        governor.load();
    }

    TempDir dir;
    std::shared_ptr<ManualClock> clock;
    kc::engine::PersistenceManager persistence;
    kc::engine::ScreenTimeGovernor governor;
};

} // namespace

TEST_CASE("Watching time counts toward the daily limit")
{
    ScreenTimeFixture fx("screen-accrual");
    CHECK(fx.governor.remaining_minutes() == 60);

    fx.governor.tick(59 * 60);
    CHECK(fx.governor.remaining_minutes() == 1);
    CHECK_FALSE(fx.governor.is_limit_reached());

    fx.governor.tick(59);
    CHECK_FALSE(fx.governor.is_limit_reached());
    fx.governor.tick(1);
    CHECK(fx.governor.is_limit_reached());
    CHECK(fx.governor.remaining_minutes() == 0);

    fx.governor.tick(-5);
    CHECK(fx.governor.state().used_seconds == 3600);
}

TEST_CASE("An extension lifts the limit for the rest of the day")
{
    ScreenTimeFixture fx("screen-extension");
    fx.governor.set_daily_limit(30);
    fx.governor.tick(30 * 60);
    REQUIRE(fx.governor.is_limit_reached());

    fx.governor.grant_extension(15);
    CHECK_FALSE(fx.governor.is_limit_reached());
    CHECK(fx.governor.remaining_minutes() == 15);

    fx.governor.grant_extension(0);
    CHECK(fx.governor.state().extension_minutes == 15);
}

TEST_CASE("A new day starts from zero and drops extensions")
{
    ScreenTimeFixture fx("screen-rollover");
    fx.governor.tick(70 * 60);
    fx.governor.grant_extension(20);
    REQUIRE(fx.governor.state().used_minutes() == 70);

    fx.clock->set_date("2024-05-02");
    auto snapshot = fx.governor.snapshot();
    CHECK(snapshot.state.used_seconds == 0);
    CHECK(snapshot.state.extension_minutes == 0);
    CHECK(snapshot.state.last_reset_date == "2024-05-02");
    CHECK(snapshot.remaining_minutes == 60);
    CHECK_FALSE(snapshot.limit_reached);
    CHECK_FALSE(fx.governor.reset_if_new_day());
}

TEST_CASE("A clock moved backwards does not reset the day")
{
    ScreenTimeFixture fx("screen-backwards");
    fx.governor.tick(10 * 60);
    fx.clock->set_date("2024-04-30");
    CHECK_FALSE(fx.governor.reset_if_new_day());
    CHECK(fx.governor.state().used_minutes() == 10);
}

TEST_CASE("A disabled budget never runs out")
{
    ScreenTimeFixture fx("screen-disabled");
    fx.governor.set_daily_limit(5);
    fx.governor.tick(10 * 60);
    REQUIRE(fx.governor.is_limit_reached());

    fx.governor.set_enabled(false);
    CHECK_FALSE(fx.governor.is_limit_reached());
    CHECK(fx.governor.remaining_minutes() == std::numeric_limits<int>::max());
    fx.governor.tick(60 * 60);
    CHECK(fx.governor.state().used_minutes() == 70);
}

TEST_CASE("Screen time survives a restart on the same day")
{
    ScreenTimeFixture fx("screen-restart");
    fx.governor.set_daily_limit(45);
    fx.governor.tick(20 * 60);
    fx.governor.grant_extension(5);

    kc::engine::ScreenTimeGovernor reloaded(&fx.persistence, fx.clock);
    reloaded.load();
    auto state = reloaded.state();
    CHECK(state.used_minutes() == 20);
    CHECK(state.daily_limit_minutes == 45);
    CHECK(state.extension_minutes == 5);
    CHECK(reloaded.remaining_minutes() == 30);
}

TEST_CASE("Restarting on a later day resets the counters but keeps the limit")
{
    ScreenTimeFixture fx("screen-restart-next-day");
    fx.governor.set_daily_limit(45);
    fx.governor.tick(50 * 60);

    fx.clock->set_date("2024-05-03");
    kc::engine::ScreenTimeGovernor reloaded(&fx.persistence, fx.clock);
    reloaded.load();
    CHECK(reloaded.state().used_seconds == 0);
    CHECK(reloaded.state().daily_limit_minutes == 45);
    CHECK(fx.persistence.load_screen_time()->last_reset_date == "2024-05-03");
}

TEST_CASE("A same-day window allows its own hours only")
{
    kc::engine::AccessSchedule schedule;
    schedule.enabled = true;
    schedule.start_minute = 7 * 60;
    schedule.end_minute = 20 * 60;

    CHECK(schedule.allows(0, 7 * 60));
    CHECK(schedule.allows(0, 12 * 60));
    CHECK(schedule.allows(0, 20 * 60));
    CHECK_FALSE(schedule.allows(0, 6 * 60 + 59));
    CHECK_FALSE(schedule.allows(0, 20 * 60 + 1));

    schedule.enabled = false;
    CHECK(schedule.allows(0, 3 * 60));
}

TEST_CASE("An overnight window wraps past midnight")
{
    kc::engine::AccessSchedule schedule;
    schedule.enabled = true;
    schedule.start_minute = 18 * 60;
    schedule.end_minute = 2 * 60;

    CHECK(schedule.allows(4, 18 * 60));
    CHECK(schedule.allows(4, 23 * 60 + 30));
    CHECK(schedule.allows(4, 0));
    CHECK(schedule.allows(4, 2 * 60));
    CHECK_FALSE(schedule.allows(4, 2 * 60 + 1));
    CHECK_FALSE(schedule.allows(4, 12 * 60));
}

TEST_CASE("A day left out of the schedule is closed all day")
{
    kc::engine::AccessSchedule schedule;
    schedule.enabled = true;
    schedule.start_minute = 0;
    schedule.end_minute = 24 * 60 - 1;
    schedule.allowed_days = 0x3F;

    CHECK(schedule.allows(5, 10 * 60));
    CHECK_FALSE(schedule.allows(6, 10 * 60));
    CHECK_FALSE(schedule.allows(6, 0));
    CHECK_FALSE(schedule.allows(7, 10 * 60));
}

TEST_CASE("The access schedule follows the local clock and survives a restart")
{
    ScreenTimeFixture fx("screen-schedule");
    CHECK_FALSE(fx.governor.is_outside_schedule());

    kc::engine::AccessSchedule schedule;
    schedule.enabled = true;
    schedule.start_minute = 15 * 60;
    schedule.end_minute = 18 * 60;
    schedule.allowed_days = 0x1F;
    fx.governor.set_access_schedule(schedule);

    fx.clock->set_local_time(2, 12, 0);
    CHECK(fx.governor.is_outside_schedule());
    fx.clock->set_local_time(2, 16, 0);
    CHECK_FALSE(fx.governor.is_outside_schedule());
    CHECK_FALSE(fx.governor.snapshot().outside_schedule);
    fx.clock->set_local_time(6, 16, 0);
    CHECK(fx.governor.snapshot().outside_schedule);

    kc::engine::ScreenTimeGovernor reloaded(&fx.persistence, fx.clock);
    reloaded.load();
    auto const restored = reloaded.access_schedule();
    CHECK(restored.enabled);
    CHECK(restored.start_minute == 15 * 60);
    CHECK(restored.end_minute == 18 * 60);
    CHECK(restored.allowed_days == 0x1F);
    CHECK(reloaded.is_outside_schedule());
}
