#include "TestSupport.hpp"

#include "engine/AsyncTaskService.hpp"
#include "engine/EventBus.hpp"
#include "engine/PowerMonitor.hpp"
#include "engine/SchedulerService.hpp"
#include "utils/Clock.hpp"
#include "utils/Crypto.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;
using namespace std::chrono_literals;

struct Ping
{
    int value = 0;
};

struct Pong
{
    std::string text;
};

void make_supply(std::filesystem::path const &root, std::string const &name,
                 std::string const &type,
                 std::vector<std::pair<std::string, std::string>> const &fields)
{
    write_file(root / name / "type", type + "\n");
    for (auto const &[key, value] : fields)
    {
        write_file(root / name / key, value + "\n");
    }
}

} // namespace

TEST_CASE("EventBus delivers inline by type and honours unsubscribe")
{
    kc::engine::EventBus bus;
    std::vector<int> pings;
    std::vector<std::string> pongs;
    auto id = bus.subscribe<Ping>([&](Ping const &p) { pings.push_back(p.value); });
    bus.subscribe<Pong>([&](Pong const &p) { pongs.push_back(p.text); });

    bus.publish(Ping{1});
    bus.publish(Pong{"hello"});
    bus.unsubscribe(id);
    bus.publish(Ping{2});

    CHECK(pings == std::vector<int>{1});
    CHECK(pongs == std::vector<std::string>{"hello"});
}

TEST_CASE("Queued subscribers receive events in publish order off-thread")
{
    kc::engine::EventBus bus;
    std::mutex mutex;
    std::vector<int> received;
    std::thread::id handler_thread;
    bus.subscribe_queued<Ping>(
        [&](Ping const &p)
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler_thread = std::this_thread::get_id();
            received.push_back(p.value);
        },
        "ping-mailbox");

    for (int i = 0; i < 100; ++i)
    {
        bus.publish(Ping{i});
    }
    bus.wait_idle();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(received.size() == 100);
    for (int i = 0; i < 100; ++i)
    {
        CHECK(received[static_cast<std::size_t>(i)] == i);
    }
    CHECK(handler_thread != std::this_thread::get_id());
}

TEST_CASE("A stalled queued subscriber does not hold up the others")
{
    kc::engine::EventBus bus;
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> slow_seen{0};
    std::atomic<int> fast_seen{0};
    bus.subscribe_queued<Ping>(
        [&](Ping const &)
        {
            released.wait();
            ++slow_seen;
        },
        "slow-mailbox");
    bus.subscribe_queued<Ping>([&](Ping const &) { ++fast_seen; },
                               "fast-mailbox");

    bus.publish(Ping{1});
    bus.publish(Ping{2});
    CHECK(wait_for([&] { return fast_seen.load() == 2; }));
    CHECK(slow_seen.load() == 0);

    release.set_value();
    bus.wait_idle();
    CHECK(slow_seen.load() == 2);
}

TEST_CASE("A handler may publish without deadlocking")
{
    kc::engine::EventBus bus;
    std::vector<std::string> pongs;
    bus.subscribe<Ping>([&](Ping const &p)
                        { bus.publish(Pong{std::to_string(p.value)}); });
    bus.subscribe<Pong>([&](Pong const &p) { pongs.push_back(p.text); });
    bus.publish(Ping{7});
    CHECK(pongs == std::vector<std::string>{"7"});
}

TEST_CASE("AsyncTaskService runs tasks in order and refuses work after stop")
{
    kc::engine::AsyncTaskService service("order-test");
    service.start();
    CHECK(service.is_running());

    std::vector<int> order;
    for (int i = 0; i < 20; ++i)
    {
        REQUIRE(service.submit([&order, i] { order.push_back(i); }));
    }
    service.wait_idle();
    CHECK(order.size() == 20);
    CHECK(std::is_sorted(order.begin(), order.end()));

    service.stop();
    CHECK_FALSE(service.is_running());
    CHECK_FALSE(service.submit([] {}));
    CHECK_FALSE(service.submit(nullptr));
}

TEST_CASE("SchedulerService runs due tasks and drops cancelled ones")
{
    kc::engine::SchedulerService scheduler;
    auto const t0 = kc::engine::SchedulerService::Clock::time_point{} + 1h;
    int fast = 0;
    int slow = 0;
    scheduler.schedule(100ms, [&] { ++fast; }, t0);
    auto slow_id = scheduler.schedule(1s, [&] { ++slow; }, t0);

    CHECK(scheduler.time_until_next_task(t0) == 100ms);
    CHECK(scheduler.tick(t0 + 50ms) == 0);
    CHECK(scheduler.tick(t0 + 100ms) == 1);
    CHECK(scheduler.tick(t0 + 200ms) == 1);
    CHECK(fast == 2);

    scheduler.cancel(slow_id);
    scheduler.tick(t0 + 2s);
    CHECK(slow == 0);
    CHECK(fast == 3);
}

TEST_CASE("A throwing scheduled task does not stop the others")
{
    kc::engine::SchedulerService scheduler;
    auto const t0 = kc::engine::SchedulerService::Clock::time_point{} + 1h;
    int runs = 0;
    scheduler.schedule(10ms, [] { throw std::runtime_error("boom"); }, t0);
    scheduler.schedule(10ms, [&] { ++runs; }, t0);
    scheduler.tick(t0 + 10ms);
    CHECK(runs == 1);
    scheduler.tick(t0 + 20ms);
    CHECK(runs == 2);
}

TEST_CASE("ISO-8601 timestamps from the media server are parsed")
{
    using kc::utils::parse_iso8601_seconds;
    CHECK(parse_iso8601_seconds("2024-05-01T18:22:10.1234567Z") ==
          std::optional<std::int64_t>(1714587730));
    CHECK(parse_iso8601_seconds("2024-05-01T20:22:10+02:00") ==
          std::optional<std::int64_t>(1714587730));
    CHECK(parse_iso8601_seconds("2024-05-01") ==
          std::optional<std::int64_t>(1714521600));
    CHECK(parse_iso8601_seconds("1970-01-01T00:00:00Z") ==
          std::optional<std::int64_t>(0));
    CHECK_FALSE(parse_iso8601_seconds("yesterday"));
    CHECK_FALSE(parse_iso8601_seconds("2024-13-01T00:00:00Z"));
    CHECK_FALSE(parse_iso8601_seconds("2024-02-30T00:00:00Z"));
    CHECK_FALSE(parse_iso8601_seconds(""));
}

TEST_CASE("Wall clock conversions are consistent")
{
    auto const time = kc::utils::from_unix_millis(1'700'000'000'123);
    CHECK(kc::utils::to_unix_millis(time) == 1'700'000'000'123);
    CHECK(kc::utils::to_unix_seconds(time) == 1'700'000'000);
    kc::utils::SystemClock clock;
    CHECK(clock.local_date().size() == 10);
}

TEST_CASE("SHA-256 digests match the reference vectors")
{
    std::string const abc = "abc";
    auto const digest = kc::crypto::sha256_hex(std::span<std::uint8_t const>(
        reinterpret_cast<std::uint8_t const *>(abc.data()), abc.size()));
    CHECK(digest ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    TempDir dir("crypto-file");
    write_file(dir.path() / "abc.bin", abc);
    CHECK(kc::crypto::sha256_file_hex(dir.path() / "abc.bin") ==
          std::optional<std::string>(digest));
    CHECK_FALSE(kc::crypto::sha256_file_hex(dir.path() / "missing.bin"));
}

TEST_CASE("Garbage is not accepted as a certificate")
{
    CHECK_FALSE(kc::crypto::public_key_pin_from_pem("not a certificate"));
    CHECK_FALSE(kc::crypto::public_key_pin_from_pem(""));
}

TEST_CASE("Sysfs power supplies are read into a power status")
{
    TempDir dir("sysfs-power");
    auto const root = dir.path();

    SUBCASE("discharging battery")
    {
        make_supply(root, "BAT0", "Battery",
                    {{"capacity", "25"}, {"status", "Discharging"}});
        make_supply(root, "AC", "Mains", {{"online", "0"}});
        auto status = kc::engine::SysfsPowerProbe(root).probe();
        REQUIRE(status);
        CHECK(status->has_battery);
        CHECK_FALSE(status->charging);
        CHECK(status->battery_percent == 25);
    }
    SUBCASE("mains online counts as charging")
    {
        make_supply(root, "BAT0", "Battery",
                    {{"capacity", "25"}, {"status", "Not charging"}});
        make_supply(root, "AC", "Mains", {{"online", "1"}});
        auto status = kc::engine::SysfsPowerProbe(root).probe();
        REQUIRE(status);
        CHECK(status->charging);
    }
    SUBCASE("full battery is treated as charging")
    {
        make_supply(root, "BAT1", "Battery",
                    {{"capacity", "100"}, {"status", "Full"}});
        auto status = kc::engine::SysfsPowerProbe(root).probe();
        REQUIRE(status);
        CHECK(status->charging);
    }
    SUBCASE("no battery means mains power")
    {
        auto status = kc::engine::SysfsPowerProbe(root).probe();
        REQUIRE(status);
        CHECK_FALSE(status->has_battery);
        CHECK(status->charging);
        CHECK(status->battery_percent == 100);
    }
    SUBCASE("missing sysfs is unavailable")
    {
        CHECK_FALSE(kc::engine::SysfsPowerProbe(root / "absent").probe());
    }
}

TEST_CASE("Background work needs charging or battery above the threshold")
{
    using kc::engine::PowerStatus;
    using kc::engine::power_allows_background_work;
    CHECK_FALSE(power_allows_background_work(std::nullopt, 30));
    CHECK_FALSE(power_allows_background_work(PowerStatus{false, 30, true}, 30));
    CHECK(power_allows_background_work(PowerStatus{false, 31, true}, 30));
    CHECK(power_allows_background_work(PowerStatus{true, 5, true}, 30));
}

TEST_CASE("Scheduled sync needs external power whatever the battery level")
{
    using kc::engine::PowerStatus;
    using kc::engine::power_is_connected;
    CHECK_FALSE(power_is_connected(std::nullopt));
    CHECK_FALSE(power_is_connected(PowerStatus{false, 95, true}));
    CHECK(power_is_connected(PowerStatus{true, 5, true}));
    CHECK(power_is_connected(PowerStatus{true, 100, false}));
}
