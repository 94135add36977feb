#include "TestSupport.hpp"

#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/NetworkMonitor.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

namespace
{
using namespace kc::tests;
using kc::engine::NetworkState;
using namespace std::chrono_literals;

struct MonitorFixture
{
    MonitorFixture()
        : script(std::make_shared<ConnectivityScript>()),
          monitor(std::make_unique<ScriptedConnectivityProbe>(script), &bus,
                  2000ms)
    {
        bus.subscribe<kc::engine::ConnectivityChangedEvent>(
            [this](kc::engine::ConnectivityChangedEvent const &event)
            { events.push_back(event); });
    }

    void poll_at(std::chrono::milliseconds offset)
    {
        monitor.poll(start + offset);
    }

    std::shared_ptr<ConnectivityScript> script;
    kc::engine::EventBus bus;
    kc::engine::NetworkMonitor monitor;
    std::chrono::steady_clock::time_point start{std::chrono::hours(10)};
    std::vector<kc::engine::ConnectivityChangedEvent> events;
};

void make_interface(std::filesystem::path const &root, std::string const &name,
                    std::string const &operstate, bool wireless = false)
{
    write_file(root / name / "operstate", operstate + "\n");
    if (wireless)
    {
        std::filesystem::create_directories(root / name / "wireless");
    }
}

} // namespace

TEST_CASE("The first sample is committed without an event")
{
    MonitorFixture fx;
    CHECK(fx.monitor.current_state() == NetworkState::None);
    fx.poll_at(0ms);
    CHECK(fx.monitor.current_state() == NetworkState::Unmetered);
    CHECK(fx.events.empty());
}

TEST_CASE("A change is published once it has been stable for the debounce window")
{
    MonitorFixture fx;
    fx.poll_at(0ms);

    fx.script->set(NetworkState::None);
    fx.poll_at(500ms);
    CHECK(fx.monitor.current_state() == NetworkState::Unmetered);
    fx.poll_at(2000ms);
    CHECK(fx.events.empty());

    fx.poll_at(2500ms);
    CHECK(fx.monitor.current_state() == NetworkState::None);
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events.front().previous == NetworkState::Unmetered);
    CHECK(fx.events.front().current == NetworkState::None);

    fx.poll_at(6000ms);
    CHECK(fx.events.size() == 1);
}

TEST_CASE("Flapping links do not produce transitions")
{
    MonitorFixture fx;
    fx.poll_at(0ms);

    fx.script->set(NetworkState::None);
    fx.poll_at(100ms);
    fx.script->set(NetworkState::Unmetered);
    fx.poll_at(200ms);
    fx.script->set(NetworkState::Metered);
    fx.poll_at(300ms);
    fx.script->set(NetworkState::None);
    fx.poll_at(400ms);
    fx.poll_at(2300ms);
    CHECK(fx.events.empty());

    fx.poll_at(2400ms);
    REQUIRE(fx.events.size() == 1);
    CHECK(fx.events.front().current == NetworkState::None);
}

TEST_CASE("An unreadable link state reads as no connectivity")
{
    MonitorFixture fx;
    fx.script->set(std::nullopt);
    fx.poll_at(0ms);
    CHECK(fx.monitor.current_state() == NetworkState::None);

    fx.script->set(NetworkState::Metered);
    fx.poll_at(100ms);
    fx.poll_at(2100ms);
    CHECK(fx.monitor.current_state() == NetworkState::Metered);
}

TEST_CASE("Listeners receive transitions on their own queue")
{
    MonitorFixture fx;
    std::mutex mutex;
    std::vector<NetworkState> seen;
    auto id = fx.monitor.subscribe(
        [&](kc::engine::ConnectivityChangedEvent const &event)
        {
            std::lock_guard<std::mutex> lock(mutex);
            seen.push_back(event.current);
        });

    fx.poll_at(0ms);
    fx.script->set(NetworkState::Metered);
    fx.poll_at(10ms);
    fx.poll_at(2010ms);
    fx.script->set(NetworkState::None);
    fx.poll_at(2020ms);
    fx.poll_at(4020ms);
    fx.bus.wait_idle();

    {
        std::lock_guard<std::mutex> lock(mutex);
        CHECK(seen == std::vector<NetworkState>{NetworkState::Metered,
                                                NetworkState::None});
    }
    fx.monitor.unsubscribe(id);
}

TEST_CASE("The background poller commits the initial state")
{
    MonitorFixture fx;
    fx.monitor.start(5ms);
    for (int i = 0; i < 200 && fx.monitor.current_state() == NetworkState::None;
         ++i)
    {
        std::this_thread::sleep_for(5ms);
    }
    fx.monitor.stop();
    CHECK(fx.monitor.current_state() == NetworkState::Unmetered);
}

TEST_CASE("Sysfs interfaces are classified by kind and link state")
{
    TempDir dir("sysfs-net");
    auto const root = dir.path();

    SUBCASE("wired link is unmetered")
    {
        make_interface(root, "lo", "unknown");
        make_interface(root, "eth0", "up");
        CHECK(kc::engine::SysfsConnectivityProbe(root).probe() ==
              NetworkState::Unmetered);
    }
    SUBCASE("wireless directory marks a link as unmetered")
    {
        make_interface(root, "radio0", "up", true);
        CHECK(kc::engine::SysfsConnectivityProbe(root).probe() ==
              NetworkState::Unmetered);
    }
    SUBCASE("cellular link is metered")
    {
        make_interface(root, "wlan0", "down", true);
        make_interface(root, "wwan0", "up");
        CHECK(kc::engine::SysfsConnectivityProbe(root).probe() ==
              NetworkState::Metered);
    }
    SUBCASE("virtual interfaces are ignored")
    {
        make_interface(root, "lo", "up");
        make_interface(root, "docker0", "up");
        make_interface(root, "veth12ab", "up");
        make_interface(root, "eth0", "down");
        CHECK(kc::engine::SysfsConnectivityProbe(root).probe() ==
              NetworkState::None);
    }
    SUBCASE("missing sysfs is unavailable")
    {
        CHECK_FALSE(kc::engine::SysfsConnectivityProbe(root / "absent").probe());
    }
}
