#include "engine/NetworkMonitor.hpp"

#include "utils/Log.hpp"

#include <exception>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>

namespace kc::engine
{

namespace
{

std::string read_trimmed(std::filesystem::path const &path)
{
    std::ifstream input(path);
    std::string value;
    std::getline(input, value);
    while (!value.empty() &&
           (value.back() == '\n' || value.back() == '\r' || value.back() == ' '))
    {
        value.pop_back();
    }
    return value;
}

bool starts_with_any(std::string_view name,
                     std::initializer_list<std::string_view> prefixes)
{
    for (auto prefix : prefixes)
    {
        if (name.starts_with(prefix))
        {
            return true;
        }
    }
    return false;
}

} // namespace

SysfsConnectivityProbe::SysfsConnectivityProbe(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::optional<NetworkState> SysfsConnectivityProbe::probe()
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec))
    {
        return std::nullopt;
    }
    bool metered_up = false;
    for (auto const &entry : std::filesystem::directory_iterator(root_, ec))
    {
        auto const name = entry.path().filename().string();
        // Loopback, bridges, containers and tunnels say nothing about the
        // uplink.
        if (name == "lo" ||
            starts_with_any(name, {"docker", "veth", "br-", "virbr", "tun",
                                   "tap", "wg"}))
        {
            continue;
        }
        auto const operstate = read_trimmed(entry.path() / "operstate");
        if (operstate != "up")
        {
            continue;
        }
        if (starts_with_any(name, {"wwan", "ppp", "rmnet", "ccmni"}))
        {
            metered_up = true;
            continue;
        }
        bool const wireless =
            std::filesystem::exists(entry.path() / "wireless", ec) ||
            name.starts_with("wl");
        bool const wired = starts_with_any(name, {"eth", "en"});
        if (wireless || wired)
        {
            return NetworkState::Unmetered;
        }
    }
    if (ec)
    {
        return std::nullopt;
    }
    return metered_up ? NetworkState::Metered : NetworkState::None;
}

NetworkMonitor::NetworkMonitor(std::unique_ptr<ConnectivityProbe> probe,
                               EventBus *bus,
                               std::chrono::milliseconds debounce)
    : probe_(std::move(probe)), bus_(bus), debounce_(debounce)
{
}

NetworkMonitor::~NetworkMonitor()
{
    stop();
}

NetworkState NetworkMonitor::current_state() const noexcept
{
    return committed_.load(std::memory_order_acquire);
}

EventBus::SubscriptionId NetworkMonitor::subscribe(Listener listener)
{
    return bus_->subscribe_queued<ConnectivityChangedEvent>(
        std::move(listener), "network-listener");
}

void NetworkMonitor::unsubscribe(EventBus::SubscriptionId id)
{
    bus_->unsubscribe(id);
}

NetworkState NetworkMonitor::sample()
{
    std::optional<NetworkState> observed;
    if (probe_)
    {
        try
        {
            observed = probe_->probe();
        }
        catch (std::exception const &ex)
        {
            KC_LOG_DEBUG("network: probe threw: {}", ex.what());
        }
    }
    if (!observed)
    {
        if (!unavailable_logged_)
        {
            KC_LOG_WARN("network: connectivity API unavailable, reporting "
                        "none");
            unavailable_logged_ = true;
        }
        return NetworkState::None;
    }
    return *observed;
}

void NetworkMonitor::poll(SteadyTime now)
{
    std::optional<ConnectivityChangedEvent> event;
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        auto const observed = sample();
        auto const committed = committed_.load(std::memory_order_acquire);
        if (!initialized_)
        {
            initialized_ = true;
            committed_.store(observed, std::memory_order_release);
            KC_LOG_INFO("network: initial state {}", to_string(observed));
            return;
        }
        if (observed == committed)
        {
            candidate_.reset();
            return;
        }
        if (!candidate_ || *candidate_ != observed)
        {
            candidate_ = observed;
            candidate_since_ = now;
        }
        if (now - candidate_since_ < debounce_)
        {
            return;
        }
        candidate_.reset();
        committed_.store(observed, std::memory_order_release);
        event = ConnectivityChangedEvent{committed, observed};
    }
    KC_LOG_INFO("network: {} -> {}", to_string(event->previous),
                to_string(event->current));
    bus_->publish(*event);
}

void NetworkMonitor::start(std::chrono::milliseconds interval)
{
    if (worker_.joinable())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> guard(wait_mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this, interval] { loop(interval); });
}

void NetworkMonitor::stop()
{
    {
        std::lock_guard<std::mutex> guard(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void NetworkMonitor::loop(std::chrono::milliseconds interval)
{
    while (true)
    {
        poll(std::chrono::steady_clock::now());
        std::unique_lock<std::mutex> lock(wait_mutex_);
        if (wait_cv_.wait_for(lock, interval,
                              [this] { return stop_requested_; }))
        {
            break;
        }
    }
}

} // namespace kc::engine
