#pragma once

#include "engine/Core.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace kc::engine
{

class ConnectivityProbe
{
  public:
    virtual ~ConnectivityProbe() = default;
    // std::nullopt when the platform cannot report connectivity at all.
    virtual std::optional<NetworkState> probe() = 0;
};

// Classifies interfaces under /sys/class/net: Wi-Fi and wired links are
// unmetered, cellular and point-to-point links are metered.
class SysfsConnectivityProbe final : public ConnectivityProbe
{
  public:
    explicit SysfsConnectivityProbe(
        std::filesystem::path root = "/sys/class/net");
    std::optional<NetworkState> probe() override;

  private:
    std::filesystem::path root_;
};

class NetworkMonitor
{
  public:
    using Listener = std::function<void(ConnectivityChangedEvent const &)>;
    using SteadyTime = std::chrono::steady_clock::time_point;

    NetworkMonitor(std::unique_ptr<ConnectivityProbe> probe, EventBus *bus,
                   std::chrono::milliseconds debounce);
    ~NetworkMonitor();

    NetworkMonitor(NetworkMonitor const &) = delete;
    NetworkMonitor &operator=(NetworkMonitor const &) = delete;

    NetworkState current_state() const noexcept;

    // Each listener gets its own delivery queue.
    EventBus::SubscriptionId subscribe(Listener listener);
    void unsubscribe(EventBus::SubscriptionId id);

    // Samples the probe once and commits a transition when the new state
    // has been stable for the debounce window.
    void poll(SteadyTime now);

    void start(std::chrono::milliseconds interval);
    void stop();

  private:
    NetworkState sample();
    void loop(std::chrono::milliseconds interval);

    std::unique_ptr<ConnectivityProbe> probe_;
    EventBus *bus_;
    std::chrono::milliseconds debounce_;

    std::atomic<NetworkState> committed_{NetworkState::None};
    std::mutex state_mutex_;
    bool initialized_ = false;
    std::optional<NetworkState> candidate_;
    SteadyTime candidate_since_{};
    bool unavailable_logged_ = false;

    std::thread worker_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    bool stop_requested_ = false;
};

} // namespace kc::engine
