#include "engine/ConfigurationService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PersistenceManager.hpp"
#include "utils/Log.hpp"

#include <algorithm>
#include <utility>

namespace kc::engine
{

namespace
{

// Countdown is shown to a child; anything outside 3..10 s is clamped.
constexpr int kMinCountdownSeconds = 3;
constexpr int kMaxCountdownSeconds = 10;

} // namespace

ConfigurationService::ConfigurationService(PersistenceManager *persistence,
                                           EventBus *bus, CoreSettings defaults)
    : persistence_(persistence), bus_(bus), settings_(std::move(defaults))
{
}

CoreSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

void ConfigurationService::set_storage_limit(std::uint64_t bytes)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // The ceiling can never sit below the reserved floor.
        auto const clamped = std::max(bytes, settings_.storage_floor_bytes);
        if (settings_.storage_limit_bytes == clamped)
            return;
        settings_.storage_limit_bytes = clamped;
    }
    KC_LOG_INFO("config: storage ceiling set to {} bytes", bytes);
    mark_dirty();
    notify_listeners();
}

void ConfigurationService::set_server(std::string server_url)
{
    while (!server_url.empty() && server_url.back() == '/')
    {
        server_url.pop_back();
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.server_url == server_url)
            return;
        settings_.server_url = std::move(server_url);
        // A different server invalidates a previously confirmed key.
        settings_.pinned_public_key.clear();
    }
    mark_dirty();
    notify_listeners();
}

void ConfigurationService::set_pinned_public_key(std::string pin)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.pinned_public_key == pin)
            return;
        settings_.pinned_public_key = std::move(pin);
    }
    mark_dirty();
    notify_listeners();
}

void ConfigurationService::set_enabled_libraries(
    std::vector<std::string> libraries)
{
    std::sort(libraries.begin(), libraries.end());
    libraries.erase(std::unique(libraries.begin(), libraries.end()),
                    libraries.end());
    std::erase(libraries, std::string{});
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (settings_.enabled_libraries == libraries)
            return;
        settings_.enabled_libraries = std::move(libraries);
    }
    mark_dirty();
    notify_listeners();
}

void ConfigurationService::set_autoplay(std::optional<bool> enabled,
                                        std::optional<int> countdown_seconds)
{
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto const next_enabled = enabled.value_or(settings_.autoplay_enabled);
        auto const next_countdown =
            countdown_seconds
                ? std::clamp(*countdown_seconds, kMinCountdownSeconds,
                             kMaxCountdownSeconds)
                : settings_.autoplay_countdown_seconds;
        if (next_enabled == settings_.autoplay_enabled &&
            next_countdown == settings_.autoplay_countdown_seconds)
            return;
        settings_.autoplay_enabled = next_enabled;
        settings_.autoplay_countdown_seconds = next_countdown;
    }
    mark_dirty();
    notify_listeners();
}

void ConfigurationService::mark_dirty()
{
    dirty_.store(true, std::memory_order_release);
}

void ConfigurationService::persist_if_dirty()
{
    if (!dirty_.load(std::memory_order_acquire))
        return;
    persist_now();
}

void ConfigurationService::persist_now()
{
    if (!persistence_)
        return;

    CoreSettings copy = get();
    if (persistence_->persist_settings(copy))
    {
        dirty_.store(false, std::memory_order_release);
    }
    else
    {
        KC_LOG_INFO("config: failed to persist settings");
    }
}

void ConfigurationService::notify_listeners()
{
    // Consumers call get() to see the new values.
    if (bus_)
        bus_->publish(SettingsChangedEvent{});
}

} // namespace kc::engine
