#pragma once

#include "engine/Core.hpp"
#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace kc::engine
{

class PersistenceManager;
class EventBus;

class ConfigurationService
{
  public:
    ConfigurationService(PersistenceManager *persistence, EventBus *bus,
                         CoreSettings defaults);

    CoreSettings get() const;

    // Setters publish SettingsChangedEvent when the value actually changed.
    void set_storage_limit(std::uint64_t bytes);
    void set_server(std::string server_url);
    void set_pinned_public_key(std::string pin);
    void set_enabled_libraries(std::vector<std::string> libraries);
    void set_autoplay(std::optional<bool> enabled,
                      std::optional<int> countdown_seconds);

    void persist_if_dirty();
    void persist_now();

  private:
    void mark_dirty();
    void notify_listeners();

    PersistenceManager *persistence_;
    EventBus *bus_;

    mutable std::shared_mutex mutex_;
    CoreSettings settings_;

    std::atomic_bool dirty_{false};
};

} // namespace kc::engine
