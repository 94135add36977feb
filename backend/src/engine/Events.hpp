#pragma once

#include "engine/Core.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace kc::engine
{

struct ConnectivityChangedEvent
{
    NetworkState previous = NetworkState::None;
    NetworkState current = NetworkState::None;
};

struct CatalogSyncedEvent
{
    SyncResult result;
};

struct DownloadCompletedEvent
{
    std::string item_id;
    std::uint64_t bytes = 0;
};

struct DownloadFailedEvent
{
    std::string item_id;
    std::string message;
};

// Raised once per blocked window, not once per task.
struct StorageBlockedEvent
{
    std::uint64_t requested_bytes = 0;
    std::uint64_t consumed_bytes = 0;
};

struct ReconnectRequiredEvent
{
    std::string message;
};

struct ScreenTimeLimitReachedEvent
{
    int used_minutes = 0;
};

struct OutsideScheduleEvent
{
    AccessSchedule schedule;
};

struct SettingsChangedEvent
{
};

} // namespace kc::engine
