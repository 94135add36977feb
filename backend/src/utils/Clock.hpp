#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kc::utils
{

class Clock
{
  public:
    using WallTime = std::chrono::system_clock::time_point;
    using SteadyTime = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual WallTime now() const = 0;
    virtual SteadyTime steady_now() const = 0;

    struct LocalTime
    {
        // 0 is Monday.
        int weekday = 0;
        int minute_of_day = 0;
    };

    // Calendar day of now() in local time, formatted YYYY-MM-DD.
    virtual std::string local_date() const;
    virtual LocalTime local_time() const;
};

class SystemClock final : public Clock
{
  public:
    WallTime now() const override
    {
        return std::chrono::system_clock::now();
    }

    SteadyTime steady_now() const override
    {
        return std::chrono::steady_clock::now();
    }
};

std::int64_t to_unix_seconds(Clock::WallTime time) noexcept;
std::int64_t to_unix_millis(Clock::WallTime time) noexcept;
Clock::WallTime from_unix_millis(std::int64_t millis) noexcept;

// Parses the subset of ISO-8601 the media server emits, e.g.
// "2024-05-01T18:22:10.1234567Z". Offsets other than Z are honoured.
std::optional<std::int64_t> parse_iso8601_seconds(std::string_view text);

} // namespace kc::utils
