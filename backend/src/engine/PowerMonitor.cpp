#include "engine/PowerMonitor.hpp"

#include <charconv>
#include <fstream>
#include <string>
#include <system_error>

namespace kc::engine
{

namespace
{

std::string read_line(std::filesystem::path const &path)
{
    std::ifstream input(path);
    std::string value;
    std::getline(input, value);
    while (!value.empty() && (value.back() == '\n' || value.back() == ' '))
    {
        value.pop_back();
    }
    return value;
}

} // namespace

SysfsPowerProbe::SysfsPowerProbe(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::optional<PowerStatus> SysfsPowerProbe::probe()
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec))
    {
        return std::nullopt;
    }
    PowerStatus status;
    bool mains_online = false;
    for (auto const &entry : std::filesystem::directory_iterator(root_, ec))
    {
        auto const type = read_line(entry.path() / "type");
        if (type == "Mains" || type == "USB" || type == "USB_C")
        {
            mains_online = mains_online ||
                           read_line(entry.path() / "online") == "1";
        }
        else if (type == "Battery")
        {
            status.has_battery = true;
            auto const capacity = read_line(entry.path() / "capacity");
            int percent = 0;
            auto result = std::from_chars(
                capacity.data(), capacity.data() + capacity.size(), percent);
            if (result.ec == std::errc{})
            {
                status.battery_percent = percent;
            }
            auto const state = read_line(entry.path() / "status");
            if (state == "Charging" || state == "Full")
            {
                status.charging = true;
            }
        }
    }
    if (ec)
    {
        return std::nullopt;
    }
    if (mains_online || !status.has_battery)
    {
        status.charging = true;
    }
    if (!status.has_battery)
    {
        status.battery_percent = 100;
    }
    return status;
}

bool power_allows_background_work(std::optional<PowerStatus> const &status,
                                  int battery_threshold_percent) noexcept
{
    if (!status)
    {
        return false;
    }
    return status->charging ||
           status->battery_percent > battery_threshold_percent;
}

bool power_is_connected(std::optional<PowerStatus> const &status) noexcept
{
    return status && status->charging;
}

} // namespace kc::engine
