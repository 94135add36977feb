#pragma once

#include <filesystem>
#include <optional>

namespace kc::engine
{

struct PowerStatus
{
    bool charging = false;
    int battery_percent = 0;
    bool has_battery = false;
};

class PowerProbe
{
  public:
    virtual ~PowerProbe() = default;
    virtual std::optional<PowerStatus> probe() = 0;
};

// Reads /sys/class/power_supply. A machine without a battery counts as
// charging since it runs from mains.
class SysfsPowerProbe final : public PowerProbe
{
  public:
    explicit SysfsPowerProbe(
        std::filesystem::path root = "/sys/class/power_supply");
    std::optional<PowerStatus> probe() override;

  private:
    std::filesystem::path root_;
};

// Background downloads may start while charging or above the threshold.
bool power_allows_background_work(std::optional<PowerStatus> const &status,
                                  int battery_threshold_percent) noexcept;

// Scheduled catalog passes run only on external power.
bool power_is_connected(std::optional<PowerStatus> const &status) noexcept;

} // namespace kc::engine
