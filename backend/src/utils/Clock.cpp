#include "utils/Clock.hpp"

#include <charconv>
#include <ctime>
#include <system_error>

namespace kc::utils
{

namespace
{

bool parse_fixed(std::string_view text, std::size_t pos, std::size_t len,
                 int &out)
{
    if (pos + len > text.size())
    {
        return false;
    }
    auto const *begin = text.data() + pos;
    auto result = std::from_chars(begin, begin + len, out);
    return result.ec == std::errc{} && result.ptr == begin + len;
}

} // namespace

std::string Clock::local_date() const
{
    auto const time = std::chrono::system_clock::to_time_t(now());
    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[16]{};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
    return buffer;
}

Clock::LocalTime Clock::local_time() const
{
    auto const time = std::chrono::system_clock::to_time_t(now());
    std::tm tm{};
    localtime_r(&time, &tm);
    return LocalTime{(tm.tm_wday + 6) % 7, tm.tm_hour * 60 + tm.tm_min};
}

std::int64_t to_unix_seconds(Clock::WallTime time) noexcept
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               time.time_since_epoch())
        .count();
}

std::int64_t to_unix_millis(Clock::WallTime time) noexcept
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}

Clock::WallTime from_unix_millis(std::int64_t millis) noexcept
{
    return Clock::WallTime(std::chrono::milliseconds(millis));
}

std::optional<std::int64_t> parse_iso8601_seconds(std::string_view text)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_fixed(text, 0, 4, year) || text.size() < 10 ||
        text[4] != '-' || !parse_fixed(text, 5, 2, month) || text[7] != '-' ||
        !parse_fixed(text, 8, 2, day))
    {
        return std::nullopt;
    }
    std::size_t pos = 10;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' '))
    {
        if (!parse_fixed(text, pos + 1, 2, hour) || text.size() < pos + 9 ||
            text[pos + 3] != ':' || !parse_fixed(text, pos + 4, 2, minute) ||
            text[pos + 6] != ':' || !parse_fixed(text, pos + 7, 2, second))
        {
            return std::nullopt;
        }
        pos += 9;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                ++pos;
            }
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
        minute > 59 || second > 60)
    {
        return std::nullopt;
    }

    std::int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
    {
        int off_h = 0, off_m = 0;
        if (!parse_fixed(text, pos + 1, 2, off_h))
        {
            return std::nullopt;
        }
        auto minute_pos = pos + 3;
        if (minute_pos < text.size() && text[minute_pos] == ':')
        {
            ++minute_pos;
        }
        if (minute_pos < text.size() &&
            !parse_fixed(text, minute_pos, 2, off_m))
        {
            return std::nullopt;
        }
        offset_seconds = (off_h * 3600 + off_m * 60) * (text[pos] == '-' ? -1 : 1);
    }

    using namespace std::chrono;
    auto const ymd = year_month_day{std::chrono::year{year},
                                    std::chrono::month{
                                        static_cast<unsigned>(month)},
                                    std::chrono::day{
                                        static_cast<unsigned>(day)}};
    if (!ymd.ok())
    {
        return std::nullopt;
    }
    auto const days_since_epoch = sys_days{ymd}.time_since_epoch().count();
    return static_cast<std::int64_t>(days_since_epoch) * 86400 + hour * 3600 +
           minute * 60 + second - offset_seconds;
}

} // namespace kc::utils
