#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace kc::log
{

// Appends one formatted line to kidcache.log (defined in Log.cpp).
void append_log_line_to_file(std::string const &line);

// Redirects the log file, used by the daemon once --data-dir is known.
void set_log_directory(std::string const &directory);

// KC_ENABLE_LOGGING=1 takes precedence over KC_BUILD_MINIMAL so that logs
// can be turned on in minimal builds for diagnostics.
#if !defined(KC_BUILD_MINIMAL) ||                                              \
    (defined(KC_ENABLE_LOGGING) && (KC_ENABLE_LOGGING))
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    std::string message;
    try
    {
        message = std::vformat(fmt, std::make_format_args(args...));
    }
    catch (std::format_error const &ex)
    {
        message = std::string(fmt) + " <format error: " + ex.what() + ">";
    }
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &ex)
    {
        if (stderr)
        {
            std::fprintf(stderr, "[E] log file append failed: %s\n",
                         ex.what());
        }
    }
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

} // namespace kc::log

#define KC_LOG_INFO(fmt, ...) kc::log::write_line('I', fmt, ##__VA_ARGS__)
#define KC_LOG_DEBUG(fmt, ...) kc::log::write_line('D', fmt, ##__VA_ARGS__)
#define KC_LOG_WARN(fmt, ...) kc::log::write_line('W', fmt, ##__VA_ARGS__)
#define KC_LOG_ERROR(fmt, ...) kc::log::write_line('E', fmt, ##__VA_ARGS__)
