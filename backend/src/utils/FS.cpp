#include "utils/FS.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace kc::utils
{

namespace
{
std::optional<std::filesystem::path> ensure_directory(
    std::filesystem::path const &candidate)
{
    std::error_code ec;
    std::filesystem::create_directories(candidate, ec);
    if (!ec || std::filesystem::exists(candidate))
    {
        return candidate;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> env_path(char const *key)
{
    auto const *value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    return std::filesystem::current_path();
}
} // namespace

std::optional<std::filesystem::path> executable_path()
{
    std::vector<char> buffer(4096);
    while (true)
    {
        ssize_t length =
            readlink("/proc/self/exe", buffer.data(), buffer.size());
        if (length == -1)
        {
            return std::nullopt;
        }
        if (static_cast<std::size_t>(length) < buffer.size())
        {
            return std::filesystem::path(buffer.data(), buffer.data() + length);
        }
        buffer.resize(buffer.size() * 2);
    }
}

std::optional<std::filesystem::path> appdata_root()
{
    if (auto explicit_dir = env_path("KC_DATA_DIR"))
    {
        return ensure_directory(*explicit_dir);
    }
    if (auto xdg = env_path("XDG_DATA_HOME"))
    {
        return ensure_directory(*xdg / "kidcache");
    }
    if (auto home = env_path("HOME"))
    {
        return ensure_directory(*home / ".local" / "share" / "kidcache");
    }
    return std::nullopt;
}

std::filesystem::path data_root()
{
    if (auto appdata = appdata_root())
    {
        return *appdata;
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return std::filesystem::current_path();
}

} // namespace kc::utils
