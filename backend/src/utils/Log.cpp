#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace kc::log
{

namespace
{
std::mutex s_mutex;
std::ofstream s_ofs;
std::optional<std::filesystem::path> s_path;
} // namespace

void set_log_directory(std::string const &directory)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::filesystem::path(directory) / "kidcache.log";
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        if (auto root = kc::utils::appdata_root())
        {
            s_path = *root / "kidcache.log";
        }
        else
        {
            s_path = std::filesystem::path("kidcache.log");
        }
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(s_path->string(), std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace kc::log
