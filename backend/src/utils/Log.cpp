#include "utils/Log.hpp"
#include "utils/FS.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>

namespace tf::log
{

namespace
{

std::mutex s_mutex;
std::ofstream s_ofs;
std::optional<std::filesystem::path> s_path;
std::atomic<int> s_min_level{0};

int level_rank(char level) noexcept
{
    switch (level)
    {
    case 'D':
        return 0;
    case 'I':
        return 1;
    case 'W':
        return 2;
    case 'E':
        return 3;
    default:
        return 1;
    }
}

} // namespace

void set_log_file(std::filesystem::path path)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (s_ofs.is_open())
    {
        s_ofs.close();
    }
    s_path = std::move(path);
}

void set_min_level(char level) noexcept
{
    s_min_level.store(level_rank(level), std::memory_order_relaxed);
}

bool level_enabled(char level) noexcept
{
    return level_rank(level) >= s_min_level.load(std::memory_order_relaxed);
}

void append_log_line_to_file(std::string const &line)
{
    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_path)
    {
        s_path = tf::utils::data_root() / "tinyfetch.log";
    }
    if (s_path->empty())
    {
        return;
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

} // namespace tf::log
