#include "utils/FS.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace tf::utils
{

namespace
{

// data_root() is reached from the log sink, so nothing here may log.
std::mutex g_root_mutex;
std::optional<std::filesystem::path> g_root_override;

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

std::filesystem::path fallback_root()
{
    if (auto exe = executable_path(); exe && !exe->filename().empty())
    {
        return exe->parent_path();
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
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

void set_data_root(std::filesystem::path root)
{
    std::lock_guard<std::mutex> lock(g_root_mutex);
    g_root_override = std::move(root);
}

std::filesystem::path data_root()
{
    {
        std::lock_guard<std::mutex> lock(g_root_mutex);
        if (g_root_override && !g_root_override->empty())
        {
            if (auto ensured = ensure_directory(*g_root_override))
            {
                return *ensured;
            }
        }
    }
    if (char const *env = std::getenv("TINYFETCH_DATA_ROOT");
        env != nullptr && *env != '\0')
    {
        if (auto ensured = ensure_directory(env))
        {
            return *ensured;
        }
    }
    auto fallback = fallback_root();
    fallback /= "data";
    if (auto ensured = ensure_directory(fallback))
    {
        return *ensured;
    }
    return fallback;
}

bool write_file_atomically(std::filesystem::path const &target,
                           std::span<std::uint8_t const> data,
                           std::error_code &ec)
{
    ec.clear();
    auto parent = target.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return false;
        }
    }
    auto temp = target;
    temp += ".tfpart";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            ec = std::make_error_code(std::errc::permission_denied);
            return false;
        }
        out.write(reinterpret_cast<char const *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out)
        {
            ec = std::make_error_code(std::errc::io_error);
            std::error_code ignore_ec;
            std::filesystem::remove(temp, ignore_ec);
            return false;
        }
    }
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        std::error_code ignore_ec;
        std::filesystem::remove(temp, ignore_ec);
        return false;
    }
    return true;
}

} // namespace tf::utils
