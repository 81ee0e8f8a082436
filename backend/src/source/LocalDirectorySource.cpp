#include "source/LocalDirectorySource.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace tf::source
{

namespace
{

std::optional<engine::FileInfo::time_point>
to_system_time(std::filesystem::file_time_type value)
{
    auto sys = std::chrono::file_clock::to_sys(value);
    return std::chrono::time_point_cast<engine::FileInfo::time_point::duration>(
        sys);
}

bool directory_available(std::filesystem::path const &root,
                         std::error_code &ec)
{
    return std::filesystem::is_directory(root, ec) && !ec;
}

} // namespace

bool is_safe_entry_name(std::string const &name)
{
    if (name.empty() || name == "." || name == "..")
    {
        return false;
    }
    if (name.find('/') != std::string::npos ||
        name.find('\\') != std::string::npos ||
        name.find('\0') != std::string::npos)
    {
        return false;
    }
    return true;
}

engine::ListResult finish_listing(std::filesystem::path const &root,
                                  engine::Snapshot snapshot,
                                  std::error_code const &ec)
{
    if (ec)
    {
        return engine::ListResult::failure(std::format(
            "listing {} interrupted after {} entries: {}", root.string(),
            snapshot.entries.size() + snapshot.malformed.size(),
            ec.message()));
    }
    return engine::ListResult::success(std::move(snapshot));
}

LocalDirectoryClient::LocalDirectoryClient(std::filesystem::path root)
    : root_(std::move(root))
{
}

engine::ListResult LocalDirectoryClient::list() const
{
    std::error_code ec;
    if (!directory_available(root_, ec))
    {
        return engine::ListResult::failure(std::format(
            "{} is not a readable directory{}{}", root_.string(),
            ec ? ": " : "", ec ? ec.message() : std::string()));
    }
    std::filesystem::directory_iterator it(root_, ec);
    if (ec)
    {
        return engine::ListResult::failure(
            std::format("cannot list {}: {}", root_.string(), ec.message()));
    }

    engine::Snapshot snapshot;
    // A failed increment leaves the iterator at end, so the error is only
    // visible once the loop is over.
    for (auto end = std::filesystem::directory_iterator(); it != end;
         it.increment(ec))
    {
        auto const &entry = *it;
        auto name = entry.path().filename().string();

        std::error_code status_ec;
        if (!entry.is_regular_file(status_ec))
        {
            if (status_ec)
            {
                snapshot.malformed.push_back(
                    {std::move(name), status_ec.message()});
            }
            continue;
        }

        std::optional<std::int64_t> size;
        std::error_code size_ec;
        auto raw_size = entry.file_size(size_ec);
        if (!size_ec)
        {
            size = static_cast<std::int64_t>(raw_size);
        }
        std::optional<engine::FileInfo::time_point> modified;
        std::error_code time_ec;
        auto raw_time = entry.last_write_time(time_ec);
        if (!time_ec)
        {
            modified = to_system_time(raw_time);
        }

        engine::MalformedEntry rejected;
        if (auto info = engine::make_file_info(std::move(name), size, modified,
                                               &rejected))
        {
            snapshot.entries.push_back(std::move(*info));
        }
        else
        {
            snapshot.malformed.push_back(std::move(rejected));
        }
    }
    return finish_listing(root_, std::move(snapshot), ec);
}

engine::RetrieveResult LocalDirectoryClient::read(std::string const &name) const
{
    std::error_code ec;
    if (!directory_available(root_, ec))
    {
        return engine::RetrieveResult::channel_failure(
            std::format("{} is gone", root_.string()));
    }
    if (!is_safe_entry_name(name))
    {
        return engine::RetrieveResult::entry_failure(
            std::format("refusing entry name '{}'", name));
    }
    auto path = root_ / name;
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return engine::RetrieveResult::entry_failure(
            std::format("cannot open {}", path.string()));
    }
    std::vector<std::uint8_t> content{std::istreambuf_iterator<char>(in),
                                      std::istreambuf_iterator<char>()};
    if (in.bad())
    {
        return engine::RetrieveResult::entry_failure(
            std::format("read error on {}", path.string()));
    }
    return engine::RetrieveResult::success(std::move(content));
}

LocalDirectorySource::LocalDirectorySource(std::filesystem::path root,
                                           std::size_t pool_size)
    : root_(std::move(root)),
      pool_(pool_size,
            [root = root_]
            { return std::make_unique<LocalDirectoryClient>(root); })
{
}

engine::ListResult LocalDirectorySource::list()
{
    auto client = pool_.acquire();
    if (!client)
    {
        return engine::ListResult::failure("no directory client available");
    }
    auto result = client->list();
    if (!result.ok())
    {
        client.discard();
    }
    return result;
}

engine::RetrieveResult LocalDirectorySource::retrieve(std::string const &name)
{
    auto client = pool_.acquire();
    if (!client)
    {
        return engine::RetrieveResult::channel_failure(
            "no directory client available");
    }
    auto result = client->read(name);
    if (!result.ok() && result.error->scope == engine::RetrieveError::Scope::Channel)
    {
        client.discard();
    }
    return result;
}

} // namespace tf::source
