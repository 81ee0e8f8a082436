#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tf::engine
{

// One entry as observed in a single listing. Two FileInfo with the same name
// and different size or modification time are two versions of one entry.
struct FileInfo
{
    using time_point = std::chrono::system_clock::time_point;

    std::string name;
    std::int64_t size = 0;
    time_point modified_at{};

    bool same_version(FileInfo const &other) const noexcept
    {
        return size == other.size && modified_at == other.modified_at;
    }

    bool operator==(FileInfo const &other) const = default;
};

// A listing row that could not be turned into a FileInfo.
struct MalformedEntry
{
    std::string name;
    std::string reason;

    bool operator==(MalformedEntry const &other) const = default;
};

struct Snapshot
{
    std::vector<FileInfo> entries;
    std::vector<MalformedEntry> malformed;
};

// Builds a FileInfo from a raw listing row, or describes why it can't.
inline std::optional<FileInfo>
make_file_info(std::string name, std::optional<std::int64_t> size,
               std::optional<FileInfo::time_point> modified_at,
               MalformedEntry *rejected = nullptr)
{
    char const *reason = nullptr;
    if (name.empty())
    {
        reason = "empty name";
    }
    else if (!size)
    {
        reason = "size unreadable";
    }
    else if (*size < 0)
    {
        reason = "negative size";
    }
    else if (!modified_at)
    {
        reason = "modification time unreadable";
    }
    if (reason != nullptr)
    {
        if (rejected)
        {
            *rejected = MalformedEntry{std::move(name), reason};
        }
        return std::nullopt;
    }
    return FileInfo{std::move(name), *size, *modified_at};
}

} // namespace tf::engine
