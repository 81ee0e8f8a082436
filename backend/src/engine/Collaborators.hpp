#pragma once

#include "engine/FileInfo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tf::engine
{

// The remote listing could not be obtained. Nothing was observed.
struct ListError
{
    std::string message;
};

struct RetrieveError
{
    enum class Scope
    {
        // Only this entry failed; other entries may still be retrieved.
        Entry,
        // The retrieval channel itself is gone (connection lost, source
        // unmounted). Nothing further can be retrieved in this cycle.
        Channel,
    };

    Scope scope = Scope::Entry;
    std::string message;
};

struct ListResult
{
    Snapshot snapshot;
    std::optional<ListError> error;

    bool ok() const noexcept { return !error.has_value(); }

    static ListResult success(Snapshot snapshot)
    {
        return ListResult{std::move(snapshot), std::nullopt};
    }
    static ListResult failure(std::string message)
    {
        return ListResult{{}, ListError{std::move(message)}};
    }
};

struct RetrieveResult
{
    std::vector<std::uint8_t> content;
    std::optional<RetrieveError> error;

    bool ok() const noexcept { return !error.has_value(); }

    static RetrieveResult success(std::vector<std::uint8_t> content)
    {
        return RetrieveResult{std::move(content), std::nullopt};
    }
    static RetrieveResult entry_failure(std::string message)
    {
        return RetrieveResult{
            {}, RetrieveError{RetrieveError::Scope::Entry, std::move(message)}};
    }
    static RetrieveResult channel_failure(std::string message)
    {
        return RetrieveResult{
            {},
            RetrieveError{RetrieveError::Scope::Channel, std::move(message)}};
    }
};

// Lists the polled source. Implementations must not return duplicate names;
// rows they cannot parse belong in Snapshot::malformed.
class SnapshotProvider
{
  public:
    virtual ~SnapshotProvider() = default;
    virtual ListResult list() = 0;
};

// Fetches the bytes of one entry. Must tolerate repeated calls for the same
// name.
class ContentRetriever
{
  public:
    virtual ~ContentRetriever() = default;
    virtual RetrieveResult retrieve(std::string const &name) = 0;
};

} // namespace tf::engine
