#pragma once

#include "engine/FileInfo.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tf::engine
{

struct DispatchItem
{
    FileInfo info;
    std::vector<std::uint8_t> content;
};

// One batch handed to the consumer. `names` lists the items in selection
// order; the consumer confirms exactly these names once the unit is accepted.
struct DispatchUnit
{
    std::uint64_t id = 0;
    std::vector<std::string> names;
    std::vector<DispatchItem> items;

    bool empty() const noexcept { return names.empty(); }

    std::size_t payload_bytes() const noexcept
    {
        std::size_t total = 0;
        for (auto const &item : items)
        {
            total += item.content.size();
        }
        return total;
    }
};

} // namespace tf::engine
