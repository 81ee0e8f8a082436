#pragma once

#include "engine/Dispatch.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tf::engine
{

struct DispatchReadyEvent
{
    DispatchUnit unit;
};

struct DispatchConfirmedEvent
{
    std::uint64_t unit_id = 0;
    std::vector<std::string> names;
};

} // namespace tf::engine
