#include "engine/DispatchConfirmer.hpp"

#include "engine/Backlog.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "utils/Log.hpp"

namespace tf::engine
{

DispatchConfirmer::DispatchConfirmer(Backlog *backlog, EventBus *bus)
    : backlog_(backlog), bus_(bus)
{
}

void DispatchConfirmer::confirm(std::vector<std::string> const &names)
{
    release(0, names);
}

void DispatchConfirmer::confirm(DispatchUnit const &unit)
{
    release(unit.id, unit.names);
}

std::uint64_t DispatchConfirmer::confirmations() const noexcept
{
    return confirmations_.load(std::memory_order_relaxed);
}

void DispatchConfirmer::release(std::uint64_t unit_id,
                                std::vector<std::string> const &names)
{
    if (backlog_ == nullptr || names.empty())
    {
        return;
    }
    backlog_->mark_done(names);
    confirmations_.fetch_add(1, std::memory_order_relaxed);
    TF_LOG_DEBUG("confirmed unit {} ({} entries)", unit_id, names.size());
    if (bus_)
    {
        bus_->publish(DispatchConfirmedEvent{unit_id, names});
    }
}

} // namespace tf::engine
