#pragma once

#include "engine/Dispatch.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace tf::engine
{

class Backlog;
class EventBus;

// Consumer-side acknowledgement path. Confirming releases names from the
// backlog's in-flight set; repeated confirmations are harmless.
class DispatchConfirmer
{
  public:
    // bus may be null; otherwise each confirmation is published as a
    // DispatchConfirmedEvent.
    explicit DispatchConfirmer(Backlog *backlog, EventBus *bus = nullptr);

    void confirm(std::vector<std::string> const &names);
    void confirm(DispatchUnit const &unit);

    std::uint64_t confirmations() const noexcept;

  private:
    void release(std::uint64_t unit_id, std::vector<std::string> const &names);

    Backlog *backlog_ = nullptr;
    EventBus *bus_ = nullptr;
    std::atomic<std::uint64_t> confirmations_{0};
};

} // namespace tf::engine
