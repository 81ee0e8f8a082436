#pragma once

#include "engine/Dispatch.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace tf::engine
{
class DispatchConfirmer;
}

namespace tf::consumer
{

// Materializes dispatch units as files under a working directory and
// confirms each unit once every item is on disk. Existing files with the same
// name are replaced.
class WorkingDirectorySink
{
  public:
    WorkingDirectorySink(std::filesystem::path working_dir,
                         engine::DispatchConfirmer *confirmer);

    // Returns false, leaving the unit unconfirmed, if any item could not be
    // written.
    bool accept(engine::DispatchUnit const &unit);

    std::filesystem::path const &working_dir() const noexcept
    {
        return working_dir_;
    }
    std::uint64_t accepted_units() const noexcept { return accepted_units_; }
    std::uint64_t failed_units() const noexcept { return failed_units_; }

  private:
    std::filesystem::path working_dir_;
    engine::DispatchConfirmer *confirmer_ = nullptr;
    std::uint64_t accepted_units_ = 0;
    std::uint64_t failed_units_ = 0;
};

} // namespace tf::consumer
