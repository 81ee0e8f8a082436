#include "consumer/WorkingDirectorySink.hpp"

#include "engine/DispatchConfirmer.hpp"
#include "source/LocalDirectorySource.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"

#include <system_error>
#include <utility>

namespace tf::consumer
{

WorkingDirectorySink::WorkingDirectorySink(std::filesystem::path working_dir,
                                           engine::DispatchConfirmer *confirmer)
    : working_dir_(std::move(working_dir)), confirmer_(confirmer)
{
}

bool WorkingDirectorySink::accept(engine::DispatchUnit const &unit)
{
    for (auto const &item : unit.items)
    {
        if (!source::is_safe_entry_name(item.info.name))
        {
            TF_LOG_ERROR("unit {}: refusing to write entry '{}'", unit.id,
                         item.info.name);
            ++failed_units_;
            return false;
        }
        std::error_code ec;
        auto target = working_dir_ / item.info.name;
        if (!tf::utils::write_file_atomically(target, item.content, ec))
        {
            TF_LOG_ERROR("unit {}: writing {} failed: {}", unit.id,
                         target.string(), ec.message());
            ++failed_units_;
            return false;
        }
    }
    if (confirmer_)
    {
        confirmer_->confirm(unit);
    }
    ++accepted_units_;
    TF_LOG_DEBUG("unit {} stored in {}", unit.id, working_dir_.string());
    return true;
}

} // namespace tf::consumer
