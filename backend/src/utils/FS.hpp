#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <system_error>

namespace tf::utils
{

// Directory for the log file and default journal. Honors TINYFETCH_DATA_ROOT,
// then falls back to "<exe dir>/data".
std::filesystem::path data_root();
void set_data_root(std::filesystem::path root);
std::optional<std::filesystem::path> executable_path();

// Writes through a sibling temp file and renames it over the target so a
// reader never observes a half-written file.
bool write_file_atomically(std::filesystem::path const &target,
                           std::span<std::uint8_t const> data,
                           std::error_code &ec);

} // namespace tf::utils
