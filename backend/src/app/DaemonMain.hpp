#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tf::app
{

struct DaemonOptions
{
    std::filesystem::path config_path;
    bool run_once = false;
    bool show_help = false;
    bool show_version = false;
};

// Returns std::nullopt and fills `error` on a malformed command line.
std::optional<DaemonOptions> parse_arguments(std::vector<std::string> const &args,
                                             std::string &error);

// Runs the TinyFetch daemon: polls the configured source directory on a
// fixed interval and stores dispatched entries in the working directory.
// Returns 0 on clean shutdown, 1 on runtime/config failure, 2 on usage error.
int daemon_main(int argc, char *argv[]);

} // namespace tf::app
