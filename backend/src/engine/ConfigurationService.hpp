#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct yyjson_val;

namespace tf::engine
{

struct FetchSettings
{
    std::filesystem::path source_dir;
    std::filesystem::path working_dir;
    std::chrono::milliseconds poll_interval{1000};
    // -1 = unbounded.
    int max_batch_size = -1;
    int client_pool_size = 2;
    // Empty disables the dispatch journal.
    std::filesystem::path journal_path;
    std::filesystem::path data_root;
    char log_level = 'I';
};

class ConfigurationService
{
  public:
    struct LoadResult
    {
        std::optional<FetchSettings> settings;
        std::vector<std::string> errors;

        bool ok() const noexcept { return settings.has_value(); }
    };

    static constexpr std::chrono::milliseconds kMinPollInterval{50};

    // Relative paths in the document resolve against base_dir.
    static LoadResult parse(std::string_view json,
                            std::filesystem::path const &base_dir = {});
    static LoadResult load_file(std::filesystem::path const &path);

    // Collects every violated rule rather than stopping at the first.
    static std::vector<std::string> validate(FetchSettings const &settings);

    explicit ConfigurationService(FetchSettings settings);

    FetchSettings const &get() const noexcept;

  private:
    static LoadResult from_root(yyjson_val *root,
                                std::filesystem::path const &base_dir);

    FetchSettings settings_;
};

} // namespace tf::engine
