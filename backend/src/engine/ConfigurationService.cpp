#include "engine/ConfigurationService.hpp"

#include "engine/Backlog.hpp"
#include "utils/Json.hpp"

#include <format>
#include <limits>
#include <utility>

namespace tf::engine
{

namespace
{

std::filesystem::path resolve(std::filesystem::path const &base,
                              std::string const &value)
{
    std::filesystem::path path(value);
    if (path.is_relative() && !base.empty())
    {
        return base / path;
    }
    return path;
}

std::filesystem::path comparable(std::filesystem::path const &path)
{
    auto normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path())
    {
        normal = normal.parent_path();
    }
    return normal;
}

bool is_known_level(char level)
{
    return level == 'D' || level == 'I' || level == 'W' || level == 'E';
}

std::optional<char> parse_level(std::string const &value)
{
    if (value == "debug")
        return 'D';
    if (value == "info")
        return 'I';
    if (value == "warn" || value == "warning")
        return 'W';
    if (value == "error")
        return 'E';
    return std::nullopt;
}

// Reads an integer key that must fit an int. Records type or range errors.
std::optional<int> read_int(yyjson_val *root, char const *key,
                            std::vector<std::string> &errors)
{
    bool type_error = false;
    auto value = tf::json::get_int(root, key, &type_error);
    if (type_error)
    {
        errors.push_back(std::format("'{}' must be an integer", key));
        return std::nullopt;
    }
    if (!value)
    {
        return std::nullopt;
    }
    if (*value < std::numeric_limits<int>::min() ||
        *value > std::numeric_limits<int>::max())
    {
        errors.push_back(std::format("'{}' is out of range", key));
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

std::optional<std::string> read_string(yyjson_val *root, char const *key,
                                       std::vector<std::string> &errors)
{
    bool type_error = false;
    auto value = tf::json::get_string(root, key, &type_error);
    if (type_error)
    {
        errors.push_back(std::format("'{}' must be a string", key));
    }
    return value;
}

} // namespace

auto ConfigurationService::parse(std::string_view json,
                                 std::filesystem::path const &base_dir)
    -> LoadResult
{
    auto doc = tf::json::Document::parse(json);
    if (!doc.is_valid() || doc.root() == nullptr)
    {
        LoadResult result;
        result.errors.emplace_back("configuration is not valid JSON");
        return result;
    }
    return from_root(doc.root(), base_dir);
}

auto ConfigurationService::load_file(std::filesystem::path const &path)
    -> LoadResult
{
    std::string read_error;
    auto doc = tf::json::Document::parse_file(path, &read_error);
    if (!doc.is_valid() || doc.root() == nullptr)
    {
        LoadResult result;
        result.errors.push_back(
            std::format("cannot read {}: {}", path.string(), read_error));
        return result;
    }
    return from_root(doc.root(), path.parent_path());
}

auto ConfigurationService::from_root(yyjson_val *root,
                                     std::filesystem::path const &base_dir)
    -> LoadResult
{
    LoadResult result;
    if (!yyjson_is_obj(root))
    {
        result.errors.emplace_back("configuration must be a JSON object");
        return result;
    }

    FetchSettings settings;
    auto &errors = result.errors;
    if (auto value = read_string(root, "sourceDir", errors))
    {
        settings.source_dir = resolve(base_dir, *value);
    }
    if (auto value = read_string(root, "workingDir", errors))
    {
        settings.working_dir = resolve(base_dir, *value);
    }
    if (auto value = read_string(root, "journalPath", errors);
        value && !value->empty())
    {
        settings.journal_path = resolve(base_dir, *value);
    }
    if (auto value = read_string(root, "dataRoot", errors);
        value && !value->empty())
    {
        settings.data_root = resolve(base_dir, *value);
    }
    if (auto value = read_string(root, "logLevel", errors))
    {
        if (auto level = parse_level(*value))
        {
            settings.log_level = *level;
        }
        else
        {
            errors.push_back(std::format("unknown logLevel '{}'", *value));
        }
    }
    if (auto value = read_int(root, "pollIntervalMs", errors))
    {
        settings.poll_interval = std::chrono::milliseconds(*value);
    }
    if (auto value = read_int(root, "maxBatchSize", errors))
    {
        settings.max_batch_size = *value;
    }
    if (auto value = read_int(root, "clientPoolSize", errors))
    {
        settings.client_pool_size = *value;
    }

    auto rule_errors = validate(settings);
    errors.insert(errors.end(), rule_errors.begin(), rule_errors.end());
    if (errors.empty())
    {
        result.settings = std::move(settings);
    }
    return result;
}

std::vector<std::string>
ConfigurationService::validate(FetchSettings const &settings)
{
    std::vector<std::string> errors;
    if (settings.source_dir.empty())
    {
        errors.emplace_back("'sourceDir' is required");
    }
    if (settings.working_dir.empty())
    {
        errors.emplace_back("'workingDir' is required");
    }
    if (!settings.source_dir.empty() && !settings.working_dir.empty() &&
        comparable(settings.source_dir) == comparable(settings.working_dir))
    {
        errors.emplace_back("'workingDir' must differ from 'sourceDir'");
    }
    if (settings.poll_interval < kMinPollInterval)
    {
        errors.push_back(std::format("'pollIntervalMs' must be at least {}",
                                     kMinPollInterval.count()));
    }
    if (settings.max_batch_size != Backlog::kUnbounded &&
        settings.max_batch_size <= 0)
    {
        errors.push_back(
            std::format("'maxBatchSize' must be positive or {} (unbounded)",
                        Backlog::kUnbounded));
    }
    if (settings.client_pool_size < 1)
    {
        errors.emplace_back("'clientPoolSize' must be at least 1");
    }
    if (!is_known_level(settings.log_level))
    {
        errors.emplace_back("unknown log level");
    }
    return errors;
}

ConfigurationService::ConfigurationService(FetchSettings settings)
    : settings_(std::move(settings))
{
}

FetchSettings const &ConfigurationService::get() const noexcept
{
    return settings_;
}

} // namespace tf::engine
