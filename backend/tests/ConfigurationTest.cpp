#include "FetchTestUtils.hpp"
#include "engine/Backlog.hpp"
#include "engine/ConfigurationService.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <doctest/doctest.h>

using tf::engine::ConfigurationService;
using tf::engine::FetchSettings;

namespace
{

bool has_error(ConfigurationService::LoadResult const &result,
               std::string const &message)
{
    return std::find(result.errors.begin(), result.errors.end(), message) !=
           result.errors.end();
}

} // namespace

TEST_CASE("ConfigurationService applies defaults")
{
    auto result = ConfigurationService::parse(
        R"({"sourceDir": "/srv/inbox", "workingDir": "/srv/work"})");
    REQUIRE(result.ok());
    auto const &settings = *result.settings;
    CHECK(settings.source_dir == "/srv/inbox");
    CHECK(settings.working_dir == "/srv/work");
    CHECK(settings.poll_interval == std::chrono::milliseconds(1000));
    CHECK(settings.max_batch_size == tf::engine::Backlog::kUnbounded);
    CHECK(settings.client_pool_size == 2);
    CHECK(settings.journal_path.empty());
    CHECK(settings.log_level == 'I');
}

TEST_CASE("ConfigurationService reads every key")
{
    auto result = ConfigurationService::parse(R"({
        // hand-edited
        "sourceDir": "inbox",
        "workingDir": "/srv/work",
        "pollIntervalMs": 250,
        "maxBatchSize": 16,
        "clientPoolSize": 4,
        "journalPath": "state/journal.db",
        "dataRoot": "/var/lib/tinyfetch",
        "logLevel": "debug",
    })",
                                              "/etc/tinyfetch");
    REQUIRE(result.ok());
    auto const &settings = *result.settings;
    CHECK(settings.source_dir == std::filesystem::path("/etc/tinyfetch/inbox"));
    CHECK(settings.working_dir == "/srv/work");
    CHECK(settings.poll_interval == std::chrono::milliseconds(250));
    CHECK(settings.max_batch_size == 16);
    CHECK(settings.client_pool_size == 4);
    CHECK(settings.journal_path ==
          std::filesystem::path("/etc/tinyfetch/state/journal.db"));
    CHECK(settings.data_root == "/var/lib/tinyfetch");
    CHECK(settings.log_level == 'D');
}

TEST_CASE("ConfigurationService rejects invalid batch sizes")
{
    auto zero = ConfigurationService::parse(
        R"({"sourceDir":"/a","workingDir":"/b","maxBatchSize":0})");
    CHECK_FALSE(zero.ok());
    CHECK(has_error(zero, "'maxBatchSize' must be positive or -1 (unbounded)"));

    auto negative = ConfigurationService::parse(
        R"({"sourceDir":"/a","workingDir":"/b","maxBatchSize":-7})");
    CHECK_FALSE(negative.ok());

    auto unbounded = ConfigurationService::parse(
        R"({"sourceDir":"/a","workingDir":"/b","maxBatchSize":-1})");
    CHECK(unbounded.ok());
}

TEST_CASE("ConfigurationService collects every violation")
{
    auto result = ConfigurationService::parse(
        R"({"pollIntervalMs": 10, "clientPoolSize": 0, "logLevel": "loud"})");
    CHECK_FALSE(result.ok());
    CHECK(has_error(result, "'sourceDir' is required"));
    CHECK(has_error(result, "'workingDir' is required"));
    CHECK(has_error(result, "'pollIntervalMs' must be at least 50"));
    CHECK(has_error(result, "'clientPoolSize' must be at least 1"));
    CHECK(has_error(result, "unknown logLevel 'loud'"));
}

TEST_CASE("ConfigurationService reports type errors and bad documents")
{
    auto typed = ConfigurationService::parse(
        R"({"sourceDir": 5, "workingDir": "/b", "maxBatchSize": "ten"})");
    CHECK_FALSE(typed.ok());
    CHECK(has_error(typed, "'sourceDir' must be a string"));
    CHECK(has_error(typed, "'maxBatchSize' must be an integer"));

    auto broken = ConfigurationService::parse("{\"sourceDir\": ");
    CHECK(has_error(broken, "configuration is not valid JSON"));

    auto array = ConfigurationService::parse("[1, 2]");
    CHECK(has_error(array, "configuration must be a JSON object"));

    auto same = ConfigurationService::parse(
        R"({"sourceDir": "/data/x", "workingDir": "/data/x/"})");
    CHECK(has_error(same, "'workingDir' must differ from 'sourceDir'"));
}

TEST_CASE("ConfigurationService loads a file relative to its directory")
{
    auto root = tf::tests::make_temp_root("config-file");
    auto path = root / "tinyfetch.json";
    tf::tests::write_text(
        path, R"({"sourceDir": "in", "workingDir": "out", "maxBatchSize": 3})");

    auto result = ConfigurationService::load_file(path);
    REQUIRE(result.ok());
    CHECK(result.settings->source_dir == root / "in");
    CHECK(result.settings->working_dir == root / "out");
    CHECK(result.settings->max_batch_size == 3);

    auto missing = ConfigurationService::load_file(root / "absent.json");
    CHECK_FALSE(missing.ok());
    CHECK(missing.errors.size() == 1);

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}
