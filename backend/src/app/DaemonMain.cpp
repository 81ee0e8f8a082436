#include "app/DaemonMain.hpp"

#include "consumer/WorkingDirectorySink.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/ConfigurationService.hpp"
#include "engine/DispatchConfirmer.hpp"
#include "engine/DispatchJournal.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PollingSource.hpp"
#include "engine/SchedulerService.hpp"
#include "source/LocalDirectorySource.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tf::app
{

namespace
{

constexpr std::string_view kUsage =
    "usage: tinyfetch --config <file> [--once]\n"
    "  --config <file>  JSON configuration (sourceDir, workingDir, ...)\n"
    "  --once           run a single poll cycle and exit\n"
    "  --version        print version and exit\n"
    "  --help           show this help";

constexpr std::chrono::hours kJournalRetention{24 * 7};

void report_outcome(engine::PollOutcome const &outcome)
{
    switch (outcome.status)
    {
    case engine::PollStatus::Idle:
        if (!outcome.entry_failures.empty())
        {
            TF_LOG_INFO("poll: nothing dispatched, {} entries requeued",
                        outcome.entry_failures.size());
        }
        break;
    case engine::PollStatus::Dispatched:
        if (!outcome.entry_failures.empty())
        {
            TF_LOG_INFO("poll: unit {} dispatched, {} entries requeued",
                        outcome.unit_id, outcome.entry_failures.size());
        }
        break;
    case engine::PollStatus::ListFailed:
    case engine::PollStatus::RetrieveChannelFailed:
    case engine::PollStatus::DispatchFailed:
        TF_LOG_WARN("poll: {} ({} names rolled back)",
                    engine::to_string(outcome.status), outcome.rolled_back);
        break;
    case engine::PollStatus::Cancelled:
        TF_LOG_DEBUG("poll: cancelled");
        break;
    }
}

// Everything one daemon run owns. Declaration order is teardown order in
// reverse: the bus outlives every subscriber.
struct Runtime
{
    explicit Runtime(engine::FetchSettings settings)
        : config(std::move(settings)),
          source(config.get().source_dir,
                 static_cast<std::size_t>(config.get().client_pool_size))
    {
    }

    bool init()
    {
        auto settings = config.get();
        engine::PollingConfig polling_config;
        polling_config.max_batch_size = settings.max_batch_size;
        polling_config.source_label = settings.source_dir.filename().string();
        if (polling_config.source_label.empty())
        {
            polling_config.source_label = settings.source_dir.string();
        }
        polling = engine::PollingSource::create(
            polling_config, &source, &source,
            [this](engine::DispatchUnit unit)
            {
                if (bus.publish(engine::DispatchReadyEvent{std::move(unit)}) ==
                    0)
                {
                    TF_LOG_WARN("dispatch unit has no consumer");
                }
            });
        if (!polling)
        {
            return false;
        }
        confirmer = std::make_unique<engine::DispatchConfirmer>(
            &polling->backlog(), &bus);
        sink = std::make_unique<consumer::WorkingDirectorySink>(
            settings.working_dir, confirmer.get());

        if (!settings.journal_path.empty())
        {
            journal =
                std::make_unique<engine::DispatchJournal>(settings.journal_path);
            if (journal->is_valid())
            {
                journal->attach(bus);
                journal->start();
                journal->prune_confirmed_older_than(kJournalRetention);
            }
            else
            {
                TF_LOG_WARN("journal {} unavailable, continuing without it",
                            settings.journal_path.string());
                journal.reset();
            }
        }

        bus.subscribe<engine::DispatchReadyEvent>(
            [this](engine::DispatchReadyEvent const &event)
            {
                auto unit =
                    std::make_shared<engine::DispatchUnit const>(event.unit);
                if (!consumer.submit([this, unit] { sink->accept(*unit); }))
                {
                    TF_LOG_WARN("consumer stopping, unit {} stays in flight",
                                unit->id);
                }
            });
        consumer.start();
        return true;
    }

    void shutdown()
    {
        if (polling)
        {
            polling->stop();
        }
        consumer.stop();
        if (journal)
        {
            journal->flush();
            journal->stop();
        }
        if (polling)
        {
            auto const &backlog = polling->backlog();
            TF_LOG_INFO("stopped with {} pending and {} in flight",
                        backlog.pending_count(), backlog.in_flight_count());
        }
    }

    engine::EventBus bus;
    engine::ConfigurationService config;
    source::LocalDirectorySource source;
    std::unique_ptr<engine::PollingSource> polling;
    std::unique_ptr<engine::DispatchConfirmer> confirmer;
    std::unique_ptr<consumer::WorkingDirectorySink> sink;
    std::unique_ptr<engine::DispatchJournal> journal;
    engine::AsyncTaskService consumer{"consumer"};
};

int run_once(Runtime &runtime)
{
    auto outcome = runtime.polling->poll();
    report_outcome(outcome);
    runtime.consumer.wait_idle();
    tf::log::print_status("{}: {} entries dispatched",
                          engine::to_string(outcome.status),
                          outcome.dispatched.size());
    return outcome.ok() ? 0 : 1;
}

int run_loop(Runtime &runtime)
{
    engine::SchedulerService scheduler;
    auto interval = runtime.config.get().poll_interval;
    scheduler.schedule(
        interval,
        [&runtime]
        {
            auto outcome = runtime.polling->poll();
            report_outcome(outcome);
        },
        true);

    while (!tf::runtime::should_shutdown())
    {
        auto now = engine::SchedulerService::Clock::now();
        scheduler.tick(now);
        auto wait = scheduler.time_until_next_task(
            engine::SchedulerService::Clock::now());
        tf::runtime::wait_for_shutdown(wait);
    }
    return 0;
}

} // namespace

std::optional<DaemonOptions> parse_arguments(std::vector<std::string> const &args,
                                             std::string &error)
{
    DaemonOptions options;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        auto const &arg = args[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= args.size())
            {
                error = "--config needs a file argument";
                return std::nullopt;
            }
            options.config_path = args[++i];
        }
        else if (arg.starts_with("--config="))
        {
            options.config_path = arg.substr(sizeof("--config=") - 1);
        }
        else if (arg == "--once")
        {
            options.run_once = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--version")
        {
            options.show_version = true;
        }
        else
        {
            error = "unknown argument '" + arg + "'";
            return std::nullopt;
        }
    }
    if (!options.show_help && !options.show_version &&
        options.config_path.empty())
    {
        error = "--config is required";
        return std::nullopt;
    }
    return options;
}

int daemon_main(int argc, char *argv[])
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    std::string arg_error;
    auto options = parse_arguments(args, arg_error);
    if (!options)
    {
        std::fprintf(stderr, "tinyfetch: %s\n%s\n", arg_error.c_str(),
                     kUsage.data());
        return 2;
    }
    if (options->show_help)
    {
        tf::log::print_status("{}", kUsage);
        return 0;
    }
    if (options->show_version)
    {
        tf::log::print_status(
            "{}", std::string_view(tf::version::kDisplayVersion));
        return 0;
    }

    auto loaded = engine::ConfigurationService::load_file(options->config_path);
    if (!loaded.ok())
    {
        for (auto const &message : loaded.errors)
        {
            std::fprintf(stderr, "tinyfetch: %s\n", message.c_str());
        }
        return 1;
    }
    auto settings = std::move(*loaded.settings);
    if (!settings.data_root.empty())
    {
        tf::utils::set_data_root(settings.data_root);
    }
    tf::log::set_log_file(tf::utils::data_root() / "tinyfetch.log");
    tf::log::set_min_level(settings.log_level);

    TF_LOG_INFO("{} polling {} every {} ms into {}",
                std::string_view(tf::version::kDisplayVersion),
                settings.source_dir.string(),
                settings.poll_interval.count(), settings.working_dir.string());

    Runtime runtime(std::move(settings));
    if (!runtime.init())
    {
        return 1;
    }

    int rc = 0;
    if (options->run_once)
    {
        rc = run_once(runtime);
    }
    else
    {
        tf::runtime::install_signal_handlers();
        rc = run_loop(runtime);
    }
    runtime.shutdown();
    TF_LOG_INFO("shutdown complete");
    return rc;
}

} // namespace tf::app
