#include "core/cleanup_coordinator.hpp"
#include "core/media_catalog.hpp"
#include "core/organization_planner.hpp"
#include "core/organization_policy.hpp"
#include "core/poco_config_manager.hpp"
#include "core/shutdown_manager.hpp"
#include "core/transfer_errors.hpp"
#include "core/transfer_session.hpp"
#include "core/volume_watcher.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace
{
    struct CliOptions
    {
        std::string config_path;
        std::string source_dir;
        std::string destination_root;
        std::string log_level;
        bool watch = false;
        bool preview = false;
        bool delete_originals = false;
        bool yes = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Media Transfer - copy camera media into an organized library" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config FILE        Configuration file (.json, .yaml), created if missing" << std::endl;
        std::cout << "  --source DIR         Transfer from this directory" << std::endl;
        std::cout << "  --watch              Wait for a removable volume and transfer from it" << std::endl;
        std::cout << "  --dest DIR           Destination root (overrides destination_root)" << std::endl;
        std::cout << "  --preview            Print the transfer plan and exit" << std::endl;
        std::cout << "  --delete-originals   Delete transferred sources after verification" << std::endl;
        std::cout << "  --yes                Confirm --delete-originals without prompting" << std::endl;
        std::cout << "  --log-level LEVEL    TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
    }

    // Returns false and prints the reason on a malformed command line
    bool parseArguments(int argc, char *argv[], CliOptions &options)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto value = [&](std::string &out) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                out = argv[++i];
                return true;
            };

            if (arg == "--config")
            {
                if (!value(options.config_path))
                    return false;
            }
            else if (arg == "--source")
            {
                if (!value(options.source_dir))
                    return false;
            }
            else if (arg == "--dest")
            {
                if (!value(options.destination_root))
                    return false;
            }
            else if (arg == "--log-level")
            {
                if (!value(options.log_level))
                    return false;
            }
            else if (arg == "--watch")
                options.watch = true;
            else if (arg == "--preview")
                options.preview = true;
            else if (arg == "--delete-originals")
                options.delete_originals = true;
            else if (arg == "--yes")
                options.yes = true;
            else
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                return false;
            }
        }

        if (options.source_dir.empty() == !options.watch)
        {
            std::cerr << "Error: exactly one of --source or --watch is required" << std::endl;
            return false;
        }
        return true;
    }

    VolumeHandlePtr waitForRemovableVolume(VolumeWatcher &watcher, int poll_interval_ms)
    {
        watcher.subscribe([](const VolumeEvent &event)
                          {
            if (event.type == VolumeEventType::ATTACHED)
                std::cout << "Volume attached: " << event.volume.toString() << std::endl;
            else if (event.type == VolumeEventType::DETACHED)
                std::cout << "Volume detached: " << event.volume.toString() << std::endl; });
        watcher.start(poll_interval_ms);

        std::cout << "Waiting for a removable volume (Ctrl+C to quit)..." << std::endl;
        auto &shutdown = ShutdownManager::getInstance();
        while (!shutdown.isShutdownRequested())
        {
            if (auto handle = watcher.activeVolume())
                return handle;
            shutdown.waitForShutdownFor(std::chrono::milliseconds(200));
        }
        return nullptr;
    }

    void printProgress(const TransferEvent &event)
    {
        switch (event.type)
        {
        case TransferEventType::STATUS_CHANGED:
            if (event.record.isTerminal())
            {
                std::cout << "[" << event.files_done << "/" << event.files_total << "] "
                          << MediaTypes::getStatusName(event.record.status) << " "
                          << event.record.destination_path;
                if (!event.record.error_detail.empty())
                    std::cout << " (" << event.record.error_detail << ")";
                else if (!event.record.skip_reason.empty())
                    std::cout << " (" << event.record.skip_reason << ")";
                std::cout << std::endl;
            }
            break;
        case TransferEventType::RETRY_SCHEDULED:
            std::cout << "retry " << event.record.source_path << ": " << event.message << std::endl;
            break;
        case TransferEventType::SESSION_FINISHED:
            std::cout << FileUtils::formatBytes(event.total_bytes_done) << " of "
                      << FileUtils::formatBytes(event.total_bytes_planned) << " copied: "
                      << event.message << std::endl;
            break;
        case TransferEventType::CHUNK_COPIED:
            Logger::trace(FileUtils::formatBytes(event.total_bytes_done) + " / " +
                          FileUtils::formatBytes(event.total_bytes_planned));
            break;
        }
    }

    void printReport(const TransferReport &report)
    {
        for (const auto &group : report.groupByStatus())
        {
            std::cout << MediaTypes::getStatusName(group.first) << ": " << group.second.size() << std::endl;
            for (const auto *record : group.second)
            {
                std::cout << "  " << record->source_path << " -> " << record->destination_path;
                if (record->error_kind != TransferErrorKind::NONE)
                    std::cout << " [" << MediaTypes::getErrorKindName(record->error_kind) << "]";
                std::cout << std::endl;
            }
        }
    }
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
    }

    CliOptions cli;
    if (!parseArguments(argc, argv, cli))
    {
        printUsage(argv[0]);
        return 1;
    }

    Logger::init();
    ShutdownManager::getInstance().installSignalHandlers();

    auto &config = PocoConfigManager::getInstance();
    if (!cli.config_path.empty() && !config.loadOrCreate(cli.config_path))
    {
        std::cerr << "Error: cannot load configuration " << cli.config_path << std::endl;
        return 1;
    }
    if (!config.validateConfig())
        Logger::warn("Configuration has invalid values, see messages above");

    Logger::setLevel(cli.log_level.empty() ? config.getLogLevel() : cli.log_level);
    if (!config.getLogFile().empty())
        Logger::addFileSink(config.getLogFile(), config.getLogMaxSizeMB(), config.getLogMaxFiles());

    const std::string destination_root = cli.destination_root.empty() ? config.getDestinationRoot()
                                                                       : cli.destination_root;

    try
    {
        OrganizationPolicy policy = OrganizationPolicy::fromConfig(config);

        std::unique_ptr<VolumeWatcher> watcher;
        VolumeHandlePtr volume;
        if (cli.watch)
        {
            watcher = std::make_unique<VolumeWatcher>();
            volume = waitForRemovableVolume(*watcher, config.getWatcherPollIntervalMs());
            if (!volume)
            {
                Logger::info("Stopped before a volume was attached");
                return 0;
            }
        }
        else
        {
            auto described = VolumeWatcher::describeVolume(cli.source_dir);
            if (!described)
            {
                std::cerr << "Error: source directory is not readable: " << cli.source_dir << std::endl;
                return 1;
            }
            volume = std::make_shared<VolumeHandle>(*described);
        }
        Logger::info("Source volume: " + volume->volume().toString());

        MediaCatalog catalog(CatalogOptions::fromConfig(config));
        MediaItems items = catalog.scan(volume->volume());
        std::cout << catalog.stats().toJson().dump(2) << std::endl;
        if (items.empty())
        {
            std::cout << "No media files found on " << volume->rootPath() << std::endl;
            return 0;
        }

        size_t discarded = MediaCatalog::discardLeftovers(destination_root);
        if (discarded > 0)
            Logger::warn("Removed " + std::to_string(discarded) + " leftover temporary files from " + destination_root);

        OrganizationPlanner planner(policy, [&catalog](const MediaItem &item)
                                    { return catalog.checksum(item); });
        TransferPlan plan = planner.plan(items, destination_root);

        if (cli.preview)
        {
            std::cout << OrganizationPlanner::preview(plan).dump(2) << std::endl;
            return 0;
        }

        TransferSession session(TransferOptions::fromConfig(config));
        session.start(plan, volume);
        ShutdownManager::getInstance().onShutdown([&session](const std::string &reason)
                                                  {
            Logger::warn("Cancelling transfer: " + reason);
            session.cancel(); });

        while (auto event = session.events().receive())
            printProgress(*event);

        TransferReport report = session.wait();
        ShutdownManager::getInstance().clearCallbacks();
        printReport(report);
        if (!session.errorMessage().empty())
            std::cerr << "Transfer aborted: " << session.errorMessage() << std::endl;

        if (cli.delete_originals)
        {
            if (!cli.yes)
                std::cout << "--delete-originals requires --yes, keeping all originals" << std::endl;
            CleanupCoordinator cleanup;
            CleanupResult result = cleanup.cleanup(report, cli.yes ? CleanupConfirmation::granted()
                                                                   : CleanupConfirmation::denied(),
                                                   volume);
            std::cout << result.toJson().dump(2) << std::endl;
        }

        if (watcher)
            watcher->stop();

        return report.count(TransferStatus::FAILED) == 0 ? 0 : 2;
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error("Invalid organization policy: " + std::string(e.what()));
        return 1;
    }
    catch (const VolumeUnavailableError &e)
    {
        Logger::error("Source volume unavailable: " + std::string(e.what()));
        return 1;
    }
    catch (const PlanCollisionError &e)
    {
        Logger::error("Planning failed: " + std::string(e.what()));
        return 1;
    }
    catch (const std::logic_error &e)
    {
        Logger::error("Cannot start transfer: " + std::string(e.what()));
        return 1;
    }
}
