#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/MediaTools.hpp"
#include "core/MetadataProvider.hpp"
#include "core/Notifier.hpp"
#include "core/RunOrchestrator.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace podcapture::core;

void printHelp() {
    std::cout << "\nPodCapture:\n"
              << "Usage: podcapture [options]\n\n"
              << "Records the scheduled radio show airing right now, splits it into\n"
              << "podcast-sized parts and regenerates the RSS feed. Meant to be run\n"
              << "from cron at the top of every hour.\n\n"
              << "Options:\n"
              << "  --config <file>      - Configuration file (default: podcapture.json)\n"
              << "  --force [show name]  - Record now, ignoring the schedule\n"
              << "                         (show name defaults to \"Manual Capture\")\n"
              << "  --help               - Show this help\n\n"
              << "Exit status: 0 when nothing was due or the capture succeeded,\n"
              << "1 when the capture or splitting failed, 2 on configuration errors.\n\n";
}

int main(int argc, char* argv[]) {
    std::string configFile = "podcapture.json";
    bool force = false;
    std::string forceShowName;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            printHelp();
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Usage: --config <file>\n";
                return 2;
            }
            configFile = argv[++i];
        } else if (arg == "--force") {
            force = true;
            // Everything up to the next option is the show name.
            while (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                if (!forceShowName.empty()) forceShowName += " ";
                forceShowName += argv[++i];
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printHelp();
            return 2;
        }
    }

    Config config;
    try {
        config = Config::load(configFile);
        if (!forceShowName.empty()) {
            config.forceShowName = forceShowName;
        }
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }

    try {
        if (!config.log.file.empty()) {
            Logger::setLogFile(config.resolve(config.log.file), config.log.maxBytes, config.log.maxFiles);
        }

        VlcMediaTools media(config.audioBitrateKbps);
        SpinitronMetadataProvider metadata(config.metadataTimeoutSeconds);

        std::unique_ptr<Notifier> notifier;
        if (!config.notify.webhookUrl.empty()) {
            notifier = std::make_unique<WebhookNotifier>(config.notify.webhookUrl, config.notify.timeoutSeconds);
        } else {
            notifier = std::make_unique<LogNotifier>();
        }

        std::unique_ptr<Publisher> publisher;
        if (config.publish.enabled) {
            publisher = std::make_unique<GitPublisher>(config.resolve(config.publish.repoDir), config.publish.remote,
                                                       config.publish.branch, config.publish.commitMessage);
        } else {
            publisher = std::make_unique<NullPublisher>();
        }

        RunOrchestrator orchestrator(config, media, media, media, metadata, *notifier, *publisher);
        RunOutcome outcome = orchestrator.run(force);
        Logger::info(std::string("Run finished: ") + toString(outcome));
        Logger::closeLogFile();
        return exitCodeFor(outcome);
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        Logger::closeLogFile();
        return 1;
    }
}
