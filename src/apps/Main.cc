#include "chronicle/core/Async.hh"
#include "chronicle/core/Config.hh"
#include "chronicle/core/Log.hh"
#include "chronicle/ingest/ImportScheduler.hh"
#include "chronicle/ingest/SaveDiscovery.hh"
#include "chronicle/ingest/SnapshotLoader.hh"
#include "chronicle/parser/ArgumentParser.hh"
#include "chronicle/store/MemoryStore.hh"
#include "chronicle/store/StoreFile.hh"
#include "chronicle/timeline/TimelineEngine.hh"
#include "chronicle/utils/ThreadPoolExecutor.hh"

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <set>
#include <string>

namespace {

constexpr const char* kAppName = "chronicle";
constexpr const char* kAppVersion = "0.1.0";
constexpr const char* kDefaultConfigFile = "chronicle.toml";
constexpr int kDefaultIntervalSeconds = 10;

void printUsage(const chronicle::ArgumentParser& args) {
    std::cout << "Usage: " << kAppName
              << " [--config F] [--threads N] [--watch] [--interval S] [--series NAME] [--store DIR]"
                 " [--log-level L] <save_dir>"
              << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << args.optionsHelp();
}

// Positive integer option, or the fallback when absent.
bool readCount(const chronicle::ArgumentParser& args, const std::string& name, int& out) {
    if (!args.hasArgument(name)) {
        return true;
    }
    try {
        size_t used = 0;
        std::string text = args.getArgument(name);
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 1) {
            throw std::invalid_argument(text);
        }
        out = value;
        return true;
    } catch (const std::logic_error&) {
        std::cerr << name << " expects a positive integer, got '" << args.getArgument(name) << "'" << std::endl;
        return false;
    }
}

chronicle::Result<chronicle::Config> resolveConfig(const chronicle::ArgumentParser& args) {
    using chronicle::Config;
    using chronicle::ErrorCode;
    using chronicle::Result;

    std::filesystem::path configPath = args.getArgument("--config", kDefaultConfigFile);
    Config config;
    if (args.hasArgument("--config") || std::filesystem::exists(configPath)) {
        auto loaded = Config::load(configPath);
        if (loaded.isError()) {
            return loaded;
        }
        config = loaded.value();
    }

    if (!readCount(args, "--threads", config.threads)) {
        return Result<Config>::error(ErrorCode::InvalidState, "invalid --threads");
    }
    config.storeDir = args.getArgument("--store", config.storeDir);
    config.logLevel = args.getArgument("--log-level", config.logLevel);
    if (!args.positionals().empty()) {
        config.saveDir = args.positionals().front();
    }

    auto valid = config.validate();
    if (valid.isError()) {
        return Result<Config>::error(valid);
    }
    return Result<Config>::ok(std::move(config));
}

} // namespace

int main(int argc, char* argv[]) {
    chronicle::ArgumentParser argParser;
    argParser.addArgument("--config", "TOML configuration file (default: ./chronicle.toml)", true);
    argParser.addArgument("--threads", "Number of parser threads", true);
    argParser.addArgument("--watch", "Keep polling the save directory for new files");
    argParser.addArgument("--interval", "Polling interval in seconds for --watch", true);
    argParser.addArgument("--series", "Only import series whose name starts with NAME", true);
    argParser.addArgument("--store", "Directory for the series store files", true);
    argParser.addArgument("--log-level", "trace, debug, info, warning, error or critical", true);
    argParser.addArgument("--version", "Display version information");
    argParser.addArgument("--help", "Display help information");

    if (!argParser.parse(argc, argv)) {
        std::cerr << argParser.getErrorMessage() << std::endl;
        printUsage(argParser);
        return 1;
    }
    if (argParser.hasArgument("--version")) {
        std::cout << kAppName << " version " << kAppVersion << std::endl;
        return 0;
    }
    if (argParser.hasArgument("--help")) {
        printUsage(argParser);
        return 0;
    }

    int intervalSeconds = kDefaultIntervalSeconds;
    if (!readCount(argParser, "--interval", intervalSeconds)) {
        return 1;
    }

    auto resolved = resolveConfig(argParser);
    if (resolved.isError()) {
        std::cerr << "Configuration error: " << resolved.message() << std::endl;
        return 1;
    }
    const chronicle::Config& config = resolved.value();

    if (config.logFile.empty()) {
        chronicle::log::init();
    } else {
        chronicle::log::init(config.logFile.c_str());
    }
    if (auto level = chronicle::log::levelFromString(config.logLevel)) {
        chronicle::log::setLevel(*level);
        chronicle::log::setParserLevel(*level);
        chronicle::log::setTimelineLevel(*level);
        chronicle::log::setStoreLevel(*level);
    }
    CHRONICLE_LOG_INFO("Starting {} {}", kAppName, kAppVersion);

    int exitCode = 0;
    try {
        chronicle::MemoryStore store;
        chronicle::StoreFile storeFile(config.storeDir);
        size_t restored = storeFile.loadAll(store);
        if (restored > 0) {
            CHRONICLE_LOG_INFO("Restored {} series from {}", restored, config.storeDir);
        }

        chronicle::TimelineOptions options;
        options.observerName = config.observerName;
        options.readAllCountries = config.readAllCountries;
        chronicle::TimelineEngine engine(store, options);

        chronicle::Utils::ThreadPoolExecutor pool(static_cast<size_t>(config.threads));
        chronicle::ParserOptions parserOptions;
        parserOptions.maxDepth = config.maxNestingDepth;
        chronicle::ImportScheduler scheduler(engine, chronicle::SnapshotLoader(parserOptions), pool);

        chronicle::DiscoveryOptions discoveryOptions;
        discoveryOptions.saveNameFilter = config.saveNameFilter;
        discoveryOptions.skipSaves = config.skipSaves;
        discoveryOptions.seriesPrefix = argParser.getArgument("--series");
        chronicle::SaveDiscovery discovery(config.saveDir, discoveryOptions);

        size_t failures = 0;
        auto importNewSaves = [&]() {
            auto files = discovery.scan();
            if (files.empty()) {
                return;
            }
            std::set<std::string> touched;
            size_t imported = 0;
            for (const auto& outcome : scheduler.importFiles(files)) {
                touched.insert(outcome.file.series);
                if (outcome.imported()) {
                    ++imported;
                } else {
                    ++failures;
                }
            }
            for (const auto& series : touched) {
                if (!storeFile.save(store, series)) {
                    CHRONICLE_STORE_LOG_WARN("Could not write {}", storeFile.pathFor(series));
                }
            }
            std::cout << "Imported " << imported << " of " << files.size() << " snapshots" << std::endl;
        };

        if (!argParser.hasArgument("--watch")) {
            importNewSaves();
            exitCode = failures == 0 ? 0 : 2;
        } else {
            chronicle::async::init();
            auto interval = std::chrono::seconds(intervalSeconds);
            auto timer = chronicle::async::makeTimer();
            auto signals = chronicle::async::makeTerminationSignals();

            std::function<void(const asio::error_code&)> onTick = [&](const asio::error_code& ec) {
                if (ec) {
                    return;
                }
                importNewSaves();
                if (scheduler.cancelled()) {
                    return;
                }
                timer.expires_after(interval);
                timer.async_wait(onTick);
            };
            signals.async_wait([&](const asio::error_code& ec, int signal) {
                if (ec) {
                    return;
                }
                CHRONICLE_LOG_INFO("Signal {} received, stopping", signal);
                scheduler.cancel();
                timer.cancel();
                chronicle::async::stop();
            });

            CHRONICLE_LOG_INFO("Watching {} every {} s", config.saveDir, intervalSeconds);
            timer.expires_after(std::chrono::seconds(0));
            timer.async_wait(onTick);
            chronicle::async::run();
            signals.cancel();
            chronicle::async::shutdown();
        }
    } catch (const std::exception& e) {
        CHRONICLE_LOG_CRITICAL("Fatal error: {}", e.what());
        exitCode = 1;
    }

    chronicle::log::shutdown();
    return exitCode;
}
