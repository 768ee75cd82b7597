#include <sys/prctl.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include "conversioncontroller.hpp"
#include "conversionpolicy.hpp"
#include "deletioncontroller.hpp"
#include "diskspacemonitor.hpp"
#include "fileservice.hpp"
#include "librawcodec.hpp"
#include "loggingservice.hpp"
#include "logutils.hpp"
#include "metadatatransplanter.hpp"
#include "pausegate.hpp"
#include "statestore.hpp"

namespace {

const int EXIT_USAGE = 2;

struct CommandLine {
    std::string command;
    std::string directory;
    std::string configPath = "config.json";
    std::optional<std::int64_t> requiredSpaceMb;
    std::optional<std::string> logName;
    std::optional<std::size_t> batch;
    bool force = false;
    bool verbose = false;
};

class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void printUsage(std::ostream& out) {
    out << "Usage:\n"
        << "  rawconvert convert --dir|-d <path> [--space|-s <MB>] [--force|-f] [--verbose|-v] [--config <file>]\n"
        << "  rawconvert delete  --dir|-d <path> [--log <name>] [--force|-f] [--batch <N>] [--verbose|-v] [--config <file>]\n"
        << "\n"
        << "convert  Convert raw images below <path> to JPEG, resuming earlier runs\n"
        << "delete   Delete raw images whose JPEG conversion is recorded and present\n";
}

std::int64_t parsePositive(const std::string& flag, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size() || parsed <= 0) {
        throw UsageError(flag + " expects a positive number, got '" + value + "'");
    }
    return parsed;
}

CommandLine parseCommandLine(int argc, char* argv[]) {
    if (argc < 2) {
        throw UsageError("Missing command");
    }

    CommandLine cmd;
    cmd.command = argv[1];
    if (cmd.command != "convert" && cmd.command != "delete") {
        throw UsageError("Unknown command '" + cmd.command + "'");
    }
    const bool converting = cmd.command == "convert";

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--dir" || arg == "-d") {
            cmd.directory = nextValue();
        } else if (arg == "--config") {
            cmd.configPath = nextValue();
        } else if (arg == "--force" || arg == "-f") {
            cmd.force = true;
        } else if (arg == "--verbose" || arg == "-v") {
            cmd.verbose = true;
        } else if (converting && (arg == "--space" || arg == "-s")) {
            cmd.requiredSpaceMb = parsePositive(arg, nextValue());
        } else if (!converting && arg == "--log") {
            cmd.logName = nextValue();
        } else if (!converting && arg == "--batch") {
            cmd.batch = static_cast<std::size_t>(parsePositive(arg, nextValue()));
        } else {
            throw UsageError("Unknown option '" + arg + "' for " + cmd.command);
        }
    }

    if (cmd.directory.empty()) {
        throw UsageError("--dir is required");
    }
    return cmd;
}

PartitionFiles partitionFilesFor(const ConversionPolicy& policy) {
    PartitionFiles files;
    files.converted = policy.conversionLogName;
    files.corrupt = policy.corruptLogName;
    files.deleted = policy.deletionLogName;
    return files;
}

void logConfigSource(LoggingService* logger, const CommandLine& cmd, bool configLoaded) {
    if (configLoaded) {
        logger->debug("Loaded configuration from " + cmd.configPath, createLogInfo(), "CLI_CONFIG");
    } else {
        logger->debug("No configuration at " + cmd.configPath + ", using defaults", createLogInfo(), "CLI_CONFIG");
    }
}

int runConvert(const CommandLine& cmd, ConversionPolicy& policy, bool configLoaded) {
    if (cmd.requiredSpaceMb) {
        policy.requiredSpaceMb = *cmd.requiredSpaceMb;
    }

    LoggingService* logger = LoggingService::getInstance(policy.conversionLogSource, cmd.directory);
    logger->setConsoleLevel(cmd.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    logConfigSource(logger, cmd, configLoaded);
    logger->info("Starting directory: " + cmd.directory,
                 createLogInfo({{"policy", policy.to_dict()}}), "CLI_CONVERT");

    FileService fileService;
    StateStore stateStore(cmd.directory, fileService, *logger, partitionFilesFor(policy));

    SpaceCheckIntervals intervals;
    intervals.ok = policy.spaceCheckIntervalOk;
    intervals.warning = policy.spaceCheckIntervalWarning;
    intervals.critical = policy.spaceCheckIntervalCritical;
    DiskSpaceMonitor spaceMonitor(cmd.directory, policy.requiredSpaceMb, fileService, *logger, intervals,
                                  policy.predictionWindow, policy.minPredictionSamples);

    LibRawJpegCodec codec;
    LibRawMetadataTransplanter transplanter;
    TerminalPauseDecisionProvider pauseProvider;
    TerminalConfirmationProvider confirmation("y");

    ConversionController controller(policy, cmd.directory, stateStore, fileService, spaceMonitor, codec,
                                    transplanter, pauseProvider, confirmation, *logger, cmd.force);

    auto start = std::chrono::steady_clock::now();
    ConversionSummary summary = controller.run();
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (!summary.cancelled) {
        logger->info("Conversion process completed in " + std::to_string(elapsed) + " seconds",
                     createLogInfo({{"aborted", summary.aborted}}), "CLI_DONE");
    }
    return 0;
}

int runDelete(const CommandLine& cmd, ConversionPolicy& policy, bool configLoaded) {
    if (cmd.logName) {
        policy.conversionLogName = *cmd.logName;
    }

    LoggingService* logger = LoggingService::getInstance(policy.deletionLogSource, cmd.directory);
    logger->setConsoleLevel(cmd.verbose ? LogLevel::DEBUG : LogLevel::INFO);
    logConfigSource(logger, cmd, configLoaded);
    logger->info("Deleting converted raw files in " + cmd.directory,
                 createLogInfo({{"log", policy.conversionLogName}, {"force", cmd.force}}), "CLI_DELETE");

    FileService fileService;
    StateStore stateStore(cmd.directory, fileService, *logger, partitionFilesFor(policy));
    TerminalConfirmationProvider confirmation("yes");

    DeletionController controller(stateStore, fileService, confirmation, *logger);
    controller.run(cmd.force, cmd.batch);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (prctl(PR_SET_NAME, "RAWCONVERT", 0, 0, 0) != 0) {
        perror("process control failed");
        return 1;
    }

    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    if (FileService::check_path_type(cmd.directory) != "directory") {
        std::cerr << "Error: The specified directory '" << cmd.directory
                  << "' does not exist or is not a directory." << std::endl;
        return 1;
    }

    try {
        // Partition keys are absolute source paths
        cmd.directory = FileService::absolute_path(cmd.directory);

        ConversionPolicy policy;
        bool configLoaded = policy.loadConfig(cmd.configPath);

        if (cmd.command == "convert") {
            return runConvert(cmd, policy, configLoaded);
        }
        return runDelete(cmd, policy, configLoaded);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
