#include "conversioncontroller.hpp"
#include "logutils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace {
constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

std::string skipReason(FileState state) {
    switch (state) {
        case FileState::SkippedAlreadyLogged: return "found in conversion log";
        case FileState::SkippedOutputExists: return "output file already exists";
        case FileState::SkippedQuarantined: return "previously identified as corrupt";
        default: return fileStateName(state);
    }
}

std::string formatMb(double mb) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << mb;
    return ss.str();
}
}

std::string fileStateName(FileState state) {
    switch (state) {
        case FileState::Pending: return "pending";
        case FileState::SkippedAlreadyLogged: return "skipped_already_logged";
        case FileState::SkippedOutputExists: return "skipped_output_exists";
        case FileState::SkippedQuarantined: return "skipped_quarantined";
        case FileState::Converted: return "converted";
        case FileState::Quarantined: return "quarantined";
    }
    return "unknown";
}

ConversionController::ConversionController(const ConversionPolicy& policy,
                                           const std::string& rootDirectory,
                                           StateStore& stateStore,
                                           FileService& fileService,
                                           DiskSpaceMonitor& spaceMonitor,
                                           ImageCodec& codec,
                                           MetadataTransplanter& metadataTransplanter,
                                           PauseDecisionProvider& pauseProvider,
                                           ConfirmationProvider& confirmationProvider,
                                           EventSink& logger,
                                           bool force)
    : policy(policy), rootDirectory(FileService::absolute_path(rootDirectory)), stateStore(stateStore),
      fileService(fileService), spaceMonitor(spaceMonitor), codec(codec), metadataTransplanter(metadataTransplanter),
      pauseProvider(pauseProvider), confirmationProvider(confirmationProvider), logger(logger),
      forceMode(force) {
    spaceCheckInterval = spaceMonitor.checkIntervalFor(SpaceStatus::Ok);
}

FileState ConversionController::classify(const std::string& sourcePath) const {
    if (convertedLog.contains(sourcePath)) {
        return FileState::SkippedAlreadyLogged;
    }
    if (fileService.file_exists(policy.outputPathFor(sourcePath))) {
        return FileState::SkippedOutputExists;
    }
    if (corruptLog.contains(sourcePath)) {
        return FileState::SkippedQuarantined;
    }
    return FileState::Pending;
}

ConversionSummary ConversionController::run() {
    ConversionSummary summary;
    startTime = std::chrono::steady_clock::now();
    sessionProcessed = 0;
    spaceCheckCounter = 0;
    paused = false;

    logger.info("Starting raw image conversion process",
                createLogInfo({{"directory", rootDirectory}, {"force", forceMode}}),
                "CONV_START");

    if (!confirmStartupSpace()) {
        logger.info("Conversion cancelled due to low disk space", createLogInfo(), "CONV_CANCELLED");
        summary.cancelled = true;
        return summary;
    }

    convertedLog = stateStore.loadConverted();
    logger.info("Loaded conversion log with " + std::to_string(convertedLog.size()) +
                " previously converted files", createLogInfo(), "CONV_LOG_LOADED");
    corruptLog = stateStore.loadCorrupt();
    logger.info("Loaded corrupt files log with " + std::to_string(corruptLog.size()) +
                " previously identified corrupt files", createLogInfo(), "CORRUPT_LOG_LOADED");

    std::size_t directoriesWithoutRaw = 0;
    std::vector<DirectoryListing> listings = scanTree(summary.totalFiles, directoriesWithoutRaw);
    summary.previouslyProcessed = convertedLog.size() + corruptLog.size();

    logger.info("Found " + std::to_string(summary.totalFiles) + " raw files to process",
                createLogInfo({{"total_files", summary.totalFiles},
                               {"previously_processed", summary.previouslyProcessed}}),
                "SCAN_COMPLETE");

    for (const auto& [directory, rawFiles] : listings) {
        summary.directoriesProcessed++;

        for (const auto& sourcePath : rawFiles) {
            const std::string filename = fs::path(sourcePath).filename().string();
            FileState state = classify(sourcePath);

            if (state != FileState::Pending) {
                summary.skipped++;
                logger.info("Skipping: " + filename + " in " + directory + " (" + skipReason(state) + ")",
                            createLogInfo({{"file", sourcePath}, {"state", fileStateName(state)}}),
                            "FILE_SKIPPED");

                if (state == FileState::SkippedOutputExists) {
                    recordExistingOutput(sourcePath);
                }
                continue;
            }

            convertFile(sourcePath, summary);
            sessionProcessed++;

            if (!checkSpaceCadence(summary)) {
                flush();
                summary.aborted = true;
                summary.elapsedSeconds = std::chrono::duration<double>(
                    std::chrono::steady_clock::now() - startTime).count();
                logger.info("Conversion aborted by user, progress saved",
                            createLogInfo({{"converted", summary.converted}, {"errors", summary.errors}}),
                            "CONV_ABORTED");
                logSummary(summary);
                return summary;
            }

            emitProgress(summary);
        }
    }

    summary.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    flush();

    if (directoriesWithoutRaw > 0) {
        logger.debug(std::to_string(directoriesWithoutRaw) + " directories contained no raw image files",
                     createLogInfo(), "SCAN_NO_RAW");
    }
    logSummary(summary);
    return summary;
}

bool ConversionController::confirmStartupSpace() {
    SpaceReport report = spaceMonitor.check();
    spaceCheckInterval = spaceMonitor.checkIntervalFor(report.status);
    logger.info("Available disk space: " + formatMb(report.freeMb) + "MB",
                createLogInfo({{"free_mb", report.freeMb}, {"status", spaceStatusName(report.status)}}),
                "SPACE_INITIAL");

    if (report.status != SpaceStatus::Critical) {
        return true;
    }
    if (forceMode) {
        logger.warning("Proceeding with low disk space (" + formatMb(report.freeMb) +
                       "MB). Some conversions may fail.", createLogInfo(), "SPACE_FORCED");
        return true;
    }
    return confirmationProvider.confirm("Low disk space warning: Only " + formatMb(report.freeMb) +
                                        "MB available. Proceed anyway? (y/n):");
}

std::vector<ConversionController::DirectoryListing>
ConversionController::scanTree(std::size_t& totalFiles, std::size_t& directoriesWithoutRaw) {
    std::vector<DirectoryListing> listings;
    totalFiles = 0;
    directoriesWithoutRaw = 0;

    for (const auto& directory : fileService.list_directories_recursively(rootDirectory)) {
        std::vector<std::string> files = fileService.list_files(directory);
        std::vector<std::string> rawFiles;
        for (const auto& file : files) {
            if (policy.isRawFile(file)) {
                rawFiles.push_back(file);
            }
        }
        if (rawFiles.empty() && !files.empty()) {
            directoriesWithoutRaw++;
            logger.debug("No raw image files found in directory: " + directory,
                         createLogInfo(), "DIR_NO_RAW");
        }
        totalFiles += rawFiles.size();
        listings.emplace_back(directory, std::move(rawFiles));
    }

    outputClaims.clear();
    for (const auto& listing : listings) {
        for (const auto& file : listing.second) {
            outputClaims[policy.outputPathFor(file)]++;
        }
    }
    for (const auto& [outputPath, claims] : outputClaims) {
        if (claims > 1) {
            logger.warning(std::to_string(claims) + " raw files map to " + outputPath +
                           ", only the first one is converted",
                           createLogInfo({{"output", outputPath}, {"sources", claims}}), "OUTPUT_COLLISION");
        }
    }
    return listings;
}

bool ConversionController::outputDerivedFrom(const std::string& sourcePath, const std::string& outputPath) {
    auto claim = outputClaims.find(outputPath);
    if (claim == outputClaims.end() || claim->second != 1) {
        return false;
    }
    try {
        const timespec source = fileService.get_file_times(sourcePath).modificationTime;
        const timespec output = fileService.get_file_times(outputPath).modificationTime;
        return source.tv_sec == output.tv_sec && source.tv_nsec == output.tv_nsec;
    } catch (const std::exception& e) {
        logger.debug("Cannot compare timestamps of " + sourcePath + " and " + outputPath,
                     createLogInfo({{"error", e.what()}}), "FILE_STAT_FAIL");
        return false;
    }
}

// Restores a converted record lost before a flush
void ConversionController::recordExistingOutput(const std::string& sourcePath) {
    const std::string outputPath = policy.outputPathFor(sourcePath);
    if (!outputDerivedFrom(sourcePath, outputPath)) {
        logger.warning("Not recording " + sourcePath + ": existing " + outputPath +
                       " was not produced from it", createLogInfo({{"file", sourcePath}}), "OUTPUT_NOT_DERIVED");
        return;
    }

    ConvertedRecord record;
    record.outputPath = outputPath;
    record.convertedAt = getIsoTimestamp();
    try {
        record.sourceSize = fileService.get_file_size(sourcePath);
    } catch (const std::exception& e) {
        logger.debug("Cannot read size of " + sourcePath,
                     createLogInfo({{"error", e.what()}}), "FILE_STAT_FAIL");
    }
    convertedLog.insert(sourcePath, record);
}

FileState ConversionController::convertFile(const std::string& sourcePath, ConversionSummary& summary) {
    const std::string outputPath = policy.outputPathFor(sourcePath);
    const std::string filename = fs::path(sourcePath).filename().string();
    const std::string outputName = fs::path(outputPath).filename().string();

    logger.debug("Processing " + filename + "...", createLogInfo({{"file", sourcePath}}), "FILE_PROCESSING");

    FileTimes sourceTimes{};
    std::uint64_t sourceSize = 0;
    try {
        sourceTimes = fileService.get_file_times(sourcePath);
        sourceSize = fileService.get_file_size(sourcePath);
    } catch (const std::exception& e) {
        quarantine(sourcePath, ConversionErrorKind::IoError, e.what(), summary);
        return FileState::Quarantined;
    }

    DecodeResult decoded = codec.decode(sourcePath);
    if (!decoded.ok()) {
        quarantine(sourcePath, decoded.error.kind, decoded.error.message, summary);
        return FileState::Quarantined;
    }

    MetadataResult metadata = metadataTransplanter.extract(sourcePath);
    if (metadata.found()) {
        logger.debug("Preserving metadata for " + filename + ": " + metadata.message, createLogInfo(), "META_COPIED");
    } else {
        logger.warning("Could not preserve metadata for " + filename + ": " + metadata.message,
                       createLogInfo({{"file", sourcePath}}), "META_COPY_FAIL");
    }

    EncodeResult encoded = codec.encode(*decoded.image, outputPath, policy.jpegQuality, metadata.blocks);
    if (!encoded.ok()) {
        fileService.remove_if_exists(outputPath);
        quarantine(sourcePath, encoded.error->kind, encoded.error->message, summary);
        return FileState::Quarantined;
    }
    if (!fileService.file_exists(outputPath)) {
        quarantine(sourcePath, ConversionErrorKind::IoError, "Encoder reported success but wrote no output", summary);
        return FileState::Quarantined;
    }

    try {
        fileService.set_file_times(outputPath, sourceTimes);
    } catch (const std::exception& e) {
        logger.warning("Could not preserve timestamps for " + outputName + ": " + e.what(),
                       createLogInfo({{"file", outputPath}}), "TIMES_COPY_FAIL");
    }

    ConvertedRecord record;
    record.outputPath = outputPath;
    record.convertedAt = getIsoTimestamp();
    record.sourceSize = sourceSize;
    convertedLog.insert(sourcePath, record);
    summary.converted++;

    try {
        spaceMonitor.recordOutputSize(static_cast<double>(fileService.get_file_size(outputPath)) / BYTES_PER_MB);
    } catch (const std::exception& e) {
        logger.debug("Cannot read size of " + outputPath, createLogInfo({{"error", e.what()}}), "FILE_STAT_FAIL");
    }

    if (policy.flushInterval > 0 && summary.converted % policy.flushInterval == 0) {
        flush();
    }

    logger.info("Converted: " + filename + " -> " + outputName,
                createLogInfo({{"source", sourcePath}, {"output", outputPath}}), "FILE_CONVERTED");
    return FileState::Converted;
}

void ConversionController::quarantine(const std::string& sourcePath, ConversionErrorKind kind,
                                      const std::string& message, ConversionSummary& summary) {
    const std::string filename = fs::path(sourcePath).filename().string();

    CorruptRecord record;
    record.errorMessage = message;
    record.errorKind = conversionErrorKindName(kind);
    record.detectedAt = getIsoTimestamp();
    try {
        record.sourceSize = fileService.get_file_size(sourcePath);
    } catch (const std::exception&) {
        record.sourceSize = 0;
    }
    corruptLog.insert(sourcePath, record);
    summary.quarantined.push_back(sourcePath);
    summary.errors++;

    logger.error("Could not process " + filename +
                 ". File format might be unsupported or corrupted: " + message,
                 createLogInfo({{"file", sourcePath}, {"error_type", record.errorKind}}),
                 "FILE_QUARANTINED");
}

bool ConversionController::checkSpaceCadence(const ConversionSummary& summary) {
    spaceCheckCounter++;
    if (spaceCheckCounter < spaceCheckInterval) {
        return true;
    }
    spaceCheckCounter = 0;

    SpaceReport report = spaceMonitor.check();
    spaceCheckInterval = spaceMonitor.checkIntervalFor(report.status);

    const std::size_t done = summary.previouslyProcessed + sessionProcessed;
    const std::size_t remaining = summary.totalFiles > done ? summary.totalFiles - done : 0;
    std::optional<Shortfall> shortfall = spaceMonitor.predictShortfall(remaining, report.freeMb);
    if (!shortfall) {
        return true;
    }

    std::ostringstream message;
    message << std::fixed << std::setprecision(1) << "Predicted space issue: Need ~" << shortfall->estimatedNeedMb
            << "MB for remaining files but only " << shortfall->freeMb << "MB available";
    logger.warning(message.str(),
                   createLogInfo({{"estimated_need_mb", shortfall->estimatedNeedMb},
                                  {"free_mb", shortfall->freeMb},
                                  {"average_output_mb", shortfall->averageOutputMb},
                                  {"remaining_files", shortfall->remainingFiles}}),
                   "SPACE_SHORTFALL");

    if (forceMode || paused) {
        return true;
    }

    paused = true;
    flush();
    PauseDecision decision = pauseProvider.decide(*shortfall);
    logger.info("Pause decision: " + pauseDecisionName(decision), createLogInfo(), "PAUSE_DECISION");

    switch (decision) {
        case PauseDecision::Abort:
            paused = false;
            return false;
        case PauseDecision::Force:
            forceMode = true;
            break;
        case PauseDecision::Continue: {
            SpaceReport recheck = spaceMonitor.check();
            spaceCheckInterval = spaceMonitor.checkIntervalFor(recheck.status);
            break;
        }
    }
    paused = false;
    return true;
}

void ConversionController::emitProgress(const ConversionSummary& summary) {
    ProgressReport report;
    report.totalFiles = summary.totalFiles;
    report.previouslyProcessed = summary.previouslyProcessed;
    report.sessionProcessed = sessionProcessed;
    report.processed = summary.previouslyProcessed + sessionProcessed;
    report.percentDone = summary.totalFiles > 0
        ? static_cast<double>(report.processed) / static_cast<double>(summary.totalFiles) * 100.0
        : 0.0;

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
    report.filesPerSecond = elapsed > 0 ? static_cast<double>(sessionProcessed) / elapsed : 0.0;

    const std::size_t onePercent = std::max<std::size_t>(1, summary.totalFiles / 100);
    if (sessionProcessed % 10 == 0 || sessionProcessed % onePercent == 0) {
        const std::size_t remaining = summary.totalFiles > report.processed ? summary.totalFiles - report.processed : 0;
        report.hasEstimate = true;
        report.estimatedRemainingSeconds = report.filesPerSecond > 0
            ? static_cast<double>(remaining) / report.filesPerSecond
            : 0.0;
    }

    logger.progress(report);
}

void ConversionController::flush() {
    stateStore.saveConverted(convertedLog);
    stateStore.saveCorrupt(corruptLog);
}

void ConversionController::logSummary(const ConversionSummary& summary) {
    std::ostringstream completed;
    completed << std::fixed << std::setprecision(1) << "Completed: "
              << summary.converted + summary.skipped + summary.errors << "/" << summary.totalFiles
              << " files processed in " << summary.elapsedSeconds / 60.0 << " minutes";
    logger.info(completed.str(), createLogInfo(), "CONV_COMPLETE");

    logger.info("Conversion Summary:",
                createLogInfo({{"directories", summary.directoriesProcessed},
                               {"converted", summary.converted},
                               {"skipped", summary.skipped},
                               {"errors", summary.errors}}),
                "CONV_SUMMARY");
    logger.info("  Directories processed: " + std::to_string(summary.directoriesProcessed));
    logger.info("  Converted: " + std::to_string(summary.converted));
    logger.info("  Skipped:   " + std::to_string(summary.skipped));
    logger.info("  Errors:    " + std::to_string(summary.errors));

    if (!summary.quarantined.empty()) {
        logger.info("  Corrupt files identified: " + std::to_string(summary.quarantined.size()));
        for (const auto& path : summary.quarantined) {
            logger.info("    - " + path);
        }
        logger.info("  Details saved to " + fs::path(stateStore.partitionPath(Partition::Corrupt)).filename().string());
    }
}
