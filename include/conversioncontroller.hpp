#ifndef CONVERSIONCONTROLLER_HPP
#define CONVERSIONCONTROLLER_HPP

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "conversionpolicy.hpp"
#include "diskspacemonitor.hpp"
#include "eventsink.hpp"
#include "fileservice.hpp"
#include "imagecodec.hpp"
#include "pausegate.hpp"
#include "statestore.hpp"

// Per-file states; every state except Pending is terminal for the run
enum class FileState {
    Pending,
    SkippedAlreadyLogged,
    SkippedOutputExists,
    SkippedQuarantined,
    Converted,
    Quarantined
};

std::string fileStateName(FileState state);

struct ConversionSummary {
    std::size_t converted = 0;
    std::size_t skipped = 0;
    std::size_t errors = 0;
    std::size_t directoriesProcessed = 0;
    std::size_t totalFiles = 0;
    std::size_t previouslyProcessed = 0;
    std::vector<std::string> quarantined;
    bool aborted = false;       // user chose exit at the pause gate
    bool cancelled = false;     // user declined to start on low disk space
    double elapsedSeconds = 0.0;
};

/**
 * @brief Resumable, disk-space-aware raw to JPEG conversion over a directory tree
 *
 * Directories are visited in pre-order with files in name order. A file is
 * skipped when it is already in the converted partition, when its output
 * already exists, or when an earlier run quarantined it. Everything else is
 * decoded and encoded; a failure quarantines that file only. An existing
 * output missing from the converted partition is recorded again only when no
 * other raw file maps to it and it carries the source's modification time.
 *
 * Only one process may work on a root directory at a time.
 */
class ConversionController {
public:
    ConversionController(const ConversionPolicy& policy,
                         const std::string& rootDirectory,
                         StateStore& stateStore,
                         FileService& fileService,
                         DiskSpaceMonitor& spaceMonitor,
                         ImageCodec& codec,
                         MetadataTransplanter& metadataTransplanter,
                         PauseDecisionProvider& pauseProvider,
                         ConfirmationProvider& confirmationProvider,
                         EventSink& logger,
                         bool force = false);

    ConversionSummary run();

    // Classification against the partitions loaded by the current run
    FileState classify(const std::string& sourcePath) const;

    const ConvertedLog& getConvertedLog() const { return convertedLog; }
    const CorruptLog& getCorruptLog() const { return corruptLog; }

private:
    using DirectoryListing = std::pair<std::string, std::vector<std::string>>;

    ConversionPolicy policy;
    std::string rootDirectory;
    StateStore& stateStore;
    FileService& fileService;
    DiskSpaceMonitor& spaceMonitor;
    ImageCodec& codec;
    MetadataTransplanter& metadataTransplanter;
    PauseDecisionProvider& pauseProvider;
    ConfirmationProvider& confirmationProvider;
    EventSink& logger;

    ConvertedLog convertedLog;
    CorruptLog corruptLog;
    std::map<std::string, std::size_t> outputClaims;   // output path -> raw files mapping to it

    // Run state
    bool forceMode;
    bool paused = false;
    std::size_t sessionProcessed = 0;
    std::size_t spaceCheckCounter = 0;
    std::size_t spaceCheckInterval = 5;
    std::chrono::steady_clock::time_point startTime;

    bool confirmStartupSpace();
    std::vector<DirectoryListing> scanTree(std::size_t& totalFiles, std::size_t& directoriesWithoutRaw);

    bool outputDerivedFrom(const std::string& sourcePath, const std::string& outputPath);
    void recordExistingOutput(const std::string& sourcePath);

    FileState convertFile(const std::string& sourcePath, ConversionSummary& summary);
    void quarantine(const std::string& sourcePath, ConversionErrorKind kind, const std::string& message,
                    ConversionSummary& summary);

    // Returns false when the user chose to abort at the pause gate
    bool checkSpaceCadence(const ConversionSummary& summary);

    void emitProgress(const ConversionSummary& summary);
    void flush();
    void logSummary(const ConversionSummary& summary);
};

#endif // CONVERSIONCONTROLLER_HPP
