#include "deletioncontroller.hpp"
#include "logutils.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

DeletionController::DeletionController(StateStore& stateStore, FileService& fileService,
                                       ConfirmationProvider& confirmationProvider, EventSink& logger)
    : stateStore(stateStore), fileService(fileService),
      confirmationProvider(confirmationProvider), logger(logger) {}

std::vector<std::string> DeletionController::plan(const ConvertedLog& convertedLog,
                                                  std::optional<std::size_t> batchLimit) {
    std::vector<std::string> eligible;
    for (const auto& [rawPath, record] : convertedLog.items()) {
        if (!fileService.file_exists(rawPath)) {
            continue;
        }
        if (record.outputPath.empty() || !fileService.file_exists(record.outputPath)) {
            logger.debug("Not eligible, converted output missing: " + rawPath,
                         createLogInfo({{"output_path", record.outputPath}}), "DEL_OUTPUT_MISSING");
            continue;
        }
        eligible.push_back(rawPath);
    }

    if (batchLimit && eligible.size() > *batchLimit) {
        logger.info("Limiting deletion to first " + std::to_string(*batchLimit) + " files of " +
                    std::to_string(eligible.size()) + " total",
                    createLogInfo({{"batch", *batchLimit}, {"eligible", eligible.size()}}),
                    "DEL_BATCH_LIMIT");
        eligible.resize(*batchLimit);
    }
    return eligible;
}

std::vector<DirectoryGroup> DeletionController::groupByDirectory(const std::vector<std::string>& paths) {
    std::vector<DirectoryGroup> groups;
    for (const auto& path : paths) {
        fs::path p(path);
        std::string directory = p.parent_path().string();
        std::string filename = p.filename().string();

        auto it = groups.begin();
        while (it != groups.end() && it->first != directory) {
            ++it;
        }
        if (it == groups.end()) {
            groups.emplace_back(directory, std::vector<std::string>{filename});
        } else {
            it->second.push_back(filename);
        }
    }
    return groups;
}

void DeletionController::presentPlan(const std::vector<std::string>& paths) {
    logger.info("Raw files to be deleted:", createLogInfo(), "DEL_PLAN");
    for (const auto& [directory, files] : groupByDirectory(paths)) {
        logger.info("Directory: " + directory);
        for (std::size_t i = 0; i < files.size(); ++i) {
            logger.info("  " + std::to_string(i + 1) + ". " + files[i]);
        }
    }
    logger.info("Total files to delete: " + std::to_string(paths.size()),
                createLogInfo({{"planned", paths.size()}}), "DEL_PLAN_TOTAL");
}

DeletionSummary DeletionController::run(bool force, std::optional<std::size_t> batchLimit) {
    DeletionSummary summary;

    ConvertedLog convertedLog = stateStore.loadConverted();
    if (convertedLog.empty()) {
        logger.warning("No converted files found in the log. Nothing to delete.",
                       createLogInfo({{"log", stateStore.partitionPath(Partition::Converted)}}),
                       "DEL_NOTHING");
        return summary;
    }

    std::vector<std::string> planned = plan(convertedLog, batchLimit);
    summary.planned = planned.size();
    presentPlan(planned);

    if (planned.empty()) {
        logger.info("No raw files are eligible for deletion", createLogInfo(), "DEL_NONE_ELIGIBLE");
        return summary;
    }

    if (!force && !confirmationProvider.confirm("Proceed with deletion? (yes/no):")) {
        logger.info("Deletion cancelled.", createLogInfo({{"planned", summary.planned}}), "DEL_CANCELLED");
        summary.cancelled = true;
        summary.skipped = summary.planned;
        return summary;
    }

    DeletedLog deletedLog = stateStore.loadDeleted();
    for (const auto& rawPath : planned) {
        deleteOne(rawPath, *convertedLog.find(rawPath), deletedLog, summary);
    }

    summary.auditSaved = stateStore.saveDeleted(deletedLog);
    if (summary.auditSaved) {
        logger.info("Deletion log saved to " + stateStore.partitionPath(Partition::Deleted),
                    createLogInfo(), "DEL_LOG_SAVED");
    }

    logger.info("Deletion Summary:",
                createLogInfo({{"deleted", summary.deleted}, {"skipped", summary.skipped},
                               {"errors", summary.errors}}),
                "DEL_SUMMARY");
    logger.info("  Deleted: " + std::to_string(summary.deleted));
    logger.info("  Skipped: " + std::to_string(summary.skipped));
    logger.info("  Errors:  " + std::to_string(summary.errors));
    return summary;
}

void DeletionController::deleteOne(const std::string& path, const ConvertedRecord& record,
                                   DeletedLog& deletedLog, DeletionSummary& summary) {
    // The output may have been removed since the plan was made
    if (!fileService.file_exists(record.outputPath)) {
        logger.warning("Converted file missing, keeping raw file: " + path,
                       createLogInfo({{"output_path", record.outputPath}}), "DEL_OUTPUT_GONE");
        summary.skipped++;
        return;
    }

    try {
        std::uint64_t size = fileService.get_file_size(path);
        fileService.delete_file(path);

        DeletedRecord deleted;
        deleted.deletedAt = getIsoTimestamp();
        deleted.originalSize = size;
        deleted.convertedTo = record.outputPath;
        deletedLog.insert(path, deleted);

        logger.info("Deleted: " + path, createLogInfo({{"size", size}}), "DEL_FILE");
        summary.deleted++;
    } catch (const fs::filesystem_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory) {
            logger.warning("File not found (already deleted?): " + path, createLogInfo(), "DEL_NOT_FOUND");
            summary.skipped++;
        } else if (e.code() == std::errc::permission_denied || e.code() == std::errc::operation_not_permitted) {
            logger.error("Permission denied when deleting: " + path,
                         createLogInfo({{"error", e.what()}}), "DEL_PERMISSION");
            summary.errors++;
        } else {
            logger.error("Failed to delete " + path + ": " + e.what(), createLogInfo(), "DEL_FAIL");
            summary.errors++;
        }
    } catch (const std::exception& e) {
        logger.error("Failed to delete " + path + ": " + e.what(), createLogInfo(), "DEL_FAIL");
        summary.errors++;
    }
}
