#ifndef DELETIONCONTROLLER_HPP
#define DELETIONCONTROLLER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "eventsink.hpp"
#include "fileservice.hpp"
#include "pausegate.hpp"
#include "statestore.hpp"

struct DeletionSummary {
    std::size_t planned = 0;
    std::size_t deleted = 0;
    std::size_t skipped = 0;
    std::size_t errors = 0;
    bool cancelled = false;
    bool auditSaved = false;
};

using DirectoryGroup = std::pair<std::string, std::vector<std::string>>;

/**
 * @brief Removes raw sources whose conversion is recorded and whose output is still on disk
 *
 * A path is eligible when it exists, has a converted record and that record's
 * output_path exists. Nothing is deleted without confirmation unless force is
 * set. Every successful deletion is added to the deleted partition, which is
 * written once when the batch ends.
 */
class DeletionController {
public:
    DeletionController(StateStore& stateStore, FileService& fileService,
                       ConfirmationProvider& confirmationProvider, EventSink& logger);

    /**
     * @brief Computes the eligible paths in the converted partition's order
     * @param batchLimit Keep only the first batchLimit eligible paths
     */
    std::vector<std::string> plan(const ConvertedLog& convertedLog,
                                  std::optional<std::size_t> batchLimit = std::nullopt);

    // Groups paths by parent directory, both levels in first-seen order
    static std::vector<DirectoryGroup> groupByDirectory(const std::vector<std::string>& paths);

    DeletionSummary run(bool force, std::optional<std::size_t> batchLimit = std::nullopt);

private:
    StateStore& stateStore;
    FileService& fileService;
    ConfirmationProvider& confirmationProvider;
    EventSink& logger;

    void presentPlan(const std::vector<std::string>& paths);
    void deleteOne(const std::string& path, const ConvertedRecord& record,
                   DeletedLog& deletedLog, DeletionSummary& summary);
};

#endif // DELETIONCONTROLLER_HPP
