#include "statestore.hpp"
#include "logutils.hpp"
#include <filesystem>
#include <stdexcept>

std::string partitionName(Partition partition) {
    switch (partition) {
        case Partition::Converted: return "converted";
        case Partition::Corrupt: return "corrupt";
        case Partition::Deleted: return "deleted";
    }
    return "unknown";
}

void to_json(nlohmann::ordered_json& j, const ConvertedRecord& record) {
    j = nlohmann::ordered_json{
        {"output_path", record.outputPath},
        {"converted_at", record.convertedAt},
        {"file_size", record.sourceSize}
    };
}

void from_json(const nlohmann::ordered_json& j, ConvertedRecord& record) {
    // output_path is what deletion verifies against, so it is mandatory
    record.outputPath = j.at("output_path").get<std::string>();
    record.convertedAt = j.value("converted_at", std::string());
    record.sourceSize = j.value("file_size", std::uint64_t{0});
}

void to_json(nlohmann::ordered_json& j, const CorruptRecord& record) {
    j = nlohmann::ordered_json{
        {"error", record.errorMessage},
        {"error_type", record.errorKind},
        {"detected_at", record.detectedAt},
        {"file_size", record.sourceSize}
    };
}

void from_json(const nlohmann::ordered_json& j, CorruptRecord& record) {
    record.errorMessage = j.value("error", std::string());
    record.errorKind = j.value("error_type", std::string());
    record.detectedAt = j.value("detected_at", std::string());
    record.sourceSize = j.value("file_size", std::uint64_t{0});
}

void to_json(nlohmann::ordered_json& j, const DeletedRecord& record) {
    j = nlohmann::ordered_json{
        {"deleted_at", record.deletedAt},
        {"original_size", record.originalSize},
        {"converted_to", record.convertedTo}
    };
}

void from_json(const nlohmann::ordered_json& j, DeletedRecord& record) {
    record.deletedAt = j.value("deleted_at", std::string());
    record.originalSize = j.value("original_size", std::uint64_t{0});
    record.convertedTo = j.value("converted_to", std::string());
}

StateStore::StateStore(const std::string& rootDirectory, FileService& fileService, EventSink& logger,
                       const PartitionFiles& files)
    : rootDirectory(rootDirectory), fileService(fileService), logger(logger), files(files) {}

std::string StateStore::partitionPath(Partition partition) const {
    std::filesystem::path root(rootDirectory);
    switch (partition) {
        case Partition::Converted: return (root / files.converted).string();
        case Partition::Corrupt: return (root / files.corrupt).string();
        case Partition::Deleted: return (root / files.deleted).string();
    }
    throw std::invalid_argument("Unknown partition");
}

template <typename Record>
RecordLog<Record> StateStore::loadPartition(Partition partition) {
    RecordLog<Record> log;
    const std::string path = partitionPath(partition);

    if (!fileService.file_exists(path)) {
        logger.warning("Partition file not found, starting empty",
                       createLogInfo({{"partition", partitionName(partition)}, {"path", path}}),
                       "STORE_LOAD_MISSING");
        return log;
    }

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(fileService.read_file(path));
    } catch (const std::exception& e) {
        logger.warning("Partition file unreadable, starting empty",
                       createLogInfo({{"partition", partitionName(partition)}, {"path", path}, {"error", e.what()}}),
                       "STORE_LOAD_FAIL");
        return log;
    }

    if (!document.is_object()) {
        logger.warning("Partition file is not a JSON object, starting empty",
                       createLogInfo({{"partition", partitionName(partition)}, {"path", path}}),
                       "STORE_LOAD_FAIL");
        return log;
    }

    for (const auto& [sourcePath, value] : document.items()) {
        try {
            log.insert(sourcePath, value.template get<Record>());
        } catch (const nlohmann::json::exception& e) {
            logger.warning("Skipping malformed partition entry",
                           createLogInfo({{"partition", partitionName(partition)}, {"file", sourcePath}, {"error", e.what()}}),
                           "STORE_ENTRY_INVALID");
        }
    }

    logger.debug("Partition loaded",
                 createLogInfo({{"partition", partitionName(partition)}, {"entries", log.size()}}),
                 "STORE_LOAD");
    return log;
}

template <typename Record>
bool StateStore::savePartition(Partition partition, const RecordLog<Record>& log) {
    const std::string path = partitionPath(partition);
    try {
        nlohmann::ordered_json document = nlohmann::ordered_json::object();
        for (const auto& [sourcePath, record] : log.items()) {
            document[sourcePath] = record;
        }
        fileService.write_file_atomically(path, document.dump(4));
        logger.debug("Partition saved",
                     createLogInfo({{"partition", partitionName(partition)}, {"entries", log.size()}}),
                     "STORE_SAVE");
        return true;
    } catch (const std::exception& e) {
        logger.error("Failed to save partition",
                     createLogInfo({{"partition", partitionName(partition)}, {"path", path}, {"error", e.what()}}),
                     "STORE_SAVE_FAIL");
        return false;
    }
}

ConvertedLog StateStore::loadConverted() {
    return loadPartition<ConvertedRecord>(Partition::Converted);
}

CorruptLog StateStore::loadCorrupt() {
    return loadPartition<CorruptRecord>(Partition::Corrupt);
}

DeletedLog StateStore::loadDeleted() {
    return loadPartition<DeletedRecord>(Partition::Deleted);
}

bool StateStore::saveConverted(const ConvertedLog& log) {
    return savePartition(Partition::Converted, log);
}

bool StateStore::saveCorrupt(const CorruptLog& log) {
    return savePartition(Partition::Corrupt, log);
}

bool StateStore::saveDeleted(const DeletedLog& log) {
    return savePartition(Partition::Deleted, log);
}
