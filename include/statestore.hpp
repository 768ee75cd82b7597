#ifndef STATESTORE_HPP
#define STATESTORE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "eventsink.hpp"
#include "fileservice.hpp"

// The three independently persisted outcome logs
enum class Partition {
    Converted,
    Corrupt,
    Deleted
};

std::string partitionName(Partition partition);

struct ConvertedRecord {
    std::string outputPath;
    std::string convertedAt;
    std::uint64_t sourceSize = 0;
};

struct CorruptRecord {
    std::string errorMessage;
    std::string errorKind;
    std::string detectedAt;
    std::uint64_t sourceSize = 0;
};

struct DeletedRecord {
    std::string deletedAt;
    std::uint64_t originalSize = 0;
    std::string convertedTo;
};

// On-disk field names: output_path, converted_at, file_size / error, error_type,
// detected_at, file_size / deleted_at, original_size, converted_to
void to_json(nlohmann::ordered_json& j, const ConvertedRecord& record);
void from_json(const nlohmann::ordered_json& j, ConvertedRecord& record);
void to_json(nlohmann::ordered_json& j, const CorruptRecord& record);
void from_json(const nlohmann::ordered_json& j, CorruptRecord& record);
void to_json(nlohmann::ordered_json& j, const DeletedRecord& record);
void from_json(const nlohmann::ordered_json& j, DeletedRecord& record);

/**
 * @brief Path-keyed record mapping that remembers insertion order
 *
 * Order matters: the deletion planner truncates batches in the order the
 * records were originally written.
 */
template <typename Record>
class RecordLog {
public:
    using Entry = std::pair<std::string, Record>;

    bool contains(const std::string& path) const {
        return index.find(path) != index.end();
    }

    const Record* find(const std::string& path) const {
        auto it = index.find(path);
        return it == index.end() ? nullptr : &entries[it->second].second;
    }

    // Replacing an existing path keeps its original position
    void insert(const std::string& path, Record record) {
        auto it = index.find(path);
        if (it != index.end()) {
            entries[it->second].second = std::move(record);
            return;
        }
        index.emplace(path, entries.size());
        entries.emplace_back(path, std::move(record));
    }

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    const std::vector<Entry>& items() const { return entries; }

private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

using ConvertedLog = RecordLog<ConvertedRecord>;
using CorruptLog = RecordLog<CorruptRecord>;
using DeletedLog = RecordLog<DeletedRecord>;

struct PartitionFiles {
    std::string converted = "conversion_log.json";
    std::string corrupt = "corrupt_files.json";
    std::string deleted = "deletion_log.json";
};

/**
 * @brief Durable owner of the converted, corrupt and deleted partitions of one root directory
 *
 * Loading never fails the caller: an absent, unreadable or malformed partition
 * yields an empty log and a warning. Saving replaces the partition file through
 * a temporary file and a rename; a failed save is logged and reported as false,
 * and the caller's in-memory log stays authoritative for the rest of the run.
 *
 * A single writer process per root directory is assumed. No file locking is done.
 */
class StateStore {
public:
    StateStore(const std::string& rootDirectory, FileService& fileService, EventSink& logger,
               const PartitionFiles& files = PartitionFiles());

    ConvertedLog loadConverted();
    CorruptLog loadCorrupt();
    DeletedLog loadDeleted();

    bool saveConverted(const ConvertedLog& log);
    bool saveCorrupt(const CorruptLog& log);
    bool saveDeleted(const DeletedLog& log);

    std::string partitionPath(Partition partition) const;

private:
    std::string rootDirectory;
    FileService& fileService;
    EventSink& logger;
    PartitionFiles files;

    template <typename Record>
    RecordLog<Record> loadPartition(Partition partition);

    template <typename Record>
    bool savePartition(Partition partition, const RecordLog<Record>& log);
};

#endif // STATESTORE_HPP
