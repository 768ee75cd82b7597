#ifndef CONVERSIONPOLICY_HPP
#define CONVERSIONPOLICY_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ConversionPolicy {
public:
    // Constructor, fills in the built-in defaults
    ConversionPolicy();

    // Source files
    std::vector<std::string> rawExtensions;   // lower case, with leading dot
    std::string outputExtension;
    int jpegQuality;

    // Disk space monitoring
    std::int64_t requiredSpaceMb;
    std::size_t flushInterval;                // successful conversions between partition flushes
    std::size_t spaceCheckIntervalOk;
    std::size_t spaceCheckIntervalWarning;
    std::size_t spaceCheckIntervalCritical;
    std::size_t predictionWindow;             // most recent output sizes kept
    std::size_t minPredictionSamples;

    // Partition files, relative to the processed root
    std::string conversionLogName;
    std::string corruptLogName;
    std::string deletionLogName;

    // Logging
    std::string conversionLogSource;
    std::string deletionLogSource;

    /**
     * @brief Overlays values from the "conversion" and "deletion" sections of a JSON file
     * @param configPath Path to the configuration file
     * @return false if the file does not exist (defaults are kept)
     * @throws std::runtime_error if the file is malformed or a value has the wrong type
     */
    bool loadConfig(const std::string& configPath);

    // Same as loadConfig, for an already parsed document
    void applyConfig(const nlohmann::json& config);

    bool isRawFile(const std::string& path) const;
    std::string outputPathFor(const std::string& sourcePath) const;

    nlohmann::json to_dict() const;
};

#endif // CONVERSIONPOLICY_HPP
