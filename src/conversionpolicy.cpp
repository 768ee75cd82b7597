#include "conversionpolicy.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string normalizeExtension(const std::string& extension) {
    std::string normalized = toLower(extension);
    if (!normalized.empty() && normalized[0] != '.') {
        normalized = "." + normalized;
    }
    return normalized;
}

template <typename T>
void readIfPresent(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section.at(key);
    if constexpr (std::is_unsigned<T>::value) {
        // get<> would wrap a negative number around
        if (!value.is_number_unsigned()) {
            throw std::runtime_error(std::string(key) + " must be a non-negative integer");
        }
    }
    target = value.get<T>();
}

} // namespace

ConversionPolicy::ConversionPolicy()
    : rawExtensions{".cr2", ".rw2", ".arw", ".nef", ".orf", ".dng", ".raf", ".pef", ".srw"},
      outputExtension(".jpg"),
      jpegQuality(95),
      requiredSpaceMb(500),
      flushInterval(5),
      spaceCheckIntervalOk(5),
      spaceCheckIntervalWarning(3),
      spaceCheckIntervalCritical(1),
      predictionWindow(20),
      minPredictionSamples(5),
      conversionLogName("conversion_log.json"),
      corruptLogName("corrupt_files.json"),
      deletionLogName("deletion_log.json"),
      conversionLogSource("raw_conversion"),
      deletionLogSource("raw_deletion") {}

bool ConversionPolicy::loadConfig(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return false;
    }

    std::ifstream configFile(configPath);
    if (!configFile.is_open()) {
        throw std::runtime_error("Failed to open " + configPath);
    }

    try {
        nlohmann::json config;
        configFile >> config;
        applyConfig(config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse " + configPath + ": " + std::string(e.what()));
    }

    configFile.close();
    return true;
}

void ConversionPolicy::applyConfig(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    if (config.contains("conversion")) {
        const auto& conversion = config.at("conversion");

        if (conversion.contains("raw_extensions")) {
            std::vector<std::string> extensions = conversion.at("raw_extensions").get<std::vector<std::string>>();
            rawExtensions.clear();
            for (const auto& extension : extensions) {
                rawExtensions.push_back(normalizeExtension(extension));
            }
        }
        if (conversion.contains("output_extension")) {
            outputExtension = normalizeExtension(conversion.at("output_extension").get<std::string>());
        }
        readIfPresent(conversion, "jpeg_quality", jpegQuality);
        readIfPresent(conversion, "required_space_mb", requiredSpaceMb);
        readIfPresent(conversion, "flush_interval", flushInterval);
        readIfPresent(conversion, "prediction_window", predictionWindow);
        readIfPresent(conversion, "min_prediction_samples", minPredictionSamples);
        readIfPresent(conversion, "conversion_log", conversionLogName);
        readIfPresent(conversion, "corrupt_log", corruptLogName);
        readIfPresent(conversion, "log_source", conversionLogSource);

        if (conversion.contains("space_check_interval")) {
            const auto& intervals = conversion.at("space_check_interval");
            readIfPresent(intervals, "ok", spaceCheckIntervalOk);
            readIfPresent(intervals, "warning", spaceCheckIntervalWarning);
            readIfPresent(intervals, "critical", spaceCheckIntervalCritical);
        }
    }

    if (config.contains("deletion")) {
        const auto& deletion = config.at("deletion");
        readIfPresent(deletion, "deletion_log", deletionLogName);
        readIfPresent(deletion, "log_source", deletionLogSource);
    }

    if (jpegQuality < 1 || jpegQuality > 100) {
        throw std::runtime_error("jpeg_quality must be between 1 and 100");
    }
    if (requiredSpaceMb <= 0) {
        throw std::runtime_error("required_space_mb must be positive");
    }
    if (flushInterval == 0 || spaceCheckIntervalOk == 0 || spaceCheckIntervalWarning == 0 ||
        spaceCheckIntervalCritical == 0) {
        throw std::runtime_error("flush and space check intervals must be positive");
    }
    if (minPredictionSamples < 5 || predictionWindow < minPredictionSamples) {
        throw std::runtime_error("prediction needs at least 5 samples and a window no smaller than that");
    }
}

bool ConversionPolicy::isRawFile(const std::string& path) const {
    std::string extension = toLower(std::filesystem::path(path).extension().string());
    return std::find(rawExtensions.begin(), rawExtensions.end(), extension) != rawExtensions.end();
}

std::string ConversionPolicy::outputPathFor(const std::string& sourcePath) const {
    std::filesystem::path source(sourcePath);
    return (source.parent_path() / (source.stem().string() + outputExtension)).string();
}

nlohmann::json ConversionPolicy::to_dict() const {
    return {
        {"raw_extensions", rawExtensions},
        {"output_extension", outputExtension},
        {"jpeg_quality", jpegQuality},
        {"required_space_mb", requiredSpaceMb},
        {"flush_interval", flushInterval},
        {"space_check_interval", {
            {"ok", spaceCheckIntervalOk},
            {"warning", spaceCheckIntervalWarning},
            {"critical", spaceCheckIntervalCritical}
        }},
        {"prediction_window", predictionWindow},
        {"min_prediction_samples", minPredictionSamples},
        {"conversion_log", conversionLogName},
        {"corrupt_log", corruptLogName},
        {"deletion_log", deletionLogName}
    };
}
