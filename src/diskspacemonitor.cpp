#include "diskspacemonitor.hpp"
#include "logutils.hpp"
#include <numeric>
#include <stdexcept>

namespace {
constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
}

std::string spaceStatusName(SpaceStatus status) {
    switch (status) {
        case SpaceStatus::Critical: return "critical";
        case SpaceStatus::Warning: return "warning";
        case SpaceStatus::Ok: return "ok";
    }
    return "unknown";
}

DiskSpaceMonitor::DiskSpaceMonitor(const std::string& directory, std::int64_t requiredMb,
                                   FileService& fileService, EventSink& logger,
                                   const SpaceCheckIntervals& intervals,
                                   std::size_t predictionWindow, std::size_t minPredictionSamples)
    : directory(directory), requiredMb(requiredMb), fileService(fileService), logger(logger),
      intervals(intervals), predictionWindow(predictionWindow), minPredictionSamples(minPredictionSamples) {
    if (requiredMb <= 0) {
        throw std::invalid_argument("Required space must be positive");
    }
    if (this->minPredictionSamples < 5) {
        this->minPredictionSamples = 5;
    }
    if (this->predictionWindow < this->minPredictionSamples) {
        this->predictionWindow = this->minPredictionSamples;
    }
}

SpaceStatus DiskSpaceMonitor::classify(double freeMb, double requiredMb) {
    if (freeMb < requiredMb) {
        return SpaceStatus::Critical;
    }
    if (freeMb < requiredMb * 2) {
        return SpaceStatus::Warning;
    }
    return SpaceStatus::Ok;
}

SpaceReport DiskSpaceMonitor::check() {
    SpaceReport report;
    try {
        std::uint64_t freeBytes = fileService.get_total_available_memory(directory);
        report.freeMb = static_cast<double>(freeBytes) / BYTES_PER_MB;
        report.status = classify(report.freeMb, static_cast<double>(requiredMb));
    } catch (const std::exception& e) {
        logger.error("Could not check disk space",
                     createLogInfo({{"directory", directory}, {"error", e.what()}}),
                     "SPACE_CHECK_FAIL");
        report.status = SpaceStatus::Critical;
        report.freeMb = 0.0;
        report.queryFailed = true;
        return report;
    }

    if (report.status == SpaceStatus::Critical) {
        logger.warning("Low disk space: only " + std::to_string(static_cast<long long>(report.freeMb)) +
                       "MB available, " + std::to_string(requiredMb) + "MB recommended",
                       createLogInfo({{"free_mb", report.freeMb}, {"required_mb", requiredMb}}),
                       "SPACE_CRITICAL");
    } else if (report.status == SpaceStatus::Warning) {
        logger.info("Disk space getting low: " + std::to_string(static_cast<long long>(report.freeMb)) +
                    "MB available",
                    createLogInfo({{"free_mb", report.freeMb}, {"required_mb", requiredMb}}),
                    "SPACE_WARNING");
    }
    return report;
}

std::size_t DiskSpaceMonitor::checkIntervalFor(SpaceStatus status) const {
    switch (status) {
        case SpaceStatus::Critical: return intervals.critical;
        case SpaceStatus::Warning: return intervals.warning;
        case SpaceStatus::Ok: return intervals.ok;
    }
    return intervals.ok;
}

void DiskSpaceMonitor::recordOutputSize(double sizeMb) {
    samples.push_back(sizeMb);
    while (samples.size() > predictionWindow) {
        samples.pop_front();
    }
}

double DiskSpaceMonitor::averageOutputMb() const {
    if (samples.empty()) {
        return 0.0;
    }
    return std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
}

std::optional<Shortfall> DiskSpaceMonitor::predictShortfall(std::size_t remainingFiles, double freeMb) const {
    if (samples.size() < minPredictionSamples) {
        return std::nullopt;
    }

    Shortfall shortfall;
    shortfall.averageOutputMb = averageOutputMb();
    shortfall.remainingFiles = remainingFiles;
    shortfall.estimatedNeedMb = shortfall.averageOutputMb * static_cast<double>(remainingFiles);
    shortfall.freeMb = freeMb;

    if (shortfall.estimatedNeedMb > freeMb) {
        return shortfall;
    }
    return std::nullopt;
}
