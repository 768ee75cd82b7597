#ifndef DISKSPACEMONITOR_HPP
#define DISKSPACEMONITOR_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include "eventsink.hpp"
#include "fileservice.hpp"

enum class SpaceStatus {
    Critical,   // free < required
    Warning,    // required <= free < 2 * required
    Ok          // free >= 2 * required
};

std::string spaceStatusName(SpaceStatus status);

struct SpaceReport {
    SpaceStatus status = SpaceStatus::Critical;
    double freeMb = 0.0;
    bool queryFailed = false;
};

struct Shortfall {
    double estimatedNeedMb = 0.0;
    double freeMb = 0.0;
    double averageOutputMb = 0.0;
    std::size_t remainingFiles = 0;
};

// Files between two space checks, per status
struct SpaceCheckIntervals {
    std::size_t ok = 5;
    std::size_t warning = 3;
    std::size_t critical = 1;
};

/**
 * @brief Samples free space under a directory, classifies it against a threshold
 * and predicts shortfalls from recently produced output sizes
 *
 * The monitor does not decide when to sample. Its owner keeps the per-file
 * counter and asks checkIntervalFor() how far apart checks should be.
 */
class DiskSpaceMonitor {
public:
    DiskSpaceMonitor(const std::string& directory, std::int64_t requiredMb,
                     FileService& fileService, EventSink& logger,
                     const SpaceCheckIntervals& intervals = SpaceCheckIntervals(),
                     std::size_t predictionWindow = 20, std::size_t minPredictionSamples = 5);

    static SpaceStatus classify(double freeMb, double requiredMb);

    /**
     * @brief Measures free space now
     * A failed query is reported as critical with zero free space.
     */
    SpaceReport check();

    std::size_t checkIntervalFor(SpaceStatus status) const;

    // Keeps only the most recent predictionWindow samples
    void recordOutputSize(double sizeMb);
    std::size_t sampleCount() const { return samples.size(); }
    double averageOutputMb() const;

    /**
     * @brief Projects the space the remaining files will need
     * @return A shortfall when the projection exceeds freeMb; nothing while
     *         fewer than minPredictionSamples sizes have been recorded
     */
    std::optional<Shortfall> predictShortfall(std::size_t remainingFiles, double freeMb) const;

    std::int64_t getRequiredMb() const { return requiredMb; }

private:
    std::string directory;
    std::int64_t requiredMb;
    FileService& fileService;
    EventSink& logger;
    SpaceCheckIntervals intervals;
    std::size_t predictionWindow;
    std::size_t minPredictionSamples;
    std::deque<double> samples;
};

#endif // DISKSPACEMONITOR_HPP
