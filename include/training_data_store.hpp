#pragma once

// C++ Standard Library
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pose_types.hpp"

// Labeled examples, one JSON file each:
//   <dir>/<exercise>/<exercise>_<YYYYmmdd_HHMMSS_ffffff>.json
class TrainingDataStore {
public:
    struct Statistics {
        size_t count;
        double avgScore;
        double minScore;
        double maxScore;
        double stdScore;  // population

        Statistics() : count(0), avgScore(0), minScore(0), maxScore(0), stdScore(0) {}
    };

    explicit TrainingDataStore(std::filesystem::path dir);

    // Returns the new example id. Throws InvalidExampleError for scores outside [0, 100].
    std::string saveExample(const std::string& exerciseType,
                            const PoseSequence& poseData,
                            double score,
                            const std::optional<std::string>& userFeedback = std::nullopt,
                            const std::map<std::string, std::string>& metadata = {});

    // Sorted by id, i.e. by creation time. Throws PoseDataError on unreadable files.
    std::vector<TrainingExample> loadExamples(const std::string& exerciseType) const;

    Statistics statistics(const std::string& exerciseType) const;

    const std::filesystem::path& directory() const { return dir_; }

private:
    // Microsecond id, bumped past the last one handed out so rapid saves stay unique
    std::string nextId(const std::string& exerciseType, std::string& timestamp);

    TrainingExample readExample(const std::filesystem::path& file) const;

    std::filesystem::path dir_;
    std::mutex mutex_;
    long long lastMicros_;
};
