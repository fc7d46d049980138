#pragma once

// C++ Standard Library
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Third-party libraries
#include <Eigen/Core>

#include "feature_scaler.hpp"
#include "score_regressor.hpp"

// A fitted (regressor, scaler) pair for one exercise type
struct ScoringModel {
    std::string exerciseType;
    std::unique_ptr<ScoreRegressor> regressor;
    FeatureScaler scaler;

    // Raw (unscaled) feature vector in, unclamped score out
    double predict(const Eigen::VectorXd& features) const;
};

// Loaded models keyed by exercise type and the generation they came from.
// Shared between stores that point at the same directory.
class ModelCache {
public:
    std::shared_ptr<const ScoringModel> find(const std::string& exerciseType,
                                             const std::string& generation) const;
    void put(const std::string& exerciseType, const std::string& generation,
             std::shared_ptr<const ScoringModel> model);
    void evict(const std::string& exerciseType);
    size_t size() const;

private:
    struct Entry {
        std::string generation;
        std::shared_ptr<const ScoringModel> model;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

// On-disk layout:
//   <root>/<exercise>             symlink -> .generations/<exercise>@<stamp>
//   <root>/<exercise>/model.yml   regressor parameters
//   <root>/<exercise>/scaler.yml  scaler parameters
//   <root>/.generations/<exercise>.lock   held by the writer for the whole save
// A save writes a fresh generation and swaps the link with a single rename,
// so readers see either the old pair or the new pair.
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root,
                           std::shared_ptr<ModelCache> cache = std::make_shared<ModelCache>());

    bool exists(const std::string& exerciseType) const;

    // Throws ArtifactError (Unavailable / Corrupt)
    std::shared_ptr<const ScoringModel> load(const std::string& exerciseType) const;

    // Replaces any previous artifact for the type as a unit
    void save(const std::string& exerciseType, std::shared_ptr<const ScoringModel> model);

    std::filesystem::path modelPath(const std::string& exerciseType) const;
    std::filesystem::path scalerPath(const std::string& exerciseType) const;
    const std::filesystem::path& root() const { return root_; }

    static constexpr const char* MODEL_FILE = "model.yml";
    static constexpr const char* SCALER_FILE = "scaler.yml";
    static constexpr const char* GENERATIONS_DIR = ".generations";

private:
    std::filesystem::path linkPath(const std::string& exerciseType) const;
    // Generation directory the link points at, empty if there is none
    std::filesystem::path currentGeneration(const std::string& exerciseType) const;
    std::string newGenerationName(const std::string& exerciseType) const;
    void writeGeneration(const std::filesystem::path& dir, const ScoringModel& model) const;
    std::shared_ptr<const ScoringModel> readGeneration(const std::filesystem::path& dir,
                                                       const std::string& exerciseType) const;
    void pruneGenerations(const std::string& exerciseType,
                          const std::filesystem::path& keepCurrent,
                          const std::filesystem::path& keepPrevious) const;
    std::mutex& writerLock(const std::string& exerciseType);

    std::filesystem::path root_;
    std::shared_ptr<ModelCache> cache_;

    std::mutex writersMutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> writers_;
};
