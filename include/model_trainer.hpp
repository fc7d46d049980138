#pragma once

// C++ Standard Library
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "analyzer_config.hpp"
#include "artifact_store.hpp"
#include "feature_extractor.hpp"
#include "pose_types.hpp"
#include "score_regressor.hpp"

class ModelTrainer {
public:
    struct TrainingReport {
        std::string exerciseType;
        ModelKind modelKind;
        size_t trainingSamples;
        size_t testSamples;
        double trainMse;
        double testMse;
        double trainRmse;
        double testRmse;
        double trainR2;
        double testR2;

        TrainingReport()
            : modelKind(ModelKind::RandomForest), trainingSamples(0), testSamples(0),
              trainMse(0), testMse(0), trainRmse(0), testRmse(0), trainR2(0), testR2(0) {}
    };

    // Outcome of a prediction attempt; predict() turns failures into NEUTRAL_SCORE
    struct Prediction {
        bool ok;
        double score;
        std::string error;

        static Prediction success(double s) { return {true, s, ""}; }
        static Prediction failure(const std::string& e) { return {false, NEUTRAL_SCORE, e}; }
    };

    explicit ModelTrainer(std::shared_ptr<ArtifactStore> store,
                          RegressorParams params = RegressorParams());

    // Throws InsufficientDataError, InvalidExampleError, TrainingFailedError
    TrainingReport train(const std::string& exerciseType,
                         const std::vector<std::pair<PoseSequence, double>>& examples,
                         ModelKind kind = ModelKind::RandomForest);

    // Always returns a score in [0, 100]; NEUTRAL_SCORE when no usable model exists
    double predict(const std::string& exerciseType, const PoseSequence& sequence) const;

    // Like predict() but reports why a model could not be used
    Prediction tryPredict(const std::string& exerciseType, const PoseSequence& sequence) const;

    bool modelExists(const std::string& exerciseType) const;

    const ArtifactStore& store() const { return *store_; }
    const FeatureExtractor& featureExtractor() const { return extractor_; }

    static constexpr size_t MIN_TRAINING_EXAMPLES = 10;
    static constexpr double NEUTRAL_SCORE = 50.0;

private:
    // Shuffled once with the configured seed; the first ceil(n * testFraction) go to test
    std::pair<std::vector<int>, std::vector<int>> splitIndices(size_t count) const;

    std::shared_ptr<ArtifactStore> store_;
    RegressorParams params_;
    FeatureExtractor extractor_;
};

// Regression metrics
double meanSquaredError(const Eigen::VectorXd& truth, const Eigen::VectorXd& predicted);
double r2Score(const Eigen::VectorXd& truth, const Eigen::VectorXd& predicted);
