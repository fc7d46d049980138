#pragma once

// C++ Standard Library
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "analyzer_config.hpp"
#include "artifact_store.hpp"
#include "exercise_analyzer.hpp"
#include "model_trainer.hpp"
#include "pose_types.hpp"

// Entry point for scoring and training. Owns one analyzer per supported
// exercise, all sharing a trainer and artifact store rooted at config.modelsDir.
class FormAnalysisEngine {
public:
    explicit FormAnalysisEngine(const AnalyzerConfig& config = AnalyzerConfig(),
                                std::shared_ptr<ModelCache> cache = std::make_shared<ModelCache>());

    // Throws UnsupportedExerciseError only. Malformed sequences score 0.
    AnalysisResult analyze(const std::string& exerciseType, const PoseSequence& sequence) const;

    ModelTrainer::TrainingReport train(const std::string& exerciseType,
                                       const std::vector<std::pair<PoseSequence, double>>& examples,
                                       ModelKind kind = ModelKind::RandomForest);
    ModelTrainer::TrainingReport train(const std::string& exerciseType,
                                       const std::vector<TrainingExample>& examples,
                                       ModelKind kind = ModelKind::RandomForest);

    bool modelExists(const std::string& exerciseType) const;
    double predict(const std::string& exerciseType, const PoseSequence& sequence) const;

    std::vector<std::string> getVideoRequirements(const std::string& exerciseType) const;
    ExerciseAnalyzer::ExerciseInfo exerciseInfo(const std::string& exerciseType) const;
    std::vector<std::string> supportedExercises() const;
    bool isSupported(const std::string& exerciseType) const;

    void setUseModel(bool useModel);

    const AnalyzerConfig& config() const { return config_; }
    const ModelTrainer& trainer() const { return *trainer_; }

private:
    const ExerciseAnalyzer& analyzerFor(const std::string& exerciseType) const;
    void registerAnalyzer(std::unique_ptr<ExerciseAnalyzer> analyzer);

    AnalyzerConfig config_;
    std::shared_ptr<ArtifactStore> store_;
    std::shared_ptr<ModelTrainer> trainer_;
    std::map<std::string, std::unique_ptr<ExerciseAnalyzer>> analyzers_;
};
