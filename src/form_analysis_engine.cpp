// form_analysis_engine.cpp
#include "form_analysis_engine.hpp"
#include "form_errors.hpp"

#include "bridge_analyzer.hpp"
#include "clam_analyzer.hpp"
#include "pull_up_analyzer.hpp"
#include "push_up_analyzer.hpp"
#include "squat_analyzer.hpp"

#include <iostream>

FormAnalysisEngine::FormAnalysisEngine(const AnalyzerConfig& config, std::shared_ptr<ModelCache> cache)
    : config_(config),
      store_(std::make_shared<ArtifactStore>(config.modelsDir, std::move(cache))),
      trainer_(std::make_shared<ModelTrainer>(store_, config.regressor)) {

    registerAnalyzer(std::make_unique<PullUpAnalyzer>(trainer_, config_.pullUp, config_.useModel));
    registerAnalyzer(std::make_unique<PushUpAnalyzer>(trainer_, config_.pushUp, config_.useModel));
    registerAnalyzer(std::make_unique<SquatAnalyzer>(trainer_, config_.squat, config_.useModel));
    registerAnalyzer(std::make_unique<BridgeAnalyzer>(trainer_, config_.bridge, config_.useModel));
    registerAnalyzer(std::make_unique<ClamAnalyzer>(trainer_, config_.clam, config_.useModel));
}

void FormAnalysisEngine::registerAnalyzer(std::unique_ptr<ExerciseAnalyzer> analyzer) {
    const std::string id = analyzer->exerciseId();
    analyzers_[id] = std::move(analyzer);
}

const ExerciseAnalyzer& FormAnalysisEngine::analyzerFor(const std::string& exerciseType) const {
    auto it = analyzers_.find(exerciseType);
    if (it == analyzers_.end()) {
        throw UnsupportedExerciseError(exerciseType);
    }
    return *it->second;
}

bool FormAnalysisEngine::isSupported(const std::string& exerciseType) const {
    return analyzers_.count(exerciseType) > 0;
}

AnalysisResult FormAnalysisEngine::analyze(const std::string& exerciseType,
                                           const PoseSequence& sequence) const {
    const ExerciseAnalyzer& analyzer = analyzerFor(exerciseType);

    std::string problem = validatePoseSequence(sequence);
    if (!problem.empty()) {
        std::cerr << "FormAnalysisEngine: rejecting " << exerciseType << " sequence: " << problem
                  << std::endl;
        return AnalysisResult(0.0, {problem}, AnalysisMethod::RuleBased);
    }

    return analyzer.analyzeForm(sequence, exerciseType);
}

ModelTrainer::TrainingReport FormAnalysisEngine::train(
    const std::string& exerciseType,
    const std::vector<std::pair<PoseSequence, double>>& examples,
    ModelKind kind) {
    analyzerFor(exerciseType);
    return trainer_->train(exerciseType, examples, kind);
}

ModelTrainer::TrainingReport FormAnalysisEngine::train(const std::string& exerciseType,
                                                       const std::vector<TrainingExample>& examples,
                                                       ModelKind kind) {
    analyzerFor(exerciseType);

    std::vector<std::pair<PoseSequence, double>> labeled;
    labeled.reserve(examples.size());
    for (const auto& example : examples) {
        if (example.exerciseType != exerciseType) {
            throw InvalidExampleError("Example " + example.id + " is a " + example.exerciseType +
                                      " example, not " + exerciseType);
        }
        labeled.emplace_back(example.poseData, example.score);
    }
    return trainer_->train(exerciseType, labeled, kind);
}

bool FormAnalysisEngine::modelExists(const std::string& exerciseType) const {
    return isSupported(exerciseType) && trainer_->modelExists(exerciseType);
}

double FormAnalysisEngine::predict(const std::string& exerciseType, const PoseSequence& sequence) const {
    analyzerFor(exerciseType);
    return trainer_->predict(exerciseType, sequence);
}

std::vector<std::string> FormAnalysisEngine::getVideoRequirements(const std::string& exerciseType) const {
    return analyzerFor(exerciseType).getVideoRequirements();
}

ExerciseAnalyzer::ExerciseInfo FormAnalysisEngine::exerciseInfo(const std::string& exerciseType) const {
    return analyzerFor(exerciseType).info();
}

std::vector<std::string> FormAnalysisEngine::supportedExercises() const {
    std::vector<std::string> ids;
    for (const auto& entry : analyzers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void FormAnalysisEngine::setUseModel(bool useModel) {
    config_.useModel = useModel;
    for (auto& entry : analyzers_) {
        entry.second->setUseModel(useModel);
    }
}
