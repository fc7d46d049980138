#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analyzer_config.hpp"
#include "exercise_analyzer.hpp"

class ClamAnalyzer : public ExerciseAnalyzer {
public:
    ClamAnalyzer(std::shared_ptr<const ModelTrainer> trainer, const ClamRules& rules,
                 bool useModel = true)
        : ExerciseAnalyzer(std::move(trainer), useModel), rules_(rules) {}

    std::string exerciseId() const override { return "clam"; }
    ExerciseInfo info() const override;
    std::vector<std::string> getVideoRequirements() const override;
    AnalysisResult ruleBasedAnalysis(const PoseSequence& sequence) const override;
    std::vector<std::string> analyzeSpecificIssues(const PoseSequence& sequence) const override;

private:
    // Shoulder tilt drifting away from its first-frame value faster than the hips
    bool torsoRotated(const PoseSequence& sequence) const;

    ClamRules rules_;
};
