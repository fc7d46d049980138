#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analyzer_config.hpp"
#include "exercise_analyzer.hpp"

class PullUpAnalyzer : public ExerciseAnalyzer {
public:
    PullUpAnalyzer(std::shared_ptr<const ModelTrainer> trainer, const PullUpRules& rules,
                   bool useModel = true)
        : ExerciseAnalyzer(std::move(trainer), useModel), rules_(rules) {}

    std::string exerciseId() const override { return "pull_up"; }
    ExerciseInfo info() const override;
    std::vector<std::string> getVideoRequirements() const override;
    AnalysisResult ruleBasedAnalysis(const PoseSequence& sequence) const override;

private:
    PullUpRules rules_;
};
