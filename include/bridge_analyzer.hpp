#pragma once

#include <memory>
#include <string>
#include <vector>

#include "analyzer_config.hpp"
#include "exercise_analyzer.hpp"

class BridgeAnalyzer : public ExerciseAnalyzer {
public:
    BridgeAnalyzer(std::shared_ptr<const ModelTrainer> trainer, const BridgeRules& rules,
                   bool useModel = true)
        : ExerciseAnalyzer(std::move(trainer), useModel), rules_(rules) {}

    std::string exerciseId() const override { return "bridge"; }
    ExerciseInfo info() const override;
    std::vector<std::string> getVideoRequirements() const override;
    AnalysisResult ruleBasedAnalysis(const PoseSequence& sequence) const override;
    std::vector<std::string> analyzeSpecificIssues(const PoseSequence& sequence) const override;

private:
    BridgeRules rules_;
};
